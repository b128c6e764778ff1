#include "config.hpp"
#include "ec_ops.hpp"
#include "errors.hpp"
#include "key_id.hpp"
#include "key_provider.hpp"
#include "package.hpp"
#include "package_service.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>
#include <stdexcept>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " keygen  --type <ed25519|x25519> --name <prefix>\n"
        "  " << prog << " create  --out <path> --payload <id>:<type>:<file>[:<cipher>] [--payload ...]\n"
        "                 --recipient <id>:<x25519-pub-file> [--recipient ...]\n"
        "                 [--producer-signing-key <ed25519-priv-file>] [--policy <file>]\n"
        "                 [--evidence-report <file>] [--evidence-html <file>]\n"
        "                 [--base-model <id>] [--cipher AES-256-GCM|ChaCha20]\n"
        "                 [--producer-id <id>] [--config <file>]\n"
        "  " << prog << " verify  <path> [--trusted-key <ed25519-pub-file>] [--config <file>]\n"
        "  " << prog << " decrypt <path> --recipient-id <id> --recipient-private-key <file>\n"
        "                 --outdir <dir> [--config <file>]\n"
        "  " << prog << " inspect <path> [--config <file>]\n"
        "\n"
        "  keygen:  writes <prefix>.priv (mode 0600) and <prefix>.pub\n"
        "  create:  encrypts payloads for every recipient, prints the package_id\n"
        "  verify:  checks inventory hashes, entry whitelist and signature; prints PASS or FAIL\n"
        "  decrypt: verifies, then writes this recipient's payloads into --outdir\n"
        "  inspect: prints the manifest summary without verifying\n"
        "\n"
        "Config: --config <file>, else $TGSP_CONFIG, else built-in defaults.\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto/verification, 3=I/O\n";
}

// ── Helpers ───────────────────────────────────────────────────────────────────

static bool load_engine_config(const std::string& cli_path, EngineConfig& cfg) {
    try {
        cfg = resolve_config(cli_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
    return true;
}

static int report_package_error(const PackageError& e) {
    std::cerr << "Error: " << error_kind_name(e.kind()) << ": " << e.what() << "\n";
    return 2;
}

// ── keygen command ────────────────────────────────────────────────────────────

static int cmd_keygen(int argc, char* argv[]) {
    std::string type_str;
    std::string name;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--type") == 0) {
            if (++i >= argc) { std::cerr << "Error: --type requires a value\n"; return 1; }
            type_str = argv[i];
        } else if (std::strcmp(argv[i], "--name") == 0) {
            if (++i >= argc) { std::cerr << "Error: --name requires a value\n"; return 1; }
            name = argv[i];
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (type_str.empty() || name.empty()) {
        std::cerr << "Error: keygen requires --type and --name\n";
        return 1;
    }

    ec::Algorithm alg;
    try {
        alg = ec::algorithm_from_name(type_str);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    KeyFilePaths paths;
    try {
        paths = write_keypair(alg, name);
    } catch (const std::exception& e) {
        std::cerr << "Error: key generation failed: " << e.what() << "\n";
        return 3;
    }

    std::cout << "Key pair generated:\n"
              << "  type:    " << ec::algorithm_name(alg) << "\n"
              << "  private: " << paths.private_path << "\n"
              << "  public:  " << paths.public_path << "\n";
    if (alg == ec::Algorithm::Ed25519) {
        try {
            std::cout << "  key id:  "
                      << key_id::derive(load_public_key(paths.public_path, alg)) << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot read back public key: " << e.what() << "\n";
            return 3;
        }
    }
    return 0;
}

// ── create command ────────────────────────────────────────────────────────────

static int cmd_create(int argc, char* argv[]) {
    CreateRequest req;
    std::vector<std::string> payload_specs;
    std::vector<std::string> recipient_specs;
    std::string signing_key_path;
    std::string cipher_str;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--out") == 0) {
            if (++i >= argc) { std::cerr << "Error: --out requires a filename\n"; return 1; }
            req.out_path = argv[i];
        } else if (std::strcmp(argv[i], "--payload") == 0) {
            if (++i >= argc) { std::cerr << "Error: --payload requires <id>:<type>:<file>\n"; return 1; }
            payload_specs.push_back(argv[i]);
        } else if (std::strcmp(argv[i], "--recipient") == 0) {
            if (++i >= argc) { std::cerr << "Error: --recipient requires <id>:<pub-file>\n"; return 1; }
            recipient_specs.push_back(argv[i]);
        } else if (std::strcmp(argv[i], "--producer-signing-key") == 0) {
            if (++i >= argc) { std::cerr << "Error: --producer-signing-key requires a filename\n"; return 1; }
            signing_key_path = argv[i];
        } else if (std::strcmp(argv[i], "--policy") == 0) {
            if (++i >= argc) { std::cerr << "Error: --policy requires a filename\n"; return 1; }
            req.policy_path = argv[i];
        } else if (std::strcmp(argv[i], "--evidence-report") == 0) {
            if (++i >= argc) { std::cerr << "Error: --evidence-report requires a filename\n"; return 1; }
            req.evidence.push_back({"evaluation_report", argv[i]});
        } else if (std::strcmp(argv[i], "--evidence-html") == 0) {
            if (++i >= argc) { std::cerr << "Error: --evidence-html requires a filename\n"; return 1; }
            req.evidence.push_back({"evaluation_report_html", argv[i]});
        } else if (std::strcmp(argv[i], "--base-model") == 0) {
            if (++i >= argc) { std::cerr << "Error: --base-model requires a value\n"; return 1; }
            req.base_model_ids.push_back(argv[i]);
        } else if (std::strcmp(argv[i], "--cipher") == 0) {
            if (++i >= argc) { std::cerr << "Error: --cipher requires a value\n"; return 1; }
            cipher_str = argv[i];
        } else if (std::strcmp(argv[i], "--producer-id") == 0) {
            if (++i >= argc) { std::cerr << "Error: --producer-id requires a value\n"; return 1; }
            req.producer_id = argv[i];
        } else if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (req.out_path.empty()) { std::cerr << "Error: --out is required\n"; return 1; }
    if (payload_specs.empty()) { std::cerr << "Error: at least one --payload is required\n"; return 1; }
    if (recipient_specs.empty()) { std::cerr << "Error: at least one --recipient is required\n"; return 1; }

    EngineConfig cfg;
    if (!load_engine_config(config_path, cfg))
        return 1;

    try {
        if (!cipher_str.empty())
            req.cipher = cipher_from_name(cipher_str);

        for (const auto& spec : payload_specs)
            req.payloads.push_back(package_service::parse_payload_arg(spec));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Recipient ids may contain ':', so the key file is after the last one.
    for (const auto& spec : recipient_specs) {
        size_t colon = spec.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == spec.size()) {
            std::cerr << "Error: --recipient expects <id>:<pub-file>, got '" << spec << "'\n";
            return 1;
        }
        RecipientInput r;
        r.recipient_id = spec.substr(0, colon);
        try {
            r.public_key = load_public_key(spec.substr(colon + 1), ec::Algorithm::X25519);
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot load recipient key: " << e.what() << "\n";
            return 3;
        }
        req.recipients.push_back(std::move(r));
    }

    std::unique_ptr<SigningKey> signing_key;
    if (!signing_key_path.empty()) {
        try {
            signing_key = load_signing_key(signing_key_path);
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot load signing key: " << e.what() << "\n";
            return 3;
        }
        req.signing_key = signing_key.get();
    }

    std::string package_id;
    try {
        package_id = package_service::create(cfg, req);
    } catch (const PackageError& e) {
        return report_package_error(e);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    std::cout << package_id << "\n"
              << "Package created:\n"
              << "  path:       " << req.out_path << "\n"
              << "  payloads:   " << req.payloads.size() << "\n"
              << "  recipients: " << req.recipients.size() << "\n"
              << "  evidence:   " << req.evidence.size() << "\n"
              << "  signed:     " << (signing_key ? "yes" : "no") << "\n";
    return 0;
}

// ── verify command ────────────────────────────────────────────────────────────

static int cmd_verify(int argc, char* argv[]) {
    std::string package_path;
    std::string trusted_key_path;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--trusted-key") == 0) {
            if (++i >= argc) { std::cerr << "Error: --trusted-key requires a filename\n"; return 1; }
            trusted_key_path = argv[i];
        } else if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else if (package_path.empty()) {
            package_path = argv[i];
        } else {
            std::cerr << "Error: unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    if (package_path.empty()) { std::cerr << "Error: verify requires a package path\n"; return 1; }

    EngineConfig cfg;
    if (!load_engine_config(config_path, cfg))
        return 1;

    std::vector<uint8_t> trusted_key;
    if (!trusted_key_path.empty()) {
        try {
            trusted_key = load_public_key(trusted_key_path, ec::Algorithm::Ed25519);
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot load trusted key: " << e.what() << "\n";
            return 3;
        }
    }

    VerifyResult r;
    try {
        r = package_service::verify(cfg, package_path,
                                    trusted_key_path.empty() ? nullptr : &trusted_key);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    if (!r.ok) {
        std::cout << "FAIL: " << r.reason << "\n";
        return 2;
    }
    std::cout << "PASS\n";
    if (r.status == VerifyStatus::Unauthenticated)
        std::cerr << "Warning: UnauthenticatedPackage: package " << r.package_id
                  << " carries no producer signature\n";
    return 0;
}

// ── decrypt command ───────────────────────────────────────────────────────────

static int cmd_decrypt(int argc, char* argv[]) {
    std::string package_path;
    std::string recipient_id;
    std::string key_path;
    std::string outdir;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--recipient-id") == 0) {
            if (++i >= argc) { std::cerr << "Error: --recipient-id requires a value\n"; return 1; }
            recipient_id = argv[i];
        } else if (std::strcmp(argv[i], "--recipient-private-key") == 0) {
            if (++i >= argc) { std::cerr << "Error: --recipient-private-key requires a filename\n"; return 1; }
            key_path = argv[i];
        } else if (std::strcmp(argv[i], "--outdir") == 0) {
            if (++i >= argc) { std::cerr << "Error: --outdir requires a directory\n"; return 1; }
            outdir = argv[i];
        } else if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else if (package_path.empty()) {
            package_path = argv[i];
        } else {
            std::cerr << "Error: unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    if (package_path.empty() || recipient_id.empty() || key_path.empty() || outdir.empty()) {
        std::cerr << "Error: decrypt requires <path>, --recipient-id, "
                     "--recipient-private-key and --outdir\n";
        return 1;
    }

    EngineConfig cfg;
    if (!load_engine_config(config_path, cfg))
        return 1;

    std::unique_ptr<AgreementKey> key;
    try {
        key = load_agreement_key(key_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot load recipient key: " << e.what() << "\n";
        return 3;
    }

    std::vector<DecryptedFile> files;
    try {
        files = package_service::decrypt(cfg, package_path, recipient_id, *key, outdir);
    } catch (const PackageError& e) {
        return report_package_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    std::cout << "Decrypted " << files.size() << " payload(s):\n";
    for (const auto& f : files)
        std::cout << "  " << f.payload_id << "  " << f.path.string()
                  << "  (" << f.size << " bytes)\n";
    return 0;
}

// ── inspect command ───────────────────────────────────────────────────────────

static int cmd_inspect(int argc, char* argv[]) {
    std::string package_path;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else if (package_path.empty()) {
            package_path = argv[i];
        } else {
            std::cerr << "Error: unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    if (package_path.empty()) { std::cerr << "Error: inspect requires a package path\n"; return 1; }

    EngineConfig cfg;
    if (!load_engine_config(config_path, cfg))
        return 1;

    PackageSummary s;
    try {
        s = package_service::inspect(cfg, package_path);
    } catch (const PackageError& e) {
        return report_package_error(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    const PackageManifest& m = s.manifest;
    std::cout << "Package (not verified):\n"
              << "  id:       " << m.package_id << "\n"
              << "  format:   " << m.format_version << "\n"
              << "  created:  " << m.created_at << "\n"
              << "  producer: " << m.producer_id << "\n"
              << "  signed:   " << (s.has_signature ? "yes, key " + s.signer_key_id : "no") << "\n";
    if (!m.policy_id.empty())
        std::cout << "  policy:   " << m.policy_id << " " << m.policy_version
                  << "  sha256=" << m.policy_hash << "\n";
    for (const auto& b : m.base_model_ids)
        std::cout << "  base:     " << b << "\n";

    std::cout << "  payloads: " << m.payloads.size() << "\n";
    for (const auto& p : m.payloads)
        std::cout << "    - " << p.payload_id << "  " << p.logical_type
                  << "  " << p.filename << "  " << cipher_name(p.cipher)
                  << "  " << p.size << "B\n";
    std::cout << "  evidence: " << m.evidence.size() << "\n";
    for (const auto& e : m.evidence)
        std::cout << "    - " << e.type << "  " << e.filename << "\n";
    std::cout << "  recipients: " << s.recipient_ids.size() << "\n";
    for (const auto& r : s.recipient_ids)
        std::cout << "    - " << r << "\n";
    std::cout << "  entries:  " << s.entries.size() << "\n";
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "keygen")  return cmd_keygen(argc - 1, argv + 1);
    if (cmd == "create")  return cmd_create(argc - 1, argv + 1);
    if (cmd == "verify")  return cmd_verify(argc - 1, argv + 1);
    if (cmd == "decrypt") return cmd_decrypt(argc - 1, argv + 1);
    if (cmd == "inspect") return cmd_inspect(argc - 1, argv + 1);

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Error: unknown command '" << cmd << "'\n";
    print_usage(argv[0]);
    return 1;
}
