#include "package_service.hpp"
#include "canonical.hpp"
#include "container.hpp"
#include "digest.hpp"
#include "ec_sig.hpp"
#include "file_io.hpp"
#include "kdf.hpp"
#include "key_id.hpp"
#include "keywrap.hpp"
#include "path_guard.hpp"
#include "policy.hpp"
#include "record_pack.hpp"
#include "secure_bytes.hpp"
#include "symmetric.hpp"
#include <openssl/rand.h>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <set>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace package_service {

static const size_t kMaxIdLen = 128;

// ── Helpers ───────────────────────────────────────────────────────────────────

static std::string iso8601_now() {
    std::time_t t = std::time(nullptr);
    struct tm gmt;
    gmtime_r(&t, &gmt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return std::string(buf);
}

// Random UUID v4 (RFC 9562)
static std::string new_package_id() {
    uint8_t out[16];
    if (RAND_bytes(out, sizeof(out)) != 1)
        throw std::runtime_error("RAND_bytes failed");

    out[6] = (out[6] & 0x0F) | 0x40;  // version nibble = 4
    out[8] = (out[8] & 0x3F) | 0x80;  // variant = 10xxxxxx

    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        out[0],  out[1],  out[2],  out[3],
        out[4],  out[5],
        out[6],  out[7],
        out[8],  out[9],
        out[10], out[11], out[12], out[13], out[14], out[15]);
    return std::string(buf);
}

static std::vector<uint8_t> random_bytes(size_t n) {
    std::vector<uint8_t> out(n);
    if (RAND_bytes(out.data(), (int)n) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return out;
}

static bool is_valid_payload_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLen || id[0] == '.')
        return false;
    for (unsigned char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!ok) return false;
    }
    return true;
}

static bool is_valid_recipient_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLen)
        return false;
    for (unsigned char c : id) {
        if (c < 0x20 || c == 0x7F) return false;
    }
    return true;
}

static std::string payload_entry(const std::string& payload_id) {
    return std::string(entry::kPayloadDir) + payload_id + ".enc";
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

// manifest and signature wrap the inventory and cannot be listed in it.
static bool is_envelope_entry(const std::string& name) {
    return name == entry::kManifest || name == entry::kSignature;
}

static bool is_exempt_entry(const std::string& name) {
    return is_envelope_entry(name) || starts_with(name, entry::kMetaDir);
}

// Reads an input file, refusing anything that could not fit in one entry.
static std::vector<uint8_t> read_input(const std::string& path, uint64_t limit,
                                       const char* what)
{
    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec)
        throw std::runtime_error(std::string("Cannot read ") + what + " " + path +
                                 ": " + ec.message());
    if (size > limit)
        throw ResourceLimitExceeded(std::string(what) + " " + path + " is " +
                                    std::to_string(size) + " bytes, limit " +
                                    std::to_string(limit));
    return read_file(path, limit);
}

// ── create ────────────────────────────────────────────────────────────────────

PayloadInput parse_payload_arg(const std::string& arg) {
    size_t c1 = arg.find(':');
    size_t c2 = c1 == std::string::npos ? c1 : arg.find(':', c1 + 1);
    if (c2 == std::string::npos || c2 + 1 == arg.size())
        throw std::invalid_argument("--payload expects <id>:<type>:<file>[:<cipher>], got '" +
                                    arg + "'");

    PayloadInput p;
    p.payload_id   = arg.substr(0, c1);
    p.logical_type = arg.substr(c1 + 1, c2 - c1 - 1);
    p.path         = arg.substr(c2 + 1);

    size_t c3 = p.path.rfind(':');
    if (c3 != std::string::npos && c3 > 0) {
        try {
            p.cipher = cipher_from_name(p.path.substr(c3 + 1));
            p.path.resize(c3);
        } catch (const std::invalid_argument&) {
            // not a cipher name: the colon is part of the path
        }
    }
    return p;
}

static void validate_request(const EngineConfig& cfg, const CreateRequest& req) {
    if (req.out_path.empty())
        throw std::invalid_argument("output path is required");
    if (req.payloads.empty())
        throw std::invalid_argument("at least one payload is required");
    if (req.recipients.empty())
        throw std::invalid_argument("at least one recipient is required");
    if (cfg.require_signature && !req.signing_key)
        throw std::invalid_argument("configuration requires a producer signing key");

    std::set<std::string> ids;
    std::set<std::string> filenames;
    for (const auto& p : req.payloads) {
        if (!is_valid_payload_id(p.payload_id))
            throw std::invalid_argument("invalid payload id '" + p.payload_id +
                                        "' (use letters, digits, '.', '-', '_')");
        if (!ids.insert(p.payload_id).second)
            throw std::invalid_argument("duplicate payload id '" + p.payload_id + "'");
        if (p.logical_type.empty())
            throw std::invalid_argument("payload '" + p.payload_id + "' has no type");
        std::string filename = path_guard::sanitize_filename(base_name(p.path));
        if (!filenames.insert(filename).second)
            throw std::invalid_argument("payload '" + p.payload_id + "': output filename '" +
                                        filename + "' is already used by another payload");
    }

    std::set<std::string> rids;
    for (const auto& r : req.recipients) {
        if (!is_valid_recipient_id(r.recipient_id))
            throw std::invalid_argument("invalid recipient id '" + r.recipient_id + "'");
        if (!rids.insert(r.recipient_id).second)
            throw std::invalid_argument("duplicate recipient id '" + r.recipient_id + "'");
        if (r.public_key.size() != 32)
            throw std::invalid_argument("recipient '" + r.recipient_id +
                                        "': public key must be 32 bytes");
    }
}

std::string create(const EngineConfig& cfg, const CreateRequest& req) {
    validate_request(cfg, req);

    auto container = Container::open(req.out_path, ContainerMode::Write, cfg);

    PackageManifest m;
    m.package_id     = new_package_id();
    m.format_version = kFormatVersion;
    m.created_at     = iso8601_now();
    m.producer_id    = req.producer_id.empty() ? cfg.producer_id : req.producer_id;
    m.base_model_ids = req.base_model_ids;

    const CipherAlg default_cipher = req.cipher ? *req.cipher : cfg.default_cipher;
    const uint64_t  pt_limit = cfg.max_entry_size > (uint64_t)(AEAD_NONCE_LEN + AEAD_TAG_LEN)
                             ? cfg.max_entry_size - AEAD_NONCE_LEN - AEAD_TAG_LEN : 0;

    // 1. Encrypt payloads
    std::vector<SecretBytes> deks;
    for (const auto& in : req.payloads) {
        std::vector<uint8_t> plaintext = read_input(in.path, pt_limit, "payload");
        ScopedWipe wipe_pt(plaintext);

        PayloadDescriptor d;
        d.payload_id     = in.payload_id;
        d.logical_type   = in.logical_type;
        d.filename       = path_guard::sanitize_filename(base_name(in.path));
        d.cipher         = in.cipher ? *in.cipher : default_cipher;
        d.plaintext_hash = sha256_hex(plaintext);
        d.size           = plaintext.size();

        SecretBytes dek = aead::generate_key();
        std::vector<uint8_t> sealed = aead::seal(d.cipher, dek, plaintext, d.payload_id);
        d.enc_hash = sha256_hex(sealed);

        container->write_entry(payload_entry(d.payload_id), sealed);
        m.payloads.push_back(std::move(d));
        deks.push_back(std::move(dek));
    }

    // 2. Wrap every DEK for every recipient under a per-recipient KEK
    auto ephemeral = LocalAgreementKey::generate();
    RecipientSet rs;
    rs.ephemeral_public_key = ephemeral->public_key();
    for (const auto& r : req.recipients) {
        RecipientEntry e;
        e.recipient_id = r.recipient_id;
        e.salt         = random_bytes(KEK_SALT_LEN);

        SecretBytes ss  = ephemeral->agree(r.public_key);
        SecretBytes kek = derive_kek(ss, e.salt);
        for (size_t i = 0; i < m.payloads.size(); ++i)
            e.wrapped_keys[m.payloads[i].payload_id] = keywrap::wrap(kek, deks[i]);
        rs.recipients.push_back(std::move(e));
    }
    ephemeral.reset();
    deks.clear();
    container->write_entry(entry::kRecipients, record_mp::pack_recipients(rs));

    // 3. Policy and evidence
    if (!req.policy_path.empty()) {
        std::vector<uint8_t> raw = read_input(req.policy_path, cfg.max_entry_size, "policy");
        PolicyDocument policy = parse_policy(raw, req.policy_path);
        m.policy_id      = policy.id;
        m.policy_version = policy.version;
        m.policy_hash    = policy.hash;
        container->write_entry(entry::kPolicy, policy.raw);
        container->write_entry(entry::kPolicyHash,
                               std::vector<uint8_t>(policy.hash.begin(), policy.hash.end()));
    }

    for (const auto& ev : req.evidence) {
        if (ev.type.empty())
            throw std::invalid_argument("evidence " + ev.path + " has no type");
        std::vector<uint8_t> data = read_input(ev.path, cfg.max_entry_size, "evidence");
        std::string filename = path_guard::sanitize_filename(base_name(ev.path));
        std::string name = std::string(entry::kEvidenceDir) + filename;
        if (container->has_entry(name))
            throw std::invalid_argument("duplicate evidence filename '" + filename + "'");

        EvidenceDescriptor d;
        d.type     = ev.type;
        d.filename = filename;
        d.hash     = sha256_hex(data);
        container->write_entry(name, data);
        m.evidence.push_back(std::move(d));
    }

    // Archive bookkeeping, outside the inventory
    canon::Value meta = canon::Value::map();
    meta.set("container_version", canon::Value::integer(CONTAINER_VERSION));
    meta.set("format_version",    canon::Value::string(kFormatVersion));
    container->write_entry(entry::kMetaContainer, canon::encode(meta));

    // 4. Inventory every entry written so far
    m.file_inventory = container->hash_all_entries();

    // 5. Encode and sign
    if (req.signing_key)
        m.producer_signing_public_key = req.signing_key->public_key();
    std::vector<uint8_t> manifest_bytes = record_mp::pack_manifest(m);

    if (req.signing_key) {
        SignatureBlock sb;
        sb.algorithm = "ed25519";
        sb.key_id    = key_id::derive(m.producer_signing_public_key);
        sb.signature = req.signing_key->sign(manifest_bytes);
        container->write_entry(entry::kSignature, record_mp::pack_signature(sb));
    }

    // 6. Manifest last, then move into place
    container->write_entry(entry::kManifest, manifest_bytes);
    container->commit();
    return m.package_id;
}

// ── verify ────────────────────────────────────────────────────────────────────

struct CheckedPackage {
    PackageManifest      manifest;
    std::vector<uint8_t> manifest_bytes;
    VerifyStatus         status = VerifyStatus::Failed;
};

// Decodes the manifest and keeps the exact bytes it was decoded from.
static PackageManifest read_manifest(Container& c, std::vector<uint8_t>& bytes) {
    if (!c.has_entry(entry::kManifest))
        throw FormatError("package has no manifest");
    bytes = c.read_entry(entry::kManifest);
    PackageManifest m = record_mp::unpack_manifest(bytes);
    if (record_mp::pack_manifest(m) != bytes)
        throw FormatError("manifest is not in canonical form");
    return m;
}

// Reads an inventoried entry again and checks it against the manifest hash.
static std::vector<uint8_t> read_inventoried(Container& c, const PackageManifest& m,
                                             const std::string& name)
{
    auto it = m.file_inventory.find(name);
    if (it == m.file_inventory.end())
        throw IntegrityError("entry '" + name + "' is not in the inventory");
    std::vector<uint8_t> data = c.read_entry(name);
    if (!digest_equal(sha256_hex(data), it->second))
        throw IntegrityError("entry '" + name + "' changed after verification");
    return data;
}

static void check_inventory(Container& c, const PackageManifest& m) {
    const std::map<std::string, std::string> actual = c.hash_all_entries();

    for (const auto& kv : m.file_inventory) {
        if (is_exempt_entry(kv.first))
            throw IntegrityError("inventory lists reserved entry '" + kv.first + "'");
        auto it = actual.find(kv.first);
        if (it == actual.end())
            throw IntegrityError("entry '" + kv.first + "' listed in manifest is missing");
        if (!digest_equal(it->second, kv.second))
            throw IntegrityError("hash mismatch for entry '" + kv.first + "'");
    }

    for (const auto& name : c.list_entries()) {
        if (is_exempt_entry(name))
            continue;
        if (!m.file_inventory.count(name))
            throw IntegrityError("unregistered entry '" + name + "'");
    }

    // Descriptors must agree with the inventory they travel with
    if (!m.file_inventory.count(entry::kRecipients))
        throw FormatError("package has no recipients entry");
    for (const auto& p : m.payloads) {
        auto it = m.file_inventory.find(payload_entry(p.payload_id));
        if (it == m.file_inventory.end())
            throw IntegrityError("payload '" + p.payload_id + "' has no ciphertext entry");
        if (!digest_equal(it->second, p.enc_hash))
            throw IntegrityError("payload '" + p.payload_id + "': enc_hash does not match entry");
    }
    for (const auto& e : m.evidence) {
        auto it = m.file_inventory.find(std::string(entry::kEvidenceDir) + e.filename);
        if (it == m.file_inventory.end() || !digest_equal(it->second, e.hash))
            throw IntegrityError("evidence '" + e.filename + "' does not match its entry");
    }
    if (!m.policy_hash.empty()) {
        auto it = m.file_inventory.find(entry::kPolicy);
        if (it == m.file_inventory.end() || !digest_equal(it->second, m.policy_hash))
            throw IntegrityError("policy does not match policy_hash");
    }
}

static VerifyStatus check_signature(const EngineConfig& cfg,
                                    Container& c,
                                    const std::vector<uint8_t>& manifest_bytes,
                                    const PackageManifest& m,
                                    const std::vector<uint8_t>* trusted_key)
{
    const auto& pk = m.producer_signing_public_key;

    if (!c.has_entry(entry::kSignature)) {
        if (!pk.empty())
            throw AuthenticationError("manifest names a signing key but the signature is missing");
        if (trusted_key)
            throw AuthenticationError("package is unsigned but a trusted key was given");
        if (cfg.require_signature)
            throw AuthenticationError("package is unsigned and configuration requires a signature");
        return VerifyStatus::Unauthenticated;
    }

    SignatureBlock sb = record_mp::unpack_signature(c.read_entry(entry::kSignature));
    if (sb.algorithm != "ed25519")
        throw AuthenticationError("unsupported signature algorithm '" + sb.algorithm + "'");
    if (pk.size() != ec_sig::ED25519_KEY_LEN)
        throw AuthenticationError("signature present but manifest has no valid signing key");
    if (sb.key_id != key_id::derive(pk))
        throw AuthenticationError("signature key id does not match manifest signing key");
    if (!ec_sig::ed25519_verify(pk, manifest_bytes, sb.signature))
        throw AuthenticationError("manifest signature is invalid");
    if (trusted_key && *trusted_key != pk)
        throw AuthenticationError("package was signed by key " + sb.key_id +
                                  ", not the trusted key " + key_id::derive(*trusted_key));
    return VerifyStatus::Authenticated;
}

static CheckedPackage check_package(const EngineConfig& cfg,
                                    Container& c,
                                    const std::vector<uint8_t>* trusted_key)
{
    CheckedPackage out;
    out.manifest = read_manifest(c, out.manifest_bytes);
    check_inventory(c, out.manifest);
    out.status = check_signature(cfg, c, out.manifest_bytes, out.manifest, trusted_key);
    return out;
}

VerifyResult verify(const EngineConfig& cfg,
                    const std::string& package_path,
                    const std::vector<uint8_t>* trusted_key)
{
    VerifyResult r;
    try {
        auto c = Container::open(package_path, ContainerMode::Read, cfg);
        CheckedPackage checked = check_package(cfg, *c, trusted_key);
        r.ok         = true;
        r.status     = checked.status;
        r.reason     = "OK";
        r.package_id = checked.manifest.package_id;
    } catch (const PackageError& e) {
        r.ok     = false;
        r.status = VerifyStatus::Failed;
        r.reason = std::string(error_kind_name(e.kind())) + ": " + e.what();
        r.error  = e.kind();
    }
    return r;
}

// ── decrypt ───────────────────────────────────────────────────────────────────

struct Plaintext {
    std::string          payload_id;
    std::string          filename;
    std::vector<uint8_t> bytes;

    Plaintext() = default;
    Plaintext(Plaintext&&) = default;
    Plaintext& operator=(Plaintext&&) = default;
    ~Plaintext() {
        if (!bytes.empty())
            OPENSSL_cleanse(bytes.data(), bytes.size());
    }
};

std::vector<DecryptedFile> decrypt(const EngineConfig& cfg,
                                   const std::string& package_path,
                                   const std::string& recipient_id,
                                   const AgreementKey& recipient_key,
                                   const fs::path& dest_dir)
{
    auto c = Container::open(package_path, ContainerMode::Read, cfg);
    CheckedPackage checked = check_package(cfg, *c, nullptr);
    const PackageManifest& m = checked.manifest;

    RecipientSet rs = record_mp::unpack_recipients(read_inventoried(*c, m, entry::kRecipients));
    const RecipientEntry* mine = nullptr;
    for (const auto& r : rs.recipients) {
        if (r.recipient_id == recipient_id) { mine = &r; break; }
    }
    if (!mine)
        throw RecipientNotFound("package has no recipient '" + recipient_id + "'");

    for (const auto& kv : mine->wrapped_keys) {
        bool known = false;
        for (const auto& p : m.payloads)
            known = known || p.payload_id == kv.first;
        if (!known)
            throw FormatError("recipient '" + recipient_id +
                              "' holds a key for unknown payload '" + kv.first + "'");
    }

    SecretBytes ss  = recipient_key.agree(rs.ephemeral_public_key);
    SecretBytes kek = derive_kek(ss, mine->salt);
    ss.wipe();

    // Everything is decrypted and checked before the first file is written.
    std::vector<Plaintext> plain;
    std::set<std::string> out_names;
    for (const auto& p : m.payloads) {
        auto wk = mine->wrapped_keys.find(p.payload_id);
        if (wk == mine->wrapped_keys.end())
            continue;

        SecretBytes dek = keywrap::unwrap(kek, wk->second);
        std::vector<uint8_t> sealed = c->read_entry(payload_entry(p.payload_id));
        if (!digest_equal(sha256_hex(sealed), p.enc_hash))
            throw IntegrityError("payload '" + p.payload_id + "': ciphertext hash mismatch");

        Plaintext pt;
        pt.payload_id = p.payload_id;
        pt.bytes      = aead::open(p.cipher, dek, sealed, p.payload_id);
        if (pt.bytes.size() != p.size ||
            !digest_equal(sha256_hex(pt.bytes), p.plaintext_hash))
            throw IntegrityError("payload '" + p.payload_id + "': plaintext hash mismatch");

        pt.filename = path_guard::sanitize_filename(p.filename);
        if (!out_names.insert(pt.filename).second)
            throw PathSecurityError("two payloads decrypt to the same filename '" +
                                    pt.filename + "'");
        plain.push_back(std::move(pt));
    }

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec)
        throw std::runtime_error("Cannot create output directory " + dest_dir.string() +
                                 ": " + ec.message());

    std::vector<DecryptedFile> written;
    for (const auto& pt : plain) {
        DecryptedFile f;
        f.payload_id = pt.payload_id;
        f.path       = path_guard::write_file_safely(dest_dir, pt.filename, pt.bytes);
        f.size       = pt.bytes.size();
        written.push_back(std::move(f));
    }
    return written;
}

// ── inspect ───────────────────────────────────────────────────────────────────

PackageSummary inspect(const EngineConfig& cfg, const std::string& package_path) {
    auto c = Container::open(package_path, ContainerMode::Read, cfg);

    PackageSummary s;
    s.entries  = c->list_entries();
    s.manifest = record_mp::unpack_manifest(c->read_entry(entry::kManifest));

    if (c->has_entry(entry::kRecipients)) {
        RecipientSet rs = record_mp::unpack_recipients(c->read_entry(entry::kRecipients));
        for (const auto& r : rs.recipients)
            s.recipient_ids.push_back(r.recipient_id);
    }
    if (c->has_entry(entry::kSignature)) {
        SignatureBlock sb = record_mp::unpack_signature(c->read_entry(entry::kSignature));
        s.has_signature = true;
        s.signer_key_id = sb.key_id;
    }
    return s;
}

} // namespace package_service
