#include "test_util.hpp"
#include "container.hpp"
#include "digest.hpp"
#include "key_id.hpp"
#include "key_provider.hpp"
#include "package_service.hpp"
#include "record_pack.hpp"
#include <memory>
#include <cstring>

using Entries = std::vector<std::pair<std::string, std::vector<uint8_t>>>;

static const std::string kSecret = "SECRET_MODEL_DATA_123";

// ── Fixture ───────────────────────────────────────────────────────────────────

struct Fixture {
    TempDir tmp{"package"};
    EngineConfig cfg;
    std::unique_ptr<LocalSigningKey>   producer = LocalSigningKey::generate();
    std::unique_ptr<LocalAgreementKey> alice    = LocalAgreementKey::generate();
    std::unique_ptr<LocalAgreementKey> bob      = LocalAgreementKey::generate();
    std::string secret_path;
    std::string weights_path;
    std::string policy_path;
    std::string report_path;

    Fixture() {
        secret_path  = tmp.file("model.bin");
        weights_path = tmp.file("weights.safetensors");
        policy_path  = tmp.file("policy.yaml");
        report_path  = tmp.file("report.json");
        write_text(secret_path, kSecret);
        std::string weights;
        for (int i = 0; i < 20000; ++i) weights += "w" + std::to_string(i % 97) + ",";
        write_text(weights_path, weights);
        write_text(policy_path, "id: test-policy\nversion: 1.0\n");
        write_text(report_path, "{\"accuracy\": 0.93}\n");
    }

    CreateRequest request(const std::string& out, bool sign) const {
        CreateRequest req;
        req.out_path = out;
        req.payloads.push_back({"adapter", "lora", secret_path, std::nullopt});
        req.recipients.push_back({"alice", alice->public_key()});
        if (sign) req.signing_key = producer.get();
        return req;
    }
};

static Entries read_all(const std::string& path, const EngineConfig& cfg) {
    auto c = Container::open(path, ContainerMode::Read, cfg);
    Entries out;
    for (const auto& name : c->list_entries())
        out.push_back({name, c->read_entry(name)});
    return out;
}

static void write_all(const std::string& path, const EngineConfig& cfg, const Entries& entries) {
    auto c = Container::open(path, ContainerMode::Write, cfg);
    for (const auto& e : entries)
        c->write_entry(e.first, e.second);
    c->commit();
}

static std::vector<uint8_t>& entry_data(Entries& entries, const std::string& name) {
    for (auto& e : entries)
        if (e.first == name) return e.second;
    throw std::runtime_error("test: no entry " + name);
}

static void drop_entry(Entries& entries, const std::string& name) {
    for (auto it = entries.begin(); it != entries.end(); ++it)
        if (it->first == name) { entries.erase(it); return; }
    throw std::runtime_error("test: no entry " + name);
}

static bool dir_empty(const fs::path& p) {
    return !fs::exists(p) || fs::is_empty(p);
}

static bool verify_fails_with(const EngineConfig& cfg, const std::string& path,
                              ErrorKind kind, const std::string& msg,
                              const std::vector<uint8_t>* trusted = nullptr)
{
    VerifyResult r = package_service::verify(cfg, path, trusted);
    if (r.ok)
        return fail(msg + " (verify passed)");
    if (!r.error || *r.error != kind)
        return fail(msg + " (reason: " + r.reason + ")");
    return check(r.reason.compare(0, std::strlen(error_kind_name(kind)),
                                  error_kind_name(kind)) == 0,
                 msg + " (reason lacks kind name: " + r.reason + ")");
}

// ── Scenarios ─────────────────────────────────────────────────────────────────

static bool test_secret_scenario(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("scenario.tgsp");
    CreateRequest req = f.request(pkg, false);
    req.policy_path = f.policy_path;

    std::string id = package_service::create(f.cfg, req);
    ok &= check(id.size() == 36 && id[14] == '4', "package_id is not a UUID v4");

    VerifyResult v = package_service::verify(f.cfg, pkg);
    ok &= check(v.ok && v.reason == "OK", "verify did not return OK: " + v.reason);
    ok &= check(v.status == VerifyStatus::Unauthenticated, "unsigned package not flagged");
    ok &= check(v.package_id == id, "verify reported another package_id");

    fs::path out = f.tmp.path() / "scenario-out";
    std::vector<DecryptedFile> files =
        package_service::decrypt(f.cfg, pkg, "alice", *f.alice, out);
    ok &= check(files.size() == 1, "expected one decrypted file");
    ok &= check(slurp((out / "model.bin").string()) == bytes_of(kSecret),
                "decrypted bytes differ from SECRET_MODEL_DATA_123");

    fs::path out2 = f.tmp.path() / "scenario-out2";
    ok &= expect_kind(ErrorKind::RecipientNotFound, [&] {
        package_service::decrypt(f.cfg, pkg, "mallory", *f.alice, out2);
    }, "unknown recipient id accepted");
    ok &= check(dir_empty(out2), "output written for unknown recipient");

    PackageSummary s = package_service::inspect(f.cfg, pkg);
    ok &= check(s.manifest.policy_id == "test-policy" && s.manifest.policy_version == "1.0",
                "policy identity not recorded");
    ok &= check(s.manifest.policy_hash == sha256_hex(slurp(f.policy_path)), "policy hash wrong");
    ok &= check(s.recipient_ids == std::vector<std::string>({"alice"}), "inspect recipients");
    ok &= check(!s.has_signature, "inspect claims a signature");
    return ok;
}

static bool test_round_trip_full(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("full.tgsp");
    CreateRequest req = f.request(pkg, true);
    req.payloads.push_back({"weights", "full_weights", f.weights_path, CipherAlg::ChaCha20Poly1305});
    req.recipients.push_back({"bob", f.bob->public_key()});
    req.policy_path = f.policy_path;
    req.evidence.push_back({"evaluation_report", f.report_path});
    req.base_model_ids = {"llama-3-8b"};

    package_service::create(f.cfg, req);

    VerifyResult v = package_service::verify(f.cfg, pkg);
    ok &= check(v.ok && v.status == VerifyStatus::Authenticated, "signed package: " + v.reason);

    std::vector<uint8_t> pk = f.producer->public_key();
    VerifyResult vt = package_service::verify(f.cfg, pkg, &pk);
    ok &= check(vt.ok, "trusted key rejected: " + vt.reason);

    for (const char* who : {"alice", "bob"}) {
        const AgreementKey& key = std::string(who) == "alice"
            ? static_cast<const AgreementKey&>(*f.alice) : *f.bob;
        fs::path out = f.tmp.path() / (std::string("full-") + who);
        std::vector<DecryptedFile> files = package_service::decrypt(f.cfg, pkg, who, key, out);
        ok &= check(files.size() == 2, std::string(who) + ": expected two files");
        ok &= check(slurp((out / "model.bin").string()) == slurp(f.secret_path),
                    std::string(who) + ": adapter differs");
        ok &= check(slurp((out / "weights.safetensors").string()) == slurp(f.weights_path),
                    std::string(who) + ": weights differ");
    }

    PackageSummary s = package_service::inspect(f.cfg, pkg);
    ok &= check(s.has_signature && s.signer_key_id == key_id::derive(pk), "signer key id");
    ok &= check(s.manifest.payloads.size() == 2 &&
                s.manifest.payloads[1].cipher == CipherAlg::ChaCha20Poly1305,
                "per-payload cipher not recorded");
    ok &= check(s.manifest.evidence.size() == 1 &&
                s.manifest.evidence[0].hash == sha256_hex(slurp(f.report_path)), "evidence");
    ok &= check(s.manifest.base_model_ids == req.base_model_ids, "base model ids");
    ok &= check(s.manifest.file_inventory.count("evidence/report.json") &&
                s.manifest.file_inventory.count("policy") &&
                s.manifest.file_inventory.count("policy.hash") &&
                s.manifest.file_inventory.count("recipients") &&
                !s.manifest.file_inventory.count("manifest") &&
                !s.manifest.file_inventory.count("META/container"),
                "inventory contents");
    return ok;
}

static bool test_tamper(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("tamper.tgsp");
    package_service::create(f.cfg, f.request(pkg, true));
    std::vector<uint8_t> bytes = slurp(pkg);

    // Bit flips in the stored bytes of the payload and of the manifest
    for (const std::string name : {"payload/adapter.enc", "manifest"}) {
        auto c = Container::open(pkg, ContainerMode::Read, f.cfg);
        const EntryInfo& info = c->entry_info(name);
        std::vector<uint8_t> flipped = bytes;
        flipped[info.offset + info.stored_size / 2] ^= 0x10;
        std::string bad = f.tmp.file("flip.tgsp");
        write_bytes(bad, flipped);

        ok &= verify_fails_with(f.cfg, bad, ErrorKind::Integrity, "bit flip in " + name);
        fs::path out = f.tmp.path() / "flip-out";
        ok &= expect_kind(ErrorKind::Integrity, [&] {
            package_service::decrypt(f.cfg, bad, "alice", *f.alice, out);
        }, "decrypt after bit flip in " + name);
        ok &= check(dir_empty(out), "decrypt wrote output after bit flip in " + name);
    }

    // Well-formed container with a substituted ciphertext
    Entries entries = read_all(pkg, f.cfg);
    entry_data(entries, "payload/adapter.enc")[20] ^= 0x01;
    std::string swapped = f.tmp.file("swapped.tgsp");
    write_all(swapped, f.cfg, entries);
    ok &= verify_fails_with(f.cfg, swapped, ErrorKind::Integrity, "substituted ciphertext");

    // Manifest edited and re-encoded: the old signature no longer matches
    entries = read_all(pkg, f.cfg);
    PackageManifest m = record_mp::unpack_manifest(entry_data(entries, "manifest"));
    m.producer_id = "someone-else";
    entry_data(entries, "manifest") = record_mp::pack_manifest(m);
    std::string edited = f.tmp.file("edited.tgsp");
    write_all(edited, f.cfg, entries);
    ok &= verify_fails_with(f.cfg, edited, ErrorKind::Authentication, "edited manifest");

    // Well-formed recipients record from another package
    std::string donor = f.tmp.file("donor.tgsp");
    package_service::create(f.cfg, f.request(donor, true));
    Entries donor_entries = read_all(donor, f.cfg);
    entries = read_all(pkg, f.cfg);
    entry_data(entries, "recipients") = entry_data(donor_entries, "recipients");
    std::string rewrapped = f.tmp.file("rewrapped.tgsp");
    write_all(rewrapped, f.cfg, entries);
    fs::path rw_out = f.tmp.path() / "rewrapped-out";
    ok &= expect_kind(ErrorKind::Integrity, [&] {
        package_service::decrypt(f.cfg, rewrapped, "alice", *f.alice, rw_out);
    }, "decrypt with substituted recipients entry");
    ok &= check(dir_empty(rw_out), "decrypt wrote output with substituted recipients entry");
    return ok;
}

static bool test_whitelist(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("white.tgsp");
    package_service::create(f.cfg, f.request(pkg, true));

    Entries entries = read_all(pkg, f.cfg);
    entries.push_back({"payload/extra.bin", bytes_of("smuggled")});
    std::string injected = f.tmp.file("injected.tgsp");
    write_all(injected, f.cfg, entries);
    ok &= verify_fails_with(f.cfg, injected, ErrorKind::Integrity, "unregistered entry");

    // A listed entry that is missing
    entries = read_all(pkg, f.cfg);
    drop_entry(entries, "recipients");
    std::string missing = f.tmp.file("missing.tgsp");
    write_all(missing, f.cfg, entries);
    ok &= verify_fails_with(f.cfg, missing, ErrorKind::Integrity, "missing inventoried entry");

    // META/ is bookkeeping and may hold anything
    entries = read_all(pkg, f.cfg);
    entries.push_back({"META/notes", bytes_of("archiver notes")});
    std::string meta = f.tmp.file("meta.tgsp");
    write_all(meta, f.cfg, entries);
    VerifyResult v = package_service::verify(f.cfg, meta);
    ok &= check(v.ok, "META/ entry broke verification: " + v.reason);
    return ok;
}

static bool test_signatures(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("signed.tgsp");
    package_service::create(f.cfg, f.request(pkg, true));

    // Stripped signature
    Entries entries = read_all(pkg, f.cfg);
    drop_entry(entries, "signature");
    std::string stripped = f.tmp.file("stripped.tgsp");
    write_all(stripped, f.cfg, entries);
    ok &= verify_fails_with(f.cfg, stripped, ErrorKind::Authentication, "stripped signature");

    // Signature from another key under the original key id
    entries = read_all(pkg, f.cfg);
    auto intruder = LocalSigningKey::generate();
    SignatureBlock sb = record_mp::unpack_signature(entry_data(entries, "signature"));
    sb.signature = intruder->sign(entry_data(entries, "manifest"));
    entry_data(entries, "signature") = record_mp::pack_signature(sb);
    std::string forged = f.tmp.file("forged.tgsp");
    write_all(forged, f.cfg, entries);
    ok &= verify_fails_with(f.cfg, forged, ErrorKind::Authentication, "forged signature");

    // Valid signature, but not by the trusted producer
    std::vector<uint8_t> other_pk = intruder->public_key();
    ok &= verify_fails_with(f.cfg, pkg, ErrorKind::Authentication, "untrusted signer", &other_pk);

    // Unsigned package under a signature requirement
    std::string unsigned_pkg = f.tmp.file("unsigned.tgsp");
    package_service::create(f.cfg, f.request(unsigned_pkg, false));
    EngineConfig strict = f.cfg;
    strict.require_signature = true;
    ok &= verify_fails_with(strict, unsigned_pkg, ErrorKind::Authentication,
                            "unsigned package under require_signature");
    std::vector<uint8_t> pk = f.producer->public_key();
    ok &= verify_fails_with(f.cfg, unsigned_pkg, ErrorKind::Authentication,
                            "unsigned package with trusted key", &pk);
    ok &= expect_throw<std::invalid_argument>([&] {
        package_service::create(strict, f.request(f.tmp.file("never.tgsp"), false));
    }, "create without key under require_signature");
    ok &= check(!fs::exists(f.tmp.file("never.tgsp")), "refused create left a file");
    return ok;
}

static bool test_wrong_recipient(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("recip.tgsp");
    package_service::create(f.cfg, f.request(pkg, false));

    fs::path out = f.tmp.path() / "wrong-out";
    ok &= expect_kind(ErrorKind::Crypto, [&] {
        package_service::decrypt(f.cfg, pkg, "alice", *f.bob, out);
    }, "bob's key opened alice's slot");
    auto random_key = LocalAgreementKey::generate();
    ok &= expect_kind(ErrorKind::Crypto, [&] {
        package_service::decrypt(f.cfg, pkg, "alice", *random_key, out);
    }, "random key opened alice's slot");
    ok &= check(dir_empty(out), "wrong key produced output");
    return ok;
}

static bool test_path_traversal(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("trav.tgsp");
    package_service::create(f.cfg, f.request(pkg, false));

    for (const std::string evil : {"../escape.bin", "/tmp/abs.bin", "..\\win.bin"}) {
        Entries entries = read_all(pkg, f.cfg);
        PackageManifest m = record_mp::unpack_manifest(entry_data(entries, "manifest"));
        m.payloads[0].filename = evil;
        entry_data(entries, "manifest") = record_mp::pack_manifest(m);
        std::string hostile = f.tmp.file("hostile.tgsp");
        write_all(hostile, f.cfg, entries);

        fs::path out = f.tmp.path() / "trav-out";
        ok &= expect_kind(ErrorKind::PathSecurity, [&] {
            package_service::decrypt(f.cfg, hostile, "alice", *f.alice, out);
        }, "traversal filename accepted: " + evil);
        ok &= check(dir_empty(out), "output written for " + evil);
    }
    ok &= check(!fs::exists(f.tmp.path() / "escape.bin"), "file escaped the destination");
    return ok;
}

static bool test_limits(Fixture& f) {
    bool ok = true;
    std::string pkg = f.tmp.file("big.tgsp");
    CreateRequest req = f.request(pkg, false);
    req.payloads[0].path = f.weights_path;
    package_service::create(f.cfg, req);

    EngineConfig tight = f.cfg;
    tight.max_entry_size = 4096;
    ok &= verify_fails_with(tight, pkg, ErrorKind::ResourceLimit, "oversize entry on verify");
    ok &= expect_kind(ErrorKind::ResourceLimit, [&] {
        CreateRequest big = f.request(f.tmp.file("too-big.tgsp"), false);
        big.payloads[0].path = f.weights_path;
        package_service::create(tight, big);
    }, "oversize payload packaged");
    ok &= check(!fs::exists(f.tmp.file("too-big.tgsp")), "partial package left behind");
    return ok;
}

static bool test_bad_requests(Fixture& f) {
    bool ok = true;
    std::string out = f.tmp.file("bad.tgsp");

    CreateRequest dup = f.request(out, false);
    dup.payloads.push_back(dup.payloads[0]);
    ok &= expect_throw<std::invalid_argument>([&] { package_service::create(f.cfg, dup); },
                                              "duplicate payload id accepted");

    CreateRequest slash = f.request(out, false);
    slash.payloads[0].payload_id = "../x";
    ok &= expect_throw<std::invalid_argument>([&] { package_service::create(f.cfg, slash); },
                                              "payload id with '/' accepted");

    CreateRequest none = f.request(out, false);
    none.recipients.clear();
    ok &= expect_throw<std::invalid_argument>([&] { package_service::create(f.cfg, none); },
                                              "package without recipients accepted");

    CreateRequest missing = f.request(out, false);
    missing.payloads[0].path = f.tmp.file("does-not-exist.bin");
    ok &= expect_throw<std::runtime_error>([&] { package_service::create(f.cfg, missing); },
                                           "missing payload file accepted");
    ok &= check(!fs::exists(out), "failed create left a package");

    // Two payloads from different directories with the same basename
    fs::create_directories(f.tmp.path() / "m1");
    fs::create_directories(f.tmp.path() / "m2");
    write_text((f.tmp.path() / "m1" / "adapter.bin").string(), "first");
    write_text((f.tmp.path() / "m2" / "adapter.bin").string(), "second");
    CreateRequest clash = f.request(out, true);
    clash.payloads.clear();
    clash.payloads.push_back({"a", "lora", (f.tmp.path() / "m1" / "adapter.bin").string(), std::nullopt});
    clash.payloads.push_back({"b", "lora", (f.tmp.path() / "m2" / "adapter.bin").string(), std::nullopt});
    ok &= expect_throw<std::invalid_argument>([&] { package_service::create(f.cfg, clash); },
                                              "payloads sharing an output filename accepted");
    ok &= check(!fs::exists(out), "create with clashing filenames left a package");
    return ok;
}

static bool test_payload_args() {
    bool ok = true;
    PayloadInput plain = package_service::parse_payload_arg("adapter:lora:/models/a.bin");
    ok &= check(plain.payload_id == "adapter" && plain.logical_type == "lora" &&
                plain.path == "/models/a.bin" && !plain.cipher, "plain payload argument");

    PayloadInput with_cipher = package_service::parse_payload_arg("w:full_weights:w.st:ChaCha20");
    ok &= check(with_cipher.path == "w.st" &&
                with_cipher.cipher == CipherAlg::ChaCha20Poly1305, "payload cipher field");

    PayloadInput colon_path = package_service::parse_payload_arg("a:lora:C:/models/run:3/a.bin");
    ok &= check(colon_path.path == "C:/models/run:3/a.bin" && !colon_path.cipher,
                "colon in payload path: " + colon_path.path);

    PayloadInput both = package_service::parse_payload_arg("a:lora:/x:y/a.bin:AES-256-GCM");
    ok &= check(both.path == "/x:y/a.bin" && both.cipher == CipherAlg::AES256GCM,
                "colon in path with cipher field: " + both.path);

    for (const char* bad : {"adapter", "adapter:lora", "adapter:lora:"})
        ok &= expect_throw<std::invalid_argument>([&] { package_service::parse_payload_arg(bad); },
                                                  std::string("payload argument accepted: ") + bad);
    return ok;
}

int main() {
    bool ok = true;
    try {
        Fixture f;
        ok &= test_secret_scenario(f);
        ok &= test_round_trip_full(f);
        ok &= test_tamper(f);
        ok &= test_whitelist(f);
        ok &= test_signatures(f);
        ok &= test_wrong_recipient(f);
        ok &= test_path_traversal(f);
        ok &= test_limits(f);
        ok &= test_bad_requests(f);
        ok &= test_payload_args();
    } catch (const std::exception& e) {
        std::cerr << "FAIL: unexpected exception: " << e.what() << "\n";
        return 1;
    }

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
