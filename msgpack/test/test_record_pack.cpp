#include "record_pack.hpp"
#include "errors.hpp"
#include <iostream>
#include <functional>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static bool rejects(const std::function<void()>& fn, const char* msg) {
    try {
        fn();
    } catch (const FormatError&) {
        return true;
    }
    return fail(msg);
}

static PackageManifest sample_manifest() {
    PackageManifest m;
    m.package_id     = "12345678-abcd-4000-8000-deadbeefcafe";
    m.created_at     = "2026-01-01T00:00:00Z";
    m.producer_id    = "tgsp-cli";
    m.producer_signing_public_key = std::vector<uint8_t>(32, 0xCC);
    m.base_model_ids = {"llama-3-8b"};
    m.policy_id      = "test-policy";
    m.policy_version = "1.0";
    m.policy_hash    = std::string(64, 'a');

    PayloadDescriptor p;
    p.payload_id     = "adapter";
    p.logical_type   = "lora";
    p.filename       = "model.bin";
    p.cipher         = CipherAlg::ChaCha20Poly1305;
    p.enc_hash       = std::string(64, 'b');
    p.plaintext_hash = std::string(64, 'c');
    p.size           = 21;
    m.payloads.push_back(p);

    EvidenceDescriptor e;
    e.type     = "evaluation_report";
    e.filename = "report.json";
    e.hash     = std::string(64, 'd');
    m.evidence.push_back(e);

    m.file_inventory["payload/adapter.enc"] = p.enc_hash;
    m.file_inventory["recipients"]          = std::string(64, 'e');
    return m;
}

int main() {
    bool ok = true;
    PackageManifest m = sample_manifest();

    // ── manifest ──────────────────────────────────────────────────────────────

    std::vector<uint8_t> packed = record_mp::pack_manifest(m);
    ok &= check(record_mp::pack_manifest(m) == packed, "manifest encoding not deterministic");

    PackageManifest u;
    try {
        u = record_mp::unpack_manifest(packed);
    } catch (const std::exception& e) {
        std::cerr << "FAIL: unpack_manifest threw: " << e.what() << "\n";
        return 1;
    }
    ok &= check(u.package_id == m.package_id, "package_id mismatch");
    ok &= check(u.format_version == "1.0", "format_version mismatch");
    ok &= check(u.producer_signing_public_key == m.producer_signing_public_key, "signing key mismatch");
    ok &= check(u.base_model_ids == m.base_model_ids, "base_model_ids mismatch");
    ok &= check(u.payloads.size() == 1 && u.payloads[0].cipher == CipherAlg::ChaCha20Poly1305,
                "payload cipher mismatch");
    ok &= check(u.payloads.size() == 1 && u.payloads[0].size == 21, "payload size mismatch");
    ok &= check(u.evidence.size() == 1 && u.evidence[0].filename == "report.json",
                "evidence mismatch");
    ok &= check(u.file_inventory == m.file_inventory, "inventory mismatch");
    ok &= check(record_mp::pack_manifest(u) == packed, "re-encoded manifest differs");

    // Changing any field changes the bytes that get signed
    PackageManifest m2 = m;
    m2.payloads[0].size = 22;
    ok &= check(record_mp::pack_manifest(m2) != packed, "size change not reflected in encoding");

    // Cipher is stored by name
    canon::Value v = record_mp::manifest_to_value(m);
    ok &= check(v.at("payloads").as_array()[0].at("cipher").as_str() == "ChaCha20-Poly1305",
                "cipher not stored by name");

    ok &= rejects([&] {
        canon::Value bad = record_mp::manifest_to_value(m);
        bad.set("format_version", canon::Value::string("2.0"));
        record_mp::manifest_from_value(bad);
    }, "format_version 2.0 accepted");

    ok &= rejects([&] {
        canon::Value bad = record_mp::manifest_to_value(m);
        canon::Value p = bad.at("payloads").as_array()[0];
        p.set("cipher", canon::Value::string("DES"));
        bad.set("payloads", canon::Value::array({p}));
        record_mp::manifest_from_value(bad);
    }, "unknown cipher accepted");

    ok &= rejects([&] {
        PackageManifest dup = m;
        dup.payloads.push_back(dup.payloads[0]);
        record_mp::unpack_manifest(record_mp::pack_manifest(dup));
    }, "duplicate payload_id accepted");

    ok &= rejects([&] {
        canon::Value bad = record_mp::manifest_to_value(m);
        bad.entries().erase("file_inventory");
        record_mp::manifest_from_value(bad);
    }, "manifest without file_inventory accepted");

    ok &= rejects([&] {
        std::vector<uint8_t> cut(packed.begin(), packed.end() - 3);
        record_mp::unpack_manifest(cut);
    }, "truncated manifest accepted");

    // ── recipients ────────────────────────────────────────────────────────────

    RecipientSet rs;
    rs.ephemeral_public_key = std::vector<uint8_t>(32, 0x11);
    RecipientEntry r;
    r.recipient_id = "alice";
    r.salt         = std::vector<uint8_t>(32, 0x22);
    r.wrapped_keys["adapter"] = std::vector<uint8_t>(40, 0x33);
    rs.recipients.push_back(r);

    try {
        RecipientSet back = record_mp::unpack_recipients(record_mp::pack_recipients(rs));
        ok &= check(back.ephemeral_public_key == rs.ephemeral_public_key, "epk mismatch");
        ok &= check(back.recipients.size() == 1 && back.recipients[0].recipient_id == "alice",
                    "recipient id mismatch");
        ok &= check(back.recipients.size() == 1 &&
                    back.recipients[0].wrapped_keys.at("adapter") == r.wrapped_keys["adapter"],
                    "wrapped key mismatch");
    } catch (const std::exception& e) {
        std::cerr << "FAIL: recipients threw: " << e.what() << "\n";
        ok = false;
    }

    ok &= rejects([&] {
        RecipientSet dup = rs;
        dup.recipients.push_back(r);
        record_mp::unpack_recipients(record_mp::pack_recipients(dup));
    }, "duplicate recipient id accepted");

    ok &= rejects([&] {
        RecipientSet shortkey = rs;
        shortkey.ephemeral_public_key.resize(31);
        record_mp::unpack_recipients(record_mp::pack_recipients(shortkey));
    }, "31-byte ephemeral key accepted");

    // ── signature ─────────────────────────────────────────────────────────────

    SignatureBlock sb;
    sb.key_id    = "00112233445566778899aabbccddeeff";
    sb.signature = std::vector<uint8_t>(64, 0x44);
    try {
        SignatureBlock back = record_mp::unpack_signature(record_mp::pack_signature(sb));
        ok &= check(back.algorithm == "ed25519", "signature alg mismatch");
        ok &= check(back.key_id == sb.key_id, "signature key_id mismatch");
        ok &= check(back.signature == sb.signature, "signature bytes mismatch");
    } catch (const std::exception& e) {
        std::cerr << "FAIL: signature threw: " << e.what() << "\n";
        ok = false;
    }

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
