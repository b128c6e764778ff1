#include "record_pack.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <string>

namespace record_mp {

using canon::Value;

static const int64_t kRecipientsVersion = 1;

// ── helpers ───────────────────────────────────────────────────────────────────

static Value str_array(const std::vector<std::string>& items) {
    Value::Array arr;
    for (const auto& s : items)
        arr.push_back(Value::string(s));
    return Value::array(std::move(arr));
}

static std::vector<std::string> require_str_array(const Value& v, const char* ctx) {
    std::vector<std::string> out;
    for (const auto& item : v.as_array(ctx))
        out.push_back(item.as_str(ctx));
    return out;
}

static CipherAlg require_cipher(const Value& v) {
    const std::string& name = v.as_str("payload 'cipher'");
    try {
        return cipher_from_name(name);
    } catch (const std::invalid_argument&) {
        throw FormatError("unsupported payload cipher '" + name + "'");
    }
}

static void check_format_version(const std::string& ver) {
    // "1" or "1.<minor>"
    if (ver != "1" && ver.compare(0, 2, "1.") != 0)
        throw FormatError("unknown format version '" + ver + "'");
}

// ── manifest ──────────────────────────────────────────────────────────────────

Value manifest_to_value(const PackageManifest& m) {
    Value payloads = Value::array();
    for (const auto& p : m.payloads) {
        Value d = Value::map();
        d.set("payload_id",     Value::string(p.payload_id));
        d.set("logical_type",   Value::string(p.logical_type));
        d.set("filename",       Value::string(p.filename));
        d.set("cipher",         Value::string(cipher_name(p.cipher)));
        d.set("enc_hash",       Value::string(p.enc_hash));
        d.set("plaintext_hash", Value::string(p.plaintext_hash));
        d.set("size",           Value::integer(static_cast<int64_t>(p.size)));
        payloads.items().push_back(std::move(d));
    }

    Value evidence = Value::array();
    for (const auto& e : m.evidence) {
        Value d = Value::map();
        d.set("type",     Value::string(e.type));
        d.set("filename", Value::string(e.filename));
        d.set("hash",     Value::string(e.hash));
        evidence.items().push_back(std::move(d));
    }

    Value inventory = Value::map();
    for (const auto& kv : m.file_inventory)
        inventory.set(kv.first, Value::string(kv.second));

    Value v = Value::map();
    v.set("package_id",                  Value::string(m.package_id));
    v.set("format_version",              Value::string(m.format_version));
    v.set("created_at",                  Value::string(m.created_at));
    v.set("producer_id",                 Value::string(m.producer_id));
    v.set("producer_signing_public_key", Value::binary(m.producer_signing_public_key));
    v.set("base_model_ids",              str_array(m.base_model_ids));
    v.set("policy_id",                   Value::string(m.policy_id));
    v.set("policy_version",              Value::string(m.policy_version));
    v.set("policy_hash",                 Value::string(m.policy_hash));
    v.set("payloads",                    std::move(payloads));
    v.set("evidence",                    std::move(evidence));
    v.set("file_inventory",              std::move(inventory));
    return v;
}

PackageManifest manifest_from_value(const Value& v) {
    v.as_map("manifest");

    PackageManifest m;
    m.format_version = v.at("format_version").as_str("'format_version'");
    check_format_version(m.format_version);

    m.package_id     = v.at("package_id").as_str("'package_id'");
    m.created_at     = v.at("created_at").as_str("'created_at'");
    m.producer_id    = v.at("producer_id").as_str("'producer_id'");
    m.producer_signing_public_key =
        v.at("producer_signing_public_key").as_bin("'producer_signing_public_key'");
    m.base_model_ids = require_str_array(v.at("base_model_ids"), "'base_model_ids'");
    m.policy_id      = v.at("policy_id").as_str("'policy_id'");
    m.policy_version = v.at("policy_version").as_str("'policy_version'");
    m.policy_hash    = v.at("policy_hash").as_str("'policy_hash'");

    if (m.package_id.empty())
        throw FormatError("manifest: empty package_id");

    for (const auto& d : v.at("payloads").as_array("'payloads'")) {
        PayloadDescriptor p;
        p.payload_id     = d.at("payload_id").as_str("payload 'payload_id'");
        p.logical_type   = d.at("logical_type").as_str("payload 'logical_type'");
        p.filename       = d.at("filename").as_str("payload 'filename'");
        p.cipher         = require_cipher(d.at("cipher"));
        p.enc_hash       = d.at("enc_hash").as_str("payload 'enc_hash'");
        p.plaintext_hash = d.at("plaintext_hash").as_str("payload 'plaintext_hash'");
        int64_t size     = d.at("size").as_int("payload 'size'");
        if (size < 0)
            throw FormatError("payload 'size' is negative");
        p.size = static_cast<uint64_t>(size);
        for (const auto& prev : m.payloads) {
            if (prev.payload_id == p.payload_id)
                throw FormatError("manifest: duplicate payload_id '" + p.payload_id + "'");
        }
        m.payloads.push_back(std::move(p));
    }

    for (const auto& d : v.at("evidence").as_array("'evidence'")) {
        EvidenceDescriptor e;
        e.type     = d.at("type").as_str("evidence 'type'");
        e.filename = d.at("filename").as_str("evidence 'filename'");
        e.hash     = d.at("hash").as_str("evidence 'hash'");
        m.evidence.push_back(std::move(e));
    }

    for (const auto& kv : v.at("file_inventory").as_map("'file_inventory'"))
        m.file_inventory[kv.first] = kv.second.as_str("file_inventory value");

    return m;
}

std::vector<uint8_t> pack_manifest(const PackageManifest& m) {
    return canon::encode(manifest_to_value(m));
}

PackageManifest unpack_manifest(const std::vector<uint8_t>& data) {
    return manifest_from_value(canon::decode(data));
}

// ── recipients ────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack_recipients(const RecipientSet& r) {
    Value list = Value::array();
    for (const auto& rec : r.recipients) {
        Value keys = Value::map();
        for (const auto& kv : rec.wrapped_keys)
            keys.set(kv.first, Value::binary(kv.second));

        Value e = Value::map();
        e.set("id",   Value::string(rec.recipient_id));
        e.set("salt", Value::binary(rec.salt));
        e.set("keys", std::move(keys));
        list.items().push_back(std::move(e));
    }

    Value v = Value::map();
    v.set("v",          Value::integer(kRecipientsVersion));
    v.set("kem",        Value::string("X25519"));
    v.set("kdf",        Value::string("HKDF-SHA256"));
    v.set("wrap",       Value::string("AES-256-KW"));
    v.set("epk",        Value::binary(r.ephemeral_public_key));
    v.set("recipients", std::move(list));
    return canon::encode(v);
}

RecipientSet unpack_recipients(const std::vector<uint8_t>& data) {
    Value v = canon::decode(data);
    v.as_map("recipients");

    if (v.at("v").as_int("'v'") != kRecipientsVersion)
        throw FormatError("recipients: unsupported version");
    if (v.at("kem").as_str("'kem'")  != "X25519" ||
        v.at("kdf").as_str("'kdf'")  != "HKDF-SHA256" ||
        v.at("wrap").as_str("'wrap'") != "AES-256-KW")
        throw FormatError("recipients: unsupported algorithm suite");

    RecipientSet r;
    r.ephemeral_public_key = v.at("epk").as_bin("'epk'");
    if (r.ephemeral_public_key.size() != 32)
        throw FormatError("recipients: ephemeral key must be 32 bytes");

    for (const auto& e : v.at("recipients").as_array("'recipients'")) {
        RecipientEntry rec;
        rec.recipient_id = e.at("id").as_str("recipient 'id'");
        rec.salt         = e.at("salt").as_bin("recipient 'salt'");
        for (const auto& kv : e.at("keys").as_map("recipient 'keys'"))
            rec.wrapped_keys[kv.first] = kv.second.as_bin("wrapped key");
        for (const auto& prev : r.recipients) {
            if (prev.recipient_id == rec.recipient_id)
                throw FormatError("recipients: duplicate id '" + rec.recipient_id + "'");
        }
        r.recipients.push_back(std::move(rec));
    }
    return r;
}

// ── signature ─────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack_signature(const SignatureBlock& s) {
    Value v = Value::map();
    v.set("alg",    Value::string(s.algorithm));
    v.set("key_id", Value::string(s.key_id));
    v.set("sig",    Value::binary(s.signature));
    return canon::encode(v);
}

SignatureBlock unpack_signature(const std::vector<uint8_t>& data) {
    Value v = canon::decode(data);
    v.as_map("signature");

    SignatureBlock s;
    s.algorithm = v.at("alg").as_str("'alg'");
    s.key_id    = v.at("key_id").as_str("'key_id'");
    s.signature = v.at("sig").as_bin("'sig'");
    return s;
}

} // namespace record_mp
