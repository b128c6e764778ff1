#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

// Package format generation written into every manifest. Readers accept any
// "1.x"; a different major version is a FormatError.
static constexpr char kFormatVersion[] = "1.0";

enum class CipherAlg : uint8_t { AES256GCM = 0, ChaCha20Poly1305 = 1 };

struct PayloadDescriptor {
    std::string payload_id;      // unique within the package
    std::string logical_type;    // free-form tag, e.g. "adapter"
    std::string filename;        // basename written on decrypt
    CipherAlg   cipher = CipherAlg::AES256GCM;
    std::string enc_hash;        // hex SHA-256 of nonce || ciphertext || tag
    std::string plaintext_hash;  // hex SHA-256 of the original content
    uint64_t    size = 0;        // plaintext length in bytes
};

struct EvidenceDescriptor {
    std::string type;            // e.g. "evaluation_report"
    std::string filename;
    std::string hash;            // hex SHA-256
};

struct PackageManifest {
    std::string package_id;      // UUID v4
    std::string format_version = kFormatVersion;
    std::string created_at;      // ISO 8601 UTC
    std::string producer_id;
    std::vector<uint8_t> producer_signing_public_key;  // empty if unsigned
    std::vector<std::string> base_model_ids;
    std::string policy_id;
    std::string policy_version;
    std::string policy_hash;
    std::vector<PayloadDescriptor>  payloads;
    std::vector<EvidenceDescriptor> evidence;
    std::map<std::string, std::string> file_inventory;  // entry name -> hex SHA-256
};

struct RecipientEntry {
    std::string recipient_id;
    std::vector<uint8_t> salt;                                   // HKDF salt, 32 bytes
    std::map<std::string, std::vector<uint8_t>> wrapped_keys;    // payload_id -> AES-KW(KEK, DEK)
};

struct RecipientSet {
    std::vector<uint8_t> ephemeral_public_key;  // X25519, shared by all recipients
    std::vector<RecipientEntry> recipients;
};

struct SignatureBlock {
    std::string algorithm = "ed25519";
    std::string key_id;                         // see key_id::derive
    std::vector<uint8_t> signature;
};

// Logical entry names inside the container.
namespace entry {
    static constexpr char kManifest[]   = "manifest";
    static constexpr char kRecipients[] = "recipients";
    static constexpr char kSignature[]  = "signature";
    static constexpr char kPolicy[]     = "policy";
    static constexpr char kPolicyHash[] = "policy.hash";
    static constexpr char kPayloadDir[] = "payload/";
    static constexpr char kEvidenceDir[] = "evidence/";
    static constexpr char kMetaDir[]    = "META/";
    static constexpr char kMetaContainer[] = "META/container";
}

const char* cipher_name(CipherAlg c);

// Accepts "AES-256-GCM"/"AES" and "ChaCha20-Poly1305"/"ChaCha20".
// Throws std::invalid_argument on anything else.
CipherAlg cipher_from_name(const std::string& name);
