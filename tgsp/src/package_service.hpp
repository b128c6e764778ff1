#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "key_provider.hpp"
#include "package.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

// ── Inputs ────────────────────────────────────────────────────────────────────

struct PayloadInput {
    std::string payload_id;              // [A-Za-z0-9._-], unique, not starting with '.'
    std::string logical_type;            // e.g. "adapter"
    std::string path;                    // plaintext file
    std::optional<CipherAlg> cipher;     // per-payload override
};

struct RecipientInput {
    std::string recipient_id;
    std::vector<uint8_t> public_key;     // X25519, 32 bytes
};

struct EvidenceInput {
    std::string type;                    // "evaluation_report", "evaluation_report_html", ...
    std::string path;
};

struct CreateRequest {
    std::string out_path;
    std::vector<PayloadInput>   payloads;
    std::vector<RecipientInput> recipients;
    const SigningKey*           signing_key = nullptr;   // unsigned package if null
    std::string                 policy_path;             // optional
    std::vector<EvidenceInput>  evidence;
    std::vector<std::string>    base_model_ids;
    std::optional<CipherAlg>    cipher;                  // overrides cfg.default_cipher
    std::string                 producer_id;             // overrides cfg.producer_id
};

// ── Results ───────────────────────────────────────────────────────────────────

enum class VerifyStatus { Authenticated, Unauthenticated, Failed };

struct VerifyResult {
    bool         ok     = false;
    VerifyStatus status = VerifyStatus::Failed;
    std::string  reason;                 // "OK" or "<ErrorKind>: <detail>"
    std::string  package_id;             // empty if the manifest could not be read
    std::optional<ErrorKind> error;
};

struct DecryptedFile {
    std::string payload_id;
    std::filesystem::path path;
    uint64_t size = 0;
};

struct PackageSummary {
    PackageManifest          manifest;
    std::vector<std::string> recipient_ids;
    bool                     has_signature = false;
    std::string              signer_key_id;
    std::vector<std::string> entries;
};

// ── Workflows ─────────────────────────────────────────────────────────────────

namespace package_service {

// Parses "<id>:<type>:<file>[:<cipher>]". The trailing field is a cipher only
// when it names one; otherwise it belongs to the file path.
PayloadInput parse_payload_arg(const std::string& arg);

// Encrypts every payload under a fresh DEK, wraps each DEK for every
// recipient, inventories all entries, signs the manifest if a key is given,
// and commits atomically. Returns the new package_id.
// Throws std::invalid_argument for bad requests, PackageError subclasses and
// std::runtime_error for I/O failures. No file exists at out_path on failure.
std::string create(const EngineConfig& cfg, const CreateRequest& req);

// Fail-closed check of manifest, inventory hashes, entry whitelist and
// signature. PackageError is reported in the result, not thrown; an
// unreadable file still throws std::runtime_error.
VerifyResult verify(const EngineConfig& cfg,
                    const std::string& package_path,
                    const std::vector<uint8_t>* trusted_key = nullptr);

// Runs the full verify, then unwraps and decrypts every payload held for
// recipient_id, rechecks plaintext hashes, and only then writes files under
// dest_dir. Throws RecipientNotFound, CryptoError, IntegrityError,
// PathSecurityError, or whatever verify would have reported.
std::vector<DecryptedFile> decrypt(const EngineConfig& cfg,
                                   const std::string& package_path,
                                   const std::string& recipient_id,
                                   const AgreementKey& recipient_key,
                                   const std::filesystem::path& dest_dir);

// Reads manifest and recipient ids without verifying anything.
PackageSummary inspect(const EngineConfig& cfg, const std::string& package_path);

} // namespace package_service
