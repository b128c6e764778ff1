#pragma once
#include "ec_ops.hpp"
#include "secure_bytes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

// Key capabilities used by the package service. The service only calls
// these methods, so a key held by external hardware can implement them and
// return std::nullopt from export_secret().

class SigningKey {
public:
    virtual ~SigningKey() = default;
    virtual std::vector<uint8_t> public_key() const = 0;
    // Ed25519 signature over msg.
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& msg) const = 0;
    virtual std::optional<SecretBytes> export_secret() const = 0;
};

class AgreementKey {
public:
    virtual ~AgreementKey() = default;
    virtual std::vector<uint8_t> public_key() const = 0;
    // X25519 shared secret with peer_pk. Throws CryptoError.
    virtual SecretBytes agree(const std::vector<uint8_t>& peer_pk) const = 0;
    virtual std::optional<SecretBytes> export_secret() const = 0;
};

// ── Local (in-process) keys ───────────────────────────────────────────────────

class LocalSigningKey : public SigningKey {
public:
    explicit LocalSigningKey(SecretBytes sk);
    static std::unique_ptr<LocalSigningKey> generate();

    std::vector<uint8_t> public_key() const override { return pk_; }
    std::vector<uint8_t> sign(const std::vector<uint8_t>& msg) const override;
    std::optional<SecretBytes> export_secret() const override;

private:
    SecretBytes          sk_;
    std::vector<uint8_t> pk_;
};

class LocalAgreementKey : public AgreementKey {
public:
    explicit LocalAgreementKey(SecretBytes sk);
    static std::unique_ptr<LocalAgreementKey> generate();

    std::vector<uint8_t> public_key() const override { return pk_; }
    SecretBytes agree(const std::vector<uint8_t>& peer_pk) const override;
    std::optional<SecretBytes> export_secret() const override;

private:
    SecretBytes          sk_;
    std::vector<uint8_t> pk_;
};

// ── Key files ─────────────────────────────────────────────────────────────────
// Armored (see pem_io.hpp) or a raw 32-byte file.

std::string pem_type(ec::Algorithm alg, bool is_private);

std::unique_ptr<SigningKey>   load_signing_key(const std::string& path);
std::unique_ptr<AgreementKey> load_agreement_key(const std::string& path);
std::vector<uint8_t>          load_public_key(const std::string& path, ec::Algorithm alg);

struct KeyFilePaths {
    std::string private_path;
    std::string public_path;
};

// Generates a keypair and writes <prefix>.priv (mode 0600) and <prefix>.pub.
KeyFilePaths write_keypair(ec::Algorithm alg, const std::string& prefix);
