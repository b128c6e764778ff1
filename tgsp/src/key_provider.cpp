#include "key_provider.hpp"
#include "ec_kem.hpp"
#include "ec_sig.hpp"
#include "file_io.hpp"
#include "pem_io.hpp"
#include <stdexcept>

static const size_t kRawKeyLen = 32;
static const uint64_t kMaxKeyFile = 16 * 1024;

// ── LocalSigningKey ───────────────────────────────────────────────────────────

LocalSigningKey::LocalSigningKey(SecretBytes sk)
    : sk_(std::move(sk)), pk_(ec_sig::ed25519_public(sk_)) {}

std::unique_ptr<LocalSigningKey> LocalSigningKey::generate() {
    ec::KeyPair kp = ec::keygen(ec::Algorithm::Ed25519);
    return std::make_unique<LocalSigningKey>(std::move(kp.sk));
}

std::vector<uint8_t> LocalSigningKey::sign(const std::vector<uint8_t>& msg) const {
    return ec_sig::ed25519_sign(sk_, msg);
}

std::optional<SecretBytes> LocalSigningKey::export_secret() const {
    return SecretBytes(sk_.data(), sk_.size());
}

// ── LocalAgreementKey ─────────────────────────────────────────────────────────

LocalAgreementKey::LocalAgreementKey(SecretBytes sk)
    : sk_(std::move(sk)), pk_(ec_kem::x25519_public(sk_)) {}

std::unique_ptr<LocalAgreementKey> LocalAgreementKey::generate() {
    ec::KeyPair kp = ec::keygen(ec::Algorithm::X25519);
    return std::make_unique<LocalAgreementKey>(std::move(kp.sk));
}

SecretBytes LocalAgreementKey::agree(const std::vector<uint8_t>& peer_pk) const {
    return ec_kem::x25519_agree(sk_, peer_pk);
}

std::optional<SecretBytes> LocalAgreementKey::export_secret() const {
    return SecretBytes(sk_.data(), sk_.size());
}

// ── Key files ─────────────────────────────────────────────────────────────────

std::string pem_type(ec::Algorithm alg, bool is_private) {
    std::string name = alg == ec::Algorithm::X25519 ? "X25519" : "ED25519";
    return "TGSP " + name + (is_private ? " PRIVATE KEY" : " PUBLIC KEY");
}

static std::vector<uint8_t> load_key_bytes(const std::string& path,
                                           ec::Algorithm alg, bool is_private)
{
    std::vector<uint8_t> raw = read_file(path, kMaxKeyFile);
    ScopedWipe wipe_raw(raw);

    std::vector<uint8_t> key;
    std::string text(raw.begin(), raw.end());
    if (looks_like_pem(text)) {
        key = parse_pem(text, pem_type(alg, is_private), path);
        OPENSSL_cleanse(&text[0], text.size());
    } else {
        OPENSSL_cleanse(&text[0], text.size());
        key = raw;
    }

    if (key.size() != kRawKeyLen) {
        OPENSSL_cleanse(key.data(), key.size());
        throw std::runtime_error("Key file " + path + " must hold a 32-byte " +
                                 ec::algorithm_name(alg) +
                                 (is_private ? " private key" : " public key"));
    }
    return key;
}

std::unique_ptr<SigningKey> load_signing_key(const std::string& path) {
    SecretBytes sk(load_key_bytes(path, ec::Algorithm::Ed25519, true));
    return std::make_unique<LocalSigningKey>(std::move(sk));
}

std::unique_ptr<AgreementKey> load_agreement_key(const std::string& path) {
    SecretBytes sk(load_key_bytes(path, ec::Algorithm::X25519, true));
    return std::make_unique<LocalAgreementKey>(std::move(sk));
}

std::vector<uint8_t> load_public_key(const std::string& path, ec::Algorithm alg) {
    return load_key_bytes(path, alg, false);
}

KeyFilePaths write_keypair(ec::Algorithm alg, const std::string& prefix) {
    ec::KeyPair kp = ec::keygen(alg);

    KeyFilePaths paths;
    paths.private_path = prefix + ".priv";
    paths.public_path  = prefix + ".pub";

    std::vector<uint8_t> sk = kp.sk.reveal();
    ScopedWipe wipe_sk(sk);
    write_pem_file(paths.private_path, pem_type(alg, true), sk, true);
    write_pem_file(paths.public_path,  pem_type(alg, false), kp.pk, false);
    return paths;
}
