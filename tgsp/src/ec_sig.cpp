#include "ec_sig.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace ec_sig {

std::vector<uint8_t> ed25519_sign(const SecretBytes& sk,
                                  const std::vector<uint8_t>& msg)
{
    if (sk.size() != ED25519_KEY_LEN)
        throw CryptoError("Ed25519 sign: secret key must be 32 bytes");

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  sk.data(), sk.size());
    if (!pkey) throw CryptoError("Ed25519 sign: load sk failed");

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Ed25519 sign: EVP_MD_CTX_new failed");
    }

    // Ed25519 requires nullptr md (hashes internally) and one-shot signing
    if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw CryptoError("Ed25519 sign: DigestSignInit failed");
    }

    std::vector<uint8_t> sig(ED25519_SIG_LEN);
    size_t sig_len = ED25519_SIG_LEN;
    if (EVP_DigestSign(ctx, sig.data(), &sig_len, msg.data(), msg.size()) <= 0) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw CryptoError("Ed25519 sign: DigestSign failed");
    }
    sig.resize(sig_len);

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return sig;
}

bool ed25519_verify(const std::vector<uint8_t>& pk,
                    const std::vector<uint8_t>& msg,
                    const std::vector<uint8_t>& sig)
{
    if (pk.size() != ED25519_KEY_LEN || sig.size() != ED25519_SIG_LEN)
        return false;

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                 pk.data(), pk.size());
    if (!pkey) return false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Ed25519 verify: EVP_MD_CTX_new failed");
    }

    if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Ed25519 verify: DigestVerifyInit failed");
    }

    int rc = EVP_DigestVerify(ctx, sig.data(), sig.size(), msg.data(), msg.size());
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return (rc == 1);
}

std::vector<uint8_t> ed25519_public(const SecretBytes& sk) {
    if (sk.size() != ED25519_KEY_LEN)
        throw CryptoError("Ed25519: secret key must be 32 bytes");
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  sk.data(), sk.size());
    if (!pkey) throw CryptoError("Ed25519: load sk failed");

    std::vector<uint8_t> pk(ED25519_KEY_LEN);
    size_t pk_len = ED25519_KEY_LEN;
    if (EVP_PKEY_get_raw_public_key(pkey, pk.data(), &pk_len) <= 0) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Ed25519: get_raw_public_key failed");
    }
    EVP_PKEY_free(pkey);
    pk.resize(pk_len);
    return pk;
}

} // namespace ec_sig
