#include "ec_ops.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace ec {

// ── X25519 / Ed25519 ──────────────────────────────────────────────────────────
// Both use 32-byte raw key representation.

static KeyPair keygen_raw_curve(int nid) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(nid, nullptr);
    if (!ctx) throw std::runtime_error("EVP_PKEY_CTX_new_id failed");

    if (EVP_PKEY_keygen_init(ctx) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("EVP_PKEY_keygen_init failed");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx, &pkey) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("EVP_PKEY_keygen failed");
    }
    EVP_PKEY_CTX_free(ctx);

    KeyPair kp;
    kp.pk.resize(32);
    kp.sk = SecretBytes(32);

    size_t pk_len = 32, sk_len = 32;
    if (EVP_PKEY_get_raw_public_key(pkey, kp.pk.data(), &pk_len) <= 0 ||
        EVP_PKEY_get_raw_private_key(pkey, kp.sk.data(), &sk_len) <= 0 ||
        pk_len != 32 || sk_len != 32) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Failed to extract raw keys");
    }

    EVP_PKEY_free(pkey);
    return kp;
}

// ── Public API ────────────────────────────────────────────────────────────────

KeyPair keygen(Algorithm alg) {
    switch (alg) {
        case Algorithm::X25519:  return keygen_raw_curve(EVP_PKEY_X25519);
        case Algorithm::Ed25519: return keygen_raw_curve(EVP_PKEY_ED25519);
    }
    throw std::invalid_argument("Unknown EC algorithm");
}

Algorithm algorithm_from_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (lower == "x25519")  return Algorithm::X25519;
    if (lower == "ed25519") return Algorithm::Ed25519;
    throw std::invalid_argument("unknown key type '" + name + "' (must be ed25519 or x25519)");
}

const char* algorithm_name(Algorithm alg) {
    switch (alg) {
        case Algorithm::X25519:  return "X25519";
        case Algorithm::Ed25519: return "Ed25519";
    }
    return "unknown";
}

} // namespace ec
