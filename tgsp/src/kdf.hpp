#pragma once
#include "errors.hpp"
#include "secure_bytes.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/kdf.h>

// Versioned HKDF context for recipient key-encryption keys. Changing it
// changes every KEK, so it is bumped together with the package format.
static constexpr char KEK_INFO[] = "TGSP-1.0-KEK-DERIVATION";
static constexpr int  KEK_LEN    = 32;
static constexpr int  KEK_SALT_LEN = 32;

// HKDF-SHA256 (RFC 5869), extract-and-expand.
inline SecretBytes hkdf_sha256(const SecretBytes& ikm,
                               const std::vector<uint8_t>& salt,
                               const std::string& info,
                               size_t out_len)
{
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!ctx) throw std::runtime_error("HKDF: EVP_PKEY_CTX_new_id failed");

    SecretBytes out(out_len);
    size_t len = out_len;
    if (EVP_PKEY_derive_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt.data(), (int)salt.size()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx, ikm.data(), (int)ikm.size()) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx, reinterpret_cast<const uint8_t*>(info.data()),
                                    (int)info.size()) <= 0 ||
        EVP_PKEY_derive(ctx, out.data(), &len) <= 0 ||
        len != out_len) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("HKDF-SHA256 derive failed");
    }
    EVP_PKEY_CTX_free(ctx);
    return out;
}

// KEK = HKDF-SHA256(ikm = X25519 shared secret, salt, info = KEK_INFO)
inline SecretBytes derive_kek(const SecretBytes& shared_secret,
                              const std::vector<uint8_t>& salt)
{
    if (shared_secret.size() != 32)
        throw CryptoError("KEK derivation: shared secret must be 32 bytes");
    if (salt.size() != KEK_SALT_LEN)
        throw FormatError("KEK derivation: salt must be 32 bytes");
    return hkdf_sha256(shared_secret, salt, KEK_INFO, KEK_LEN);
}
