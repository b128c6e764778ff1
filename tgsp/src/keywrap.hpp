#pragma once
#include "errors.hpp"
#include "secure_bytes.hpp"
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <openssl/evp.h>

// AES-256 key wrap (RFC 3394). Wrapping a 32-byte DEK yields 40 bytes.
// The wrap is deterministic; the built-in integrity check makes a wrong KEK
// or a modified blob fail unwrap instead of producing a different key.

static constexpr int KW_KEK_LEN      = 32;
static constexpr int KW_OVERHEAD     = 8;

namespace keywrap {

inline std::vector<uint8_t> wrap(const SecretBytes& kek, const SecretBytes& dek) {
    if (kek.size() != KW_KEK_LEN)
        throw std::invalid_argument("AES-KW: KEK must be 32 bytes");
    if (dek.size() < 16 || dek.size() % 8 != 0)
        throw std::invalid_argument("AES-KW: key to wrap must be a multiple of 8 bytes, at least 16");

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    EVP_CIPHER_CTX_set_flags(ctx, EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);

    std::vector<uint8_t> out(dek.size() + KW_OVERHEAD);
    int len = 0, flen = 0;
    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1 ||
        EVP_EncryptUpdate(ctx, out.data(), &len, dek.data(), (int)dek.size()) != 1 ||
        EVP_EncryptFinal_ex(ctx, out.data() + len, &flen) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-KW wrap failed");
    }
    EVP_CIPHER_CTX_free(ctx);
    out.resize((size_t)(len + flen));
    return out;
}

// Throws CryptoError when the integrity check fails.
inline SecretBytes unwrap(const SecretBytes& kek, const std::vector<uint8_t>& wrapped) {
    if (kek.size() != KW_KEK_LEN)
        throw std::invalid_argument("AES-KW: KEK must be 32 bytes");
    if (wrapped.size() < 24 || wrapped.size() % 8 != 0)
        throw CryptoError("AES-KW: wrapped key has invalid length");

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    EVP_CIPHER_CTX_set_flags(ctx, EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);

    SecretBytes out(wrapped.size());
    int len = 0, flen = 0;
    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1 ||
        EVP_DecryptUpdate(ctx, out.data(), &len, wrapped.data(), (int)wrapped.size()) <= 0 ||
        EVP_DecryptFinal_ex(ctx, out.data() + len, &flen) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw CryptoError("AES-KW unwrap failed (wrong key or corrupted wrapped key)");
    }
    EVP_CIPHER_CTX_free(ctx);
    out.resize((size_t)(len + flen));
    return out;
}

} // namespace keywrap
