#pragma once
#include "package.hpp"
#include "errors.hpp"
#include "secure_bytes.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <climits>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

// AES-256-GCM and ChaCha20-Poly1305 AEAD.
// Sealed layout: nonce(12) || ciphertext(N) || tag(16)
// A fresh random nonce is drawn for every seal; keys are 32 bytes.

static constexpr int AEAD_NONCE_LEN = 12;
static constexpr int AEAD_TAG_LEN   = 16;
// EVP lengths are int
static constexpr uint64_t AEAD_MAX_SEALED = INT_MAX;
static constexpr int AEAD_KEY_LEN   = 32;

namespace aead {

inline const EVP_CIPHER* evp_cipher(CipherAlg alg) {
    switch (alg) {
        case CipherAlg::AES256GCM:        return EVP_aes_256_gcm();
        case CipherAlg::ChaCha20Poly1305: return EVP_chacha20_poly1305();
    }
    throw std::invalid_argument("Unknown CipherAlg");
}

// Fresh random 256-bit data encryption key.
inline SecretBytes generate_key() {
    SecretBytes key(AEAD_KEY_LEN);
    if (RAND_bytes(key.data(), AEAD_KEY_LEN) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return key;
}

inline std::vector<uint8_t> seal(CipherAlg alg,
                                 const SecretBytes& key,
                                 const std::vector<uint8_t>& plaintext,
                                 const std::string& aad)
{
    if (key.size() != AEAD_KEY_LEN)
        throw std::invalid_argument("AEAD key must be 32 bytes");

    const char* name = cipher_name(alg);
    if (plaintext.size() > AEAD_MAX_SEALED - AEAD_NONCE_LEN - AEAD_TAG_LEN)
        throw ResourceLimitExceeded(std::string(name) + ": plaintext of " +
                                    std::to_string(plaintext.size()) + " bytes is too large");

    std::vector<uint8_t> out(AEAD_NONCE_LEN + plaintext.size() + AEAD_TAG_LEN);
    uint8_t* nonce = out.data();
    uint8_t* ct    = out.data() + AEAD_NONCE_LEN;
    uint8_t* tag   = ct + plaintext.size();

    if (RAND_bytes(nonce, AEAD_NONCE_LEN) != 1)
        throw std::runtime_error("RAND_bytes failed");

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    auto fail = [&](const char* step) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error(std::string(name) + " " + step + " failed");
    };

    int len = 0;
    if (EVP_EncryptInit_ex(ctx, evp_cipher(alg), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, AEAD_NONCE_LEN, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1)
        fail("encrypt init");

    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx, nullptr, &len,
                          reinterpret_cast<const uint8_t*>(aad.data()), (int)aad.size()) != 1)
        fail("AAD update");

    int ct_len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, ct, &len, plaintext.data(), (int)plaintext.size()) != 1)
            fail("EncryptUpdate");
        ct_len = len;
    }
    int flen = 0;
    if (EVP_EncryptFinal_ex(ctx, ct + ct_len, &flen) != 1)
        fail("EncryptFinal");
    if ((size_t)(ct_len + flen) != plaintext.size())
        fail("length check");

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, AEAD_TAG_LEN, tag) != 1)
        fail("GET_TAG");
    EVP_CIPHER_CTX_free(ctx);
    return out;
}

// Throws CryptoError if the input is too short or the tag does not verify.
inline std::vector<uint8_t> open(CipherAlg alg,
                                 const SecretBytes& key,
                                 const std::vector<uint8_t>& sealed,
                                 const std::string& aad)
{
    if (key.size() != AEAD_KEY_LEN)
        throw std::invalid_argument("AEAD key must be 32 bytes");

    const char* name = cipher_name(alg);
    if (sealed.size() < (size_t)(AEAD_NONCE_LEN + AEAD_TAG_LEN))
        throw CryptoError(std::string(name) + ": sealed input too short");
    if (sealed.size() > AEAD_MAX_SEALED)
        throw ResourceLimitExceeded(std::string(name) + ": sealed input of " +
                                    std::to_string(sealed.size()) + " bytes is too large");

    const uint8_t* nonce = sealed.data();
    const uint8_t* ct    = sealed.data() + AEAD_NONCE_LEN;
    size_t ct_len        = sealed.size() - AEAD_NONCE_LEN - AEAD_TAG_LEN;
    const uint8_t* tag   = ct + ct_len;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> pt(ct_len);
    auto fail = [&](const char* step) {
        EVP_CIPHER_CTX_free(ctx);
        OPENSSL_cleanse(pt.data(), pt.size());
        throw CryptoError(std::string(name) + " " + step + " failed");
    };

    int len = 0;
    if (EVP_DecryptInit_ex(ctx, evp_cipher(alg), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, AEAD_NONCE_LEN, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1)
        fail("decrypt init");

    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx, nullptr, &len,
                          reinterpret_cast<const uint8_t*>(aad.data()), (int)aad.size()) != 1)
        fail("AAD update");

    int pt_len = 0;
    if (ct_len > 0) {
        if (EVP_DecryptUpdate(ctx, pt.data(), &len, ct, (int)ct_len) != 1)
            fail("DecryptUpdate");
        pt_len = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, AEAD_TAG_LEN,
                            const_cast<uint8_t*>(tag)) != 1)
        fail("SET_TAG");

    int flen = 0;
    if (EVP_DecryptFinal_ex(ctx, pt.data() + pt_len, &flen) != 1)
        fail("authentication");
    EVP_CIPHER_CTX_free(ctx);

    pt.resize((size_t)(pt_len + flen));
    return pt;
}

} // namespace aead
