#include "ec_kem.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <string>

namespace ec_kem {

static const size_t kX25519Len = 32;

SecretBytes x25519_agree(const SecretBytes& sk, const std::vector<uint8_t>& peer_pk) {
    if (sk.size() != kX25519Len)
        throw CryptoError("X25519: secret key must be 32 bytes");
    if (peer_pk.size() != kX25519Len)
        throw CryptoError("X25519: peer public key must be 32 bytes");

    // Load own sk
    EVP_PKEY* own = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                 sk.data(), sk.size());
    if (!own) throw CryptoError("X25519: load sk failed");

    // Load peer pk
    EVP_PKEY* peer = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                 peer_pk.data(), peer_pk.size());
    if (!peer) {
        EVP_PKEY_free(own);
        throw CryptoError("X25519: load peer pk failed");
    }

    // ECDH derive
    EVP_PKEY_CTX* dctx = EVP_PKEY_CTX_new(own, nullptr);
    EVP_PKEY_free(own);
    if (!dctx) {
        EVP_PKEY_free(peer);
        throw std::runtime_error("X25519: EVP_PKEY_CTX_new (derive) failed");
    }
    if (EVP_PKEY_derive_init(dctx) <= 0 ||
        EVP_PKEY_derive_set_peer(dctx, peer) <= 0) {
        EVP_PKEY_CTX_free(dctx);
        EVP_PKEY_free(peer);
        throw CryptoError("X25519: derive init/set_peer failed");
    }
    EVP_PKEY_free(peer);

    SecretBytes ss(kX25519Len);
    size_t ss_len = kX25519Len;
    if (EVP_PKEY_derive(dctx, ss.data(), &ss_len) <= 0) {
        EVP_PKEY_CTX_free(dctx);
        throw CryptoError("X25519: EVP_PKEY_derive failed");
    }
    EVP_PKEY_CTX_free(dctx);
    ss.resize(ss_len);

    static const uint8_t kZero[kX25519Len] = {0};
    if (ss.size() != kX25519Len || CRYPTO_memcmp(ss.data(), kZero, kX25519Len) == 0)
        throw CryptoError("X25519: degenerate shared secret");
    return ss;
}

std::vector<uint8_t> x25519_public(const SecretBytes& sk) {
    if (sk.size() != kX25519Len)
        throw CryptoError("X25519: secret key must be 32 bytes");
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                  sk.data(), sk.size());
    if (!pkey) throw CryptoError("X25519: load sk failed");

    std::vector<uint8_t> pk(kX25519Len);
    size_t pk_len = kX25519Len;
    if (EVP_PKEY_get_raw_public_key(pkey, pk.data(), &pk_len) <= 0) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("X25519: get_raw_public_key failed");
    }
    EVP_PKEY_free(pkey);
    pk.resize(pk_len);
    return pk;
}

} // namespace ec_kem
