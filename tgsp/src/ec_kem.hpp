#pragma once
#include "secure_bytes.hpp"
#include <vector>
#include <cstdint>

namespace ec_kem {

// X25519 Diffie-Hellman: own secret key (32 bytes) with the peer's public
// key (32 bytes). Throws CryptoError on malformed keys or when the result is
// all-zero (low-order peer point).
SecretBytes x25519_agree(const SecretBytes& sk, const std::vector<uint8_t>& peer_pk);

// Raw 32-byte public key for a raw 32-byte X25519 secret key.
std::vector<uint8_t> x25519_public(const SecretBytes& sk);

} // namespace ec_kem
