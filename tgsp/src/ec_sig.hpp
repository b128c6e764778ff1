#pragma once
#include "secure_bytes.hpp"
#include <vector>
#include <cstdint>

namespace ec_sig {

static constexpr size_t ED25519_SIG_LEN = 64;
static constexpr size_t ED25519_KEY_LEN = 32;

// Sign msg with a raw 32-byte Ed25519 secret key; returns the 64-byte signature.
std::vector<uint8_t> ed25519_sign(const SecretBytes& sk,
                                  const std::vector<uint8_t>& msg);

// Returns true if sig is a valid Ed25519 signature of msg under pk.
// Malformed keys or signatures verify as false.
bool ed25519_verify(const std::vector<uint8_t>& pk,
                    const std::vector<uint8_t>& msg,
                    const std::vector<uint8_t>& sig);

std::vector<uint8_t> ed25519_public(const SecretBytes& sk);

} // namespace ec_sig
