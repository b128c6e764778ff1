#pragma once
#include "secure_bytes.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace ec {

enum class Algorithm {
    X25519,
    Ed25519
};

struct KeyPair {
    std::vector<uint8_t> pk;
    SecretBytes          sk;
};

KeyPair keygen(Algorithm alg);

// "x25519" / "ed25519" (case-insensitive). Throws std::invalid_argument.
Algorithm algorithm_from_name(const std::string& name);
const char* algorithm_name(Algorithm alg);

} // namespace ec
