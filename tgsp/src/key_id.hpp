#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace key_id {

// Signer key identifier: BLAKE3 derive-key mode over the raw public key,
// truncated to 16 bytes, lowercase hex (32 chars). Stable for a given key.
std::string derive(const std::vector<uint8_t>& public_key);

} // namespace key_id
