#include "key_id.hpp"
#include "digest.hpp"
#include "blake3.h"

namespace key_id {

std::string derive(const std::vector<uint8_t>& public_key) {
    blake3_hasher h;
    blake3_hasher_init_derive_key(&h, "TGSP producer key-id v1");

    // Length-prefix the key (little-endian uint32_t)
    uint32_t pk_len = static_cast<uint32_t>(public_key.size());
    uint8_t  pk_len_le[4] = {
        static_cast<uint8_t>( pk_len        & 0xFF),
        static_cast<uint8_t>((pk_len >>  8) & 0xFF),
        static_cast<uint8_t>((pk_len >> 16) & 0xFF),
        static_cast<uint8_t>((pk_len >> 24) & 0xFF),
    };
    blake3_hasher_update(&h, pk_len_le, 4);
    blake3_hasher_update(&h, public_key.data(), public_key.size());

    uint8_t out[16];
    blake3_hasher_finalize(&h, out, 16);
    return to_hex(out, sizeof(out));
}

} // namespace key_id
