#pragma once
#include "package.hpp"
#include <string>
#include <cstdint>

// Engine settings passed explicitly into every container and package call.
struct EngineConfig {
    uint64_t    max_entry_size    = 100ull * 1024 * 1024;  // per entry, uncompressed
    uint32_t    max_entries       = 4096;
    CipherAlg   default_cipher    = CipherAlg::AES256GCM;
    bool        compress          = true;
    int         compression_level = 6;                     // zlib 1..9
    std::string producer_id       = "tgsp-cli";
    bool        require_signature = false;
};

// Load from YAML. Keys (all optional):
//   max-entry-size, max-entries, cipher, compress, compression-level,
//   producer-id, require-signature
// Throws std::runtime_error on unreadable files, unknown keys or bad values.
EngineConfig load_config(const std::string& path);

// --config path if given, else $TGSP_CONFIG if set, else defaults.
EngineConfig resolve_config(const std::string& cli_path);
