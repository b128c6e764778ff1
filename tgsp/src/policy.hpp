#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Policy document bound into a package. Only the identity fields are read;
// the raw bytes are stored verbatim and hashed.
struct PolicyDocument {
    std::string id;
    std::string version;
    std::vector<uint8_t> raw;
    std::string hash;            // hex SHA-256 of raw
};

// Parses YAML with top-level scalar keys `id` and `version`, e.g.
//   id: test-policy
//   version: 1.0
// Throws std::invalid_argument if the document is not YAML or either key
// is missing or empty.
PolicyDocument parse_policy(const std::vector<uint8_t>& raw, const std::string& origin);
