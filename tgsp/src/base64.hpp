#pragma once
#include <string>
#include <vector>
#include <cstdint>

std::string base64_encode(const uint8_t* data, size_t len);

// Whitespace is skipped. Throws std::invalid_argument on characters outside
// the alphabet, data after padding, or a truncated final quantum.
std::vector<uint8_t> base64_decode(const std::string& encoded);
