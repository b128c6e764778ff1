#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Whole-file reads. Throw std::runtime_error if the file cannot be opened
// or is larger than max_size.
std::vector<uint8_t> read_file(const std::string& path, uint64_t max_size = UINT64_MAX);
std::string read_file_text(const std::string& path, uint64_t max_size = UINT64_MAX);

// Final path component ("a/b/c.bin" -> "c.bin").
std::string base_name(const std::string& path);
