#pragma once
#include <string>
#include <vector>
#include <ostream>
#include <cstdint>

// PEM-like armor for raw key files, e.g.
//   -----BEGIN TGSP X25519 PUBLIC KEY-----
//   <base64, 64 columns>
//   -----END TGSP X25519 PUBLIC KEY-----

void write_pem(std::ostream& out,
               const std::string& type_header,
               const std::vector<uint8_t>& data);

// Writes the armored file. private_file restricts permissions to 0600
// before any key bytes are written.
void write_pem_file(const std::string& path,
                    const std::string& type_header,
                    const std::vector<uint8_t>& data,
                    bool private_file);

// Decode armor from text. expected_type is validated against the BEGIN line;
// origin names the source in error messages.
std::vector<uint8_t> parse_pem(const std::string& text,
                               const std::string& expected_type,
                               const std::string& origin);

// True if text contains a BEGIN line of any type.
bool looks_like_pem(const std::string& text);
