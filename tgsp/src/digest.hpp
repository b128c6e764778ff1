#pragma once
#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <cstddef>
#include <openssl/evp.h>

// SHA-256 digests (OpenSSL EVP) and hex helpers.

std::array<uint8_t, 32> sha256(const uint8_t* data, size_t len);
std::array<uint8_t, 32> sha256(const std::vector<uint8_t>& data);

// Lowercase hex of sha256(data), the form stored in manifests.
std::string sha256_hex(const std::vector<uint8_t>& data);

// Incremental SHA-256 for inputs that are hashed in chunks.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, size_t len);
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    EVP_MD_CTX* ctx_;
    bool done_ = false;
};

std::string to_hex(const uint8_t* data, size_t len);
template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& a) { return to_hex(a.data(), N); }
inline std::string to_hex(const std::vector<uint8_t>& v) { return to_hex(v.data(), v.size()); }

// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<uint8_t> from_hex(const std::string& hex);

// Constant-time comparison of two hex digests.
bool digest_equal(const std::string& a, const std::string& b);
