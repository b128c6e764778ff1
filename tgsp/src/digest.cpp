#include "digest.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <stdexcept>

std::array<uint8_t, 32> sha256(const uint8_t* data, size_t len) {
    std::array<uint8_t, 32> out;
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
        out_len != 32)
        throw std::runtime_error("SHA-256 failed");
    return out;
}

std::array<uint8_t, 32> sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return to_hex(sha256(data));
}

// ── Sha256 ────────────────────────────────────────────────────────────────────

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("SHA-256 DigestInit failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const uint8_t* data, size_t len) {
    if (done_) throw std::logic_error("Sha256::update after finish");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1)
        throw std::runtime_error("SHA-256 DigestUpdate failed");
}

std::array<uint8_t, 32> Sha256::finish() {
    if (done_) throw std::logic_error("Sha256::finish called twice");
    std::array<uint8_t, 32> out;
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &out_len) != 1 || out_len != 32)
        throw std::runtime_error("SHA-256 DigestFinal failed");
    done_ = true;
    return out;
}

std::string Sha256::finish_hex() {
    return to_hex(finish());
}

// ── hex ───────────────────────────────────────────────────────────────────────

std::string to_hex(const uint8_t* data, size_t len) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0)
        throw std::invalid_argument("hex string has odd length");
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("invalid hex character");
        out.push_back((uint8_t)((hi << 4) | lo));
    }
    return out;
}

bool digest_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
