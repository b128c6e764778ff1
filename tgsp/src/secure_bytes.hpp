#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <openssl/crypto.h>

// Owning byte buffer for key material (DEKs, KEKs, shared secrets, private
// keys). Contents are wiped with OPENSSL_cleanse when the buffer is
// destroyed, reassigned or moved from.

class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t n) : bytes_(n, 0) {}
    SecretBytes(const uint8_t* p, size_t n) : bytes_(p, p + n) {}
    explicit SecretBytes(std::vector<uint8_t>&& v) : bytes_(std::move(v)) {}

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& o) noexcept : bytes_(std::move(o.bytes_)) {
        o.bytes_.clear();
    }
    SecretBytes& operator=(SecretBytes&& o) noexcept {
        if (this != &o) {
            wipe();
            bytes_ = std::move(o.bytes_);
            o.bytes_.clear();
        }
        return *this;
    }

    ~SecretBytes() { wipe(); }

    uint8_t*       data()       { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const  { return bytes_.size(); }
    bool   empty() const { return bytes_.empty(); }

    void resize(size_t n) {
        if (n < bytes_.size())
            OPENSSL_cleanse(bytes_.data() + n, bytes_.size() - n);
        bytes_.resize(n, 0);
    }

    // Copy out as a plain vector; the caller owns wiping it.
    std::vector<uint8_t> reveal() const { return bytes_; }

    bool equals(const uint8_t* p, size_t n) const {
        return n == bytes_.size() && CRYPTO_memcmp(bytes_.data(), p, n) == 0;
    }

    void wipe() {
        if (!bytes_.empty())
            OPENSSL_cleanse(bytes_.data(), bytes_.size());
        bytes_.clear();
    }

private:
    std::vector<uint8_t> bytes_;
};

// Wipes a caller-owned plain buffer on scope exit.
class ScopedWipe {
public:
    explicit ScopedWipe(std::vector<uint8_t>& v) : v_(v) {}
    ~ScopedWipe() {
        if (!v_.empty())
            OPENSSL_cleanse(v_.data(), v_.size());
    }
    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;

private:
    std::vector<uint8_t>& v_;
};
