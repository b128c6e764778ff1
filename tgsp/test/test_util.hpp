#pragma once
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

// Shared helpers for the tgsp test executables.

namespace fs = std::filesystem;

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

// Passes if fn throws E; any other outcome is reported.
template <typename E>
static bool expect_throw(const std::function<void()>& fn, const std::string& msg) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        return fail(msg + " (threw other: " + e.what() + ")");
    }
    return fail(msg + " (no exception)");
}

// Passes if fn throws a PackageError of the given kind.
static bool expect_kind(ErrorKind kind, const std::function<void()>& fn, const std::string& msg) {
    try {
        fn();
    } catch (const PackageError& e) {
        if (e.kind() == kind) return true;
        return fail(msg + " (got " + error_kind_name(e.kind()) + ": " + e.what() + ")");
    } catch (const std::exception& e) {
        return fail(msg + " (threw non-package error: " + e.what() + ")");
    }
    return fail(msg + " (no exception)");
}

// Fresh directory under the system temp dir; removed by the destructor.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::string templ = (fs::temp_directory_path() / ("tgsp-" + tag + "-XXXXXX")).string();
        std::vector<char> buf(templ.begin(), templ.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data()))
            throw std::runtime_error("mkdtemp failed for " + templ);
        path_ = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static void write_bytes(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("Cannot write test file: " + path);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

static void write_text(const std::string& path, const std::string& text) {
    write_bytes(path, bytes_of(text));
}

static std::vector<uint8_t> slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot read test file: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

// Offset of the last occurrence of needle in hay. Directory records sit at
// the end of a container, so the last match of an entry name is its record.
static size_t find_last(const std::vector<uint8_t>& hay, const std::string& needle) {
    auto it = std::find_end(hay.begin(), hay.end(), needle.begin(), needle.end());
    if (it == hay.end())
        throw std::runtime_error("pattern not found: " + needle);
    return (size_t)(it - hay.begin());
}

static void put_le64(std::vector<uint8_t>& b, size_t off, uint64_t v) {
    for (int i = 0; i < 8; ++i) b[off + i] = (uint8_t)(v >> (8 * i));
}

static uint64_t get_le64(const std::vector<uint8_t>& b, size_t off) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | b[off + i];
    return v;
}

// Directory record field offsets, relative to the start of the name.
//   name | u8 method | u64 offset | u64 stored_size | u64 size | u32 crc32
static size_t record_method(size_t name_pos, size_t name_len) { return name_pos + name_len; }
static size_t record_offset(size_t name_pos, size_t name_len) { return name_pos + name_len + 1; }
static size_t record_stored(size_t name_pos, size_t name_len) { return name_pos + name_len + 9; }
static size_t record_size(size_t name_pos, size_t name_len)   { return name_pos + name_len + 17; }
