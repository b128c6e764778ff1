#pragma once
#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

// ── TGSP container, version 1 ─────────────────────────────────────────────────
//
// A flat archive of named, write-once byte entries. All integers are
// little-endian.
//
//   header    "TGSP" | u16 version (=1) | u16 flags (=0)
//   entries   stored bytes of each entry, back to back
//   directory per entry:
//               u16 name_len | name | u8 method (0 stored, 1 deflate)
//               u64 offset | u64 stored_size | u64 size | u32 crc32(stored bytes)
//   trailer   u32 entry_count | u64 directory_offset | "TGSE"
//
// Entry names are relative '/'-separated paths. Names under META/ are
// archive bookkeeping and are skipped by hash_all_entries().
//
// Errors: FormatError for malformed framing, IntegrityError for CRC or
// length mismatches, ResourceLimitExceeded for entries or counts above the
// configured ceilings, PathSecurityError for unsafe names on extraction.

enum class ContainerMode { Read, Write };

struct EntryInfo {
    std::string name;
    uint8_t     method      = 0;
    uint64_t    offset      = 0;
    uint64_t    stored_size = 0;
    uint64_t    size        = 0;     // declared uncompressed size
    uint32_t    crc32       = 0;
};

static constexpr uint16_t CONTAINER_VERSION = 1;
static constexpr uint8_t  METHOD_STORED     = 0;
static constexpr uint8_t  METHOD_DEFLATE    = 1;

class Container {
public:
    // Write mode creates a fresh archive at a temporary sibling path; nothing
    // appears at `path` until commit(). Read mode parses and validates the
    // directory of an existing archive.
    static std::unique_ptr<Container> open(const std::string& path,
                                           ContainerMode mode,
                                           const EngineConfig& cfg);
    ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    // Write mode only. Rejects oversize data before any byte is written.
    void write_entry(const std::string& name, const std::vector<uint8_t>& data);

    // Write mode only. Writes the directory and renames into place.
    void commit();

    std::vector<uint8_t> read_entry(const std::string& name);
    bool has_entry(const std::string& name) const;
    std::vector<std::string> list_entries() const;
    const EntryInfo& entry_info(const std::string& name) const;

    // name -> hex SHA-256 of the uncompressed bytes, for every entry outside
    // META/. Streams in bounded chunks and enforces max_entry_size while
    // inflating.
    std::map<std::string, std::string> hash_all_entries();

    // Writes the entry under dest_dir, refusing names that resolve outside it.
    std::filesystem::path extract_entry_safely(const std::string& name,
                                               const std::filesystem::path& dest_dir);

    const std::string& path() const { return path_; }
    ContainerMode mode() const { return mode_; }

private:
    Container(const std::string& path, ContainerMode mode, const EngineConfig& cfg);

    void load_directory();
    void check_readable() const;
    uint64_t stored_size_ceiling() const;

    // Verifies the CRC of the stored bytes, then feeds the uncompressed
    // bytes to sink in chunks, stopping at `cap`.
    template <typename Sink>
    void stream_entry(const EntryInfo& info, uint64_t cap, Sink&& sink);

    std::string        path_;
    std::string        temp_path_;
    ContainerMode      mode_;
    EngineConfig       cfg_;
    std::fstream       file_;
    uint64_t           file_size_  = 0;
    uint64_t           write_pos_  = 0;
    bool               committed_  = false;
    std::vector<EntryInfo>        entries_;
    std::map<std::string, size_t> index_;
};

// Name rule enforced by write_entry() and extract_entry_safely(): non-empty,
// relative, '/'-separated, no empty / "." / ".." components, no backslash
// or NUL. The reader accepts any non-empty name so that hostile archives can
// still be listed and verified.
bool is_valid_entry_name(const std::string& name);
