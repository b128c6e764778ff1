#include "container.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "package.hpp"
#include "path_guard.hpp"
#include <zlib.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

static const uint8_t kMagic[4]    = {'T', 'G', 'S', 'P'};
static const uint8_t kEndMagic[4] = {'T', 'G', 'S', 'E'};

static const size_t kHeaderLen   = 8;
static const size_t kTrailerLen  = 20;
static const size_t kRecordFixed = 2 + 1 + 8 + 8 + 8 + 4;
static const size_t kMaxNameLen  = 4096;
static const size_t kChunk       = 64 * 1024;
static const size_t kMinCompress = 64;

// ── Little-endian helpers ─────────────────────────────────────────────────────

static void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back((uint8_t)(v & 0xFF));
    b.push_back((uint8_t)(v >> 8));
}

static void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    for (int i = 0; i < 4; ++i) b.push_back((uint8_t)(v >> (8 * i)));
}

static void put_u64(std::vector<uint8_t>& b, uint64_t v) {
    for (int i = 0; i < 8; ++i) b.push_back((uint8_t)(v >> (8 * i)));
}

static uint16_t get_u16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t get_u32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) |
           ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

static uint32_t crc32_of(const uint8_t* data, size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    while (len > 0) {
        uInt n = (uInt)std::min<size_t>(len, kChunk);
        crc = crc32(crc, data, n);
        data += n;
        len  -= n;
    }
    return (uint32_t)crc;
}

// Ends an inflate stream on every exit path.
struct InflateGuard {
    z_stream& zs;
    ~InflateGuard() { inflateEnd(&zs); }
};

// ── Entry names ───────────────────────────────────────────────────────────────

bool is_valid_entry_name(const std::string& name) {
    if (name.empty() || name.size() > kMaxNameLen) return false;
    if (name.find('\0') != std::string::npos) return false;
    if (name.find('\\') != std::string::npos) return false;
    if (name.size() >= 2 && name[1] == ':') return false;

    size_t start = 0;
    while (true) {
        size_t slash = name.find('/', start);
        std::string comp = name.substr(start, slash == std::string::npos
                                                  ? std::string::npos : slash - start);
        if (comp.empty() || comp == "." || comp == "..") return false;
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return true;
}

static bool is_meta_name(const std::string& name) {
    static const size_t kLen = std::strlen(entry::kMetaDir);
    return name.compare(0, kLen, entry::kMetaDir) == 0;
}

// ── Open / close ──────────────────────────────────────────────────────────────

Container::Container(const std::string& path, ContainerMode mode, const EngineConfig& cfg)
    : path_(path), mode_(mode), cfg_(cfg)
{
    if (mode_ == ContainerMode::Write) {
        uint8_t rnd[4];
        if (RAND_bytes(rnd, sizeof(rnd)) != 1)
            throw std::runtime_error("RAND_bytes failed");
        temp_path_ = path_ + ".partial-" + to_hex(rnd, sizeof(rnd));

        file_.open(temp_path_, std::ios::in | std::ios::out |
                               std::ios::binary | std::ios::trunc);
        if (!file_)
            throw std::runtime_error("Cannot create container: " + temp_path_);

        std::vector<uint8_t> hdr(kMagic, kMagic + 4);
        put_u16(hdr, CONTAINER_VERSION);
        put_u16(hdr, 0);
        file_.write(reinterpret_cast<const char*>(hdr.data()), (std::streamsize)hdr.size());
        if (!file_)
            throw std::runtime_error("Write error on container: " + temp_path_);
        write_pos_ = kHeaderLen;
    } else {
        file_.open(path_, std::ios::in | std::ios::binary);
        if (!file_)
            throw std::runtime_error("Cannot open container: " + path_);
        std::error_code ec;
        file_size_ = fs::file_size(path_, ec);
        if (ec)
            throw std::runtime_error("Cannot stat container " + path_ + ": " + ec.message());
        load_directory();
    }
}

std::unique_ptr<Container> Container::open(const std::string& path,
                                           ContainerMode mode,
                                           const EngineConfig& cfg)
{
    return std::unique_ptr<Container>(new Container(path, mode, cfg));
}

Container::~Container() {
    if (file_.is_open())
        file_.close();
    if (mode_ == ContainerMode::Write && !committed_ && !temp_path_.empty()) {
        std::error_code ec;
        fs::remove(temp_path_, ec);
    }
}

// ── Reading helpers ───────────────────────────────────────────────────────────

static void read_at(std::fstream& f, uint64_t off, uint8_t* buf, size_t n) {
    f.clear();
    f.seekg((std::streamoff)off);
    f.read(reinterpret_cast<char*>(buf), (std::streamsize)n);
    if ((size_t)f.gcount() != n)
        throw FormatError("container truncated");
}

void Container::load_directory() {
    if (file_size_ < kHeaderLen + kTrailerLen)
        throw FormatError("container too short (" + std::to_string(file_size_) + " bytes)");

    uint8_t hdr[kHeaderLen];
    read_at(file_, 0, hdr, kHeaderLen);
    if (std::memcmp(hdr, kMagic, 4) != 0)
        throw FormatError("not a TGSP container (bad magic)");
    uint16_t version = get_u16(hdr + 4);
    if (version != CONTAINER_VERSION)
        throw FormatError("unsupported container version " + std::to_string(version));

    uint8_t tr[kTrailerLen];
    read_at(file_, file_size_ - kTrailerLen, tr, kTrailerLen);
    if (std::memcmp(tr + 12, kEndMagic, 4) != 0)
        throw FormatError("container trailer missing (truncated or not committed)");

    uint32_t count   = get_u32(tr);
    uint64_t dir_off = get_u64(tr + 4);
    uint64_t dir_end = file_size_ - kTrailerLen;

    if (count > cfg_.max_entries)
        throw ResourceLimitExceeded("container holds " + std::to_string(count) +
                                    " entries, limit " + std::to_string(cfg_.max_entries));
    if (dir_off < kHeaderLen || dir_off > dir_end)
        throw FormatError("directory offset out of range");

    uint64_t dir_len = dir_end - dir_off;
    if (dir_len > (uint64_t)count * (kRecordFixed + kMaxNameLen))
        throw FormatError("directory larger than its entry count allows");

    std::vector<uint8_t> dir((size_t)dir_len);
    if (dir_len > 0)
        read_at(file_, dir_off, dir.data(), dir.size());

    size_t pos = 0;
    for (uint32_t i = 0; i < count; ++i) {
        if (dir.size() - pos < kRecordFixed)
            throw FormatError("directory truncated");
        uint16_t name_len = get_u16(&dir[pos]);
        pos += 2;
        if (name_len == 0 || name_len > kMaxNameLen ||
            dir.size() - pos < (size_t)name_len + kRecordFixed - 2)
            throw FormatError("bad entry name length in directory");

        EntryInfo e;
        e.name.assign(reinterpret_cast<const char*>(&dir[pos]), name_len);
        pos += name_len;
        e.method      = dir[pos];              pos += 1;
        e.offset      = get_u64(&dir[pos]);    pos += 8;
        e.stored_size = get_u64(&dir[pos]);    pos += 8;
        e.size        = get_u64(&dir[pos]);    pos += 8;
        e.crc32       = get_u32(&dir[pos]);    pos += 4;

        if (e.name.find('\0') != std::string::npos)
            throw FormatError("entry name contains NUL byte");
        if (e.method != METHOD_STORED && e.method != METHOD_DEFLATE)
            throw FormatError("entry '" + e.name + "': unknown storage method " +
                              std::to_string(e.method));
        if (e.offset < kHeaderLen || e.offset > dir_off ||
            e.stored_size > dir_off - e.offset)
            throw FormatError("entry '" + e.name + "': data out of bounds");
        if (e.method == METHOD_STORED && e.stored_size != e.size)
            throw FormatError("entry '" + e.name + "': stored size mismatch");
        if (!index_.emplace(e.name, entries_.size()).second)
            throw FormatError("duplicate entry '" + e.name + "'");
        entries_.push_back(std::move(e));
    }
    if (pos != dir.size())
        throw FormatError("trailing bytes in container directory");
}

void Container::check_readable() const {
    if (committed_)
        throw std::logic_error("container already committed: " + path_);
}

uint64_t Container::stored_size_ceiling() const {
    // DEFLATE worst-case expansion is a few bytes per 16 KiB block.
    return cfg_.max_entry_size + cfg_.max_entry_size / 1000 + 1024;
}

template <typename Sink>
void Container::stream_entry(const EntryInfo& info, uint64_t cap, Sink&& sink) {
    if (info.size > cap)
        throw ResourceLimitExceeded("entry '" + info.name + "' declares " +
                                    std::to_string(info.size) + " bytes, limit " +
                                    std::to_string(cap));
    if (info.stored_size > stored_size_ceiling())
        throw ResourceLimitExceeded("entry '" + info.name + "' stored size exceeds limit");

    if (mode_ == ContainerMode::Write)
        file_.flush();

    std::vector<uint8_t> buf(kChunk);

    // Pass 1: CRC over the stored bytes, before anything is inflated
    uLong crc = crc32(0L, Z_NULL, 0);
    for (uint64_t done = 0; done < info.stored_size; ) {
        size_t n = (size_t)std::min<uint64_t>(kChunk, info.stored_size - done);
        read_at(file_, info.offset + done, buf.data(), n);
        crc = crc32(crc, buf.data(), (uInt)n);
        done += n;
    }
    if ((uint32_t)crc != info.crc32)
        throw IntegrityError("CRC mismatch in entry '" + info.name + "'");

    // Pass 2: deliver uncompressed bytes
    if (info.method == METHOD_STORED) {
        for (uint64_t done = 0; done < info.stored_size; ) {
            size_t n = (size_t)std::min<uint64_t>(kChunk, info.stored_size - done);
            read_at(file_, info.offset + done, buf.data(), n);
            sink(buf.data(), n);
            done += n;
        }
        return;
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit(&zs) != Z_OK)
        throw std::runtime_error("zlib inflateInit failed");
    InflateGuard guard{zs};

    std::vector<uint8_t> out(kChunk);
    uint64_t consumed = 0;
    uint64_t produced = 0;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        if (zs.avail_in == 0) {
            if (consumed == info.stored_size)
                throw IntegrityError("entry '" + info.name + "': deflate stream truncated");
            size_t n = (size_t)std::min<uint64_t>(kChunk, info.stored_size - consumed);
            read_at(file_, info.offset + consumed, buf.data(), n);
            consumed += n;
            zs.next_in  = buf.data();
            zs.avail_in = (uInt)n;
        }
        zs.next_out  = out.data();
        zs.avail_out = (uInt)out.size();
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            ret == Z_STREAM_ERROR)
            throw FormatError("entry '" + info.name + "': corrupt deflate stream");

        size_t have = out.size() - zs.avail_out;
        produced += have;
        // Output past the declared size counts as a bomb.
        if (produced > cap || produced > info.size)
            throw ResourceLimitExceeded("entry '" + info.name +
                                        "' inflates past its size limit");
        if (have > 0)
            sink(out.data(), have);
    }

    if (produced != info.size || consumed != info.stored_size || zs.avail_in != 0)
        throw IntegrityError("entry '" + info.name + "': length mismatch after inflate");
}

// ── Public API ────────────────────────────────────────────────────────────────

void Container::write_entry(const std::string& name, const std::vector<uint8_t>& data) {
    if (mode_ != ContainerMode::Write || committed_)
        throw std::logic_error("container not open for writing: " + path_);
    if (!is_valid_entry_name(name))
        throw PathSecurityError("invalid entry name '" + name + "'");
    if (data.size() > cfg_.max_entry_size)
        throw ResourceLimitExceeded("entry '" + name + "' is " + std::to_string(data.size()) +
                                    " bytes, limit " + std::to_string(cfg_.max_entry_size));
    if (entries_.size() >= cfg_.max_entries)
        throw ResourceLimitExceeded("container entry limit reached (" +
                                    std::to_string(cfg_.max_entries) + ")");
    if (index_.count(name))
        throw FormatError("duplicate entry '" + name + "' (entries are write-once)");

    EntryInfo e;
    e.name   = name;
    e.size   = data.size();
    e.offset = write_pos_;
    e.method = METHOD_STORED;

    std::vector<uint8_t> packed;
    const std::vector<uint8_t>* stored = &data;
    if (cfg_.compress && data.size() >= kMinCompress) {
        uLongf bound = compressBound((uLong)data.size());
        packed.resize(bound);
        int rc = compress2(packed.data(), &bound, data.data(), (uLong)data.size(),
                           cfg_.compression_level);
        if (rc != Z_OK)
            throw std::runtime_error("zlib compress2 failed: " + std::to_string(rc));
        packed.resize(bound);
        if (packed.size() < data.size()) {
            stored   = &packed;
            e.method = METHOD_DEFLATE;
        }
    }
    e.stored_size = stored->size();
    e.crc32       = crc32_of(stored->data(), stored->size());

    file_.clear();
    file_.seekp((std::streamoff)write_pos_);
    file_.write(reinterpret_cast<const char*>(stored->data()), (std::streamsize)stored->size());
    if (!file_)
        throw std::runtime_error("Write error on container: " + temp_path_);
    write_pos_ += e.stored_size;

    index_[name] = entries_.size();
    entries_.push_back(std::move(e));
}

void Container::commit() {
    if (mode_ != ContainerMode::Write || committed_)
        throw std::logic_error("container not open for writing: " + path_);

    std::vector<uint8_t> tail;
    for (const auto& e : entries_) {
        put_u16(tail, (uint16_t)e.name.size());
        tail.insert(tail.end(), e.name.begin(), e.name.end());
        tail.push_back(e.method);
        put_u64(tail, e.offset);
        put_u64(tail, e.stored_size);
        put_u64(tail, e.size);
        put_u32(tail, e.crc32);
    }
    put_u32(tail, (uint32_t)entries_.size());
    put_u64(tail, write_pos_);
    tail.insert(tail.end(), kEndMagic, kEndMagic + 4);

    file_.clear();
    file_.seekp((std::streamoff)write_pos_);
    file_.write(reinterpret_cast<const char*>(tail.data()), (std::streamsize)tail.size());
    file_.flush();
    if (!file_)
        throw std::runtime_error("Write error on container: " + temp_path_);
    file_.close();

    std::error_code ec;
    fs::rename(temp_path_, path_, ec);
    if (ec)
        throw std::runtime_error("Cannot move container into place at " + path_ +
                                 ": " + ec.message());
    committed_ = true;
}

std::vector<uint8_t> Container::read_entry(const std::string& name) {
    check_readable();
    const EntryInfo& info = entry_info(name);

    if (info.size > cfg_.max_entry_size)
        throw ResourceLimitExceeded("entry '" + name + "' declares " +
                                    std::to_string(info.size) + " bytes, limit " +
                                    std::to_string(cfg_.max_entry_size));

    std::vector<uint8_t> out;
    out.reserve((size_t)info.size);
    stream_entry(info, cfg_.max_entry_size, [&](const uint8_t* p, size_t n) {
        out.insert(out.end(), p, p + n);
    });
    return out;
}

bool Container::has_entry(const std::string& name) const {
    return index_.count(name) != 0;
}

std::vector<std::string> Container::list_entries() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& e : entries_)
        names.push_back(e.name);
    return names;
}

const EntryInfo& Container::entry_info(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end())
        throw FormatError("container has no entry '" + name + "'");
    return entries_[it->second];
}

std::map<std::string, std::string> Container::hash_all_entries() {
    check_readable();
    std::map<std::string, std::string> hashes;
    for (const auto& e : entries_) {
        if (is_meta_name(e.name))
            continue;
        Sha256 h;
        stream_entry(e, cfg_.max_entry_size, [&](const uint8_t* p, size_t n) {
            h.update(p, n);
        });
        hashes[e.name] = h.finish_hex();
    }
    return hashes;
}

fs::path Container::extract_entry_safely(const std::string& name, const fs::path& dest_dir) {
    check_readable();
    entry_info(name);
    if (!is_valid_entry_name(name))
        throw PathSecurityError("unsafe entry name '" + name + "'");
    // Resolve before reading so a hostile name costs nothing.
    path_guard::resolve_under(dest_dir, name);

    std::vector<uint8_t> data = read_entry(name);
    return path_guard::write_file_safely(dest_dir, name, data);
}
