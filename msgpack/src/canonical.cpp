#include "canonical.hpp"
#include "errors.hpp"
#include <msgpack.hpp>
#include <algorithm>
#include <limits>
#include <string>

namespace canon {

// ── Limits ────────────────────────────────────────────────────────────────────
// Manifests and recipient blocks are small; anything deeper or wider than
// this is hostile input.

static const msgpack::unpack_limit kLimit(
    /*array*/ 1u << 16, /*map*/ 1u << 16, /*str*/ 1u << 20,
    /*bin*/   1u << 24, /*ext*/ 0,       /*depth*/ 32);

// ── Value ─────────────────────────────────────────────────────────────────────

Value Value::boolean(bool b)            { Value v; v.type_ = Type::Bool;  v.bool_ = b;  return v; }
Value Value::integer(int64_t i)         { Value v; v.type_ = Type::Int;   v.int_ = i;   return v; }
Value Value::string(const std::string& s) { Value v; v.type_ = Type::Str; v.str_ = s;   return v; }

Value Value::binary(const std::vector<uint8_t>& b) {
    Value v;
    v.type_ = Type::Bin;
    v.bin_  = b;
    return v;
}

Value Value::array(Array items) {
    Value v;
    v.type_  = Type::Array;
    v.array_ = std::move(items);
    return v;
}

Value Value::map(Map entries) {
    Value v;
    v.type_ = Type::Map;
    v.map_  = std::move(entries);
    return v;
}

static const char* type_name(Value::Type t) {
    switch (t) {
        case Value::Type::Nil:   return "nil";
        case Value::Type::Bool:  return "bool";
        case Value::Type::Int:   return "integer";
        case Value::Type::Str:   return "string";
        case Value::Type::Bin:   return "binary";
        case Value::Type::Array: return "array";
        case Value::Type::Map:   return "map";
    }
    return "unknown";
}

static void expect(const Value& v, Value::Type t, const char* ctx) {
    if (v.type() != t)
        throw FormatError(std::string(ctx) + ": expected " + type_name(t) +
                          ", got " + type_name(v.type()));
}

bool Value::as_bool(const char* ctx) const                   { expect(*this, Type::Bool, ctx);  return bool_; }
int64_t Value::as_int(const char* ctx) const                 { expect(*this, Type::Int, ctx);   return int_; }
const std::string& Value::as_str(const char* ctx) const      { expect(*this, Type::Str, ctx);   return str_; }
const std::vector<uint8_t>& Value::as_bin(const char* ctx) const { expect(*this, Type::Bin, ctx); return bin_; }
const Value::Array& Value::as_array(const char* ctx) const   { expect(*this, Type::Array, ctx); return array_; }
const Value::Map& Value::as_map(const char* ctx) const       { expect(*this, Type::Map, ctx);   return map_; }

Value::Array& Value::items() {
    expect(*this, Type::Array, "items");
    return array_;
}

Value::Map& Value::entries() {
    expect(*this, Type::Map, "entries");
    return map_;
}

Value& Value::set(const std::string& key, Value v) {
    expect(*this, Type::Map, "set");
    map_[key] = std::move(v);
    return *this;
}

bool Value::has(const std::string& key) const {
    return type_ == Type::Map && map_.count(key) != 0;
}

const Value& Value::at(const std::string& key) const {
    expect(*this, Type::Map, key.c_str());
    auto it = map_.find(key);
    if (it == map_.end())
        throw FormatError("missing required field '" + key + "'");
    return it->second;
}

bool Value::operator==(const Value& o) const {
    if (type_ != o.type_) return false;
    switch (type_) {
        case Type::Nil:   return true;
        case Type::Bool:  return bool_ == o.bool_;
        case Type::Int:   return int_ == o.int_;
        case Type::Str:   return str_ == o.str_;
        case Type::Bin:   return bin_ == o.bin_;
        case Type::Array: return array_ == o.array_;
        case Type::Map:   return map_ == o.map_;
    }
    return false;
}

// ── encode ────────────────────────────────────────────────────────────────────

static void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const Value& v) {
    switch (v.type()) {
        case Value::Type::Nil:
            pk.pack_nil();
            break;
        case Value::Type::Bool:
            if (v.as_bool()) pk.pack_true(); else pk.pack_false();
            break;
        case Value::Type::Int: {
            int64_t i = v.as_int();
            // msgpack-c picks the shortest form for both families
            if (i >= 0) pk.pack_uint64(static_cast<uint64_t>(i));
            else        pk.pack_int64(i);
            break;
        }
        case Value::Type::Str: {
            const std::string& s = v.as_str();
            pk.pack_str(static_cast<uint32_t>(s.size()));
            pk.pack_str_body(s.data(), s.size());
            break;
        }
        case Value::Type::Bin: {
            const auto& b = v.as_bin();
            pk.pack_bin(static_cast<uint32_t>(b.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(b.data()), b.size());
            break;
        }
        case Value::Type::Array: {
            const auto& arr = v.as_array();
            pk.pack_array(static_cast<uint32_t>(arr.size()));
            for (const auto& item : arr)
                pack_value(pk, item);
            break;
        }
        case Value::Type::Map: {
            // std::map iterates in ascending bytewise key order
            const auto& m = v.as_map();
            pk.pack_map(static_cast<uint32_t>(m.size()));
            for (const auto& kv : m) {
                pk.pack_str(static_cast<uint32_t>(kv.first.size()));
                pk.pack_str_body(kv.first.data(), kv.first.size());
                pack_value(pk, kv.second);
            }
            break;
        }
    }
}

std::vector<uint8_t> encode(const Value& v) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);
    pack_value(pk, v);
    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

// ── decode ────────────────────────────────────────────────────────────────────

static Value from_object(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return Value();
        case msgpack::type::BOOLEAN:
            return Value::boolean(obj.via.boolean);
        case msgpack::type::POSITIVE_INTEGER:
            if (obj.via.u64 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                throw FormatError("decode: integer out of range");
            return Value::integer(static_cast<int64_t>(obj.via.u64));
        case msgpack::type::NEGATIVE_INTEGER:
            return Value::integer(obj.via.i64);
        case msgpack::type::STR:
            return Value::string(std::string(obj.via.str.ptr, obj.via.str.size));
        case msgpack::type::BIN: {
            const uint8_t* p = reinterpret_cast<const uint8_t*>(obj.via.bin.ptr);
            return Value::binary(std::vector<uint8_t>(p, p + obj.via.bin.size));
        }
        case msgpack::type::ARRAY: {
            Value::Array items;
            items.reserve(obj.via.array.size);
            for (uint32_t i = 0; i < obj.via.array.size; ++i)
                items.push_back(from_object(obj.via.array.ptr[i]));
            return Value::array(std::move(items));
        }
        case msgpack::type::MAP: {
            Value::Map entries;
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                if (kv.key.type != msgpack::type::STR)
                    throw FormatError("decode: map key must be a string");
                std::string key(kv.key.via.str.ptr, kv.key.via.str.size);
                if (!entries.emplace(key, from_object(kv.val)).second)
                    throw FormatError("decode: duplicate map key '" + key + "'");
            }
            return Value::map(std::move(entries));
        }
        default:
            throw FormatError("decode: unsupported msgpack type " +
                              std::to_string(static_cast<int>(obj.type)));
    }
}

Value decode(const uint8_t* data, size_t len) {
    if (len == 0)
        throw FormatError("decode: empty input");

    msgpack::object_handle oh;
    size_t off = 0;
    try {
        oh = msgpack::unpack(reinterpret_cast<const char*>(data), len, off,
                             nullptr, nullptr, kLimit);
    } catch (const msgpack::unpack_error& e) {
        throw FormatError(std::string("decode: ") + e.what());
    }
    if (off != len)
        throw FormatError("decode: trailing bytes after value");

    Value v = from_object(oh.get());

    std::vector<uint8_t> again = encode(v);
    if (again.size() != len || !std::equal(again.begin(), again.end(), data))
        throw FormatError("decode: input is not in canonical form");
    return v;
}

Value decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

} // namespace canon
