#pragma once
#include <vector>
#include <map>
#include <string>
#include <cstdint>

// Canonical msgpack encoding.
//
// Every value has exactly one byte representation:
//   - map keys are strings, emitted in ascending bytewise order
//   - integers use the shortest msgpack form (non-negative as uint family)
//   - strings and binary are distinct types and never coerced
//   - floats and extension types are not representable
//
// decode() accepts only bytes that encode() could have produced for the
// decoded value: trailing bytes, duplicate keys, non-string keys, floats and
// non-shortest forms are rejected with FormatError.

namespace canon {

class Value {
public:
    enum class Type { Nil, Bool, Int, Str, Bin, Array, Map };

    using Array = std::vector<Value>;
    using Map   = std::map<std::string, Value>;

    Value() = default;

    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value string(const std::string& s);
    static Value binary(const std::vector<uint8_t>& b);
    static Value array(Array items = {});
    static Value map(Map entries = {});

    Type type() const { return type_; }
    bool is(Type t) const { return type_ == t; }

    // Typed accessors throw FormatError when the type does not match;
    // ctx names the field in the message.
    bool                        as_bool(const char* ctx = "value") const;
    int64_t                     as_int(const char* ctx = "value") const;
    const std::string&          as_str(const char* ctx = "value") const;
    const std::vector<uint8_t>& as_bin(const char* ctx = "value") const;
    const Array&                as_array(const char* ctx = "value") const;
    const Map&                  as_map(const char* ctx = "value") const;

    Array& items();
    Map&   entries();

    // Map helpers. set() requires a map value.
    Value& set(const std::string& key, Value v);
    bool has(const std::string& key) const;
    // Throws FormatError if the key is missing.
    const Value& at(const std::string& key) const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    Type                 type_ = Type::Nil;
    bool                 bool_ = false;
    int64_t              int_  = 0;
    std::string          str_;
    std::vector<uint8_t> bin_;
    Array                array_;
    Map                  map_;
};

std::vector<uint8_t> encode(const Value& v);

// Throws FormatError on malformed, truncated or non-canonical input.
Value decode(const std::vector<uint8_t>& bytes);
Value decode(const uint8_t* data, size_t len);

} // namespace canon
