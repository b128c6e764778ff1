#include "canonical.hpp"
#include "errors.hpp"
#include <iostream>
#include <cstring>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static bool decode_rejects(const std::vector<uint8_t>& bytes, const char* msg) {
    try {
        canon::decode(bytes);
    } catch (const FormatError&) {
        return true;
    }
    return fail(msg);
}

using canon::Value;

int main() {
    bool ok = true;

    // Same logical map, built in two different insertion orders
    Value a = Value::map();
    a.set("zeta",  Value::integer(1));
    a.set("alpha", Value::string("x"));
    a.set("mid",   Value::array({Value::integer(3), Value::boolean(true), Value()}));
    Value inner_a = Value::map();
    inner_a.set("b", Value::binary({0x00, 0xFF}));
    inner_a.set("a", Value::integer(-7));
    a.set("nested", inner_a);

    Value b = Value::map();
    Value inner_b = Value::map();
    inner_b.set("a", Value::integer(-7));
    inner_b.set("b", Value::binary({0x00, 0xFF}));
    b.set("nested", inner_b);
    b.set("mid",   Value::array({Value::integer(3), Value::boolean(true), Value()}));
    b.set("alpha", Value::string("x"));
    b.set("zeta",  Value::integer(1));

    std::vector<uint8_t> ea = canon::encode(a);
    std::vector<uint8_t> eb = canon::encode(b);
    ok &= check(ea == eb, "insertion order changed the encoding");
    ok &= check(canon::encode(a) == ea, "repeated encode is not deterministic");

    // Keys come out in ascending bytewise order: fixmap(4), fixstr "alpha" first
    ok &= check(ea.size() > 7 && ea[0] == 0x84 && ea[1] == 0xA5 &&
                std::memcmp(&ea[2], "alpha", 5) == 0, "first key is not 'alpha'");

    // Array order is significant
    Value arr1 = Value::array({Value::integer(1), Value::integer(2)});
    Value arr2 = Value::array({Value::integer(2), Value::integer(1)});
    ok &= check(canon::encode(arr1) != canon::encode(arr2), "array order ignored");

    // Decode of canonical bytes gives back an equal value
    try {
        ok &= check(canon::decode(ea) == a, "decode(encode(v)) != v");
    } catch (const std::exception& e) {
        std::cerr << "FAIL: decode threw: " << e.what() << "\n";
        ok = false;
    }

    // Shortest integer forms
    ok &= check(canon::encode(Value::integer(5))   == std::vector<uint8_t>({0x05}), "fixint 5");
    ok &= check(canon::encode(Value::integer(200)) == std::vector<uint8_t>({0xCC, 0xC8}), "uint8 200");
    ok &= check(canon::encode(Value::integer(-1))  == std::vector<uint8_t>({0xFF}), "negative fixint -1");

    // String and binary stay distinct
    ok &= check(canon::encode(Value::string("ab")) != canon::encode(Value::binary({'a', 'b'})),
                "string and binary encoded alike");

    // Rejections
    ok &= decode_rejects({0xCC, 0x05}, "non-shortest uint8 accepted");
    ok &= decode_rejects({0x05, 0x06}, "trailing bytes accepted");
    ok &= decode_rejects({0x82, 0xA1, 'a', 0x01, 0xA1, 'a', 0x02}, "duplicate key accepted");
    ok &= decode_rejects({0x82, 0xA1, 'b', 0x01, 0xA1, 'a', 0x02}, "unsorted keys accepted");
    ok &= decode_rejects({0x81, 0x01, 0x02}, "integer map key accepted");
    ok &= decode_rejects({0xCB, 0, 0, 0, 0, 0, 0, 0, 0}, "float accepted");
    ok &= decode_rejects({0x92, 0x01}, "truncated array accepted");
    ok &= decode_rejects({}, "empty input accepted");

    // Typed accessors name the field on mismatch
    try {
        Value::integer(1).as_str("'package_id'");
        ok &= fail("as_str on integer did not throw");
    } catch (const FormatError& e) {
        ok &= check(std::strstr(e.what(), "package_id") != nullptr, "field name missing from error");
    }

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
