#include "avrolite/value.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

using avrolite::ErrorKind;
using avrolite::Value;

int main() {
    // Scalars
    {
        CHECK(avrolite::parse_json("null").is_null());
        CHECK(avrolite::parse_json(" true ").as_bool());
        CHECK(avrolite::parse_json("-42").as_int() == -42);
        CHECK(avrolite::parse_json("9223372036854775807").as_int() == std::numeric_limits<std::int64_t>::max());
        CHECK(avrolite::parse_json("9223372036854775808").is_double());
        CHECK(avrolite::parse_json("1.5").as_double() == 1.5);
        CHECK(avrolite::parse_json("2e3").as_double() == 2000.0);
    }

    // Strings and escapes
    {
        CHECK(avrolite::parse_json(R"("a\"b\\c\n")").as_string() == "a\"b\\c\n");
        CHECK(avrolite::parse_json(R"("é")").as_string() == "\xC3\xA9");
        CHECK(avrolite::parse_json(R"("😀")").as_string() == "\xF0\x9F\x98\x80");
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json(R"("\ude00")"); }));
    }

    // Containers
    {
        Value v = avrolite::parse_json(R"({"b":[1,"x",null],"a":{}})");
        CHECK(v.is_object());
        CHECK(v.find("a") && v.find("a")->is_object());
        const auto& arr = v.find("b")->as_array();
        CHECK(arr.size() == 3);
        CHECK(arr[0].as_int() == 1);
        CHECK(arr[1].as_string() == "x");
        CHECK(arr[2].is_null());
        CHECK(v.find("missing") == nullptr);
    }

    // Malformed input
    {
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json(""); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("[1,]"); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("{\"a\" 1}"); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("nul"); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("1 2"); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json(std::string(600, '[')); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("01"); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("1."); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("-"); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_json("\"a\tb\""); }));
    }

    // Rendering
    {
        Value v = Value::make_object();
        v["s"] = "q\"\n";
        v["n"] = 3;
        v["d"] = 2.0;
        v["l"] = Value(Value::Array{Value(true), Value()});
        CHECK(avrolite::dump_json(v) == R"({"d":2.0,"l":[true,null],"n":3,"s":"q\"\n"})");
        CHECK(avrolite::parse_json(avrolite::dump_json(v)) == v);
        CHECK(avrolite::dump_json(Value(std::numeric_limits<double>::infinity())) == "null");
        CHECK(avrolite::dump_json_pretty(avrolite::parse_json("[1]")) == "[\n  1\n]");
        CHECK(avrolite::dump_json(Value(std::string("\x01"))) == R"("\u0001")");
        CHECK(avrolite::dump_json_pretty(avrolite::parse_json(R"({"a":{}})")) == "{\n  \"a\": {}\n}");
    }

    std::cout << "test_json: all tests passed.\n";
    return 0;
}
