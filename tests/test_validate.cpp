#include "avrolite/easy.hpp"
#include "avrolite/record.hpp"
#include "avrolite/schemas.hpp"

#include "test_util.hpp"

#include <iostream>
#include <string>
#include <vector>

using avrolite::ErrorKind;
using avrolite::Path;
using avrolite::Value;

namespace easy = avrolite::easy;

// Reads data written with a one-field writer record into a two-field reader
// record, filling the extra field from its default.
class WidenResolver : public avrolite::Resolver {
public:
    explicit WidenResolver(avrolite::TypePtr reader) : reader_(std::move(reader)) {}

    const avrolite::Type& reader_type() const noexcept override { return *reader_; }

    Value read(avrolite::Cursor& cur, bool lazy) const override {
        const auto& rec = static_cast<const avrolite::RecordType&>(*reader_);
        Value name = rec.fields()[0].type().read(cur);
        if (!lazy) last_strict_ = true;
        return rec.construct({std::move(name)});
    }

    mutable bool last_strict_{false};

private:
    avrolite::TypePtr reader_;
};

struct Failure {
    Path path;
    Value value;
    std::string type;
};

static std::vector<Failure> collect(const avrolite::Type& t, const Value& v, bool* ok = nullptr) {
    std::vector<Failure> out;
    bool b = t.is_valid(v, [&](const Path& path, const Value& val, const avrolite::Type& type) {
        out.push_back(Failure{path, val, std::string(type.type_name())});
    });
    if (ok) *ok = b;
    return out;
}

int main() {
    const char* schema_text = R"({"type":"record","name":"Doc","fields":[
        {"name":"title","type":"string"},
        {"name":"a","type":{"type":"array","items":"string"}},
        {"name":"meta","type":{"type":"record","name":"Meta","fields":[
            {"name":"owner","type":"string"},
            {"name":"labels","type":{"type":"array","items":"string"},"default":[]}
        ]}}
    ]})";
    auto doc = avrolite::parse_schema(schema_text);

    // Error paths name the field and the array index
    {
        auto string_array = avrolite::parse_schema(R"({"type":"record","name":"S","fields":[
            {"name":"a","type":{"type":"array","items":"string"}}]})");
        bool ok = true;
        auto failures = collect(*string_array, avrolite::parse_json(R"({"a":["x",1]})"), &ok);
        CHECK(!ok);
        CHECK(failures.size() == 1);
        CHECK(failures[0].path == Path({"a", "1"}));
        CHECK(failures[0].value == Value(1));
        CHECK(failures[0].type == "string");

        failures = collect(*string_array, avrolite::parse_json(R"({"a":[1,"x"]})"));
        CHECK(failures.size() == 1);
        CHECK(failures[0].path == Path({"a", "0"}));
    }

    // Every invalid leaf is reported, not just the first
    {
        Value v = avrolite::parse_json(R"({"title":7,"a":["ok",null,"ok",false],"meta":{"owner":[],"labels":["l",2]}})");
        bool ok = true;
        auto failures = collect(*doc, v, &ok);
        CHECK(!ok);
        CHECK(failures.size() == 5);
        CHECK(failures[0].path == Path({"title"}));
        CHECK(failures[1].path == Path({"a", "1"}));
        CHECK(failures[2].path == Path({"a", "3"}));
        CHECK(failures[3].path == Path({"meta", "owner"}));
        CHECK(failures[4].path == Path({"meta", "labels", "1"}));
        CHECK(!doc->is_valid(v));
    }

    // Non-object values fail at the root; missing fields fail as null
    {
        auto failures = collect(*doc, Value("x"));
        CHECK(failures.size() == 1);
        CHECK(failures[0].path.empty());
        CHECK(failures[0].type == "record");

        failures = collect(*doc, avrolite::parse_json(R"({"a":[],"meta":{"owner":"o"}})"));
        CHECK(failures.size() == 1);
        CHECK(failures[0].path == Path({"title"}));
        CHECK(failures[0].value.is_null());
    }

    // Valid values never reach the hook, and validation leaves no state behind
    {
        Value v = avrolite::parse_json(R"({"title":"t","a":["x"],"meta":{"owner":"o"}})");
        for (int i = 0; i < 3; ++i) {
            bool ok = false;
            CHECK(collect(*doc, v, &ok).empty());
            CHECK(ok);
            CHECK(doc->is_valid(v));
        }
    }

    // Strict and lenient decoding
    {
        Value v = avrolite::parse_json(R"({"title":"t","a":["x","y"],"meta":{"owner":"o","labels":[]}})");
        auto bytes = doc->to_buffer(v);
        CHECK(doc->from_buffer(bytes) == v);

        auto longer = bytes;
        longer.push_back(0x00);
        longer.push_back(0x00);
        bool threw = false;
        try {
            doc->from_buffer(longer);
        } catch (const avrolite::AvroError& e) {
            threw = e.kind() == ErrorKind::TrailingData &&
                    std::string(e.what()).find("2 unread bytes") != std::string::npos;
        }
        CHECK(threw);
        CHECK(doc->from_buffer(longer, nullptr, true) == v);

        for (std::size_t n = 0; n < bytes.size(); ++n) {
            std::vector<std::uint8_t> cut(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(n));
            CHECK(throws_kind(ErrorKind::TruncatedBuffer, [&] { doc->from_buffer(cut); }));
        }
    }

    // Resolvers
    {
        auto writer = avrolite::parse_schema(R"({"type":"record","name":"V1","fields":[
            {"name":"name","type":"string"}]})");
        auto reader = avrolite::parse_schema(R"({"type":"record","name":"V2","fields":[
            {"name":"name","type":"string"},
            {"name":"email","type":"string","default":"none"}]})");
        auto bytes = writer->to_buffer(easy::object({{"name", "ann"}}));

        WidenResolver resolver(reader);
        Value v = reader->from_buffer(bytes, &resolver);
        CHECK(v.find("name")->as_string() == "ann");
        CHECK(v.find("email")->as_string() == "none");
        CHECK(resolver.last_strict_);

        CHECK(throws_kind(ErrorKind::InvalidResolver, [&] { writer->from_buffer(bytes, &resolver); }));
    }

    std::cout << "test_validate: all tests passed.\n";
    return 0;
}
