#include "avrolite/easy.hpp"
#include "avrolite/record.hpp"
#include "avrolite/schemas.hpp"

#include "test_util.hpp"

#include <iostream>
#include <memory>
#include <string>

using avrolite::ErrorKind;
using avrolite::ParseOptions;
using avrolite::Registry;
using avrolite::Value;

namespace easy = avrolite::easy;

// Logical wrapper used to exercise the parse hook: same wire format as the
// underlying type, tagged with the logical name.
class TaggedType : public avrolite::Type {
public:
    TaggedType(std::string tag, avrolite::TypePtr base) : tag_(std::move(tag)), base_(std::move(base)) {}

    std::string_view type_name() const noexcept override { return base_->type_name(); }
    const std::string& tag() const noexcept { return tag_; }

    bool check(const Value& val, const avrolite::ErrorHook* hook, avrolite::Path& path) const override {
        return base_->check(val, hook, path);
    }
    Value read(avrolite::Cursor& cur) const override { return base_->read(cur); }
    void skip(avrolite::Cursor& cur) const override { base_->skip(cur); }
    void write(avrolite::Cursor& cur, const Value& val) const override { base_->write(cur, val); }
    Value copy(const Value& val) const override { return base_->copy(val); }
    Value attrs(std::set<std::string>& named) const override {
        Value out = base_->attrs(named);
        if (!out.is_object()) out = easy::object({{"type", out}});
        out["logicalType"] = tag_;
        return out;
    }

private:
    std::string tag_;
    avrolite::TypePtr base_;
};

int main() {
    // Named types register under their qualified name
    {
        Registry registry;
        ParseOptions opts;
        opts.registry = &registry;
        auto foo = avrolite::parse_schema(R"({"type":"record","name":"Foo","namespace":"ns","fields":[]})", opts);
        CHECK(foo->name() == "ns.Foo");
        CHECK(registry.contains("ns.Foo"));
        CHECK(registry.find("ns.Foo") == foo);

        auto again = avrolite::parse(std::string("ns.Foo"), opts);
        CHECK(again == foo);

        // Dotless references fall back to the default namespace.
        ParseOptions in_ns = opts;
        in_ns.name_space = "ns";
        CHECK(avrolite::parse(std::string("Foo"), in_ns) == foo);
    }

    // Conflicting names
    {
        Registry registry;
        ParseOptions opts;
        opts.registry = &registry;
        avrolite::parse_schema(R"({"type":"record","name":"Foo","namespace":"ns","fields":[]})", opts);
        CHECK(throws_kind(ErrorKind::NameConflict, [&] {
            avrolite::parse_schema(
                R"({"type":"record","name":"ns.Foo","fields":[{"name":"x","type":"string"}]})", opts);
        }));
        CHECK(throws_kind(ErrorKind::NameConflict, [] {
            avrolite::parse_schema(R"({"type":"record","name":"string","fields":[]})");
        }));
        CHECK(throws_kind(ErrorKind::NameConflict, [] {
            avrolite::parse_schema(R"({"type":"record","name":"long","namespace":"ns","fields":[]})");
        }));
    }

    // Malformed schemas
    {
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse(Value()); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse_schema(R"({"type":"array"})"); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] {
            avrolite::parse_schema(R"({"type":"record","name":"R","fields":{}})");
        }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] {
            avrolite::parse_schema(R"({"type":"record","fields":[]})");
        }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] {
            avrolite::parse_schema(R"({"type":"record","name":"1bad","fields":[]})");
        }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse_schema(R"({"type":"widget"})"); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse_schema(R"({"items":"string"})"); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse(std::string("Nope")); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse(std::string("int")); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse_schema(R"(["string"])"); }));
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::parse(Value(3)); }));
        CHECK(throws_kind(ErrorKind::JsonParse, [] { avrolite::parse_schema("{"); }));
    }

    // A failed definition leaves no entry behind
    {
        Registry registry;
        ParseOptions opts;
        opts.registry = &registry;
        CHECK(throws_kind(ErrorKind::InvalidSchema, [&] {
            avrolite::parse_schema(R"({"type":"record","name":"Broken","fields":[{"name":"x"}]})", opts);
        }));
        CHECK(!registry.contains("Broken"));
        auto fixed = avrolite::parse_schema(
            R"({"type":"record","name":"Broken","fields":[{"name":"x","type":"string"}]})", opts);
        CHECK(fixed->name() == "Broken");

        // Nested named types referring back to the failed record are dropped too.
        std::size_t size_before = registry.size();
        CHECK(throws_kind(ErrorKind::NameConflict, [&] {
            avrolite::parse_schema(R"({"type":"record","name":"A","fields":[
                {"name":"b","type":{"type":"record","name":"B","fields":[{"name":"a","type":"A"}]}},
                {"name":"b","type":"string"}]})", opts);
        }));
        CHECK(!registry.contains("A"));
        CHECK(!registry.contains("B"));
        CHECK(registry.contains("Broken"));
        CHECK(registry.size() == size_before);
        CHECK(throws_kind(ErrorKind::InvalidSchema, [&] { avrolite::parse(std::string("B"), opts); }));
    }

    // Primitive and array definitions
    {
        auto s = avrolite::parse_schema(R"({"type":"string"})");
        CHECK(s->type_name() == "string");
        CHECK(s->to_string() == "\"string\"");

        auto a = avrolite::parse(easy::array_schema("string"));
        CHECK(a->type_name() == "array");
        CHECK(a->to_string() == R"({"items":"string","type":"array"})");

        // Precompiled input comes back untouched.
        CHECK(avrolite::parse(a) == a);
    }

    // Nested names inherit the enclosing namespace
    {
        Registry registry;
        ParseOptions opts;
        opts.registry = &registry;
        auto outer = avrolite::parse(easy::record_schema("Outer", {
            easy::field_schema("inner", easy::record_schema("Inner", {})),
            easy::field_schema("again", "Inner"),
            easy::field_schema("other", easy::record_schema("Other", {}, "elsewhere")),
        }, "a.b"), opts);
        CHECK(outer->name() == "a.b.Outer");
        CHECK(registry.contains("a.b.Inner"));
        CHECK(registry.contains("elsewhere.Other"));

        const auto& rec = static_cast<const avrolite::RecordType&>(*outer);
        CHECK(&rec.fields()[0].type() == &rec.fields()[1].type());
    }

    // Recursive schemas render each named type once
    {
        const char* text = R"({"type":"record","name":"Node","fields":[
            {"name":"label","type":"string"},
            {"name":"children","type":{"type":"array","items":"Node"}}
        ]})";
        auto node = avrolite::parse_schema(text);
        CHECK(node->to_string() ==
              R"({"fields":[{"name":"label","type":"string"},)"
              R"({"name":"children","type":{"items":"Node","type":"array"}}],"name":"Node","type":"record"})");

        auto reparsed = avrolite::parse_schema(node->to_string());
        CHECK(reparsed->to_string() == node->to_string());

        Value tree = avrolite::parse_json(R"({"label":"root","children":[
            {"label":"a","children":[]},
            {"label":"b","children":[{"label":"c","children":[]}]}
        ]})");
        CHECK(node->is_valid(tree));
        auto bytes = node->to_buffer(tree);
        Value back = node->from_buffer(bytes);
        CHECK(back == tree);
        CHECK(back.record_type.lock() == node);
        CHECK(back.find("children")->as_array()[1].record_type.lock() == node);
    }

    // Logical type hooks wrap the underlying type
    {
        ParseOptions opts;
        opts.logical_types["uuid"] = [](const Value& attrs, avrolite::TypePtr underlying) -> avrolite::TypePtr {
            CHECK(attrs.find("logicalType")->as_string() == "uuid");
            return std::make_shared<const TaggedType>("uuid", std::move(underlying));
        };
        auto rec = avrolite::parse_schema(R"({"type":"record","name":"R","fields":[
            {"name":"id","type":{"type":"string","logicalType":"uuid"}},
            {"name":"note","type":{"type":"string","logicalType":"unknown"}}
        ]})", opts);
        const auto& r = static_cast<const avrolite::RecordType&>(*rec);
        const auto* tagged = dynamic_cast<const TaggedType*>(&r.field("id")->type());
        CHECK(tagged != nullptr);
        CHECK(tagged->tag() == "uuid");
        CHECK(dynamic_cast<const TaggedType*>(&r.field("note")->type()) == nullptr);

        Value v = avrolite::parse_json(R"({"id":"123e4567","note":"n"})");
        CHECK(rec->from_buffer(rec->to_buffer(v)) == v);
    }

    // Names
    {
        CHECK(avrolite::is_valid_name("_a1"));
        CHECK(!avrolite::is_valid_name("a-b"));
        CHECK(!avrolite::is_valid_name(""));
        CHECK(avrolite::is_primitive("bytes"));
        CHECK(!avrolite::is_primitive("record"));
        CHECK(avrolite::unqualify("a.b.C") == "C");
        CHECK(avrolite::qualify("C", "a.b") == "a.b.C");
        CHECK(avrolite::qualify("x.C", "a.b") == "x.C");
        CHECK(throws_kind(ErrorKind::InvalidSchema, [] { avrolite::qualify("a..C", ""); }));
    }

    std::cout << "test_schemas: all tests passed.\n";
    return 0;
}
