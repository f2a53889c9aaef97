#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace avrolite {

class RecordType;

// ------------------------------
// Dynamic value model
// ------------------------------

// JSON-shaped in-memory value. Schemas, decoded data and text round-trips all
// go through this representation.
struct Value {
    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    std::variant<
        std::nullptr_t,
        bool,
        std::int64_t,
        double,
        std::string,
        Array,
        Object
    > v{nullptr};

    // Set on values built by a record type's constructor. Non-owning: it
    // expires with the type instead of dangling.
    std::weak_ptr<const RecordType> record_type;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : v(b) {}
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T n) : v(static_cast<std::int64_t>(n)) {}
    Value(double d) : v(d) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(std::string s) : v(std::move(s)) {}
    Value(Array a) : v(std::move(a)) {}
    Value(Object o) : v(std::move(o)) {}

    static Value make_array();
    static Value make_object();

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(v); }
    bool is_double() const noexcept { return std::holds_alternative<double>(v); }
    bool is_number() const noexcept { return is_int() || is_double(); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_array() const noexcept { return std::holds_alternative<Array>(v); }
    bool is_object() const noexcept { return std::holds_alternative<Object>(v); }

    bool as_bool() const { return std::get<bool>(v); }
    std::int64_t as_int() const { return std::get<std::int64_t>(v); }
    double as_double() const;
    const std::string& as_string() const { return std::get<std::string>(v); }
    const Array& as_array() const { return std::get<Array>(v); }
    Array& as_array() { return std::get<Array>(v); }
    const Object& as_object() const { return std::get<Object>(v); }
    Object& as_object() { return std::get<Object>(v); }

    // Object member lookup; nullptr when absent or when this is not an object.
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    // Object member access, turning a null value into an empty object first.
    Value& operator[](const std::string& key);

    // Short description of the held alternative ("string", "object", ...).
    const char* kind_name() const noexcept;

    // Compares contents only; the record type link is ignored.
    bool operator==(const Value& o) const { return v == o.v; }
    bool operator!=(const Value& o) const { return !(*this == o); }
};

// ------------------------------
// JSON text
// ------------------------------

/// Parse one JSON document. Integers that fit become int64, other numbers
/// double. Throws AvroError(JsonParse) on malformed input or trailing data.
Value parse_json(std::string_view text);

/// Compact JSON rendering. Non-finite doubles render as null.
std::string dump_json(const Value& v);

/// Indented JSON rendering, used by the CLI previews.
std::string dump_json_pretty(const Value& v, int indent = 2);

} // namespace avrolite
