#pragma once

#include "avrolite/value.hpp"

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace avrolite::easy {

// ------------------------------
// Value builders
// ------------------------------

inline Value object(std::initializer_list<std::pair<const std::string, Value>> members) {
    return Value(Value::Object(members));
}

inline Value array(std::initializer_list<Value> items) {
    return Value(Value::Array(items));
}

inline Value strings(const std::vector<std::string>& items) {
    Value out = Value::make_array();
    out.as_array().reserve(items.size());
    for (const auto& s : items) out.as_array().emplace_back(s);
    return out;
}

inline void set(Value& obj, std::string key, Value v) {
    obj[std::move(key)] = std::move(v);
}

// ------------------------------
// Schema builders
// ------------------------------

inline Value array_schema(Value items) {
    return object({{"type", "array"}, {"items", std::move(items)}});
}

inline Value field_schema(std::string name, Value type) {
    return object({{"name", std::move(name)}, {"type", std::move(type)}});
}

inline Value field_schema(std::string name, Value type, Value default_value) {
    Value f = field_schema(std::move(name), std::move(type));
    f["default"] = std::move(default_value);
    return f;
}

// Empty `name_space` leaves the namespace to the enclosing schema.
inline Value record_schema(std::string name, std::vector<Value> fields, std::string name_space = {}) {
    Value r = object({{"type", "record"}, {"name", std::move(name)}});
    if (!name_space.empty()) r["namespace"] = std::move(name_space);
    r["fields"] = Value(Value::Array(std::move(fields)));
    return r;
}

} // namespace avrolite::easy
