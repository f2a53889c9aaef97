#pragma once

#include "avrolite/types.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace avrolite {

// ------------------------------
// Registry
// ------------------------------

// Qualified name -> compiled type. Grows while parsing and is read-only
// afterwards. Parses sharing one registry must not run concurrently.
class Registry {
public:
    TypePtr find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::size_t size() const noexcept { return types_.size(); }
    std::vector<std::string> names() const;

    // Throws AvroError(NameConflict) when `name` is taken.
    void add(const std::string& name, TypePtr type);

    // Used while a named type is being built: `pending` entries resolve to
    // non-owning back-references until mark_complete().
    void add_pending(const std::string& name, TypePtr type);
    bool is_pending(const std::string& name) const;
    void mark_complete(const std::string& name);
    void erase(const std::string& name);
    // Drops every entry whose name is not in `keep` (sorted, as from names()).
    void rollback(const std::vector<std::string>& keep);

private:
    std::map<std::string, TypePtr> types_;
    std::set<std::string> pending_;
};

// ------------------------------
// Parse options
// ------------------------------

// Builds the type for a schema carrying `"logicalType": <key>` from its
// attributes and the compiled underlying type.
using LogicalTypeHook = std::function<TypePtr(const Value& attrs, TypePtr underlying)>;
using LogicalTypes = std::map<std::string, LogicalTypeHook>;

struct ParseOptions {
    // Caller-owned registry to reuse across parses; a fresh one per call when null.
    Registry* registry{nullptr};
    // Namespace for dotless names.
    std::string name_space{};
    LogicalTypes logical_types{};
};

// Factory input: an already compiled type (returned as is), a type name, or
// a schema definition. A Value holding a string is also a type name.
using SchemaInput = std::variant<TypePtr, std::string, Value>;

/// Compiles a schema into a type graph.
TypePtr parse(const SchemaInput& schema, const ParseOptions& opts = ParseOptions{});

/// Compiles a schema given as JSON text.
TypePtr parse_schema(std::string_view json_text, const ParseOptions& opts = ParseOptions{});

// ------------------------------
// Names
// ------------------------------

/// `[A-Za-z_][A-Za-z0-9_]*`
bool is_valid_name(std::string_view name) noexcept;

/// Reserved Avro primitive names (null, boolean, int, long, float, double,
/// bytes, string).
bool is_primitive(std::string_view name) noexcept;

/// Last dot-separated segment of a name.
std::string unqualify(const std::string& name);

/// Prefixes a dotless name with `name_space` and checks every segment.
/// Throws AvroError(InvalidSchema) for bad segments and
/// AvroError(NameConflict) when the last segment is a primitive name.
std::string qualify(const std::string& name, const std::string& name_space);

} // namespace avrolite
