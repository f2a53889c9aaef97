#pragma once

#include "avrolite/schemas.hpp"

#include <string>
#include <vector>

namespace avrolite::detail {

// Options threaded through one recursive parse.
struct ParseContext {
    Registry& registry;
    std::string name_space;
    const LogicalTypes& logical_types;

    // Context for a nested definition: its own namespace, when it has one,
    // applies to itself and its descendants.
    ParseContext nested(const Value& attrs) const;
};

TypeLink create_type(const Value& schema, const ParseContext& ctx);

struct ResolvedNames {
    std::string name;
    std::vector<std::string> aliases;
};

// Qualified name and aliases of a named definition, read from `key`.
ResolvedNames resolve_names(const Value& attrs, const std::string& name_space, const char* key = "name");

// Everything before the last dot of a qualified name.
std::string namespace_of(const std::string& qualified);

// Bounded rendering of a schema node for error messages.
std::string describe_schema(const Value& attrs);

} // namespace avrolite::detail
