#include "avrolite/schemas.hpp"
#include "avrolite/record.hpp"

#include "internal.hpp"

#include <algorithm>
#include <array>

namespace avrolite {

namespace {

constexpr std::array<std::string_view, 8> kPrimitiveNames = {
    "null", "boolean", "int", "long", "float", "double", "bytes", "string",
};

// Lookup through the registry: owning for completed types, a back-reference
// for a type whose definition is still being parsed.
TypeLink lookup(const Registry& registry, const std::string& name) {
    TypePtr t = registry.find(name);
    if (!t) return {};
    if (registry.is_pending(name)) return TypeLink::back_reference(*t);
    return TypeLink(std::move(t));
}

TypeLink resolve_reference(const std::string& name, const detail::ParseContext& ctx) {
    if (TypeLink t = lookup(ctx.registry, name)) return t;
    if (name.find('.') == std::string::npos && !ctx.name_space.empty()) {
        if (TypeLink t = lookup(ctx.registry, ctx.name_space + "." + name)) return t;
    }
    if (is_primitive(name)) {
        if (name == "string") {
            // Cached so every reference shares one instance.
            TypePtr t = std::make_shared<const StringType>();
            ctx.registry.add(name, t);
            return TypeLink(std::move(t));
        }
        throw AvroError(ErrorKind::InvalidSchema, "unsupported primitive type: " + name);
    }
    throw AvroError(ErrorKind::InvalidSchema, "undefined type name: " + name);
}

TypePtr create_definition(const Value& attrs, const detail::ParseContext& ctx) {
    const Value* t = attrs.find("type");
    if (!t || !t->is_string()) {
        throw AvroError(ErrorKind::InvalidSchema,
                        "unknown type: " + (t ? dump_json(*t) : std::string("undefined")));
    }
    const std::string& type_name = t->as_string();

    if (type_name == "string") {
        return std::make_shared<const StringType>();
    }
    if (type_name == "array") {
        const Value* items = attrs.find("items");
        if (!items || items->is_null()) {
            throw AvroError(ErrorKind::InvalidSchema, "missing array items: " + detail::describe_schema(attrs));
        }
        return std::make_shared<const ArrayType>(detail::create_type(*items, ctx));
    }
    if (type_name == "record") {
        return RecordType::create(attrs, ctx);
    }
    throw AvroError(ErrorKind::InvalidSchema, "unknown type: " + type_name);
}

} // namespace

// ------------------------------
// Registry
// ------------------------------

TypePtr Registry::find(const std::string& name) const {
    auto it = types_.find(name);
    if (it == types_.end()) return nullptr;
    return it->second;
}

bool Registry::contains(const std::string& name) const {
    return types_.find(name) != types_.end();
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> out;
    out.reserve(types_.size());
    for (const auto& kv : types_) out.push_back(kv.first);
    return out;
}

void Registry::add(const std::string& name, TypePtr type) {
    if (!types_.emplace(name, std::move(type)).second) {
        throw AvroError(ErrorKind::NameConflict, "duplicate type name: " + name);
    }
}

void Registry::add_pending(const std::string& name, TypePtr type) {
    add(name, std::move(type));
    pending_.insert(name);
}

bool Registry::is_pending(const std::string& name) const {
    return pending_.find(name) != pending_.end();
}

void Registry::mark_complete(const std::string& name) {
    pending_.erase(name);
}

void Registry::erase(const std::string& name) {
    types_.erase(name);
    pending_.erase(name);
}

void Registry::rollback(const std::vector<std::string>& keep) {
    for (auto it = types_.begin(); it != types_.end();) {
        if (std::binary_search(keep.begin(), keep.end(), it->first)) {
            ++it;
            continue;
        }
        pending_.erase(it->first);
        it = types_.erase(it);
    }
}

// ------------------------------
// Names
// ------------------------------

bool is_valid_name(std::string_view name) noexcept {
    if (name.empty()) return false;
    auto alpha = [](char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'; };
    if (!alpha(name[0])) return false;
    for (char c : name.substr(1)) {
        if (!alpha(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

bool is_primitive(std::string_view name) noexcept {
    for (auto p : kPrimitiveNames) {
        if (p == name) return true;
    }
    return false;
}

std::string unqualify(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos) return name;
    return name.substr(dot + 1);
}

std::string qualify(const std::string& name, const std::string& name_space) {
    std::string out = name;
    if (out.find('.') == std::string::npos && !name_space.empty()) {
        out = name_space + "." + out;
    }
    std::string tail = unqualify(out);
    if (is_primitive(tail)) {
        // Primitive types cannot be defined in any namespace.
        throw AvroError(ErrorKind::NameConflict, "cannot rename primitive type: " + tail);
    }
    std::size_t start = 0;
    while (true) {
        auto dot = out.find('.', start);
        std::string_view part = std::string_view(out).substr(
            start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!is_valid_name(part)) {
            throw AvroError(ErrorKind::InvalidSchema, "invalid name: " + out);
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return out;
}

// ------------------------------
// Factory
// ------------------------------

namespace detail {

ParseContext ParseContext::nested(const Value& attrs) const {
    const Value* ns = attrs.find("namespace");
    if (ns && ns->is_string() && !ns->as_string().empty()) {
        return ParseContext{registry, ns->as_string(), logical_types};
    }
    return ParseContext{registry, name_space, logical_types};
}

std::string namespace_of(const std::string& qualified) {
    auto dot = qualified.rfind('.');
    if (dot == std::string::npos) return {};
    return qualified.substr(0, dot);
}

std::string describe_schema(const Value& attrs) {
    std::string s = dump_json(attrs);
    if (s.size() > 120) {
        s.resize(120);
        s += "...";
    }
    return s;
}

ResolvedNames resolve_names(const Value& attrs, const std::string& name_space, const char* key) {
    const Value* name = attrs.find(key);
    if (!name || !name->is_string() || name->as_string().empty()) {
        throw AvroError(ErrorKind::InvalidSchema,
                        std::string("missing ") + key + " property in schema: " + describe_schema(attrs));
    }

    ResolvedNames out;
    out.name = qualify(name->as_string(), name_space);
    if (const Value* aliases = attrs.find("aliases")) {
        if (!aliases->is_array()) {
            throw AvroError(ErrorKind::InvalidSchema, "aliases must be an array: " + describe_schema(attrs));
        }
        for (const auto& a : aliases->as_array()) {
            if (!a.is_string()) {
                throw AvroError(ErrorKind::InvalidSchema, "invalid alias: " + dump_json(a));
            }
            out.aliases.push_back(qualify(a.as_string(), name_space));
        }
    }
    return out;
}

TypeLink create_type(const Value& schema, const ParseContext& ctx) {
    if (schema.is_null()) {
        throw AvroError(ErrorKind::InvalidSchema, "invalid type: null (did you mean \"null\"?)");
    }
    if (schema.is_string()) {
        return resolve_reference(schema.as_string(), ctx);
    }
    if (schema.is_array()) {
        throw AvroError(ErrorKind::InvalidSchema, "unsupported schema (union): " + describe_schema(schema));
    }
    if (!schema.is_object()) {
        throw AvroError(ErrorKind::InvalidSchema, "invalid schema: " + describe_schema(schema));
    }

    ParseContext inner = ctx.nested(schema);
    TypePtr type = create_definition(schema, inner);

    const Value* logical = schema.find("logicalType");
    if (logical && logical->is_string()) {
        auto it = ctx.logical_types.find(logical->as_string());
        if (it != ctx.logical_types.end() && it->second) {
            if (TypePtr wrapped = it->second(schema, type)) return TypeLink(std::move(wrapped));
        }
    }
    return TypeLink(std::move(type));
}

} // namespace detail

TypePtr parse(const SchemaInput& schema, const ParseOptions& opts) {
    if (const auto* compiled = std::get_if<TypePtr>(&schema)) {
        if (!*compiled) throw AvroError(ErrorKind::InvalidSchema, "invalid type: empty type pointer");
        return *compiled;
    }

    Registry local;
    Registry& registry = opts.registry ? *opts.registry : local;
    detail::ParseContext ctx{registry, opts.name_space, opts.logical_types};

    TypeLink link;
    if (const auto* name = std::get_if<std::string>(&schema)) {
        link = detail::create_type(Value(*name), ctx);
    } else {
        link = detail::create_type(std::get<Value>(schema), ctx);
    }
    if (!link.owned()) {
        throw AvroError(ErrorKind::InvalidSchema, "type is still being defined: " + link->name());
    }
    return link.owned();
}

TypePtr parse_schema(std::string_view json_text, const ParseOptions& opts) {
    return parse(parse_json(json_text), opts);
}

} // namespace avrolite
