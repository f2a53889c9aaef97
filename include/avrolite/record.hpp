#pragma once

#include "avrolite/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace avrolite {

namespace detail {
struct ParseContext;
}

// ------------------------------
// Field
// ------------------------------

enum class FieldOrder {
    Ascending,
    Descending,
    Ignore,
};

const char* to_string(FieldOrder o) noexcept;

// One record member.
class Field {
public:
    Field(std::string name, TypeLink type, std::optional<Value> default_json,
          std::vector<std::string> aliases, FieldOrder order);

    /// Builds a field from its schema attributes
    /// (`{name, type, default?, order?, aliases?}`).
    static Field parse(const Value& attrs, const detail::ParseContext& ctx);

    const std::string& name() const noexcept { return name_; }
    const Type& type() const noexcept { return *type_; }
    const std::vector<std::string>& aliases() const noexcept { return aliases_; }
    FieldOrder order() const noexcept { return order_; }
    // +1 ascending, -1 descending, 0 ignore.
    int order_weight() const noexcept;

    bool has_default() const noexcept { return default_json_.has_value(); }
    // Schema-level default as written, for rendering.
    const std::optional<Value>& default_json() const noexcept { return default_json_; }
    // Fresh in-memory default on every call. Only valid when has_default().
    Value get_default() const;

private:
    std::string name_;
    TypeLink type_;
    std::optional<Value> default_json_;
    std::vector<std::string> aliases_;
    FieldOrder order_;
};

// ------------------------------
// RecordType
// ------------------------------

// Values are objects keyed by field name. Objects built by construct(),
// read() or copy() also link back to this type; plain objects with matching
// fields are accepted everywhere too.
class RecordType : public Type, public std::enable_shared_from_this<RecordType> {
public:
    /// Resolves the record's name, registers it (so fields can refer back to
    /// it), parses the fields, rejects duplicate field names and precomputes
    /// the encoded defaults.
    static std::shared_ptr<const RecordType> create(const Value& attrs, const detail::ParseContext& ctx);

    std::string_view type_name() const noexcept override { return "record"; }

    const std::vector<Field>& fields() const noexcept { return fields_; }
    const Field* field(const std::string& name) const;

    /// Positional constructor. A missing or empty argument takes the field's
    /// default when it has one and is left unset otherwise.
    Value construct(std::vector<std::optional<Value>> args = {}) const;

    bool check(const Value& val, const ErrorHook* hook, Path& path) const override;
    Value read(Cursor& cur) const override;
    void skip(Cursor& cur) const override;
    void write(Cursor& cur, const Value& val) const override;
    Value copy(const Value& val) const override;
    Value attrs(std::set<std::string>& named) const override;

private:
    RecordType(std::string name, std::vector<std::string> aliases, std::optional<std::string> doc);

    void init_fields(const Value& attrs, const detail::ParseContext& ctx);
    void encode_defaults();

    std::optional<std::string> doc_;
    std::vector<Field> fields_;
    // Encoded default per field, computed once at parse time.
    std::vector<std::optional<std::vector<std::uint8_t>>> default_blobs_;
};

// ------------------------------
// Record value helpers
// ------------------------------

/// The record type a value was built by. Throws AvroError(InvalidValue) for
/// values without one, or whose type has since been destroyed.
std::shared_ptr<const RecordType> record_type_of(const Value& rec);

std::vector<std::uint8_t> record_to_buffer(const Value& rec);
bool record_is_valid(const Value& rec, const ErrorHook& hook = nullptr);
std::string record_to_string(const Value& rec);

} // namespace avrolite
