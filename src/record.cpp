#include "avrolite/record.hpp"

#include "internal.hpp"

#include <set>

namespace avrolite {

const char* to_string(FieldOrder o) noexcept {
    switch (o) {
        case FieldOrder::Ascending: return "ascending";
        case FieldOrder::Descending: return "descending";
        case FieldOrder::Ignore: return "ignore";
    }
    return "ascending";
}

// ------------------------------
// Field
// ------------------------------

Field::Field(std::string name, TypeLink type, std::optional<Value> default_json,
             std::vector<std::string> aliases, FieldOrder order)
    : name_(std::move(name)),
      type_(std::move(type)),
      default_json_(std::move(default_json)),
      aliases_(std::move(aliases)),
      order_(order) {}

Field Field::parse(const Value& attrs, const detail::ParseContext& ctx) {
    if (!attrs.is_object()) {
        throw AvroError(ErrorKind::InvalidSchema, "invalid field: " + detail::describe_schema(attrs));
    }
    const Value* name = attrs.find("name");
    if (!name || !name->is_string() || !is_valid_name(name->as_string())) {
        throw AvroError(ErrorKind::InvalidSchema,
                        "invalid field name: " + (name ? dump_json(*name) : std::string("undefined")));
    }
    const Value* type = attrs.find("type");
    if (!type) {
        throw AvroError(ErrorKind::InvalidSchema, "missing type for field " + name->as_string());
    }

    std::vector<std::string> aliases;
    if (const Value* a = attrs.find("aliases")) {
        if (!a->is_array()) {
            throw AvroError(ErrorKind::InvalidSchema, "invalid aliases for field " + name->as_string());
        }
        for (const auto& el : a->as_array()) {
            if (!el.is_string()) {
                throw AvroError(ErrorKind::InvalidSchema, "invalid alias: " + dump_json(el));
            }
            aliases.push_back(el.as_string());
        }
    }

    FieldOrder order = FieldOrder::Ascending;
    if (const Value* o = attrs.find("order")) {
        std::string s = o->is_string() ? o->as_string() : dump_json(*o);
        if (s == "ascending") order = FieldOrder::Ascending;
        else if (s == "descending") order = FieldOrder::Descending;
        else if (s == "ignore") order = FieldOrder::Ignore;
        else throw AvroError(ErrorKind::InvalidSchema, "invalid order: " + s);
    }

    // A `null` default is still a default.
    std::optional<Value> def;
    if (const Value* d = attrs.find("default")) def = *d;

    return Field(name->as_string(), detail::create_type(*type, ctx), std::move(def),
                 std::move(aliases), order);
}

int Field::order_weight() const noexcept {
    switch (order_) {
        case FieldOrder::Ascending: return 1;
        case FieldOrder::Descending: return -1;
        case FieldOrder::Ignore: return 0;
    }
    return 1;
}

Value Field::get_default() const {
    if (!default_json_) {
        throw AvroError(ErrorKind::InvalidValue, "field " + name_ + " has no default");
    }
    return type_->copy(*default_json_);
}

// ------------------------------
// RecordType
// ------------------------------

RecordType::RecordType(std::string name, std::vector<std::string> aliases, std::optional<std::string> doc)
    : Type(std::move(name), std::move(aliases)), doc_(std::move(doc)) {}

std::shared_ptr<const RecordType> RecordType::create(const Value& attrs, const detail::ParseContext& ctx) {
    detail::ResolvedNames names = detail::resolve_names(attrs, ctx.name_space);
    std::optional<std::string> doc;
    if (const Value* d = attrs.find("doc"); d && d->is_string()) doc = d->as_string();

    std::shared_ptr<RecordType> type(new RecordType(names.name, std::move(names.aliases), std::move(doc)));

    // Registered before the fields are parsed so that they can refer back
    // to the record itself. On failure, nested named types go too: they may
    // hold back-references to this record.
    const std::vector<std::string> before = ctx.registry.names();
    ctx.registry.add_pending(type->name(), type);
    try {
        type->init_fields(attrs, ctx);
        type->encode_defaults();
    } catch (...) {
        ctx.registry.rollback(before);
        throw;
    }
    ctx.registry.mark_complete(type->name());
    return type;
}

void RecordType::init_fields(const Value& attrs, const detail::ParseContext& ctx) {
    const Value* fields = attrs.find("fields");
    if (!fields || !fields->is_array()) {
        throw AvroError(ErrorKind::InvalidSchema, "non-array " + name() + " fields");
    }

    detail::ParseContext field_ctx{ctx.registry, detail::namespace_of(name()), ctx.logical_types};
    std::set<std::string> seen;
    fields_.reserve(fields->as_array().size());
    for (const auto& f : fields->as_array()) {
        Field field = Field::parse(f, field_ctx);
        if (!seen.insert(field.name()).second) {
            throw AvroError(ErrorKind::NameConflict, "duplicate " + name() + " field name: " + field.name());
        }
        fields_.push_back(std::move(field));
    }
}

void RecordType::encode_defaults() {
    default_blobs_.clear();
    default_blobs_.reserve(fields_.size());
    for (const auto& f : fields_) {
        if (!f.has_default()) {
            default_blobs_.emplace_back();
            continue;
        }
        try {
            default_blobs_.emplace_back(f.type().to_buffer(f.get_default()));
        } catch (const AvroError& e) {
            throw AvroError(ErrorKind::InvalidSchema,
                            "invalid default for field " + f.name() + ": " + e.what());
        }
    }
}

const Field* RecordType::field(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.name() == name) return &f;
    }
    return nullptr;
}

Value RecordType::construct(std::vector<std::optional<Value>> args) const {
    Value out = Value::make_object();
    auto& obj = out.as_object();
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        const Field& f = fields_[i];
        if (i < args.size() && args[i]) {
            obj[f.name()] = std::move(*args[i]);
        } else if (f.has_default()) {
            obj[f.name()] = f.get_default();
        }
    }
    out.record_type = weak_from_this();
    return out;
}

bool RecordType::check(const Value& val, const ErrorHook* hook, Path& path) const {
    if (!val.is_object()) {
        report(val, hook, path);
        return false;
    }

    const Value absent;
    bool b = true;
    for (const auto& f : fields_) {
        const Value* member = val.find(f.name());
        if (!member) {
            if (f.has_default()) continue;
            member = &absent;
        }
        if (!hook) {
            if (!f.type().check(*member, nullptr, path)) return false;
            continue;
        }
        path.push_back(f.name());
        if (!f.type().check(*member, hook, path)) b = false;
        path.pop_back();
    }
    return b;
}

Value RecordType::read(Cursor& cur) const {
    Value out = Value::make_object();
    auto& obj = out.as_object();
    for (const auto& f : fields_) {
        obj[f.name()] = f.type().read(cur);
    }
    out.record_type = weak_from_this();
    return out;
}

void RecordType::skip(Cursor& cur) const {
    for (const auto& f : fields_) f.type().skip(cur);
}

void RecordType::write(Cursor& cur, const Value& val) const {
    if (!val.is_object()) throw_invalid(val);
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        const Field& f = fields_[i];
        if (const Value* member = val.find(f.name())) {
            f.type().write(cur, *member);
        } else if (i < default_blobs_.size() && default_blobs_[i]) {
            const auto& blob = *default_blobs_[i];
            cur.write_fixed(blob.data(), blob.size());
        } else {
            throw AvroError(ErrorKind::InvalidValue, "missing field " + f.name() + " in record " + name());
        }
    }
}

Value RecordType::copy(const Value& val) const {
    if (!val.is_object()) throw_invalid(val);
    std::vector<std::optional<Value>> args;
    args.reserve(fields_.size());
    for (const auto& f : fields_) {
        if (const Value* member = val.find(f.name())) {
            args.emplace_back(f.type().copy(*member));
        } else if (f.has_default()) {
            args.emplace_back();
        } else {
            throw AvroError(ErrorKind::InvalidValue, "missing field " + f.name() + " in record " + name());
        }
    }
    return construct(std::move(args));
}

Value RecordType::attrs(std::set<std::string>& named) const {
    if (named.count(name())) return Value(name());
    named.insert(name());

    Value out = Value::make_object();
    out["type"] = "record";
    out["name"] = name();
    if (!aliases().empty()) {
        Value a = Value::make_array();
        for (const auto& s : aliases()) a.as_array().push_back(s);
        out["aliases"] = std::move(a);
    }
    if (doc_) out["doc"] = *doc_;

    Value fields = Value::make_array();
    for (const auto& f : fields_) {
        Value fa = Value::make_object();
        fa["name"] = f.name();
        fa["type"] = f.type().attrs(named);
        if (f.default_json()) fa["default"] = *f.default_json();
        if (f.order() != FieldOrder::Ascending) fa["order"] = avrolite::to_string(f.order());
        if (!f.aliases().empty()) {
            Value a = Value::make_array();
            for (const auto& s : f.aliases()) a.as_array().push_back(s);
            fa["aliases"] = std::move(a);
        }
        fields.as_array().push_back(std::move(fa));
    }
    out["fields"] = std::move(fields);
    return out;
}

// ------------------------------
// Record value helpers
// ------------------------------

std::shared_ptr<const RecordType> record_type_of(const Value& rec) {
    std::shared_ptr<const RecordType> type = rec.record_type.lock();
    if (!type) {
        throw AvroError(ErrorKind::InvalidValue, "value has no live record type");
    }
    return type;
}

std::vector<std::uint8_t> record_to_buffer(const Value& rec) {
    return record_type_of(rec)->to_buffer(rec);
}

bool record_is_valid(const Value& rec, const ErrorHook& hook) {
    return record_type_of(rec)->is_valid(rec, hook);
}

std::string record_to_string(const Value& rec) {
    return record_type_of(rec)->to_string(rec);
}

} // namespace avrolite
