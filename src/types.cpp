#include "avrolite/types.hpp"

namespace avrolite {

namespace {

// Keeps error messages bounded for large values.
std::string describe(const Value& val) {
    std::string s = dump_json(val);
    if (s.size() > 200) {
        s.resize(200);
        s += "...";
    }
    return s;
}

// Block item count. The most negative long has no positive counterpart,
// so the magnitude goes through uint64.
std::uint64_t block_count(std::int64_t n) noexcept {
    return n < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(n) : static_cast<std::uint64_t>(n);
}

// A count that cannot come from `cur`'s remaining bytes. Invalidates the
// cursor so the caller reports a truncated buffer.
bool reject_count(Cursor& cur, std::uint64_t decoded, std::uint64_t count) noexcept {
    if (count <= cur.remaining()) return false;
    if (count <= ArrayType::kMaxBytelessItems && decoded + count <= ArrayType::kMaxBytelessItems) return false;
    cur.skip_fixed(cur.remaining() + 1);
    return true;
}

} // namespace

// ------------------------------
// Type
// ------------------------------

Type::Type(std::string name, std::vector<std::string> aliases)
    : name_(std::move(name)), aliases_(std::move(aliases)) {}

void Type::report(const Value& val, const ErrorHook* hook, const Path& path) const {
    if (hook) (*hook)(path, val, *this);
}

void Type::throw_invalid(const Value& val) const {
    std::string what = name_.empty() ? std::string(type_name()) : name_;
    throw AvroError(ErrorKind::InvalidValue, "invalid " + what + ": " + describe(val));
}

std::vector<std::uint8_t> Type::to_buffer(const Value& val) const {
    EncodeBuffer scratch;
    return to_buffer(val, scratch);
}

std::vector<std::uint8_t> Type::to_buffer(const Value& val, EncodeBuffer& scratch) const {
    Cursor cur = scratch.cursor();
    write(cur, val);
    if (!cur.is_valid()) {
        // The cursor kept counting past the end, so its position is the
        // size actually needed.
        scratch.reserve(2 * cur.pos());
        cur = scratch.cursor();
        write(cur, val);
    }
    return scratch.copy_prefix(cur.pos());
}

Value Type::from_buffer(const std::uint8_t* data, std::size_t size,
                        const Resolver* resolver, bool no_check) const {
    Cursor cur(data, size);
    Value val;
    if (resolver) {
        if (&resolver->reader_type() != this) {
            throw AvroError(ErrorKind::InvalidResolver, "invalid resolver");
        }
        val = resolver->read(cur, no_check);
    } else {
        val = read(cur);
    }
    if (!cur.is_valid()) {
        throw AvroError(ErrorKind::TruncatedBuffer, "truncated buffer");
    }
    if (!no_check && cur.pos() < size) {
        throw AvroError(ErrorKind::TrailingData,
                        "trailing data: " + std::to_string(size - cur.pos()) + " unread bytes");
    }
    return val;
}

Value Type::from_buffer(const std::vector<std::uint8_t>& buf,
                        const Resolver* resolver, bool no_check) const {
    return from_buffer(buf.data(), buf.size(), resolver, no_check);
}

Value Type::from_string(std::string_view json) const {
    return copy(parse_json(json));
}

std::string Type::to_string(const Value& val) const {
    return dump_json(copy(val));
}

std::string Type::to_string() const {
    return dump_json(schema());
}

bool Type::is_valid(const Value& val, const ErrorHook& hook) const {
    Path path;
    return check(val, hook ? &hook : nullptr, path);
}

Value Type::schema() const {
    std::set<std::string> named;
    return attrs(named);
}

TypeLink TypeLink::back_reference(const Type& type) noexcept {
    TypeLink link;
    link.ptr_ = &type;
    return link;
}

// ------------------------------
// StringType
// ------------------------------

bool StringType::check(const Value& val, const ErrorHook* hook, Path& path) const {
    bool b = val.is_string();
    if (!b) report(val, hook, path);
    return b;
}

Value StringType::read(Cursor& cur) const {
    auto s = cur.read_string();
    if (!s) return Value();
    return Value(std::move(*s));
}

void StringType::skip(Cursor& cur) const {
    cur.skip_string();
}

void StringType::write(Cursor& cur, const Value& val) const {
    if (!val.is_string()) throw_invalid(val);
    cur.write_string(val.as_string());
}

Value StringType::copy(const Value& val) const {
    if (!val.is_string()) throw_invalid(val);
    return Value(val.as_string());
}

Value StringType::attrs(std::set<std::string>&) const {
    return Value("string");
}

// ------------------------------
// ArrayType
// ------------------------------

ArrayType::ArrayType(TypeLink items) : items_(std::move(items)) {}

bool ArrayType::check(const Value& val, const ErrorHook* hook, Path& path) const {
    if (!val.is_array()) {
        report(val, hook, path);
        return false;
    }
    const auto& arr = val.as_array();
    if (!hook) {
        for (const auto& el : arr) {
            if (!items_->check(el, nullptr, path)) return false;
        }
        return true;
    }

    bool b = true;
    path.emplace_back();
    for (std::size_t i = 0; i < arr.size(); ++i) {
        path.back() = std::to_string(i);
        if (!items_->check(arr[i], hook, path)) b = false;
    }
    path.pop_back();
    return b;
}

Value ArrayType::read(Cursor& cur) const {
    Value out = Value::make_array();
    auto& arr = out.as_array();
    std::int64_t n = 0;
    while ((n = cur.read_long()) != 0) {
        std::uint64_t count = block_count(n);
        if (n < 0) cur.skip_long(); // block size
        if (reject_count(cur, arr.size(), count)) break;
        // A truncated buffer would otherwise keep yielding empty items.
        for (; count > 0 && cur.is_valid(); --count) {
            arr.push_back(items_->read(cur));
        }
        if (!cur.is_valid()) break;
    }
    return out;
}

void ArrayType::skip(Cursor& cur) const {
    std::int64_t n = 0;
    std::uint64_t skipped = 0;
    while ((n = cur.read_long()) != 0) {
        if (n < 0) {
            std::int64_t size = cur.read_long();
            if (size < 0) {
                cur.skip_fixed(cur.size() + 1);
                break;
            }
            cur.skip_fixed(static_cast<std::uint64_t>(size));
        } else {
            std::uint64_t count = block_count(n);
            if (reject_count(cur, skipped, count)) break;
            skipped += count;
            for (; count > 0 && cur.is_valid(); --count) items_->skip(cur);
        }
        if (!cur.is_valid()) break;
    }
}

void ArrayType::write(Cursor& cur, const Value& val) const {
    if (!val.is_array()) throw_invalid(val);
    const auto& arr = val.as_array();
    if (!arr.empty()) {
        cur.write_long(static_cast<std::int64_t>(arr.size()));
        for (const auto& el : arr) items_->write(cur, el);
    }
    cur.write_long(0);
}

Value ArrayType::copy(const Value& val) const {
    if (!val.is_array()) throw_invalid(val);
    Value out = Value::make_array();
    auto& arr = out.as_array();
    arr.reserve(val.as_array().size());
    for (const auto& el : val.as_array()) arr.push_back(items_->copy(el));
    return out;
}

Value ArrayType::attrs(std::set<std::string>& named) const {
    Value out = Value::make_object();
    out["type"] = "array";
    out["items"] = items_->attrs(named);
    return out;
}

} // namespace avrolite
