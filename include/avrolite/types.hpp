#pragma once

#include "avrolite/cursor.hpp"
#include "avrolite/error.hpp"
#include "avrolite/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace avrolite {

class Type;
class Resolver;

using TypePtr = std::shared_ptr<const Type>;

// Field names and array indices from the validated root down to the current
// value.
using Path = std::vector<std::string>;

// Invoked once per invalid leaf when validating with a hook.
using ErrorHook = std::function<void(const Path& path, const Value& val, const Type& type)>;

// ------------------------------
// Type contract
// ------------------------------

// Compiled, immutable representation of one schema node.
class Type {
public:
    virtual ~Type() = default;

    Type(const Type&) = delete;
    Type& operator=(const Type&) = delete;

    // Discriminator as written in schemas: "string", "array", "record", ...
    virtual std::string_view type_name() const noexcept = 0;

    // Qualified name of a named type, empty for anonymous ones.
    const std::string& name() const noexcept { return name_; }
    const std::vector<std::string>& aliases() const noexcept { return aliases_; }

    // Structural validity. Without a hook this stops at the first failure;
    // with one it visits every child, pushing each field name or index onto
    // `path` while checking it.
    virtual bool check(const Value& val, const ErrorHook* hook, Path& path) const = 0;

    // Raw codec primitives. None of them check the cursor for overflow.
    virtual Value read(Cursor& cur) const = 0;
    virtual void skip(Cursor& cur) const = 0;
    // Throws AvroError(InvalidValue) when `val` does not have this type's shape.
    virtual void write(Cursor& cur, const Value& val) const = 0;

    // Converts a JSON value into this type's in-memory form (record values
    // carry their record type). Throws AvroError(InvalidValue).
    virtual Value copy(const Value& val) const = 0;

    // Schema attributes. Named types already in `named` render as their name.
    virtual Value attrs(std::set<std::string>& named) const = 0;

    /// Binary encoding using a call-local scratch buffer.
    std::vector<std::uint8_t> to_buffer(const Value& val) const;
    /// Binary encoding reusing `scratch`, which grows on overflow and is kept.
    std::vector<std::uint8_t> to_buffer(const Value& val, EncodeBuffer& scratch) const;

    /// Decodes one value. Throws TruncatedBuffer when the input is too short and,
    /// unless `no_check` is set, TrailingData when bytes are left over.
    Value from_buffer(const std::uint8_t* data, std::size_t size,
                      const Resolver* resolver = nullptr, bool no_check = false) const;
    Value from_buffer(const std::vector<std::uint8_t>& buf,
                      const Resolver* resolver = nullptr, bool no_check = false) const;

    Value from_string(std::string_view json) const;
    std::string to_string(const Value& val) const;
    /// Schema as compact JSON.
    std::string to_string() const;

    bool is_valid(const Value& val, const ErrorHook& hook = nullptr) const;

    Value schema() const;

protected:
    Type() = default;
    Type(std::string name, std::vector<std::string> aliases);

    void report(const Value& val, const ErrorHook* hook, const Path& path) const;
    // Throws AvroError(InvalidValue) naming this type and `val`.
    void throw_invalid(const Value& val) const;

private:
    std::string name_;
    std::vector<std::string> aliases_;
};

// How a parent holds a child type: owning for completed types, non-owning for
// a back-reference to a named type still under construction. The latter is
// always an ancestor of the referencing node, so it outlives the link.
class TypeLink {
public:
    TypeLink() = default;
    TypeLink(TypePtr owned) noexcept : owned_(std::move(owned)), ptr_(owned_.get()) {}

    static TypeLink back_reference(const Type& type) noexcept;

    const Type& operator*() const noexcept { return *ptr_; }
    const Type* operator->() const noexcept { return ptr_; }
    const Type* get() const noexcept { return ptr_; }
    const TypePtr& owned() const noexcept { return owned_; }
    explicit operator bool() const noexcept { return ptr_ != nullptr; }

private:
    TypePtr owned_;
    const Type* ptr_{nullptr};
};

// ------------------------------
// Resolver
// ------------------------------

// Maps a writer schema's wire layout onto a compatible reader type.
// Implementations live outside this library.
class Resolver {
public:
    virtual ~Resolver() = default;
    virtual const Type& reader_type() const noexcept = 0;
    // `lazy` allows trailing writer fields to be left unread.
    virtual Value read(Cursor& cur, bool lazy) const = 0;
};

// ------------------------------
// Built-in types
// ------------------------------

class StringType : public Type {
public:
    StringType() = default;

    std::string_view type_name() const noexcept override { return "string"; }
    bool check(const Value& val, const ErrorHook* hook, Path& path) const override;
    Value read(Cursor& cur) const override;
    void skip(Cursor& cur) const override;
    void write(Cursor& cur, const Value& val) const override;
    Value copy(const Value& val) const override;
    Value attrs(std::set<std::string>& named) const override;
};

// Block-encoded homogeneous sequence.
class ArrayType : public Type {
public:
    // Most items a decoded array may claim beyond the bytes left in its
    // input. Only items that encode to nothing can legitimately do so.
    static constexpr std::uint64_t kMaxBytelessItems = std::uint64_t{1} << 20;

    explicit ArrayType(TypeLink items);

    std::string_view type_name() const noexcept override { return "array"; }
    const Type& items() const noexcept { return *items_; }

    bool check(const Value& val, const ErrorHook* hook, Path& path) const override;
    Value read(Cursor& cur) const override;
    void skip(Cursor& cur) const override;
    void write(Cursor& cur, const Value& val) const override;
    Value copy(const Value& val) const override;
    Value attrs(std::set<std::string>& named) const override;

private:
    TypeLink items_;
};

} // namespace avrolite
