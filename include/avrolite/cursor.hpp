#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace avrolite {

// ------------------------------
// Cursor
// ------------------------------

// Sequential reader/writer over one byte buffer.
//
// None of the primitives fail on overflow: reads past the end see zero bytes
// and writes past the end store nothing, but both still advance the position.
// Callers check is_valid() once after a sequence of operations.
class Cursor {
public:
    // Read-only cursor. Writing through it throws std::logic_error.
    Cursor(const std::uint8_t* data, std::size_t size, std::size_t pos = 0) noexcept;
    // Writable cursor over caller-owned storage.
    Cursor(std::uint8_t* data, std::size_t size, std::size_t pos = 0) noexcept;
    explicit Cursor(const std::vector<std::uint8_t>& buf) noexcept;

    bool is_valid() const noexcept { return pos_ <= size_; }
    std::size_t pos() const noexcept { return pos_; }
    void set_pos(std::size_t pos) noexcept { pos_ = pos; }
    std::size_t size() const noexcept { return size_; }
    std::size_t remaining() const noexcept { return pos_ < size_ ? size_ - pos_ : 0; }
    const std::uint8_t* data() const noexcept { return data_; }

    // Zigzag varint (Avro int and long share the encoding).
    std::int64_t read_long() noexcept;
    void skip_long() noexcept;
    void write_long(std::int64_t n);

    // Length-prefixed UTF-8. std::nullopt when the length runs past the end.
    std::optional<std::string> read_string();
    void skip_string() noexcept;
    void write_string(std::string_view s);

    // Length-prefixed raw bytes.
    std::optional<std::vector<std::uint8_t>> read_bytes();
    void write_bytes(const std::uint8_t* p, std::size_t len);

    // Raw bytes with a length known from context.
    std::optional<std::vector<std::uint8_t>> read_fixed(std::uint64_t len);
    void skip_fixed(std::uint64_t len) noexcept;
    void write_fixed(const std::uint8_t* p, std::size_t len);

private:
    std::uint8_t byte_at(std::size_t i) const noexcept { return i < size_ ? data_[i] : 0; }
    void put(std::uint8_t b);
    // Moves past `len` bytes; false (and an invalid cursor) when that ends
    // beyond the buffer.
    bool advance(std::uint64_t len) noexcept;

    const std::uint8_t* data_{nullptr};
    std::uint8_t* out_{nullptr};
    std::size_t size_{0};
    std::size_t pos_{0};
};

// Zigzag helpers, exposed for tests and container framing.
std::uint64_t zigzag_encode(std::int64_t n) noexcept;
std::int64_t zigzag_decode(std::uint64_t n) noexcept;

// ------------------------------
// Encode scratch buffer
// ------------------------------

// Growable scratch space reused across encode calls. Owned by the caller, so
// separate threads encode with separate buffers.
class EncodeBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit EncodeBuffer(std::size_t capacity = kDefaultCapacity);

    Cursor cursor() noexcept { return Cursor(buf_.data(), buf_.size()); }
    std::size_t capacity() const noexcept { return buf_.size(); }

    // Grows to at least `capacity` bytes. Never shrinks.
    void reserve(std::size_t capacity);

    // Copy of the first `len` bytes.
    std::vector<std::uint8_t> copy_prefix(std::size_t len) const;

private:
    std::vector<std::uint8_t> buf_;
};

} // namespace avrolite
