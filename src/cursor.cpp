#include "avrolite/cursor.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace avrolite {

Cursor::Cursor(const std::uint8_t* data, std::size_t size, std::size_t pos) noexcept
    : data_(data), out_(nullptr), size_(size), pos_(pos) {}

Cursor::Cursor(std::uint8_t* data, std::size_t size, std::size_t pos) noexcept
    : data_(data), out_(data), size_(size), pos_(pos) {}

Cursor::Cursor(const std::vector<std::uint8_t>& buf) noexcept
    : Cursor(buf.data(), buf.size()) {}

std::uint64_t zigzag_encode(std::int64_t n) noexcept {
    return (static_cast<std::uint64_t>(n) << 1) ^ static_cast<std::uint64_t>(n >> 63);
}

std::int64_t zigzag_decode(std::uint64_t n) noexcept {
    return static_cast<std::int64_t>((n >> 1) ^ (~(n & 1) + 1));
}

void Cursor::put(std::uint8_t b) {
    if (!out_) throw std::logic_error("write on read-only cursor");
    if (pos_ < size_) out_[pos_] = b;
    ++pos_;
}

bool Cursor::advance(std::uint64_t len) noexcept {
    if (pos_ > size_ || len > size_ - pos_) {
        pos_ = std::max(pos_, size_) + 1;
        return false;
    }
    pos_ += static_cast<std::size_t>(len);
    return true;
}

// ------------------------------
// Varints
// ------------------------------

std::int64_t Cursor::read_long() noexcept {
    std::uint64_t n = 0;
    unsigned k = 0;
    std::uint8_t b = 0;
    do {
        b = byte_at(pos_++);
        // Groups beyond the 10th cannot carry bits of a 64-bit value.
        if (k < 64) n |= static_cast<std::uint64_t>(b & 0x7F) << k;
        k += 7;
    } while (b & 0x80);
    return zigzag_decode(n);
}

void Cursor::skip_long() noexcept {
    while (byte_at(pos_++) & 0x80) {}
}

void Cursor::write_long(std::int64_t n) {
    std::uint64_t m = zigzag_encode(n);
    while (m > 0x7F) {
        put(static_cast<std::uint8_t>((m & 0x7F) | 0x80));
        m >>= 7;
    }
    put(static_cast<std::uint8_t>(m));
}

// ------------------------------
// Strings and bytes
// ------------------------------

namespace {

// Length of the well-formed UTF-8 sequence starting at `p`, 0 when there is none.
std::size_t utf8_sequence_length(const std::uint8_t* p, std::size_t n) noexcept {
    std::uint8_t b = p[0];
    if (b < 0x80) return 1;

    std::size_t len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (b >= 0xC2 && b <= 0xDF) {
        len = 2;
    } else if (b >= 0xE0 && b <= 0xEF) {
        len = 3;
        if (b == 0xE0) lo = 0xA0;
        if (b == 0xED) hi = 0x9F; // surrogates
    } else if (b >= 0xF0 && b <= 0xF4) {
        len = 4;
        if (b == 0xF0) lo = 0x90;
        if (b == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (n < len || p[1] < lo || p[1] > hi) return 0;
    for (std::size_t i = 2; i < len; ++i) {
        if ((p[i] & 0xC0) != 0x80) return 0;
    }
    return len;
}

// Decodes UTF-8, replacing each byte that starts no valid sequence with U+FFFD.
std::string decode_utf8(const std::uint8_t* p, std::size_t n) {
    std::string out;
    out.reserve(n);
    std::size_t i = 0;
    while (i < n) {
        std::size_t len = utf8_sequence_length(p + i, n - i);
        if (len == 0) {
            out += "\xEF\xBF\xBD";
            ++i;
            continue;
        }
        out.append(reinterpret_cast<const char*>(p + i), len);
        i += len;
    }
    return out;
}

} // namespace

std::optional<std::string> Cursor::read_string() {
    std::int64_t len = read_long();
    std::size_t start = pos_;
    if (len < 0 || !advance(static_cast<std::uint64_t>(len))) return std::nullopt;
    return decode_utf8(data_ + start, static_cast<std::size_t>(len));
}

void Cursor::skip_string() noexcept {
    std::int64_t len = read_long();
    if (len < 0) {
        advance(size_ + 1);
        return;
    }
    advance(static_cast<std::uint64_t>(len));
}

void Cursor::write_string(std::string_view s) {
    write_long(static_cast<std::int64_t>(s.size()));
    write_fixed(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

std::optional<std::vector<std::uint8_t>> Cursor::read_bytes() {
    std::int64_t len = read_long();
    if (len < 0) {
        advance(size_ + 1);
        return std::nullopt;
    }
    return read_fixed(static_cast<std::uint64_t>(len));
}

void Cursor::write_bytes(const std::uint8_t* p, std::size_t len) {
    write_long(static_cast<std::int64_t>(len));
    write_fixed(p, len);
}

std::optional<std::vector<std::uint8_t>> Cursor::read_fixed(std::uint64_t len) {
    std::size_t start = pos_;
    if (!advance(len)) return std::nullopt;
    return std::vector<std::uint8_t>(data_ + start, data_ + pos_);
}

void Cursor::skip_fixed(std::uint64_t len) noexcept {
    advance(len);
}

void Cursor::write_fixed(const std::uint8_t* p, std::size_t len) {
    if (!out_) throw std::logic_error("write on read-only cursor");
    std::size_t start = pos_;
    pos_ += len;
    if (pos_ > size_ || len == 0) return;
    std::memcpy(out_ + start, p, len);
}

// ------------------------------
// EncodeBuffer
// ------------------------------

EncodeBuffer::EncodeBuffer(std::size_t capacity) : buf_(capacity) {}

void EncodeBuffer::reserve(std::size_t capacity) {
    if (capacity > buf_.size()) buf_.resize(capacity);
}

std::vector<std::uint8_t> EncodeBuffer::copy_prefix(std::size_t len) const {
    len = std::min(len, buf_.size());
    return std::vector<std::uint8_t>(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(len));
}

} // namespace avrolite
