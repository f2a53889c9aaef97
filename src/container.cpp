#include "avrolite/container.hpp"
#include "avrolite/schemas.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <random>

namespace avrolite {

namespace {

constexpr std::array<char, 4> kMagic = {'O', 'b', 'j', '\x01'};
constexpr const char* kSchemaKey = "avro.schema";
constexpr const char* kCodecKey = "avro.codec";

// Upper bound for one block and one metadata entry.
constexpr std::uint64_t kMaxChunk = 1ull << 30;

// ------------------------------
// Byte-level helpers
// ------------------------------

void put_long(std::vector<std::uint8_t>& out, std::int64_t n) {
    std::uint64_t z = zigzag_encode(n);
    while (z > 0x7f) {
        out.push_back(static_cast<std::uint8_t>((z & 0x7f) | 0x80));
        z >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(z));
}

void put_bytes(std::vector<std::uint8_t>& out, const std::uint8_t* p, std::size_t len) {
    put_long(out, static_cast<std::int64_t>(len));
    out.insert(out.end(), p, p + len);
}

void write_raw(std::ostream& os, const std::uint8_t* p, std::size_t len) {
    os.write(reinterpret_cast<const char*>(p), static_cast<std::streamsize>(len));
}

std::int64_t read_stream_long(std::istream& is) {
    std::uint64_t z = 0;
    for (int shift = 0; shift < 70; shift += 7) {
        int c = is.get();
        if (c == std::char_traits<char>::eof()) {
            throw AvroError(ErrorKind::TruncatedBuffer, "unexpected EOF reading varint");
        }
        z |= static_cast<std::uint64_t>(c & 0x7f) << shift;
        if (!(c & 0x80)) return zigzag_decode(z);
    }
    throw AvroError(ErrorKind::Codec, "varint too long");
}

std::vector<std::uint8_t> read_stream_chunk(std::istream& is, std::int64_t len, const char* what) {
    if (len < 0 || static_cast<std::uint64_t>(len) > kMaxChunk) {
        throw AvroError(ErrorKind::Codec, std::string("unreasonable ") + what + " length");
    }
    std::vector<std::uint8_t> out(static_cast<std::size_t>(len));
    if (!out.empty()) {
        is.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!is) {
            throw AvroError(ErrorKind::TruncatedBuffer, std::string("unexpected EOF reading ") + what);
        }
    }
    return out;
}

SyncMarker read_sync(std::istream& is) {
    SyncMarker s{};
    is.read(reinterpret_cast<char*>(s.data()), static_cast<std::streamsize>(s.size()));
    if (!is) throw AvroError(ErrorKind::TruncatedBuffer, "unexpected EOF reading sync marker");
    return s;
}

SyncMarker random_sync() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 255);
    SyncMarker s{};
    for (auto& b : s) b = static_cast<std::uint8_t>(dist(gen));
    return s;
}

// ------------------------------
// Raw deflate (RFC 1951, no zlib wrapper)
// ------------------------------

std::vector<std::uint8_t> deflate_raw(const std::vector<std::uint8_t>& in, int level) {
    z_stream zs{};
    if (::deflateInit2(&zs, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw AvroError(ErrorKind::Codec, "zlib deflateInit2 failed");
    }
    std::vector<std::uint8_t> out(::deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = ::deflate(&zs, Z_FINISH);
    std::size_t produced = out.size() - zs.avail_out;
    ::deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw AvroError(ErrorKind::Codec, "zlib deflate failed");
    }
    out.resize(produced);
    return out;
}

std::vector<std::uint8_t> inflate_raw(const std::vector<std::uint8_t>& in) {
    z_stream zs{};
    if (::inflateInit2(&zs, -15) != Z_OK) {
        throw AvroError(ErrorKind::Codec, "zlib inflateInit2 failed");
    }
    std::vector<std::uint8_t> out(std::max<std::size_t>(in.size() * 4, 256));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    int rc = Z_OK;
    std::size_t produced = 0;
    while (rc != Z_STREAM_END) {
        if (produced == out.size()) {
            if (out.size() >= kMaxChunk) {
                ::inflateEnd(&zs);
                throw AvroError(ErrorKind::Codec, "inflated block exceeds size limit");
            }
            out.resize(out.size() * 2);
        }
        zs.next_out = reinterpret_cast<Bytef*>(out.data() + produced);
        zs.avail_out = static_cast<uInt>(out.size() - produced);
        rc = ::inflate(&zs, Z_NO_FLUSH);
        produced = out.size() - zs.avail_out;
        if (rc == Z_STREAM_END) break;
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            ::inflateEnd(&zs);
            throw AvroError(ErrorKind::Codec, "zlib inflate failed");
        }
        if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
            ::inflateEnd(&zs);
            throw AvroError(ErrorKind::Codec, "truncated deflate stream");
        }
    }
    ::inflateEnd(&zs);
    out.resize(produced);
    return out;
}

ContainerHeader read_header(std::istream& is) {
    std::array<char, 4> magic{};
    is.read(magic.data(), magic.size());
    if (!is) throw AvroError(ErrorKind::TruncatedBuffer, "unexpected EOF reading magic");
    if (magic != kMagic) {
        throw AvroError(ErrorKind::BadMagic, "not an object container file");
    }

    ContainerHeader h;
    std::int64_t n = 0;
    while ((n = read_stream_long(is)) != 0) {
        if (n < 0) {
            if (n == std::numeric_limits<std::int64_t>::min()) {
                throw AvroError(ErrorKind::Codec, "invalid metadata block count");
            }
            n = -n;
            read_stream_long(is); // block size
        }
        for (; n > 0; --n) {
            auto key = read_stream_chunk(is, read_stream_long(is), "metadata key");
            auto val = read_stream_chunk(is, read_stream_long(is), "metadata value");
            h.metadata[std::string(key.begin(), key.end())] = std::move(val);
        }
    }
    h.sync = read_sync(is);
    h.data_start = static_cast<std::uint64_t>(is.tellg());

    auto schema = h.metadata.find(kSchemaKey);
    if (schema == h.metadata.end()) {
        throw AvroError(ErrorKind::InvalidSchema, "missing avro.schema metadata");
    }
    h.schema_json.assign(schema->second.begin(), schema->second.end());

    auto codec = h.metadata.find(kCodecKey);
    if (codec != h.metadata.end()) {
        h.codec = codec_from_string(std::string(codec->second.begin(), codec->second.end()));
    }
    return h;
}

} // namespace

const char* to_string(Codec c) noexcept {
    switch (c) {
        case Codec::Null: return "null";
        case Codec::Deflate: return "deflate";
    }
    return "null";
}

Codec codec_from_string(const std::string& name) {
    if (name == "null") return Codec::Null;
    if (name == "deflate") return Codec::Deflate;
    throw AvroError(ErrorKind::Codec, "unsupported codec: " + name);
}

// ------------------------------
// ContainerWriter
// ------------------------------

ContainerWriter::ContainerWriter(const std::filesystem::path& file, TypePtr type,
                                 const ContainerWriteOptions& opts)
    : os_(file, std::ios::binary | std::ios::trunc),
      file_(file),
      type_(std::move(type)),
      opts_(opts),
      sync_(random_sync()) {
    if (!type_) throw AvroError(ErrorKind::InvalidSchema, "container writer needs a type");
    if (!os_) throw AvroError(ErrorKind::Io, "failed to open for write: " + file.string());
    if (opts_.deflate_level < 0 || opts_.deflate_level > 9) {
        throw AvroError(ErrorKind::Codec, "deflate level must be in 0..9");
    }
    for (const auto& kv : opts_.metadata) {
        if (kv.first.rfind("avro.", 0) == 0) {
            throw AvroError(ErrorKind::InvalidValue, "reserved metadata key: " + kv.first);
        }
    }
    write_header();
}

ContainerWriter::~ContainerWriter() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception&) {
        // Destructors must not throw; close() reports the same failure.
    }
}

void ContainerWriter::write_header() {
    std::vector<std::uint8_t> out(kMagic.begin(), kMagic.end());

    std::map<std::string, std::string> meta = opts_.metadata;
    meta[kSchemaKey] = type_->to_string();
    meta[kCodecKey] = to_string(opts_.codec);

    put_long(out, static_cast<std::int64_t>(meta.size()));
    for (const auto& kv : meta) {
        put_bytes(out, reinterpret_cast<const std::uint8_t*>(kv.first.data()), kv.first.size());
        put_bytes(out, reinterpret_cast<const std::uint8_t*>(kv.second.data()), kv.second.size());
    }
    put_long(out, 0);
    out.insert(out.end(), sync_.begin(), sync_.end());

    write_raw(os_, out.data(), out.size());
    if (!os_) throw AvroError(ErrorKind::Io, "failed writing header: " + file_.string());
}

void ContainerWriter::append(const Value& val) {
    if (closed_) throw AvroError(ErrorKind::Io, "container writer is closed");
    std::vector<std::uint8_t> bytes = type_->to_buffer(val, scratch_);
    block_.insert(block_.end(), bytes.begin(), bytes.end());
    ++block_count_;
    ++count_;
    if (block_.size() >= opts_.block_size) flush();
}

void ContainerWriter::flush() {
    if (block_count_ == 0) return;

    std::vector<std::uint8_t> data = opts_.codec == Codec::Deflate
        ? deflate_raw(block_, opts_.deflate_level)
        : block_;

    std::vector<std::uint8_t> frame;
    put_long(frame, static_cast<std::int64_t>(block_count_));
    put_long(frame, static_cast<std::int64_t>(data.size()));
    write_raw(os_, frame.data(), frame.size());
    write_raw(os_, data.data(), data.size());
    write_raw(os_, sync_.data(), sync_.size());
    os_.flush();
    if (!os_) throw AvroError(ErrorKind::Io, "failed writing block: " + file_.string());

    block_.clear();
    block_count_ = 0;
}

void ContainerWriter::close() {
    if (closed_) return;
    closed_ = true;
    flush();
    os_.close();
    if (!os_) throw AvroError(ErrorKind::Io, "failed closing: " + file_.string());
}

// ------------------------------
// ContainerReader
// ------------------------------

ContainerReader::ContainerReader(const std::filesystem::path& file, const ContainerReadOptions& opts)
    : is_(file, std::ios::binary) {
    if (!is_) throw AvroError(ErrorKind::Io, "failed to open file: " + file.string());
    header_ = read_header(is_);

    TypePtr writer_type = parse_schema(header_.schema_json);
    if (opts.reader_type) {
        if (opts.reader_type->to_string() != writer_type->to_string()) {
            throw AvroError(ErrorKind::InvalidResolver, "reader type does not match the writer schema");
        }
        type_ = opts.reader_type;
    } else {
        type_ = std::move(writer_type);
    }
}

bool ContainerReader::load_block() {
    if (is_.peek() == std::char_traits<char>::eof()) return false;

    std::int64_t count = read_stream_long(is_);
    std::int64_t size = read_stream_long(is_);
    if (count < 0) throw AvroError(ErrorKind::Codec, "negative block count");
    std::vector<std::uint8_t> data = read_stream_chunk(is_, size, "block");
    if (read_sync(is_) != header_.sync) {
        throw AvroError(ErrorKind::SyncMismatch, "sync marker mismatch");
    }

    block_ = header_.codec == Codec::Deflate ? inflate_raw(data) : std::move(data);
    if (static_cast<std::uint64_t>(count) > block_.size() &&
        static_cast<std::uint64_t>(count) > ArrayType::kMaxBytelessItems) {
        throw AvroError(ErrorKind::Codec, "block count " + std::to_string(count) + " exceeds block size");
    }
    block_pos_ = 0;
    block_remaining_ = static_cast<std::uint64_t>(count);
    return true;
}

bool ContainerReader::next(Value& out) {
    while (block_remaining_ == 0) {
        if (block_pos_ < block_.size()) {
            throw AvroError(ErrorKind::TrailingData,
                            "trailing data: " + std::to_string(block_.size() - block_pos_) + " unread bytes in block");
        }
        if (!load_block()) return false;
    }

    Cursor cur(block_.data(), block_.size(), block_pos_);
    Value val = type_->read(cur);
    if (!cur.is_valid()) throw AvroError(ErrorKind::TruncatedBuffer, "truncated buffer");
    block_pos_ = cur.pos();
    --block_remaining_;
    out = std::move(val);
    return true;
}

// ------------------------------
// Whole-file helpers
// ------------------------------

void write_container(const std::filesystem::path& file, const TypePtr& type,
                     const std::vector<Value>& values, const ContainerWriteOptions& opts) {
    ContainerWriter w(file, type, opts);
    for (const auto& v : values) w.append(v);
    w.close();
}

ContainerData read_container(const std::filesystem::path& file, const ContainerReadOptions& opts) {
    ContainerReader r(file, opts);
    ContainerData out;
    out.header = r.header();
    out.type = r.type_ptr();
    Value v;
    while (r.next(v)) out.values.push_back(std::move(v));
    return out;
}

ContainerHeader read_container_header(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw AvroError(ErrorKind::Io, "failed to open file: " + file.string());
    return read_header(is);
}

} // namespace avrolite
