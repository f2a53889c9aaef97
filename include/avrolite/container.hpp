#pragma once

#include "avrolite/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace avrolite {

// ------------------------------
// Object container files
// ------------------------------

enum class Codec {
    Null,
    Deflate,
};

const char* to_string(Codec c) noexcept;
// Throws AvroError(Codec) for names other than "null" and "deflate".
Codec codec_from_string(const std::string& name);

using SyncMarker = std::array<std::uint8_t, 16>;

struct ContainerHeader {
    // Every metadata entry, including avro.schema and avro.codec.
    std::map<std::string, std::vector<std::uint8_t>> metadata{};
    Codec codec{Codec::Null};
    SyncMarker sync{};
    std::string schema_json{};
    // Offset of the first data block.
    std::uint64_t data_start{0};
};

struct ContainerWriteOptions {
    Codec codec{Codec::Null};
    int deflate_level{6}; // 0..9
    // Encoded bytes collected before a block is written out.
    std::size_t block_size{64 * 1024};
    // Extra user metadata. Keys starting with "avro." are reserved.
    std::map<std::string, std::string> metadata{};
};

struct ContainerReadOptions {
    // Type to decode with instead of compiling the embedded schema. It must
    // render the same schema as the writer's.
    TypePtr reader_type{};
};

class ContainerWriter {
public:
    ContainerWriter(const std::filesystem::path& file, TypePtr type,
                    const ContainerWriteOptions& opts = ContainerWriteOptions{});
    // Closes the file. Errors are only reported by an explicit close().
    ~ContainerWriter();

    ContainerWriter(const ContainerWriter&) = delete;
    ContainerWriter& operator=(const ContainerWriter&) = delete;

    /// Encodes `val` into the current block. Throws AvroError(InvalidValue)
    /// when it does not match the writer type.
    void append(const Value& val);
    /// Writes out the pending block, if any.
    void flush();
    void close();

    const Type& type() const noexcept { return *type_; }
    const SyncMarker& sync() const noexcept { return sync_; }
    std::uint64_t count() const noexcept { return count_; }

private:
    void write_header();

    std::ofstream os_;
    std::filesystem::path file_;
    TypePtr type_;
    ContainerWriteOptions opts_;
    SyncMarker sync_{};
    EncodeBuffer scratch_;
    std::vector<std::uint8_t> block_;
    std::uint64_t block_count_{0};
    std::uint64_t count_{0};
    bool closed_{false};
};

class ContainerReader {
public:
    explicit ContainerReader(const std::filesystem::path& file,
                             const ContainerReadOptions& opts = ContainerReadOptions{});

    const ContainerHeader& header() const noexcept { return header_; }
    const Type& type() const noexcept { return *type_; }
    const TypePtr& type_ptr() const noexcept { return type_; }

    /// Decodes the next value into `out`. Returns false at the end of the file.
    bool next(Value& out);

private:
    bool load_block();

    std::ifstream is_;
    ContainerHeader header_;
    TypePtr type_;
    std::vector<std::uint8_t> block_;
    std::size_t block_pos_{0};
    std::uint64_t block_remaining_{0};
};

/// Writes every value of `values` into a new container file.
void write_container(const std::filesystem::path& file, const TypePtr& type,
                     const std::vector<Value>& values,
                     const ContainerWriteOptions& opts = ContainerWriteOptions{});

struct ContainerData {
    ContainerHeader header{};
    // Owns the record types the values link back to.
    TypePtr type{};
    std::vector<Value> values{};
};

/// Reads every value of a container file.
ContainerData read_container(const std::filesystem::path& file,
                            const ContainerReadOptions& opts = ContainerReadOptions{});

/// Reads the header without touching the data blocks.
ContainerHeader read_container_header(const std::filesystem::path& file);

} // namespace avrolite
