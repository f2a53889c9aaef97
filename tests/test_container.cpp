#include "avrolite/container.hpp"
#include "avrolite/easy.hpp"
#include "avrolite/record.hpp"
#include "avrolite/schemas.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using avrolite::Codec;
using avrolite::ErrorKind;
using avrolite::Value;

namespace easy = avrolite::easy;

static std::vector<Value> make_values(std::size_t n) {
    std::vector<Value> out;
    for (std::size_t i = 0; i < n; ++i) {
        std::vector<std::string> tags(i % 4, "tag" + std::to_string(i));
        out.push_back(easy::object({
            {"id", "item-" + std::to_string(i)},
            {"tags", easy::strings(tags)},
        }));
    }
    return out;
}

static void flip_byte(const std::filesystem::path& p, std::uint64_t offset) {
    std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
    CHECK(static_cast<bool>(f));
    f.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    char c;
    f.read(&c, 1);
    CHECK(static_cast<bool>(f));
    c ^= 0x01;
    f.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    f.write(&c, 1);
    CHECK(static_cast<bool>(f));
}

int main() {
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "avrolite_container_test.avro";
    std::filesystem::remove(tmp);

    auto type = avrolite::parse_schema(R"({"type":"record","name":"Item","namespace":"test","fields":[
        {"name":"id","type":"string"},
        {"name":"tags","type":{"type":"array","items":"string"}}
    ]})");
    const std::vector<Value> values = make_values(250);

    // Round trip with both codecs, across many blocks
    for (Codec codec : {Codec::Null, Codec::Deflate}) {
        avrolite::ContainerWriteOptions wo;
        wo.codec = codec;
        wo.block_size = 512;
        wo.metadata["origin"] = "unit-test";
        avrolite::write_container(tmp, type, values, wo);

        auto hdr = avrolite::read_container_header(tmp);
        CHECK(hdr.codec == codec);
        CHECK(hdr.schema_json == type->to_string());
        CHECK(hdr.metadata.count("origin") == 1);
        CHECK(std::string(hdr.metadata["origin"].begin(), hdr.metadata["origin"].end()) == "unit-test");
        CHECK(hdr.data_start > 4 + 16);

        auto data = avrolite::read_container(tmp);
        CHECK(data.values.size() == values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            CHECK(data.values[i] == values[i]);
            CHECK(data.values[i].record_type.lock() == data.type);
        }
    }

    // Streaming writer and reader
    {
        {
            avrolite::ContainerWriter w(tmp, type);
            w.append(values[0]);
            w.flush();
            w.append(values[1]);
            w.append(values[2]);
            CHECK(w.count() == 3);
            CHECK(throws_kind(ErrorKind::InvalidValue, [&] { w.append(Value("bad")); }));
            // Closed by the destructor.
        }
        avrolite::ContainerReadOptions ro;
        ro.reader_type = type;
        avrolite::ContainerReader r(tmp, ro);
        CHECK(&r.type() == type.get());
        Value v;
        std::size_t n = 0;
        while (r.next(v)) {
            CHECK(v == values[n]);
            ++n;
        }
        CHECK(n == 3);
        CHECK(!r.next(v));
    }

    // Empty files hold a header only
    {
        avrolite::write_container(tmp, type, {});
        CHECK(avrolite::read_container(tmp).values.empty());
    }

    // A reader type must match the writer schema
    {
        avrolite::write_container(tmp, type, values);
        avrolite::ContainerReadOptions ro;
        ro.reader_type = avrolite::parse_schema(R"({"type":"record","name":"Other","fields":[]})");
        CHECK(throws_kind(ErrorKind::InvalidResolver, [&] { avrolite::ContainerReader r(tmp, ro); }));
    }

    // Corrupt sync marker
    {
        avrolite::ContainerWriteOptions wo;
        wo.codec = Codec::Deflate;
        avrolite::write_container(tmp, type, make_values(10), wo);
        auto size = std::filesystem::file_size(tmp);
        flip_byte(tmp, size - 1);
        CHECK(throws_kind(ErrorKind::SyncMismatch, [&] { avrolite::read_container(tmp); }));
    }

    // Corrupt magic
    {
        avrolite::write_container(tmp, type, make_values(3));
        flip_byte(tmp, 0);
        CHECK(throws_kind(ErrorKind::BadMagic, [&] { avrolite::read_container_header(tmp); }));
    }

    // A metadata block count with no positive magnitude
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        const char bytes[] = {'O', 'b', 'j', 0x01,
                              char(0xff), char(0xff), char(0xff), char(0xff), char(0xff),
                              char(0xff), char(0xff), char(0xff), char(0xff), 0x01, 0x00};
        os.write(bytes, sizeof(bytes));
        os.close();
        CHECK(throws_kind(ErrorKind::Codec, [&] { avrolite::read_container_header(tmp); }));
    }

    // Unknown codec names and missing files
    {
        CHECK(throws_kind(ErrorKind::Codec, [] { avrolite::codec_from_string("snappy"); }));
        CHECK(avrolite::codec_from_string("deflate") == Codec::Deflate);
        CHECK(throws_kind(ErrorKind::Io, [] {
            avrolite::read_container(std::filesystem::temp_directory_path() / "avrolite_missing_dir" / "x.avro");
        }));
        CHECK(throws_kind(ErrorKind::InvalidValue, [&] {
            avrolite::ContainerWriteOptions wo;
            wo.metadata["avro.codec"] = "null";
            avrolite::ContainerWriter w(tmp, type, wo);
        }));
    }

    std::filesystem::remove(tmp);
    std::cout << "test_container: all tests passed.\n";
    return 0;
}
