#include "avrolite/avrolite.hpp"
#include "avrolite/easy.hpp"

#include <cstdint>
#include <iostream>
#include <vector>


// Person { name, nicknames[], address { city, tags[] = [] }, friends: Person[] = [] }
static avrolite::Value make_person_schema() {
    using namespace avrolite::easy;
    return record_schema("Person", {
        field_schema("name", "string"),
        field_schema("nicknames", array_schema("string")),
        field_schema("address", record_schema("Address", {
            field_schema("city", "string"),
            field_schema("tags", array_schema("string"), array({})),
        })),
        field_schema("friends", array_schema("Person"), array({})),
    }, "demo");
}

int main() {
    try {
        using namespace avrolite;

        TypePtr person = parse(make_person_schema());
        const auto& rec = static_cast<const RecordType&>(*person);
        std::cout << "Schema: " << person->to_string() << "\n";

        // Positional construction; missing trailing fields take their defaults
        Value bob = rec.construct({
            Value("bob"),
            easy::strings({"b"}),
            easy::object({{"city", "Oslo"}}),
        });

        Value ann = person->from_string(R"({"name":"ann","nicknames":[],"address":{"city":"Rome"}})");
        ann["friends"].as_array().push_back(bob);

        // Encode / decode
        std::vector<std::uint8_t> bytes = person->to_buffer(ann);
        std::cout << "Encoded ann: " << bytes.size() << " bytes\n";

        Value back = person->from_buffer(bytes);
        std::cout << "Decoded: " << person->to_string(back) << "\n";

        // Validation with error paths
        Value broken = parse_json(R"({"name":"x","nicknames":["ok",7],"address":{"city":null}})");
        person->is_valid(broken, [](const Path& path, const Value& val, const Type& t) {
            std::cout << "Invalid at [";
            for (std::size_t i = 0; i < path.size(); ++i) std::cout << (i ? ", " : "") << path[i];
            std::cout << "]: " << dump_json(val) << " is not a " << t.type_name() << "\n";
        });

        // Container file
        ContainerWriteOptions wo;
        wo.codec = Codec::Deflate;
        wo.metadata["producer"] = "avrolite_demo";

        std::string file = "demo_out.avro";
        write_container(file, person, {ann, bob}, wo);
        std::cout << "Wrote: " << file << "\n";

        ContainerData data = read_container(file);
        std::cout << "Read " << data.values.size() << " value(s), codec="
                  << to_string(data.header.codec) << "\n";

        std::cout << "OK\n";
        return 0;

    } catch (const avrolite::AvroError& e) {
        std::cerr << "Avro error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
