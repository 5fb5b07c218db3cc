#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "stanza/stanza.hpp"

namespace {

    const Stanza::QualifierDeclaration Upper{ "Upper" };

    struct Person {
        std::string name;
        std::optional<std::int32_t> age;
        std::vector<std::string> tags;
        std::string nickname;
    };

    class UpperAdapter final : public Stanza::JsonAdapter<std::string> {
    public:
        std::string from_json(Stanza::JsonReader& reader) const override {
            std::string s = reader.next_string();
            for (char& c : s) {
                if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
            }
            return s;
        }

        void to_json(Stanza::JsonWriter& writer, const std::string& value) const override { writer.value(value); }

        std::string to_string() const override { return "UpperAdapter"; }
    };

} // namespace

template<>
struct Stanza::JsonObject<Person> {
    static constexpr std::string_view name = "Person";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("name", &Person::name).json("full_name"),
            Stanza::property("age", &Person::age),
            Stanza::property("tags", &Person::tags).defaults_to([] { return std::vector<std::string>{}; }),
            Stanza::property("nickname", &Person::nickname).qualified(Upper()));
    }
};

int main(int argc, char** argv) {
    auto registry = Stanza::AdapterRegistry::Builder{}
        .add<std::string>(std::make_shared<UpperAdapter>(), { Upper() })
        .build();
    auto adapter = registry.adapter<Person>();

    Person p = adapter->parse(R"({"full_name":"Zetta","age":27,"nickname":"zb","extra":[1,2,3]})");
    p.tags = { "c++", "json" };

    std::cout << adapter->dump(p, { .indent = "    " }) << "\n\n";

    auto missing = adapter->try_parse(R"({"age":null})");
    if (!missing) std::cout << missing.error().msg << "\n\n";

    if (argc < 2) return 0;

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        Stanza::get_logger()->error("Failed to open {}", argv[1]);
        return -1;
    }
    std::string text{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };

    auto people = registry.adapter<std::vector<Person>>()->try_parse(text, { .allow_comments = true });
    if (!people) {
        Stanza::get_logger()->error("Parse error! -> {}", people.error().msg);
        return 1;
    }
    std::cout << registry.adapter<std::vector<Person>>()->dump(*people, { .indent = "  " }) << "\n";

    return 0;
}
