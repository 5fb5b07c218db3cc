#include <catch2/catch.hpp>

#include "test_model.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Catch;


TEST_CASE("Unknown Keys of Any Shape are Skipped") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::Simple>();

    auto s = adapter->parse(R"({"a":[1,{"b":[]}],"prop":"value","c":{"d":null},"e":true})");
    REQUIRE(s.prop == "value");
    REQUIRE(adapter->dump(s) == R"({"prop":"value"})");
}

TEST_CASE("Keys are Accepted in Any Order") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::CustomNames>();

    auto c = adapter->parse(R"({"jsonProp2":"two","jsonProp1":"one"})");
    REQUIRE(c.jsonProp1 == "one");
    REQUIRE(c.jsonProp2 == "two");
    REQUIRE(adapter->dump(c) == R"({"jsonProp1":"one","jsonProp2":"two"})");
}

TEST_CASE("Repeated Keys Keep the Last Value") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::Simple>();

    REQUIRE(adapter->parse(R"({"prop":"first","prop":"second"})").prop == "second");
}

TEST_CASE("Missing Required Properties are Listed in Declaration Order") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::CustomNames>();

    try {
        (void)adapter->parse(R"({"jsonProp2":"two"})");
        FAIL("expected MissingPropertiesError");
    } catch (const Stanza::MissingPropertiesError& e) {
        REQUIRE(e.names() == std::vector<std::string>{ "jsonProp1" });
        REQUIRE(std::string{ e.what() } == "The following properties were null: jsonProp1");
    }
}

TEST_CASE("Absent Properties Take Their Defaults") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::WithDefaults>();

    auto d = adapter->parse(R"({"name":"x"})");
    REQUIRE(d.name == "x");
    REQUIRE(d.retries == 3);
    REQUIRE(d.note == std::optional<std::string>{ "none" });
    REQUIRE_FALSE(d.label.has_value());

    // Explicit null is a value, not an absence.
    auto n = adapter->parse(R"({"name":"x","note":null,"retries":0})");
    REQUIRE_FALSE(n.note.has_value());
    REQUIRE(n.retries == 0);

    // Defaulted properties are not required.
    REQUIRE_THROWS_AS(adapter->parse("{}"), Stanza::MissingPropertiesError);
    REQUIRE_NOTHROW(adapter->parse(R"({"name":""})"));
}

TEST_CASE("Every Declared Property is Written") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::WithDefaults>();

    Model::WithDefaults d;
    d.name = "x";
    d.retries = 3;

    REQUIRE(adapter->dump(d) == R"({"name":"x","retries":3,"note":null,"label":null})");

    Stanza::WriteOptions opts;
    opts.serialize_nulls = false;
    REQUIRE(adapter->dump(d, opts) == R"({"name":"x","retries":3})");
}

TEST_CASE("Wrong Value Types Report the Path") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::NestedClasses>();

    try {
        (void)adapter->parse(R"({"inner":{"prop":true}})");
        FAIL("expected JsonDataError");
    } catch (const Stanza::JsonDataError& e) {
        REQUIRE(e.path() == "$.inner.prop");
        REQUIRE(std::string{ e.what() } == "Expected a string but was BOOLEAN at path $.inner.prop");
    }

    REQUIRE_THROWS_AS(adapter->parse(R"({"inner":{"prop":null}})"), Stanza::JsonDataError);
    REQUIRE_THROWS_AS(adapter->parse(R"(["inner"])"), Stanza::JsonDataError);
}

TEST_CASE("Duplicate JSON Keys are Rejected") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    REQUIRE_THROWS_AS(registry.adapter<Model::DuplicateKeys>(), std::invalid_argument);
}

TEST_CASE("Records Decline Qualified Usages") {
    auto registry = Model::hello_builder().build();
    REQUIRE_THROWS_AS(registry.adapter<Model::Simple>({ Model::Hello() }), Stanza::UnsupportedTypeError);
}

TEST_CASE("Generic Instantiations are Cached Independently") {
    auto registry = Model::hello_builder().build();

    using OfStrings = Model::GenericClass<std::vector<std::string>, std::string>;
    using OfInts = Model::GenericClass<std::vector<std::int32_t>, std::int32_t>;

    auto strings = registry.adapter<OfStrings>();
    auto ints = registry.adapter<OfInts>();
    REQUIRE(strings == registry.adapter<OfStrings>());
    REQUIRE(std::static_pointer_cast<const Stanza::JsonAdapterBase>(strings) != std::static_pointer_cast<const Stanza::JsonAdapterBase>(ints));

    REQUIRE(Stanza::TypeDescriptor::of<OfInts>().to_string() == "GenericClass<std::vector<std::int32_t>, std::int32_t>");

    auto v = ints->parse(R"({"collection":[1,2],"value":3})");
    REQUIRE(v.collection == std::vector<std::int32_t>{ 1, 2 });
    REQUIRE(v.value == 3);
    REQUIRE(ints->dump(v) == R"({"collection":[1,2],"value":3})");
}

TEST_CASE("Parse Rejects Malformed Documents") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::Simple>();

    REQUIRE_THROWS_AS(adapter->parse(R"({"prop":"value"} {})"), Stanza::MalformedJsonError);
    REQUIRE_THROWS_AS(adapter->parse(R"({"prop":"value",})"), Stanza::MalformedJsonError);

    Stanza::ParseOptions relaxed;
    relaxed.allow_trailing_commas = true;
    relaxed.allow_comments = true;
    REQUIRE(adapter->parse("{\"prop\":\"value\", /* note */ }", relaxed).prop == "value");
}

TEST_CASE("Try Parse Returns Conversion Failures") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::NestedClasses>();

    auto ok = adapter->try_parse(R"({"inner":{"prop":"value"}})");
    REQUIRE(ok.has_value());
    REQUIRE(ok->inner.prop == "value");

    auto malformed = adapter->try_parse(R"({"inner":)");
    REQUIRE_FALSE(malformed.has_value());
    REQUIRE(malformed.error().errc == Stanza::ConvertError::code::malformed_json);
    REQUIRE(malformed.error().parse.has_value());
    REQUIRE(malformed.error().parse->errc == Stanza::ParseError::code::unexpected_end_of_input);

    auto wrong = adapter->try_parse(R"({"inner":{"prop":[]}})");
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().errc == Stanza::ConvertError::code::unexpected_data);
    REQUIRE(wrong.error().path == "$.inner.prop");

    auto missing = adapter->try_parse(R"({"inner":{}})");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().errc == Stanza::ConvertError::code::missing_properties);
    REQUIRE(missing.error().msg == "The following properties were null: prop");
}

TEST_CASE("Leftover Input is Told Apart from Trailing Text") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();

    REQUIRE_THROWS_AS(registry.adapter<std::string>()->parse(R"("a" "b")"), Stanza::MalformedJsonError);

    // Reads the first element and stops.
    Stanza::FunctionAdapter<std::string> first_only{ "std::string",
        [](Stanza::JsonReader& r) {
            r.begin_array();
            return r.next_string();
        },
        [](Stanza::JsonWriter& w, const std::string& v) { w.value(v); } };

    try {
        (void)first_only.parse(R"(["a","b"])");
        FAIL("expected JsonDataError");
    } catch (const Stanza::JsonDataError& e) {
        REQUIRE(std::string{ e.what() }.starts_with("JSON document was not fully consumed."));
        REQUIRE(e.path() == "$[1]");
    }

    auto failure = first_only.try_parse(R"(["a","b"])");
    REQUIRE_FALSE(failure.has_value());
    REQUIRE(failure.error().errc == Stanza::ConvertError::code::unexpected_data);
}
