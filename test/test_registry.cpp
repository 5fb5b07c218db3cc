#include <catch2/catch.hpp>

#include "test_model.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Catch;

namespace {

    const Stanza::QualifierDeclaration Other{ "Other" };

    // Counts its calls and claims nothing.
    class CountingFactory final : public Stanza::JsonAdapterFactory {
    public:
        explicit CountingFactory(std::atomic<int>& calls) : m_Calls{ calls } {}

        std::shared_ptr<const Stanza::JsonAdapterBase> create(const Stanza::TypeDescriptor&, const Stanza::AdapterRegistry&) const override {
            m_Calls++;
            return nullptr;
        }

    private:
        std::atomic<int>& m_Calls;
    };

    // Claims every std::int32_t usage with an adapter of the wrong C++ type.
    class WrongTypeFactory final : public Stanza::JsonAdapterFactory {
    public:
        std::shared_ptr<const Stanza::JsonAdapterBase> create(const Stanza::TypeDescriptor& type, const Stanza::AdapterRegistry&) const override {
            if (!(type == Stanza::TypeDescriptor::of<std::int32_t>())) return nullptr;
            return std::make_shared<Stanza::StringAdapter>();
        }
    };

    const Stanza::QualifierDeclaration Blob{ "Blob", {
        { "data", Stanza::element_kind::bytes },
        { "labels", Stanza::element_kind::array, Stanza::QualifierValue::Array{} },
    } };

    // Serves any qualified std::string and counts how often it was asked.
    class QualifiedStringFactory final : public Stanza::JsonAdapterFactory {
    public:
        std::shared_ptr<const Stanza::JsonAdapterBase> create(const Stanza::TypeDescriptor& type, const Stanza::AdapterRegistry&) const override {
            if (!(type.raw() == Stanza::TypeDescriptor::of<std::string>().raw()) || !type.is_qualified()) return nullptr;
            calls++;
            return std::make_shared<Stanza::StringAdapter>();
        }

        mutable std::atomic<int> calls = 0;
    };

    class ShoutingAdapter final : public Stanza::JsonAdapter<std::string> {
    public:
        explicit ShoutingAdapter(std::string tag) : m_Tag{ std::move(tag) } {}

        std::string from_json(Stanza::JsonReader& reader) const override { return reader.next_string() + "!"; }
        void to_json(Stanza::JsonWriter& writer, const std::string& value) const override { writer.value(value + "!"); }
        std::string to_string() const override { return m_Tag; }

    private:
        std::string m_Tag;
    };
}


TEST_CASE("Builder Rejects a Null Factory") {
    Stanza::AdapterRegistry::Builder builder;
    REQUIRE_THROWS_AS(builder.add(std::shared_ptr<const Stanza::JsonAdapterFactory>{}), std::invalid_argument);
}

TEST_CASE("Built-in Adapters Resolve Without Registration") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();

    REQUIRE(registry.adapter<std::string>()->to_string() == "JsonAdapter(std::string)");
    REQUIRE(registry.adapter<bool>()->to_string() == "JsonAdapter(bool)");
    REQUIRE(registry.adapter<std::int32_t>()->to_string() == "JsonAdapter(std::int32_t)");
    REQUIRE(registry.adapter<std::vector<std::string>>()->to_string() == "JsonAdapter(std::vector<std::string>)");
    REQUIRE(registry.adapter<Model::Simple>()->to_string() == "GeneratedJsonAdapter(Simple)");
}

TEST_CASE("Adapters are Cached Per Descriptor") {
    auto registry = Model::hello_builder().build();

    auto a = registry.adapter<std::vector<std::string>>();
    auto b = registry.adapter<std::vector<std::string>>();
    REQUIRE(a == b);

    // The element adapter was cached on the way.
    REQUIRE(registry.cached() == 2);

    auto hello = registry.adapter<std::string>({ Model::Hello() });
    REQUIRE(hello == registry.adapter<std::string>({ Model::Hello() }));
    REQUIRE_FALSE(hello == registry.adapter<std::string>());
    REQUIRE(registry.cached() == 3);
}

TEST_CASE("Equal Byte and Array Qualifiers Share a Cache Entry") {
    auto factory = std::make_shared<QualifiedStringFactory>();
    auto registry = Stanza::AdapterRegistry::Builder{}.add(factory).build();

    using Bytes = Stanza::QualifierValue::Bytes;
    using Array = Stanza::QualifierValue::Array;

    Bytes data{ 7, 8, 9 };
    Stanza::TypeDescriptor first = Stanza::TypeDescriptor::of<std::string>(
        { Blob({ { "data", data }, { "labels", Array{ "x", Bytes{ 1 } } } }), Other() });

    Bytes same_data;
    for (std::uint8_t b : { 7, 8, 9 }) same_data.push_back(b);
    Stanza::TypeDescriptor second = Stanza::TypeDescriptor::of<std::string>(
        { Other(), Blob({ { "labels", Array{ std::string{ "x" }, Bytes{ 1 } } }, { "data", same_data } }) });

    REQUIRE(first.hash() == second.hash());

    auto a = registry.adapter_for(first);
    auto b = registry.adapter_for(second);
    REQUIRE(a != nullptr);
    REQUIRE(a == b);
    REQUIRE(factory->calls.load() == 1);
    REQUIRE(registry.cached() == 1);

    auto different = registry.adapter_for(Stanza::TypeDescriptor::of<std::string>({ Blob({ { "data", Bytes{ 7, 8 } } }) }));
    REQUIRE(different != a);
    REQUIRE(factory->calls.load() == 2);
}

TEST_CASE("Qualifiers Match by Exact Set") {
    auto registry = Model::hello_builder().build();

    REQUIRE(registry.adapter<std::string>({ Model::Hello() })->to_string() == "HelloAdapter");
    REQUIRE(registry.adapter<std::string>()->to_string() == "JsonAdapter(std::string)");

    try {
        (void)registry.adapter<std::string>({ Model::Hello(), Other() });
        FAIL("expected UnsupportedTypeError");
    } catch (const Stanza::UnsupportedTypeError& e) {
        REQUIRE(e.type() == "std::string");
        REQUIRE(e.qualifiers() == std::vector<std::string>{ "@Hello", "@Other" });
        REQUIRE(std::string{ e.what() } == "No JSON adapter for std::string annotated [@Hello, @Other]");
    }

    REQUIRE_THROWS_AS(registry.adapter<std::string>({ Other() }), Stanza::UnsupportedTypeError);
}

TEST_CASE("Factories are Consulted in Registration Order") {
    auto registry = Stanza::AdapterRegistry::Builder{}
        .add<std::string>(std::make_shared<ShoutingAdapter>("first"), { Other() })
        .add<std::string>(std::make_shared<ShoutingAdapter>("second"), { Other() })
        .build();

    REQUIRE(registry.adapter<std::string>({ Other() })->to_string() == "first");
}

TEST_CASE("Registered Factories Precede Built-in Adapters") {
    auto registry = Stanza::AdapterRegistry::Builder{}
        .add<std::string>(std::make_shared<ShoutingAdapter>("shouting"))
        .build();

    auto adapter = registry.adapter<std::vector<std::string>>();
    REQUIRE(adapter->parse(R"(["a","b"])") == std::vector<std::string>{ "a!", "b!" });
    REQUIRE(adapter->dump({ "x" }) == R"(["x!"])");
}

TEST_CASE("Function Adapters Register Inline") {
    auto registry = Stanza::AdapterRegistry::Builder{}
        .add<std::int32_t>({ Other() },
            [](Stanza::JsonReader& r) { return static_cast<std::int32_t>(r.next_string().size()); },
            [](Stanza::JsonWriter& w, const std::int32_t& v) { w.value(std::string(static_cast<size_t>(v), '*')); })
        .build();

    auto adapter = registry.adapter<std::int32_t>({ Other() });
    REQUIRE(adapter->to_string() == "FunctionAdapter(std::int32_t)");
    REQUIRE(adapter->parse(R"("abcd")") == 4);
    REQUIRE(adapter->dump(3) == R"("***")");
}

TEST_CASE("Every Factory Sees Every Lookup Once") {
    std::atomic<int> calls = 0;
    auto registry = Stanza::AdapterRegistry::Builder{}
        .add(std::make_shared<CountingFactory>(calls))
        .build();

    (void)registry.adapter<std::vector<std::string>>();
    REQUIRE(calls.load() == 2);

    (void)registry.adapter<std::vector<std::string>>();
    (void)registry.adapter<std::string>();
    REQUIRE(calls.load() == 2);
}

TEST_CASE("Unsupported Types are Reported") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();

    try {
        (void)registry.adapter<Model::Unconvertible>();
        FAIL("expected UnsupportedTypeError");
    } catch (const Stanza::UnsupportedTypeError& e) {
        REQUIRE(e.qualifiers().empty());
        REQUIRE(std::string{ e.what() }.starts_with("No JSON adapter for "));
    }

    // A failed lookup leaves nothing behind.
    REQUIRE(registry.cached() == 0);
    REQUIRE_THROWS_AS(registry.adapter<Model::Unconvertible>(), Stanza::UnsupportedTypeError);
    REQUIRE(registry.adapter<Model::Simple>()->parse(R"({"prop":"v"})").prop == "v");
}

TEST_CASE("Undeclared Types are Reported by Readable Name") {
    REQUIRE(Stanza::type_name<Model::SomeEnum>() == "Model::SomeEnum");
    REQUIRE(Stanza::TypeDescriptor::of<std::vector<Model::SomeEnum>>().to_string() == "std::vector<Model::SomeEnum>");

    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    try {
        (void)registry.adapter<Model::SomeEnum>();
        FAIL("expected UnsupportedTypeError");
    } catch (const Stanza::UnsupportedTypeError& e) {
        REQUIRE(e.type() == "Model::SomeEnum");
        REQUIRE(std::string{ e.what() } == "No JSON adapter for Model::SomeEnum");
    }
}

TEST_CASE("Adapters of the Wrong C++ Type are Rejected") {
    auto registry = Stanza::AdapterRegistry::Builder{}
        .add(std::make_shared<WrongTypeFactory>())
        .build();

    REQUIRE_THROWS_AS(registry.adapter<std::int32_t>(), Stanza::UnsupportedTypeError);
}

TEST_CASE("Untyped Lookups Use Registered Factories Only") {
    auto registry = Model::hello_builder().build();

    auto hello = registry.adapter_for(Stanza::TypeDescriptor::of<std::string>({ Model::Hello() }));
    REQUIRE(hello->to_string() == "HelloAdapter");
    REQUIRE(std::dynamic_pointer_cast<const Stanza::JsonAdapter<std::string>>(hello) != nullptr);

    REQUIRE_THROWS_AS(registry.adapter_for(Stanza::TypeDescriptor::of<std::int64_t>()), Stanza::UnsupportedTypeError);

    // Once resolved through a typed lookup, the cache serves untyped ones too.
    auto typed = registry.adapter<std::int64_t>();
    REQUIRE(registry.adapter_for(Stanza::TypeDescriptor::of<std::int64_t>()) == std::static_pointer_cast<const Stanza::JsonAdapterBase>(typed));
}

TEST_CASE("Concurrent Lookups Share One Adapter") {
    auto registry = Model::hello_builder().build();

    constexpr int thread_count = 8;
    std::vector<std::shared_ptr<const Stanza::JsonAdapter<Model::TestClass>>> results(thread_count);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; i++) {
        threads.emplace_back([&registry, &results, i] { results[static_cast<size_t>(i)] = registry.adapter<Model::TestClass>(); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) REQUIRE(r == results.front());
    REQUIRE(results.front() == registry.adapter<Model::TestClass>());
}

TEST_CASE("Recursive Records Resolve") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::TreeNode>();

    std::string json = R"({"name":"root","children":[{"name":"a","children":[]},{"name":"b","children":[{"name":"c","children":[]}]}]})";
    Model::TreeNode root = adapter->parse(json);

    REQUIRE(root.name == "root");
    REQUIRE(root.children.size() == 2);
    REQUIRE(root.children[1].children[0].name == "c");
    REQUIRE(adapter->dump(root) == json);

    // The list adapter inside the record reuses the record's own adapter.
    REQUIRE(registry.adapter<std::vector<Model::TreeNode>>()->parse(R"([{"name":"x","children":[]}])").front().name == "x");
}

TEST_CASE("Mutually Recursive Records Resolve") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<Model::Employee>();

    std::string json = R"({"name":"Ada","manages":[{"title":"R&D","staff":[{"name":"Bob","manages":null}]}]})";
    Model::Employee ada = adapter->parse(json);

    REQUIRE(ada.manages);
    REQUIRE(ada.manages->front().title == "R&D");
    REQUIRE(ada.manages->front().staff.front().name == "Bob");
    REQUIRE_FALSE(ada.manages->front().staff.front().manages);
    REQUIRE(adapter->dump(ada) == json);

    REQUIRE(registry.adapter<Model::Department>()->to_string() == "GeneratedJsonAdapter(Department)");
}

TEST_CASE("Optional Passes Qualifiers to Its Element") {
    auto registry = Model::hello_builder().build();
    auto adapter = registry.adapter<std::optional<std::string>>({ Model::Hello() });

    REQUIRE(adapter->parse(R"("there")") == std::optional<std::string>{ "Hello, there" });
    REQUIRE_FALSE(adapter->parse("null").has_value());
    REQUIRE(adapter->dump(std::optional<std::string>{ "Hello, you" }) == R"("you")");
    REQUIRE(adapter->dump(std::nullopt) == "null");
}

TEST_CASE("Integer Adapters Check Range") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();

    auto i32 = registry.adapter<std::int32_t>();
    REQUIRE(i32->parse("2147483647") == std::numeric_limits<std::int32_t>::max());
    try {
        (void)i32->parse("3000000000");
        FAIL("expected JsonDataError");
    } catch (const Stanza::JsonDataError& e) {
        REQUIRE(std::string{ e.what() } == "Expected an int but was 3000000000 at path $");
    }

    auto i16 = registry.adapter<std::int16_t>();
    REQUIRE(i16->parse("-32768") == -32768);
    REQUIRE_THROWS_AS(i16->parse("32768"), Stanza::JsonDataError);

    auto u64 = registry.adapter<std::uint64_t>();
    REQUIRE(u64->parse("18446744073709551615") == std::numeric_limits<std::uint64_t>::max());
    REQUIRE_THROWS_AS(u64->parse("-1"), Stanza::JsonDataError);
}

TEST_CASE("Signed and Unsigned Integers Accept the Same Spellings") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto i64 = registry.adapter<std::int64_t>();
    auto u64 = registry.adapter<std::uint64_t>();

    REQUIRE(i64->parse("1e2") == 100);
    REQUIRE(u64->parse("1e2") == 100u);
    REQUIRE(i64->parse("7.0") == 7);
    REQUIRE(u64->parse("7.0") == 7u);
    REQUIRE(u64->parse(R"("42")") == 42u);

    REQUIRE_THROWS_AS(i64->parse("1.5"), Stanza::JsonDataError);
    REQUIRE_THROWS_AS(u64->parse("1.5"), Stanza::JsonDataError);
    REQUIRE_THROWS_AS(u64->parse("-1e2"), Stanza::JsonDataError);
    REQUIRE_THROWS_AS(u64->parse("2e19"), Stanza::JsonDataError);
}

TEST_CASE("Bytes Accept the Unsigned Range") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<std::int8_t>();

    REQUIRE(adapter->parse("255") == -1);
    REQUIRE(adapter->parse("-128") == -128);
    REQUIRE(adapter->dump(std::int8_t{ -1 }) == "255");
    REQUIRE_THROWS_AS(adapter->parse("256"), Stanza::JsonDataError);
    REQUIRE_THROWS_AS(adapter->parse("-129"), Stanza::JsonDataError);
}

TEST_CASE("Chars are One-Character Strings") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();
    auto adapter = registry.adapter<char>();

    REQUIRE(adapter->parse(R"("c")") == 'c');
    REQUIRE(adapter->dump('n') == R"("n")");
    REQUIRE_THROWS_AS(adapter->parse(R"("cc")"), Stanza::JsonDataError);
}

TEST_CASE("Containers Convert Element-wise") {
    auto registry = Stanza::AdapterRegistry::Builder{}.build();

    auto set = registry.adapter<std::set<std::string>>();
    REQUIRE(set->parse(R"(["b","a","b"])") == std::set<std::string>{ "a", "b" });
    REQUIRE(set->dump({ "z", "y" }) == R"(["y","z"])");

    auto list = registry.adapter<std::list<double>>();
    REQUIRE(list->parse("[1.5, 2]") == std::list<double>{ 1.5, 2.0 });

    auto map = registry.adapter<std::map<std::string, std::int32_t>>();
    REQUIRE(map->parse(R"({"b":2,"a":1,"b":3})") == std::map<std::string, std::int32_t>{ { "a", 1 }, { "b", 3 } });
    REQUIRE(map->dump({ { "k", 1 } }) == R"({"k":1})");

    REQUIRE_THROWS_AS(registry.adapter<std::vector<std::string>>({ Other() }), Stanza::UnsupportedTypeError);
}

TEST_CASE("Logger is Shared") {
    auto a = Stanza::get_logger();
    auto b = Stanza::get_logger();
    REQUIRE(a != nullptr);
    REQUIRE(a == b);
    REQUIRE(a->name() == "stanza");
}

TEST_CASE("Logger is Created Without a Default Logger") {
    auto previous = spdlog::default_logger();
    spdlog::drop("stanza");
    spdlog::set_default_logger(nullptr);

    auto logger = Stanza::get_logger();
    spdlog::set_default_logger(previous);

    REQUIRE(logger != nullptr);
    REQUIRE(logger->name() == "stanza");
    REQUIRE(spdlog::get("stanza") == logger);
}
