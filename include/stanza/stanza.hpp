#pragma once


/*
    ----------------------------------------------------------------
    Stanza - Modern C++ JSON adapters (records + qualifiers + registry)
    ----------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Streaming JSON I/O:           `Stanza::JsonReader`,
                                        `Stanza::JsonWriter`
        - Adapters:                     `Stanza::JsonAdapter<T>`
        - Adapter resolution:           `Stanza::AdapterRegistry`,
                                        `Stanza::JsonAdapterFactory`
        - Type usages:                  `Stanza::TypeDescriptor`,
                                        `Stanza::QualifierMarker`
        - Declared records:             `Stanza::JsonObject<T>`,
                                        `Stanza::property(...)`
        - Error reporting types:        `Stanza::ParseError`,
                                        `Stanza::ConvertError`
        - Configuration options:        `Stanza::ParseOptions`,
                                        `Stanza::WriteOptions`

    -------------------
    High-Level Overview
    -------------------
    - Records:
        * A struct becomes convertible by specializing `JsonObject<T>`
          with its name and the list of its properties
        * Properties may rename their JSON key, carry qualifiers, supply
          a default or bind to a type argument of a generic record
    - Qualifiers:
        * A `QualifierMarker` is a named tag with typed elements that
          distinguishes usages of the same C++ type (`@Hello std::string`
          versus plain `std::string`)
        * Markers are built from a `QualifierDeclaration`, which fills in
          default element values
    - Resolution:
        * `AdapterRegistry::adapter<T>(qualifiers)` asks the registered
          factories in order, then the built-in adapters, and caches the
          result per `TypeDescriptor`
        * Recursive types resolve through deferred adapters
    - Conversion:
        * `T parse(std::string_view, const ParseOptions& = {})`
        * `std::expected<T, ConvertError> try_parse(std::string_view, const ParseOptions& = {})`
        * `std::string dump(const T&, const WriteOptions& = {})`

    ------------
    Design Goals
    ------------
    - Modern C++:
        * Uses C++20/23 features (concepts, `std::expected`)
    - Correctness:
        * RFC 8259-compliant reading by default, with opt-in extensions
          (comments, trailing commas)
        * Every missing required property is reported at once
    - Composability:
        * No global registry; each `AdapterRegistry` owns its factories
          and its cache
        * Records are described non-intrusively

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        struct Person {
            std::string name;
            std::optional<std::int32_t> age;
        };

        template<>
        struct Stanza::JsonObject<Person> {
            static constexpr std::string_view name = "Person";
            static auto properties() {
                return std::make_tuple(
                    Stanza::property("name", &Person::name),
                    Stanza::property("age", &Person::age));
            }
        };

        auto registry = Stanza::AdapterRegistry::Builder{}.build();
        auto adapter = registry.adapter<Person>();

        Person p = adapter->parse(R"({"name":"Ada","age":36})");
        std::string s = adapter->dump(p, { .indent = "  " });
*/

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/logging.hpp"
#include "stanza/reader.hpp"
#include "stanza/writer.hpp"
#include "stanza/type_name.hpp"
#include "stanza/qualifier.hpp"
#include "stanza/type.hpp"
#include "stanza/adapter.hpp"
#include "stanza/factory.hpp"
#include "stanza/registry.hpp"
#include "stanza/standard.hpp"
#include "stanza/object.hpp"
#include "stanza/combinator.hpp"
