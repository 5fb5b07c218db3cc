#pragma once

#include "stanza/stanza.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace Model {

    // ------------------------------------------------------------
    // Qualifiers
    // ------------------------------------------------------------

    inline const Stanza::QualifierDeclaration Hello{ "Hello" };
    inline const Stanza::QualifierDeclaration WrappedInObject{ "WrappedInObject" };
    inline const Stanza::QualifierDeclaration WrappedInArray{ "WrappedInArray" };

    enum class SomeEnum { VALUE1, VALUE2, VALUE3, VALUE4, VALUE5 };

    inline const Stanza::QualifierDeclaration WithStringElement{ "WithStringElement", {
        { "string", Stanza::element_kind::string },
    } };
    inline const Stanza::QualifierDeclaration WithNumberElement{ "WithNumberElement", {
        { "number", Stanza::element_kind::integer },
    } };
    inline const Stanza::QualifierDeclaration WithBooleanElement{ "WithBooleanElement", {
        { "bool", Stanza::element_kind::boolean },
    } };
    inline const Stanza::QualifierDeclaration WithClassElement{ "WithClassElement", {
        { "cls", Stanza::element_kind::type },
    } };
    inline const Stanza::QualifierDeclaration WithEnumElement{ "WithEnumElement", {
        { "someEnum", Stanza::element_kind::enumeration },
    } };
    inline const Stanza::QualifierDeclaration WithArrayElements{ "WithArrayElements", {
        { "stringArray", Stanza::element_kind::array },
        { "byteArray", Stanza::element_kind::bytes },
        { "classArray", Stanza::element_kind::array },
    } };
    inline const Stanza::QualifierDeclaration WithDefaultStringElement{ "WithDefaultStringElement", {
        { "string", Stanza::element_kind::string, "default" },
    } };

    // Prepends "Hello, " when reading and strips it when writing.
    class HelloAdapter final : public Stanza::JsonAdapter<std::string> {
    public:
        std::string from_json(Stanza::JsonReader& reader) const override {
            return "Hello, " + reader.next_string();
        }

        void to_json(Stanza::JsonWriter& writer, const std::string& value) const override {
            constexpr std::string_view prefix = "Hello, ";
            std::string_view v{ value };
            if (v.starts_with(prefix)) v.remove_prefix(prefix.size());
            writer.value(v);
        }

        std::string to_string() const override { return "HelloAdapter"; }
    };

    inline Stanza::AdapterRegistry::Builder hello_builder() {
        Stanza::AdapterRegistry::Builder builder;
        builder.add<std::string>(std::make_shared<HelloAdapter>(), { Hello() });
        return builder;
    }

    // ------------------------------------------------------------
    // Records
    // ------------------------------------------------------------

    template<class C, class V>
    struct GenericClass {
        C collection;
        V value;

        bool operator==(const GenericClass&) const = default;
    };

    struct TestClass {
        std::string string;
        std::optional<std::string> nullableString;
        std::int32_t integer = 0;
        std::optional<std::int32_t> nullableInt;
        bool isBoolean = false;
        std::optional<bool> isNullableBoolean;
        std::int16_t aShort = 0;
        std::optional<std::int16_t> nullableShort;
        std::int8_t aByte = 0;
        std::optional<std::int8_t> nullableByte;
        char aChar = 0;
        std::optional<char> nullableChar;
        std::vector<std::string> list;
        std::vector<std::map<std::string, std::set<std::string>>> nestedList;
        std::string abstractProperty;
        std::string customName;
        std::string annotated;
        std::string anotherAnnotated;
        GenericClass<std::vector<std::string>, std::string> genericClass;

        bool operator==(const TestClass&) const = default;
    };

    struct CustomNames {
        std::string jsonProp1;
        std::string jsonProp2;

        bool operator==(const CustomNames&) const = default;
    };

    struct Simple {
        std::string prop;

        bool operator==(const Simple&) const = default;
    };

    struct NestedClasses {
        struct Inner {
            std::string prop;

            bool operator==(const Inner&) const = default;
        };

        Inner inner;

        bool operator==(const NestedClasses&) const = default;
    };

    template<class T>
    struct GenericClassWithQualifier {
        T value;

        bool operator==(const GenericClassWithQualifier&) const = default;
    };

    struct MultipleJsonQualifiers {
        std::string string;

        bool operator==(const MultipleJsonQualifiers&) const = default;
    };

    struct ContainsComplexlyQualifiedString {
        std::string foo;
    };

    struct WithDefaults {
        std::string name;
        std::int32_t retries = 0;
        std::optional<std::string> note;
        std::optional<std::string> label;
    };

    struct TreeNode {
        std::string name;
        std::vector<TreeNode> children;

        bool operator==(const TreeNode&) const = default;
    };

    struct Employee;

    struct Department {
        std::string title;
        std::vector<Employee> staff;
    };

    struct Employee {
        std::string name;
        std::optional<std::vector<Department>> manages;
    };

    struct DuplicateKeys {
        std::string a;
        std::string b;
    };

    struct Unconvertible {
        std::string name;
        std::vector<SomeEnum> values;
    };

} // namespace Model

template<class C, class V>
struct Stanza::JsonObject<Model::GenericClass<C, V>> {
    static constexpr std::string_view name = "GenericClass";
    static auto properties() {
        using T = Model::GenericClass<C, V>;
        return std::make_tuple(
            Stanza::property("collection", &T::collection).type_parameter(0),
            Stanza::property("value", &T::value).type_parameter(1));
    }
};

template<>
struct Stanza::JsonObject<Model::TestClass> {
    static constexpr std::string_view name = "TestClass";
    static auto properties() {
        using T = Model::TestClass;
        return std::make_tuple(
            Stanza::property("string", &T::string),
            Stanza::property("nullableString", &T::nullableString),
            Stanza::property("integer", &T::integer),
            Stanza::property("nullableInt", &T::nullableInt),
            Stanza::property("isBoolean", &T::isBoolean),
            Stanza::property("isNullableBoolean", &T::isNullableBoolean),
            Stanza::property("aShort", &T::aShort),
            Stanza::property("nullableShort", &T::nullableShort),
            Stanza::property("aByte", &T::aByte),
            Stanza::property("nullableByte", &T::nullableByte),
            Stanza::property("aChar", &T::aChar),
            Stanza::property("nullableChar", &T::nullableChar),
            Stanza::property("list", &T::list),
            Stanza::property("nestedList", &T::nestedList),
            Stanza::property("abstractProperty", &T::abstractProperty),
            Stanza::property("customName", &T::customName).json("other_name"),
            Stanza::property("annotated", &T::annotated).qualified(Model::Hello()),
            Stanza::property("anotherAnnotated", &T::anotherAnnotated).qualified(Model::Hello()),
            Stanza::property("genericClass", &T::genericClass));
    }
};

template<>
struct Stanza::JsonObject<Model::CustomNames> {
    static constexpr std::string_view name = "CustomNames";
    static auto properties() {
        using T = Model::CustomNames;
        return std::make_tuple(
            Stanza::property("jsonProp1", &T::jsonProp1),
            Stanza::property("jsonProp2", &T::jsonProp2));
    }
};

template<>
struct Stanza::JsonObject<Model::Simple> {
    static constexpr std::string_view name = "Simple";
    static auto properties() {
        return std::make_tuple(Stanza::property("prop", &Model::Simple::prop));
    }
};

template<>
struct Stanza::JsonObject<Model::NestedClasses> {
    static constexpr std::string_view name = "NestedClasses";
    static auto properties() {
        return std::make_tuple(Stanza::property("inner", &Model::NestedClasses::inner));
    }
};

template<>
struct Stanza::JsonObject<Model::NestedClasses::Inner> {
    static constexpr std::string_view name = "NestedClasses.Inner";
    static auto properties() {
        return std::make_tuple(Stanza::property("prop", &Model::NestedClasses::Inner::prop));
    }
};

template<class T>
struct Stanza::JsonObject<Model::GenericClassWithQualifier<T>> {
    static constexpr std::string_view name = "GenericClassWithQualifier";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("value", &Model::GenericClassWithQualifier<T>::value).qualified(Model::Hello()).type_parameter(0));
    }
};

template<>
struct Stanza::JsonObject<Model::MultipleJsonQualifiers> {
    static constexpr std::string_view name = "MultipleJsonQualifiers";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("string", &Model::MultipleJsonQualifiers::string)
                .qualified(Model::WrappedInObject())
                .qualified(Model::WrappedInArray()));
    }
};

template<>
struct Stanza::JsonObject<Model::ContainsComplexlyQualifiedString> {
    static constexpr std::string_view name = "ContainsComplexlyQualifiedString";
    static auto properties() {
        using Stanza::QualifierValue;
        return std::make_tuple(
            Stanza::property("foo", &Model::ContainsComplexlyQualifiedString::foo)
                .qualified(Model::WithStringElement({ { "string", "\\$Hello, " } }))
                .qualified(Model::WithNumberElement({ { "number", 4 } }))
                .qualified(Model::WithBooleanElement({ { "bool", true } }))
                .qualified(Model::WithClassElement({ { "cls", Stanza::TypeRef::of<Model::ContainsComplexlyQualifiedString>() } }))
                .qualified(Model::WithEnumElement({ { "someEnum", Stanza::EnumRef::of(Model::SomeEnum::VALUE5, "SomeEnum.VALUE5") } }))
                .qualified(Model::WithArrayElements({
                    { "stringArray", QualifierValue::Array{ "one", "", "three" } },
                    { "byteArray", QualifierValue::Bytes{ 5 } },
                    { "classArray", QualifierValue::Array{} },
                }))
                .qualified(Model::WithDefaultStringElement()));
    }
};

template<>
struct Stanza::JsonObject<Model::WithDefaults> {
    static constexpr std::string_view name = "WithDefaults";
    static auto properties() {
        using T = Model::WithDefaults;
        return std::make_tuple(
            Stanza::property("name", &T::name),
            Stanza::property("retries", &T::retries).defaults_to([] { return std::int32_t{ 3 }; }),
            Stanza::property("note", &T::note).defaults_to([] { return std::optional<std::string>{ "none" }; }),
            Stanza::property("label", &T::label));
    }
};

template<>
struct Stanza::JsonObject<Model::TreeNode> {
    static constexpr std::string_view name = "TreeNode";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("name", &Model::TreeNode::name),
            Stanza::property("children", &Model::TreeNode::children));
    }
};

template<>
struct Stanza::JsonObject<Model::Department> {
    static constexpr std::string_view name = "Department";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("title", &Model::Department::title),
            Stanza::property("staff", &Model::Department::staff));
    }
};

template<>
struct Stanza::JsonObject<Model::Employee> {
    static constexpr std::string_view name = "Employee";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("name", &Model::Employee::name),
            Stanza::property("manages", &Model::Employee::manages));
    }
};

template<>
struct Stanza::JsonObject<Model::DuplicateKeys> {
    static constexpr std::string_view name = "DuplicateKeys";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("a", &Model::DuplicateKeys::a).json("key"),
            Stanza::property("b", &Model::DuplicateKeys::b).json("key"));
    }
};

template<>
struct Stanza::JsonObject<Model::Unconvertible> {
    static constexpr std::string_view name = "Unconvertible";
    static auto properties() {
        return std::make_tuple(
            Stanza::property("name", &Model::Unconvertible::name),
            Stanza::property("values", &Model::Unconvertible::values));
    }
};
