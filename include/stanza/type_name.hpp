#pragma once


/*
    ---------------------------------------------
    Stanza record declarations and printable names
    ---------------------------------------------
    A record type becomes convertible by specializing `Stanza::JsonObject<T>`.
    The specialization is what a code generator emits for a declared type: a
    printable name and the ordered list of its properties.

        template<>
        struct Stanza::JsonObject<Point> {
            static constexpr std::string_view name = "Point";
            static auto properties() {
                return std::make_tuple(
                    Stanza::property("x", &Point::x),
                    Stanza::property("y", &Point::y));
            }
        };

    `name` is the dot-separated nesting path of the declaration, e.g.
    `"NestedClasses.Inner"`; it appears in adapter diagnostics. See
    `object.hpp` for the property builder.

    `type_name<T>()` returns the name used for `T` in messages and logs.
    Types without a declared name use their demangled C++ name, e.g.
    `Model::SomeEnum`.
*/

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <typeinfo>

#include "stanza/config.hpp"

namespace Stanza {

    namespace detail {
        /// @brief Readable form of a `std::type_info::name()` string.
        [[nodiscard]] STANZA_API std::string demangle(const char* name);
    } // namespace detail

    /// @ingroup StanzaObject
    /// @brief Declaration of a record type. Specialize for each record.
    template<class T>
    struct JsonObject {};

    /// @ingroup StanzaObject
    /// @brief A type with a complete `JsonObject<T>` declaration.
    template<class T>
    concept JsonRecord = std::default_initializable<T> && requires {
        { JsonObject<T>::name } -> std::convertible_to<std::string_view>;
        JsonObject<T>::properties();
    };

    /// @brief Printable name of @p T for diagnostics.
    template<class T>
    std::string type_name() {
        if constexpr (requires { { JsonObject<T>::name } -> std::convertible_to<std::string_view>; })
            return std::string{ std::string_view{ JsonObject<T>::name } };
        else if constexpr (std::same_as<T, bool>) return "bool";
        else if constexpr (std::same_as<T, char>) return "char";
        else if constexpr (std::same_as<T, std::int8_t>) return "std::int8_t";
        else if constexpr (std::same_as<T, std::uint8_t>) return "std::uint8_t";
        else if constexpr (std::same_as<T, std::int16_t>) return "std::int16_t";
        else if constexpr (std::same_as<T, std::uint16_t>) return "std::uint16_t";
        else if constexpr (std::same_as<T, std::int32_t>) return "std::int32_t";
        else if constexpr (std::same_as<T, std::uint32_t>) return "std::uint32_t";
        else if constexpr (std::same_as<T, std::int64_t>) return "std::int64_t";
        else if constexpr (std::same_as<T, std::uint64_t>) return "std::uint64_t";
        else if constexpr (std::same_as<T, float>) return "float";
        else if constexpr (std::same_as<T, double>) return "double";
        else if constexpr (std::same_as<T, std::string>) return "std::string";
        else return detail::demangle(typeid(T).name());
    }

} // namespace Stanza
