#pragma once


/*
    ---------------------------------------------
    Stanza::TypeDescriptor - fully qualified types
    ---------------------------------------------
    A `TypeDescriptor` names one usage of a type:

        - the raw type (`RawType`: a `std::type_index` and a printable name)
        - the ordered generic arguments, each itself a `TypeDescriptor`
        - the unordered set of qualifiers attached to the usage

    Descriptors are value objects. Two descriptors are equal iff the raw
    types are the same, the arguments are pairwise equal, and the qualifier
    sets are equal as sets. They are the keys of the adapter cache.

    ----------------
    Generic raw types
    ----------------
    For a class template instantiation the raw type is the template itself,
    identified by `TemplateTag<Template>`, and the template's type arguments
    become the descriptor's arguments:

        TypeDescriptor::of<std::vector<std::string>>()
            raw       = TemplateTag<std::vector>   ("std::vector")
            arguments = [ std::string ]

    Allocators and comparators of standard containers are not arguments.
    `TypeOf<T>` performs the mapping and can be specialized for other
    templates.
*/

#include <cstddef>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <typeindex>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/qualifier.hpp"
#include "stanza/type_name.hpp"

/// @defgroup StanzaType Type Descriptors
/// @ingroup Stanza
/// @brief Raw types, generic arguments and qualifiers as a value

namespace Stanza {

    /// @ingroup StanzaType
    /// @brief The identity of a raw (unparameterized) type.
    struct RawType {
        std::type_index id;
        std::string name;

        bool operator==(const RawType& other) const noexcept { return id == other.id; }
    };

    /// @ingroup StanzaType
    /// @brief Stands for a class template as a raw type.
    template<template<class...> class Tmpl>
    struct TemplateTag {};

    template<class T>
    struct TypeOf;

    /// @ingroup StanzaType
    /// @brief A raw type with its generic arguments and qualifiers.
    class TypeDescriptor {
    public:
        STANZA_API TypeDescriptor(RawType raw, std::vector<TypeDescriptor> arguments = {}, QualifierSet qualifiers = {});

        /// @brief The descriptor of @p T, carrying @p qualifiers.
        template<class T>
        static TypeDescriptor of(QualifierSet qualifiers = {}) {
            return TypeOf<T>::get().with_qualifiers(std::move(qualifiers));
        }

        [[nodiscard]] const RawType& raw() const noexcept { return m_Raw; }
        [[nodiscard]] const std::vector<TypeDescriptor>& arguments() const noexcept { return m_Arguments; }
        [[nodiscard]] const QualifierSet& qualifiers() const noexcept { return m_Qualifiers; }
        [[nodiscard]] bool is_qualified() const noexcept { return !m_Qualifiers.empty(); }

        /// @brief A copy of this descriptor carrying @p qualifiers instead of its own.
        [[nodiscard]] STANZA_API TypeDescriptor with_qualifiers(QualifierSet qualifiers) const;
        [[nodiscard]] TypeDescriptor without_qualifiers() const { return with_qualifiers({}); }

        STANZA_API bool operator==(const TypeDescriptor& other) const;

        [[nodiscard]] std::size_t hash() const noexcept { return m_Hash; }

        /// @brief `std::map<std::string, std::int32_t>`; qualifiers are not included.
        [[nodiscard]] STANZA_API std::string to_string() const;

    private:
        RawType m_Raw;
        std::vector<TypeDescriptor> m_Arguments;
        QualifierSet m_Qualifiers;
        std::size_t m_Hash;
    };

    /// @ingroup StanzaType
    /// @brief Maps a C++ type to its descriptor.
    template<class T>
    struct TypeOf {
        static TypeDescriptor get() { return TypeDescriptor{ RawType{ typeid(T), type_name<T>() } }; }
    };

    template<template<class...> class Tmpl, class... Args>
    TypeDescriptor generic_descriptor(std::string name) {
        return TypeDescriptor{ RawType{ typeid(TemplateTag<Tmpl>), std::move(name) }, { TypeOf<Args>::get()... } };
    }

    template<class E>
    struct TypeOf<std::vector<E>> {
        static TypeDescriptor get() { return generic_descriptor<std::vector, E>("std::vector"); }
    };

    template<class E>
    struct TypeOf<std::list<E>> {
        static TypeDescriptor get() { return generic_descriptor<std::list, E>("std::list"); }
    };

    template<class E>
    struct TypeOf<std::set<E>> {
        static TypeDescriptor get() { return generic_descriptor<std::set, E>("std::set"); }
    };

    template<class K, class V>
    struct TypeOf<std::map<K, V>> {
        static TypeDescriptor get() { return generic_descriptor<std::map, K, V>("std::map"); }
    };

    template<class E>
    struct TypeOf<std::optional<E>> {
        static TypeDescriptor get() { return generic_descriptor<std::optional, E>("std::optional"); }
    };

    /// @ingroup StanzaType
    /// @brief Other class templates over types, e.g. generic records.
    ///
    /// @details
    /// The raw name is `type_name<T>()` up to the first `<`, so a record
    /// template declaring `name = "GenericClass"` prints as
    /// `GenericClass<std::string, std::int32_t>`.
    template<template<class...> class Tmpl, class... Args>
    struct TypeOf<Tmpl<Args...>> {
        static TypeDescriptor get() {
            std::string name = type_name<Tmpl<Args...>>();
            return generic_descriptor<Tmpl, Args...>(name.substr(0, name.find('<')));
        }
    };

    template<>
    struct TypeOf<std::string> {
        static TypeDescriptor get() { return TypeDescriptor{ RawType{ typeid(std::string), "std::string" } }; }
    };

} // namespace Stanza

template<>
struct std::hash<Stanza::TypeDescriptor> {
    std::size_t operator()(const Stanza::TypeDescriptor& t) const noexcept { return t.hash(); }
};
