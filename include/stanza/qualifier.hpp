#pragma once


/*
    ------------------------------------------
    Stanza qualifiers - value-based type tags
    ------------------------------------------
    A qualifier is a named tag attached to a type usage. Two usages of the
    same C++ type with different qualifiers resolve to different adapters:
    a `std::string` tagged `@Hello` can be converted differently from a plain
    `std::string`.

    -----------------------
    Stanza::QualifierMarker
    -----------------------
    One tag instance: a name plus an ordered list of named element values.
    Element values (`QualifierValue`) are one of:
        - string, integer (`std::int64_t`, wider unsigned values are
          rejected), floating (`double`), boolean
        - `TypeRef`: a reference to a C++ type, compared by `std::type_index`
        - `EnumRef`: an enumerator, compared by enum type and ordinal
        - bytes (`std::vector<std::uint8_t>`)
        - array of any of the above

    Markers compare and hash by value. Floating elements compare by bit
    pattern, so `NaN == NaN` and `0.0 != -0.0`. An integer element never
    equals a floating element.

    ----------------------------
    Stanza::QualifierDeclaration
    ----------------------------
    Declares a tag's elements with their kinds and optional defaults. Markers
    made through a declaration list every element in declaration order, so a
    marker relying on a default equals one stating it:

        const Stanza::QualifierDeclaration Wrapped{ "Wrapped", {
            { "key", Stanza::element_kind::string, "name" },
            { "depth", Stanza::element_kind::integer, 1 },
        } };

        Wrapped() == Wrapped({ { "key", "name" } });   // true

    `Stanza::QualifierSet` is the unordered set of markers carried by a
    `TypeDescriptor`.
*/

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_set>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/type_name.hpp"

/// @defgroup StanzaQualifier Qualifiers
/// @ingroup Stanza
/// @brief Value-based tags that disambiguate type usages

namespace Stanza {

    namespace detail {
        inline void hash_combine(std::size_t& seed, std::size_t h) noexcept {
            seed ^= h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
        }
    } // namespace detail

    /// @ingroup StanzaQualifier
    /// @brief A reference to a C++ type held by a qualifier element.
    struct TypeRef {
        std::type_index id;
        std::string name;

        template<class T>
        static TypeRef of() { return TypeRef{ std::type_index{ typeid(T) }, type_name<T>() }; }

        bool operator==(const TypeRef& other) const noexcept { return id == other.id; }
    };

    /// @ingroup StanzaQualifier
    /// @brief A reference to an enumerator held by a qualifier element.
    struct EnumRef {
        std::type_index type;
        std::int64_t ordinal;
        std::string name; ///< Printable name, e.g. `"SomeEnum.VALUE3"`.

        template<class E>
            requires std::is_enum_v<E>
        static EnumRef of(E e, std::string name) {
            return EnumRef{ std::type_index{ typeid(E) }, static_cast<std::int64_t>(e), std::move(name) };
        }

        bool operator==(const EnumRef& other) const noexcept { return type == other.type && ordinal == other.ordinal; }
    };

    /// @ingroup StanzaQualifier
    /// @brief The kinds of values a qualifier element can hold.
    enum class element_kind : uint8_t {
        string,
        integer,
        floating,
        boolean,
        type,
        enumeration,
        bytes,
        array,
    };

    /// @ingroup StanzaQualifier
    /// @brief The value of one qualifier element.
    class QualifierValue {
    public:
        using Bytes = std::vector<std::uint8_t>;
        using Array = std::vector<QualifierValue>;
        using storage_t = std::variant<
            std::string,
            std::int64_t,
            double,
            bool,
            TypeRef,
            EnumRef,
            Bytes,
            Array
        >;

        QualifierValue(std::string s) : m_Storage{ std::move(s) } {}
        QualifierValue(std::string_view s) : m_Storage{ std::string{ s } } {}
        QualifierValue(const char* s) : m_Storage{ std::string{ s } } {}
        QualifierValue(bool b) : m_Storage{ b } {}
        QualifierValue(double d) : m_Storage{ d } {}
        QualifierValue(TypeRef t) : m_Storage{ std::move(t) } {}
        QualifierValue(EnumRef e) : m_Storage{ std::move(e) } {}
        QualifierValue(Bytes b) : m_Storage{ std::move(b) } {}
        QualifierValue(Array a) : m_Storage{ std::move(a) } {}

        /// @throws std::out_of_range if @p i does not fit `std::int64_t`.
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        QualifierValue(I i) : m_Storage{ checked_integer(i) } {}

        [[nodiscard]] STANZA_API element_kind kind() const noexcept;

        [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_Storage); }
        [[nodiscard]] std::int64_t as_integer() const { return std::get<std::int64_t>(m_Storage); }
        [[nodiscard]] double as_double() const { return std::get<double>(m_Storage); }
        [[nodiscard]] bool as_bool() const { return std::get<bool>(m_Storage); }
        [[nodiscard]] const TypeRef& as_type() const { return std::get<TypeRef>(m_Storage); }
        [[nodiscard]] const EnumRef& as_enum() const { return std::get<EnumRef>(m_Storage); }
        [[nodiscard]] const Bytes& as_bytes() const { return std::get<Bytes>(m_Storage); }
        [[nodiscard]] const Array& as_array() const { return std::get<Array>(m_Storage); }

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        STANZA_API bool operator==(const QualifierValue& other) const noexcept;

        [[nodiscard]] STANZA_API std::size_t hash() const noexcept;

        /// @brief Source-like rendering: `"text"`, `42`, `{1, 2}`, `SomeEnum.VALUE3`.
        [[nodiscard]] STANZA_API std::string to_string() const;

    private:
        template<std::integral I>
        static std::int64_t checked_integer(I i) {
            if constexpr (std::unsigned_integral<I> && sizeof(I) >= sizeof(std::int64_t)) {
                if (i > static_cast<I>(std::numeric_limits<std::int64_t>::max()))
                    throw std::out_of_range{ "Qualifier integer " + std::to_string(i) + " exceeds the std::int64_t range" };
            }
            return static_cast<std::int64_t>(i);
        }

        storage_t m_Storage;
    };

    /// @ingroup StanzaQualifier
    /// @brief A named element of a marker.
    struct QualifierElement {
        std::string name;
        QualifierValue value;

        bool operator==(const QualifierElement&) const = default;
    };

    /// @ingroup StanzaQualifier
    /// @brief One qualifier tag instance.
    ///
    /// @details
    /// Elements are kept in the order given; markers made by a
    /// `QualifierDeclaration` list them in declaration order with defaults
    /// resolved. Equality requires the same name and pairwise equal elements.
    class QualifierMarker {
    public:
        STANZA_API explicit QualifierMarker(std::string name, std::vector<QualifierElement> elements = {});

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }
        [[nodiscard]] const std::vector<QualifierElement>& elements() const noexcept { return m_Elements; }

        /// @brief The value of element @p name.
        /// @throws std::out_of_range if the marker has no such element.
        [[nodiscard]] STANZA_API const QualifierValue& at(std::string_view name) const;

        STANZA_API bool operator==(const QualifierMarker& other) const noexcept;

        [[nodiscard]] std::size_t hash() const noexcept { return m_Hash; }

        /// @brief `@Name` or `@Name(a=1, b="x")`.
        [[nodiscard]] STANZA_API std::string to_string() const;

    private:
        std::string m_Name;
        std::vector<QualifierElement> m_Elements;
        std::size_t m_Hash;
    };

} // namespace Stanza

template<>
struct std::hash<Stanza::QualifierMarker> {
    std::size_t operator()(const Stanza::QualifierMarker& m) const noexcept { return m.hash(); }
};

namespace Stanza {

    /// @ingroup StanzaQualifier
    /// @brief The unordered set of qualifiers of a type usage.
    using QualifierSet = std::unordered_set<QualifierMarker>;

    /// @ingroup StanzaQualifier
    /// @brief Order-independent hash of a qualifier set.
    [[nodiscard]] STANZA_API std::size_t hash_value(const QualifierSet& set) noexcept;

    /// @ingroup StanzaQualifier
    /// @brief Printable markers of @p set, sorted for stable output.
    [[nodiscard]] STANZA_API std::vector<std::string> describe(const QualifierSet& set);

    /// @ingroup StanzaQualifier
    /// @brief Declared element of a qualifier tag.
    struct ElementSpec {
        std::string name;
        element_kind kind;
        std::optional<QualifierValue> default_value{};
    };

    /// @ingroup StanzaQualifier
    /// @brief Declaration of a qualifier tag: its name and elements.
    class QualifierDeclaration {
    public:
        /// @throws std::invalid_argument if a default does not match its element kind,
        ///         or an element is declared twice.
        STANZA_API explicit QualifierDeclaration(std::string name, std::vector<ElementSpec> elements = {});

        /// @brief Makes a marker from the given element values, filling in defaults.
        ///
        /// @throws std::invalid_argument for an unknown or duplicated element, a
        ///         value of the wrong kind, or a missing element without default.
        [[nodiscard]] STANZA_API QualifierMarker make(std::vector<QualifierElement> values = {}) const;

        [[nodiscard]] QualifierMarker operator()(std::vector<QualifierElement> values = {}) const { return make(std::move(values)); }

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }
        [[nodiscard]] const std::vector<ElementSpec>& elements() const noexcept { return m_Elements; }

    private:
        std::string m_Name;
        std::vector<ElementSpec> m_Elements;
    };

} // namespace Stanza
