#pragma once


/*
    ------------------------
    Stanza standard adapters
    ------------------------
    Built-in adapters for the vocabulary types, reached through
    `AdapterTraits<T>` once every registered factory has declined:

        C++ type                      JSON
        ----------------------------  ------------------------------------
        bool                          true / false
        char                          one-character string
        std::int8_t                   number in -128..255 (written 0..255)
        other integers                number, range-checked
        float, double                 number
        std::string                   string
        std::vector<E>, std::list<E>  array
        std::set<E>                   array (sorted)
        std::map<std::string, V>      object
        std::optional<E>              null, or the JSON of E

    `std::int8_t` behaves as a byte: `255` reads as `-1` and `-1` writes as
    `255`.

    All of them decline a qualified descriptor, except `std::optional<E>`,
    which resolves `E` with the optional's qualifiers. Element adapters of
    containers are resolved through the registry, so a
    `std::vector<Person>` reuses the cached `Person` adapter.
*/

#include <concepts>
#include <cstdint>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "stanza/adapter.hpp"
#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/factory.hpp"
#include "stanza/registry.hpp"
#include "stanza/type.hpp"

/// @defgroup StanzaStandard Standard Adapters
/// @ingroup Stanza
/// @brief Adapters for scalars, strings and standard containers

namespace Stanza {

#pragma region Scalars

    /// @ingroup StanzaStandard
    class STANZA_API BooleanAdapter final : public JsonAdapter<bool> {
    public:
        bool from_json(JsonReader& reader) const override;
        void to_json(JsonWriter& writer, const bool& value) const override;
        [[nodiscard]] std::string to_string() const override;
    };

    /// @ingroup StanzaStandard
    /// @brief A `char` as a one-character string.
    class STANZA_API CharAdapter final : public JsonAdapter<char> {
    public:
        char from_json(JsonReader& reader) const override;
        void to_json(JsonWriter& writer, const char& value) const override;
        [[nodiscard]] std::string to_string() const override;
    };

    /// @ingroup StanzaStandard
    class STANZA_API StringAdapter final : public JsonAdapter<std::string> {
    public:
        std::string from_json(JsonReader& reader) const override;
        void to_json(JsonWriter& writer, const std::string& value) const override;
        [[nodiscard]] std::string to_string() const override;
    };

    /// @ingroup StanzaStandard
    class STANZA_API DoubleAdapter final : public JsonAdapter<double> {
    public:
        double from_json(JsonReader& reader) const override;
        void to_json(JsonWriter& writer, const double& value) const override;
        [[nodiscard]] std::string to_string() const override;
    };

    /// @ingroup StanzaStandard
    class STANZA_API FloatAdapter final : public JsonAdapter<float> {
    public:
        float from_json(JsonReader& reader) const override;
        void to_json(JsonWriter& writer, const float& value) const override;
        [[nodiscard]] std::string to_string() const override;
    };

    namespace detail {
        template<class I>
        constexpr const char* integer_label() {
            if constexpr (std::same_as<I, std::int8_t>) return "a byte";
            else if constexpr (std::same_as<I, std::int16_t>) return "a short";
            else if constexpr (std::same_as<I, std::int32_t>) return "an int";
            else if constexpr (std::same_as<I, std::int64_t>) return "a long";
            else if constexpr (std::is_unsigned_v<I>) return "an unsigned integer";
            else return "an integer";
        }

        /// @brief Reads an unsigned 64-bit value, which may exceed `std::int64_t`.
        STANZA_API std::uint64_t next_unsigned(JsonReader& reader);
    } // namespace detail

    /// @ingroup StanzaStandard
    /// @brief Any integer type other than `bool` and `char`.
    template<std::integral I>
    class IntegerAdapter final : public JsonAdapter<I> {
    public:
        I from_json(JsonReader& reader) const override {
            if constexpr (std::same_as<I, std::uint64_t> || std::same_as<I, unsigned long long>) {
                return static_cast<I>(detail::next_unsigned(reader));
            } else {
                constexpr std::int64_t lo = std::numeric_limits<I>::min();
                constexpr std::int64_t hi = std::same_as<I, std::int8_t> ? 255 : static_cast<std::int64_t>(std::numeric_limits<I>::max());
                std::string path = reader.path();
                std::int64_t v = reader.next_long();
                if (v < lo || v > hi) throw JsonDataError{ std::string{ "Expected " } + detail::integer_label<I>() + " but was " + std::to_string(v), path };
                return static_cast<I>(v);
            }
        }

        void to_json(JsonWriter& writer, const I& value) const override {
            if constexpr (std::same_as<I, std::int8_t>) writer.value(static_cast<std::uint8_t>(value));
            else writer.value(value);
        }

        [[nodiscard]] std::string to_string() const override { return "JsonAdapter(" + type_name<I>() + ")"; }
    };

#pragma endregion
#pragma region Containers

    /// @ingroup StanzaStandard
    /// @brief `std::vector`, `std::list` and `std::set` as JSON arrays.
    template<class C>
    class CollectionAdapter final : public JsonAdapter<C> {
    public:
        using element_type = typename C::value_type;

        CollectionAdapter(TypeDescriptor type, std::shared_ptr<const JsonAdapter<element_type>> element)
            : m_Type{ std::move(type) }, m_Element{ std::move(element) } {}

        C from_json(JsonReader& reader) const override {
            C out;
            reader.begin_array();
            while (reader.has_next()) {
                if constexpr (requires(C& c) { c.push_back(std::declval<element_type>()); }) out.push_back(m_Element->from_json(reader));
                else out.insert(m_Element->from_json(reader));
            }
            reader.end_array();
            return out;
        }

        void to_json(JsonWriter& writer, const C& value) const override {
            writer.begin_array();
            for (const element_type& e : value) m_Element->to_json(writer, e);
            writer.end_array();
        }

        [[nodiscard]] std::string to_string() const override { return "JsonAdapter(" + m_Type.to_string() + ")"; }

    private:
        TypeDescriptor m_Type;
        std::shared_ptr<const JsonAdapter<element_type>> m_Element;
    };

    /// @ingroup StanzaStandard
    /// @brief `std::map<std::string, V>` as a JSON object.
    template<class V>
    class MapAdapter final : public JsonAdapter<std::map<std::string, V>> {
    public:
        using map_type = std::map<std::string, V>;

        MapAdapter(TypeDescriptor type, std::shared_ptr<const JsonAdapter<V>> value)
            : m_Type{ std::move(type) }, m_Value{ std::move(value) } {}

        map_type from_json(JsonReader& reader) const override {
            map_type out;
            reader.begin_object();
            while (reader.has_next()) {
                std::string key = reader.next_name();
                out.insert_or_assign(std::move(key), m_Value->from_json(reader));
            }
            reader.end_object();
            return out;
        }

        void to_json(JsonWriter& writer, const map_type& value) const override {
            writer.begin_object();
            for (const auto& [k, v] : value) {
                writer.name(k);
                m_Value->to_json(writer, v);
            }
            writer.end_object();
        }

        [[nodiscard]] std::string to_string() const override { return "JsonAdapter(" + m_Type.to_string() + ")"; }

    private:
        TypeDescriptor m_Type;
        std::shared_ptr<const JsonAdapter<V>> m_Value;
    };

    /// @ingroup StanzaStandard
    /// @brief `std::optional<E>`: JSON null is `std::nullopt`.
    template<class E>
    class OptionalAdapter final : public JsonAdapter<std::optional<E>> {
    public:
        OptionalAdapter(TypeDescriptor type, std::shared_ptr<const JsonAdapter<E>> inner)
            : m_Type{ std::move(type) }, m_Inner{ std::move(inner) } {}

        std::optional<E> from_json(JsonReader& reader) const override {
            if (reader.peek() == token::null) {
                reader.next_null();
                return std::nullopt;
            }
            return m_Inner->from_json(reader);
        }

        void to_json(JsonWriter& writer, const std::optional<E>& value) const override {
            if (!value) writer.null_value();
            else m_Inner->to_json(writer, *value);
        }

        [[nodiscard]] std::string to_string() const override { return "JsonAdapter(" + m_Type.to_string() + ")"; }

    private:
        TypeDescriptor m_Type;
        std::shared_ptr<const JsonAdapter<E>> m_Inner;
    };

#pragma endregion
#pragma region Traits

    namespace detail {
        template<class A>
        std::shared_ptr<const JsonAdapterBase> unqualified(const TypeDescriptor& type) {
            if (type.is_qualified()) return nullptr;
            return std::make_shared<A>();
        }

        template<class C>
        std::shared_ptr<const JsonAdapterBase> make_collection(const TypeDescriptor& type, const AdapterRegistry& registry) {
            if (type.is_qualified() || type.arguments().size() != 1) return nullptr;
            auto element = registry.adapter<typename C::value_type>(type.arguments()[0]);
            return std::make_shared<CollectionAdapter<C>>(type, std::move(element));
        }
    } // namespace detail

    template<>
    struct AdapterTraits<bool> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) { return detail::unqualified<BooleanAdapter>(type); }
    };

    template<>
    struct AdapterTraits<char> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) { return detail::unqualified<CharAdapter>(type); }
    };

    template<>
    struct AdapterTraits<std::string> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) { return detail::unqualified<StringAdapter>(type); }
    };

    template<>
    struct AdapterTraits<double> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) { return detail::unqualified<DoubleAdapter>(type); }
    };

    template<>
    struct AdapterTraits<float> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) { return detail::unqualified<FloatAdapter>(type); }
    };

    template<std::integral I>
        requires (!std::same_as<I, bool> && !std::same_as<I, char>)
    struct AdapterTraits<I> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) { return detail::unqualified<IntegerAdapter<I>>(type); }
    };

    template<class E>
    struct AdapterTraits<std::vector<E>> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) { return detail::make_collection<std::vector<E>>(type, registry); }
    };

    template<class E>
    struct AdapterTraits<std::list<E>> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) { return detail::make_collection<std::list<E>>(type, registry); }
    };

    template<class E>
    struct AdapterTraits<std::set<E>> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) { return detail::make_collection<std::set<E>>(type, registry); }
    };

    template<class V>
    struct AdapterTraits<std::map<std::string, V>> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) {
            if (type.is_qualified() || type.arguments().size() != 2) return nullptr;
            auto value = registry.adapter<V>(type.arguments()[1]);
            return std::make_shared<MapAdapter<V>>(type, std::move(value));
        }
    };

    template<class E>
    struct AdapterTraits<std::optional<E>> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) {
            if (type.arguments().size() != 1) return nullptr;
            auto inner = registry.adapter<E>(type.arguments()[0].with_qualifiers(type.qualifiers()));
            return std::make_shared<OptionalAdapter<E>>(type, std::move(inner));
        }
    };

#pragma endregion

} // namespace Stanza
