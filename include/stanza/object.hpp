#pragma once


/*
    ---------------------------------------
    Stanza record adapters - JsonObject<T>
    ---------------------------------------
    A record is a default-constructible struct whose members are listed in a
    `JsonObject<T>` specialization. Each member is described by a
    `Property`, built with `property(name, &T::member)` and refined with:

        .json("key")           JSON key, when it differs from the member name
        .qualified(marker)     qualifier of the member's type usage
        .defaults_to(fn)       value used when the key is absent
        .type_parameter(i)     the member's type is the i-th type argument of
                               the record instantiation (generic records)

    Example:

        struct Person {
            std::string name;
            std::optional<std::int32_t> age;
            std::vector<std::string> tags;
        };

        template<>
        struct Stanza::JsonObject<Person> {
            static constexpr std::string_view name = "Person";
            static auto properties() {
                return std::make_tuple(
                    Stanza::property("name", &Person::name).json("full_name"),
                    Stanza::property("age", &Person::age),
                    Stanza::property("tags", &Person::tags).defaults_to([] { return std::vector<std::string>{}; }));
            }
        };

    ------------
    Conversions
    ------------
    - Decoding accepts keys in any order, skips unknown keys whatever their
      shape, and lets a repeated key overwrite the earlier value
    - A property is required when its type is not `std::optional` and it has
      no default; every required property missing from the input is reported
      at once through `MissingPropertiesError`, in declaration order
    - Absent optional properties take their default, or `std::nullopt`
    - Encoding writes every property, in declaration order
*/

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/adapter.hpp"
#include "stanza/error.hpp"
#include "stanza/factory.hpp"
#include "stanza/logging.hpp"
#include "stanza/qualifier.hpp"
#include "stanza/registry.hpp"
#include "stanza/type.hpp"
#include "stanza/type_name.hpp"

/// @defgroup StanzaObject Record Adapters
/// @ingroup Stanza
/// @brief Declared records and their generated adapters

namespace Stanza {

    namespace detail {
        template<class T>
        struct is_optional : std::false_type {};

        template<class T>
        struct is_optional<std::optional<T>> : std::true_type {};
    } // namespace detail

    /// @ingroup StanzaObject
    /// @brief One declared member of a record.
    template<class Owner, class M>
    class Property {
    public:
        using owner_type = Owner;
        using member_type = M;

        Property(std::string_view name, M Owner::* member)
            : m_Name{ name }, m_Key{ name }, m_Member{ member } {}

        /// @brief Uses @p key in JSON instead of the member name.
        Property json(std::string_view key) && {
            m_Key = key;
            return std::move(*this);
        }

        /// @brief Adds @p marker to the qualifiers of the member's type.
        Property qualified(QualifierMarker marker) && {
            m_Qualifiers.insert(std::move(marker));
            return std::move(*this);
        }

        /// @brief Supplies the value of the member when its key is absent.
        Property defaults_to(std::function<M()> supplier) && {
            m_Default = std::move(supplier);
            return std::move(*this);
        }

        /// @brief Binds the member's type to type argument @p index of the record.
        Property type_parameter(std::size_t index) && {
            m_TypeParameter = index;
            return std::move(*this);
        }

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }
        [[nodiscard]] const std::string& key() const noexcept { return m_Key; }
        [[nodiscard]] M Owner::* member() const noexcept { return m_Member; }
        [[nodiscard]] const QualifierSet& qualifiers() const noexcept { return m_Qualifiers; }

        [[nodiscard]] bool has_default() const noexcept { return static_cast<bool>(m_Default); }
        [[nodiscard]] M make_default() const { return m_Default(); }

        /// @brief True when decoding fails without this member's key.
        [[nodiscard]] bool required() const noexcept { return !detail::is_optional<M>::value && !m_Default; }

        /// @brief The descriptor of the member's type inside the record usage @p owner.
        [[nodiscard]] TypeDescriptor element_type(const TypeDescriptor& owner) const {
            if (!m_TypeParameter) return TypeDescriptor::of<M>(m_Qualifiers);

            if (*m_TypeParameter >= owner.arguments().size()) {
                throw std::invalid_argument{ m_Name + " is bound to type argument " + std::to_string(*m_TypeParameter) + " of " + owner.to_string() };
            }
            const TypeDescriptor& argument = owner.arguments()[*m_TypeParameter];
            QualifierSet qualifiers = argument.qualifiers();
            qualifiers.insert(m_Qualifiers.begin(), m_Qualifiers.end());
            if constexpr (detail::is_optional<M>::value) {
                // std::optional<T>: the argument is the optional's element.
                return TypeDescriptor{ TypeOf<M>::get().raw(), { argument.without_qualifiers() }, std::move(qualifiers) };
            } else {
                return argument.with_qualifiers(std::move(qualifiers));
            }
        }

    private:
        std::string m_Name;
        std::string m_Key;
        M Owner::* m_Member;
        QualifierSet m_Qualifiers{};
        std::function<M()> m_Default{};
        std::optional<std::size_t> m_TypeParameter{};
    };

    /// @ingroup StanzaObject
    /// @brief Describes member @p member of a record, named @p name.
    template<class Owner, class M>
    Property<Owner, M> property(std::string_view name, M Owner::* member) {
        return Property<Owner, M>{ name, member };
    }

    /// @ingroup StanzaObject
    /// @brief The adapter of a `JsonObject` record.
    ///
    /// @details
    /// Property adapters are resolved from the registry when the adapter is
    /// constructed. Construction throws `std::invalid_argument` if two
    /// properties share a JSON key.
    template<JsonRecord T>
    class ObjectAdapter final : public JsonAdapter<T> {
        using properties_type = decltype(JsonObject<T>::properties());
        static constexpr std::size_t count = std::tuple_size_v<properties_type>;

        template<std::size_t I>
        using member_t = typename std::tuple_element_t<I, properties_type>::member_type;

        template<class Seq>
        struct layout;

        template<std::size_t... I>
        struct layout<std::index_sequence<I...>> {
            using adapters = std::tuple<std::shared_ptr<const JsonAdapter<member_t<I>>>...>;
            using slots = std::tuple<std::optional<member_t<I>>...>;
        };

        using indices = std::make_index_sequence<count>;
        using adapters_type = typename layout<indices>::adapters;
        using slots_type = typename layout<indices>::slots;

    public:
        ObjectAdapter(TypeDescriptor type, const AdapterRegistry& registry)
            : m_Type{ std::move(type) }, m_Properties{ JsonObject<T>::properties() },
              m_Adapters{ resolve(registry, indices{}) } {
            index_keys(indices{});
            get_logger()->trace("Constructed {} for {}", to_string(), m_Type.to_string());
        }

        T from_json(JsonReader& reader) const override {
            slots_type slots;
            reader.begin_object();
            while (reader.has_next()) {
                std::string key = reader.next_name();
                auto it = m_Index.find(key);
                if (it == m_Index.end()) {
                    reader.skip_value();
                    continue;
                }
                read_slot(it->second, reader, slots, indices{});
            }
            reader.end_object();

            std::vector<std::string> missing = missing_properties(slots, indices{});
            if (!missing.empty()) {
                get_logger()->debug("{} is missing {} required properties", to_string(), missing.size());
                throw MissingPropertiesError{ std::move(missing) };
            }
            return build(slots, indices{});
        }

        void to_json(JsonWriter& writer, const T& value) const override {
            writer.begin_object();
            write_properties(writer, value, indices{});
            writer.end_object();
        }

        [[nodiscard]] std::string to_string() const override {
            return "GeneratedJsonAdapter(" + std::string{ std::string_view{ JsonObject<T>::name } } + ")";
        }

    private:
        template<std::size_t... I>
        adapters_type resolve(const AdapterRegistry& registry, std::index_sequence<I...>) const {
            return adapters_type{ registry.adapter<member_t<I>>(std::get<I>(m_Properties).element_type(m_Type))... };
        }

        template<std::size_t... I>
        void index_keys(std::index_sequence<I...>) {
            (index_key(std::get<I>(m_Properties).key(), I), ...);
        }

        void index_key(const std::string& key, std::size_t index) {
            if (!m_Index.emplace(key, index).second) throw std::invalid_argument{ to_string() + " declares the JSON key " + key + " twice" };
        }

        template<std::size_t... I>
        void read_slot(std::size_t index, JsonReader& reader, slots_type& slots, std::index_sequence<I...>) const {
            ((index == I ? (std::get<I>(slots).emplace(std::get<I>(m_Adapters)->from_json(reader)), true) : false) || ...);
        }

        template<std::size_t... I>
        std::vector<std::string> missing_properties(const slots_type& slots, std::index_sequence<I...>) const {
            std::vector<std::string> out;
            ((std::get<I>(m_Properties).required() && !std::get<I>(slots) ? out.push_back(std::get<I>(m_Properties).name()) : void()), ...);
            return out;
        }

        template<std::size_t... I>
        T build(slots_type& slots, std::index_sequence<I...>) const {
            T out{};
            (assign(out, std::get<I>(m_Properties), std::get<I>(slots)), ...);
            return out;
        }

        template<class M>
        static void assign(T& out, const Property<T, M>& prop, std::optional<M>& slot) {
            if (slot) out.*prop.member() = std::move(*slot);
            else if (prop.has_default()) out.*prop.member() = prop.make_default();
            else out.*prop.member() = M{};
        }

        template<std::size_t... I>
        void write_properties(JsonWriter& writer, const T& value, std::index_sequence<I...>) const {
            ((writer.name(std::get<I>(m_Properties).key()), std::get<I>(m_Adapters)->to_json(writer, value.*std::get<I>(m_Properties).member())), ...);
        }

        TypeDescriptor m_Type;
        properties_type m_Properties;
        adapters_type m_Adapters;
        std::unordered_map<std::string, std::size_t> m_Index;
    };

    template<JsonRecord T>
    struct AdapterTraits<T> {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) {
            if (type.is_qualified()) return nullptr;
            return std::make_shared<ObjectAdapter<T>>(type, registry);
        }
    };

} // namespace Stanza
