#pragma once


/*
    ------------------------------------------------
    Stanza::QualifierCombinator - wrapping adapters
    ------------------------------------------------
    A combinator stands for a type usage carrying a specific set of
    qualifiers. It wraps the JSON of the unqualified type in a fixed shape,
    one value inside a single-element array inside a single-key object:

        std::string "Hello, world!"  <->  {"name":["Hello, world!"]}

    The combinator is produced by `QualifierCombinatorFactory<T>` for a
    descriptor of `T` whose qualifiers equal the factory's set exactly; a
    subset or superset is declined. The inner value uses whatever adapter the
    registry resolves for `T` without qualifiers.

        auto registry = Stanza::AdapterRegistry::Builder{}
            .add(std::make_shared<Stanza::QualifierCombinatorFactory<std::string>>(
                Stanza::QualifierSet{ Hello(), Wrapped() }, "name"))
            .build();

    On decode the object's key is not checked.
*/

#include <memory>
#include <string>
#include <utility>

#include "stanza/adapter.hpp"
#include "stanza/factory.hpp"
#include "stanza/qualifier.hpp"
#include "stanza/registry.hpp"
#include "stanza/type.hpp"

namespace Stanza {

    /// @ingroup StanzaAdapter
    /// @brief Reads and writes `{"<key>":[<inner>]}` around an inner adapter.
    template<class T>
    class QualifierCombinator final : public JsonAdapter<T> {
    public:
        QualifierCombinator(std::shared_ptr<const JsonAdapter<T>> inner, std::string key)
            : m_Inner{ std::move(inner) }, m_Key{ std::move(key) } {}

        T from_json(JsonReader& reader) const override {
            reader.begin_object();
            (void)reader.next_name();
            reader.begin_array();
            T out = m_Inner->from_json(reader);
            reader.end_array();
            reader.end_object();
            return out;
        }

        void to_json(JsonWriter& writer, const T& value) const override {
            writer.begin_object();
            writer.name(m_Key);
            writer.begin_array();
            m_Inner->to_json(writer, value);
            writer.end_array();
            writer.end_object();
        }

        [[nodiscard]] std::string to_string() const override { return "QualifierCombinator(" + m_Inner->to_string() + ")"; }

    private:
        std::shared_ptr<const JsonAdapter<T>> m_Inner;
        std::string m_Key;
    };

    /// @ingroup StanzaAdapter
    /// @brief Produces a `QualifierCombinator<T>` for exactly one qualifier set.
    template<class T>
    class QualifierCombinatorFactory final : public JsonAdapterFactory {
    public:
        QualifierCombinatorFactory(QualifierSet qualifiers, std::string key)
            : m_Type{ TypeDescriptor::of<T>(std::move(qualifiers)) }, m_Key{ std::move(key) } {}

        [[nodiscard]] std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) const override {
            if (!(type == m_Type)) return nullptr;
            auto inner = registry.adapter<T>(type.without_qualifiers());
            return std::make_shared<QualifierCombinator<T>>(std::move(inner), m_Key);
        }

    private:
        TypeDescriptor m_Type;
        std::string m_Key;
    };

} // namespace Stanza
