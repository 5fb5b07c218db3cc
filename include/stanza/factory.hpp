#pragma once


/*
    ----------------------------------------------
    Stanza::JsonAdapterFactory - adapter producers
    ----------------------------------------------
    A factory is asked for an adapter for a `TypeDescriptor` and either
    declines (returns `nullptr`) or returns one. An `AdapterRegistry` asks its
    factories in registration order and keeps the first answer.

    Factories that need adapters for other types (element types, property
    types, the unqualified form of a qualified type) ask the registry they
    are given, which caches and shares them.

    `AdapterTraits<T>` is the built-in producer for `T` consulted after every
    registered factory has declined: the standard adapters and the adapters
    of `JsonObject` records are specializations of it.
*/

#include <memory>
#include <utility>

#include "stanza/adapter.hpp"
#include "stanza/type.hpp"

namespace Stanza {

    class AdapterRegistry;

    /// @ingroup StanzaAdapter
    /// @brief Produces adapters for the descriptors it recognizes.
    class JsonAdapterFactory {
    public:
        virtual ~JsonAdapterFactory() = default;

        /// @brief Returns an adapter for @p type, or `nullptr` to decline.
        [[nodiscard]] virtual std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry& registry) const = 0;
    };

    /// @ingroup StanzaAdapter
    /// @brief Returns one fixed adapter for exactly one descriptor.
    class ExactAdapterFactory final : public JsonAdapterFactory {
    public:
        ExactAdapterFactory(TypeDescriptor type, std::shared_ptr<const JsonAdapterBase> adapter)
            : m_Type{ std::move(type) }, m_Adapter{ std::move(adapter) } {}

        [[nodiscard]] std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor& type, const AdapterRegistry&) const override {
            return type == m_Type ? m_Adapter : nullptr;
        }

    private:
        TypeDescriptor m_Type;
        std::shared_ptr<const JsonAdapterBase> m_Adapter;
    };

    /// @ingroup StanzaAdapter
    /// @brief Built-in adapter producer for `T`; declines unless specialized.
    template<class T>
    struct AdapterTraits {
        static std::shared_ptr<const JsonAdapterBase> create(const TypeDescriptor&, const AdapterRegistry&) { return nullptr; }
    };

} // namespace Stanza
