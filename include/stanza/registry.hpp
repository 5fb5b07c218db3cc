#pragma once


/*
    -----------------------------------------------
    Stanza::AdapterRegistry - adapter resolution
    -----------------------------------------------
    The registry turns a `TypeDescriptor` into an adapter. It is assembled
    with a `Builder` and immutable afterwards:

        auto registry = Stanza::AdapterRegistry::Builder{}
            .add<std::string>(std::make_shared<HelloAdapter>(), { Hello() })
            .add(std::make_shared<WrappedFactory>())
            .build();

        auto adapter = registry.adapter<Person>();
        Person p = adapter->parse(R"({"name":"Ada"})");

    ----------
    Resolution
    ----------
    1. The cache is consulted with the exact descriptor
    2. On a miss, the registered factories are asked in registration order;
       the first that does not decline wins
    3. Typed lookups (`adapter<T>`) then fall back to `AdapterTraits<T>`:
       the standard adapters and `JsonObject` records
    4. The result is cached under the descriptor; structurally equal
       requests reuse it
    5. If nobody produced an adapter, `UnsupportedTypeError` is thrown

    Qualifiers match by exact set equality. Built-in adapters decline every
    qualified descriptor, except `std::optional<E>` which passes its
    qualifiers on to `E`.

    -----------------------
    Threads and recursion
    -----------------------
    Lookups may run concurrently. Two threads resolving the same descriptor
    for the first time may both build an adapter; the first one cached is
    the one every caller receives.

    A recursive type (a tree node holding a list of tree nodes) would
    resolve itself forever. While a typed lookup is in progress its
    descriptor maps to a `DeferredAdapter<T>` on the resolving thread; a
    nested request for the same descriptor receives that placeholder, which
    is bound once the real adapter exists. Adapters built during a lookup are
    cached only when the outermost lookup succeeds.

    Adapters of recursive types must not outlive their registry: it unbinds
    its placeholders on destruction.
*/

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/adapter.hpp"
#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/factory.hpp"
#include "stanza/qualifier.hpp"
#include "stanza/type.hpp"

/// @defgroup StanzaRegistry Registry
/// @ingroup Stanza
/// @brief Factory chain and resolution cache

namespace Stanza {

    /// @ingroup StanzaRegistry
    /// @brief Resolves descriptors to adapters through an ordered factory chain.
    class AdapterRegistry {
    public:
        /// @ingroup StanzaRegistry
        /// @brief Accumulates factories in registration order.
        class Builder {
        public:
            /// @brief Appends a factory.
            STANZA_API Builder& add(std::shared_ptr<const JsonAdapterFactory> factory);

            /// @brief Appends @p adapter for exactly `T` with @p qualifiers.
            template<class T>
            Builder& add(std::shared_ptr<const JsonAdapter<T>> adapter, QualifierSet qualifiers = {}) {
                return add(std::make_shared<ExactAdapterFactory>(TypeDescriptor::of<T>(std::move(qualifiers)), std::move(adapter)));
            }

            /// @brief Appends an adapter for exactly `T` with @p qualifiers made of two callables.
            template<class T>
            Builder& add(QualifierSet qualifiers, typename FunctionAdapter<T>::from_fn from, typename FunctionAdapter<T>::to_fn to) {
                auto type = TypeDescriptor::of<T>(qualifiers);
                std::shared_ptr<const JsonAdapter<T>> adapter = std::make_shared<FunctionAdapter<T>>(type.to_string(), std::move(from), std::move(to));
                return add<T>(std::move(adapter), std::move(qualifiers));
            }

            /// @brief Freezes the chain into a registry.
            [[nodiscard]] STANZA_API AdapterRegistry build() const;

        private:
            std::vector<std::shared_ptr<const JsonAdapterFactory>> m_Factories;
        };

        STANZA_API ~AdapterRegistry();

        AdapterRegistry(const AdapterRegistry&) = delete;
        AdapterRegistry& operator=(const AdapterRegistry&) = delete;

        /// @brief The adapter for `T` carrying @p qualifiers.
        /// @throws UnsupportedTypeError if no factory produces one.
        template<class T>
        [[nodiscard]] std::shared_ptr<const JsonAdapter<T>> adapter(QualifierSet qualifiers = {}) const {
            return adapter<T>(TypeDescriptor::of<T>(std::move(qualifiers)));
        }

        /// @brief The adapter for @p type, which must describe `T`.
        ///
        /// @details
        /// Generic instantiations and property types use this overload to
        /// resolve descriptors assembled from their parts.
        ///
        /// @throws UnsupportedTypeError if no factory produces an adapter, or
        ///         the one produced converts a different C++ type.
        template<class T>
        [[nodiscard]] std::shared_ptr<const JsonAdapter<T>> adapter(const TypeDescriptor& type) const {
            auto base = resolve(type,
                [&type, this]() -> std::shared_ptr<const JsonAdapterBase> {
                    if (!(type.raw() == TypeOf<T>::get().raw())) return nullptr;
                    return AdapterTraits<T>::create(type, *this);
                },
                [&type]() {
                    auto placeholder = std::make_shared<DeferredAdapter<T>>(type.to_string());
                    return Placeholder{
                        placeholder,
                        [placeholder, &type](const std::shared_ptr<const JsonAdapterBase>& resolved) {
                            auto typed = std::dynamic_pointer_cast<const JsonAdapter<T>>(resolved);
                            if (!typed) throw mismatch(type, resolved);
                            placeholder->bind(std::move(typed));
                        },
                        [placeholder]() noexcept { placeholder->release(); },
                    };
                });
            auto typed = std::dynamic_pointer_cast<const JsonAdapter<T>>(base);
            if (!typed) throw mismatch(type, base);
            return typed;
        }

        /// @brief The adapter for @p type from the cache or the registered factories.
        ///
        /// @details
        /// Built-in adapters are reached only through the typed `adapter<T>`;
        /// this lookup does not know the C++ type to build one for.
        ///
        /// @throws UnsupportedTypeError if no registered factory produces one.
        [[nodiscard]] STANZA_API std::shared_ptr<const JsonAdapterBase> adapter_for(const TypeDescriptor& type) const;

        /// @brief Number of descriptors resolved and cached so far.
        [[nodiscard]] STANZA_API std::size_t cached() const;

    private:
        struct Placeholder {
            std::shared_ptr<const JsonAdapterBase> adapter;
            std::function<void(const std::shared_ptr<const JsonAdapterBase>&)> bind;
            std::function<void()> release;
        };

        using Creator = std::function<std::shared_ptr<const JsonAdapterBase>()>;
        using PlaceholderMaker = std::function<Placeholder()>;

        STANZA_API explicit AdapterRegistry(std::vector<std::shared_ptr<const JsonAdapterFactory>> factories);

        STANZA_API std::shared_ptr<const JsonAdapterBase> resolve(const TypeDescriptor& type, const Creator& fallback, const PlaceholderMaker& make_placeholder) const;

        STANZA_API static UnsupportedTypeError mismatch(const TypeDescriptor& type, const std::shared_ptr<const JsonAdapterBase>& adapter);

        std::vector<std::shared_ptr<const JsonAdapterFactory>> m_Factories;

        mutable std::shared_mutex m_Mutex;
        mutable std::unordered_map<TypeDescriptor, std::shared_ptr<const JsonAdapterBase>> m_Cache;
        mutable std::vector<std::function<void()>> m_Releases;
    };

} // namespace Stanza

// Every adapter<T>() instantiation must see the built-in AdapterTraits
// specializations.
#include "stanza/standard.hpp"
#include "stanza/object.hpp"
