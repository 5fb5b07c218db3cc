#include "stanza/registry.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

#include "stanza/logging.hpp"


namespace Stanza {

    namespace {
        std::string describe_type(const TypeDescriptor& type) {
            std::string out = type.to_string();
            for (const auto& q : describe(type.qualifiers())) {
                out += ' ';
                out += q;
            }
            return out;
        }
    } // namespace

#pragma region Lookup chains
    // ================================
    // Per-thread lookup chains
    // ================================

    namespace detail {
        struct Lookup {
            TypeDescriptor type;
            std::shared_ptr<const JsonAdapterBase> adapter{};
            std::shared_ptr<const JsonAdapterBase> placeholder{};
            std::function<void(const std::shared_ptr<const JsonAdapterBase>&)> bind{};
            std::function<void()> release{};
        };

        // The lookups in progress on one thread for one registry, outermost first.
        struct LookupChain {
            const void* owner;
            std::vector<Lookup> lookups{};
            size_t depth = 0;
        };

        thread_local std::vector<std::unique_ptr<LookupChain>> t_Chains;

        LookupChain& chain_for(const void* owner) {
            for (auto& chain : t_Chains) {
                if (chain->owner == owner) return *chain;
            }
            t_Chains.push_back(std::make_unique<LookupChain>(LookupChain{ owner }));
            return *t_Chains.back();
        }

        class ChainGuard {
        public:
            ChainGuard(LookupChain& chain, size_t index) : m_Chain{ chain }, m_Index{ index } { m_Chain.depth++; }

            ChainGuard(const ChainGuard&) = delete;
            ChainGuard& operator=(const ChainGuard&) = delete;

            ~ChainGuard() {
                // A failed lookup discards itself and every lookup resolved after it.
                if (!m_Succeeded) m_Chain.lookups.erase(m_Chain.lookups.begin() + static_cast<std::ptrdiff_t>(m_Index), m_Chain.lookups.end());
                if (--m_Chain.depth == 0) {
                    const LookupChain* done = &m_Chain;
                    std::erase_if(t_Chains, [done](const std::unique_ptr<LookupChain>& c) { return c.get() == done; });
                }
            }

            void succeeded() noexcept { m_Succeeded = true; }

        private:
            LookupChain& m_Chain;
            size_t m_Index;
            bool m_Succeeded = false;
        };
    } // namespace detail

#pragma endregion
#pragma region Builder

    AdapterRegistry::Builder& AdapterRegistry::Builder::add(std::shared_ptr<const JsonAdapterFactory> factory) {
        if (!factory) throw std::invalid_argument{ "Cannot register a null factory." };
        m_Factories.push_back(std::move(factory));
        return *this;
    }

    AdapterRegistry AdapterRegistry::Builder::build() const {
        return AdapterRegistry{ m_Factories };
    }

#pragma endregion
#pragma region Registry

    AdapterRegistry::AdapterRegistry(std::vector<std::shared_ptr<const JsonAdapterFactory>> factories)
        : m_Factories{ std::move(factories) } {
        get_logger()->debug("Built adapter registry with {} factories", m_Factories.size());
    }

    AdapterRegistry::~AdapterRegistry() {
        for (auto& release : m_Releases) release();
    }

    std::shared_ptr<const JsonAdapterBase> AdapterRegistry::adapter_for(const TypeDescriptor& type) const {
        return resolve(type, nullptr, nullptr);
    }

    std::size_t AdapterRegistry::cached() const {
        std::shared_lock lock{ m_Mutex };
        return m_Cache.size();
    }

    UnsupportedTypeError AdapterRegistry::mismatch(const TypeDescriptor& type, const std::shared_ptr<const JsonAdapterBase>& adapter) {
        return UnsupportedTypeError{ type.to_string(), describe(type.qualifiers()), adapter->to_string() + " converts a different C++ type" };
    }

    std::shared_ptr<const JsonAdapterBase> AdapterRegistry::resolve(const TypeDescriptor& type, const Creator& fallback, const PlaceholderMaker& make_placeholder) const {
        auto logger = get_logger();
        {
            std::shared_lock lock{ m_Mutex };
            if (auto it = m_Cache.find(type); it != m_Cache.end()) {
                if (logger->should_log(spdlog::level::trace)) logger->trace("Cache hit for {}", describe_type(type));
                return it->second;
            }
        }

        auto& chain = detail::chain_for(this);
        for (const auto& lookup : chain.lookups) {
            if (!(lookup.type == type)) continue;
            if (lookup.adapter) return lookup.adapter;
            if (lookup.placeholder) {
                logger->trace("Handing out placeholder for recursive {}", describe_type(type));
                return lookup.placeholder;
            }
            throw UnsupportedTypeError{ type.to_string(), describe(type.qualifiers()), "recursive lookup of a type that has no typed request in progress" };
        }

        size_t index = chain.lookups.size();
        detail::Lookup entry{ type };
        if (make_placeholder) {
            Placeholder placeholder = make_placeholder();
            entry.placeholder = std::move(placeholder.adapter);
            entry.bind = std::move(placeholder.bind);
            entry.release = std::move(placeholder.release);
        }
        chain.lookups.push_back(std::move(entry));
        detail::ChainGuard guard{ chain, index };

        std::shared_ptr<const JsonAdapterBase> result;
        for (const auto& factory : m_Factories) {
            result = factory->create(type, *this);
            if (result) break;
        }
        if (!result && fallback) result = fallback();
        if (!result) {
            logger->debug("No adapter for {}", describe_type(type));
            throw UnsupportedTypeError{ type.to_string(), describe(type.qualifiers()) };
        }

        // Nested lookups may have grown the chain; access by index only.
        if (chain.lookups[index].bind) chain.lookups[index].bind(result);
        chain.lookups[index].adapter = result;
        guard.succeeded();
        if (chain.depth > 1) return result;

        std::unique_lock lock{ m_Mutex };
        for (auto& lookup : chain.lookups) {
            auto [it, inserted] = m_Cache.try_emplace(lookup.type, lookup.adapter);
            if (inserted) logger->debug("Resolved {} to {}", describe_type(lookup.type), lookup.adapter->to_string());
            if (lookup.release) m_Releases.push_back(std::move(lookup.release));
        }
        return m_Cache.at(type);
    }

#pragma endregion

} // namespace Stanza
