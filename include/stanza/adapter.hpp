#pragma once


/*
    ---------------------------------------
    Stanza::JsonAdapter - typed converters
    ---------------------------------------
    A `JsonAdapter<T>` converts values of `T` to and from JSON by driving a
    `JsonReader` or a `JsonWriter`:

        T from_json(JsonReader& reader) const;
        void to_json(JsonWriter& writer, const T& value) const;

    Adapters are immutable once constructed and may be shared between
    threads. They are normally obtained from an `AdapterRegistry` rather than
    built by hand.

    --------------------
    Whole-document entry
    --------------------
    - `parse(text, opts)`: decodes a complete document; text left after the
      value is an error
    - `try_parse(text, opts)`: the same, reporting conversion failures as
      `std::expected<T, ConvertError>`
    - `dump(value, opts)`: encodes to a string, or onto a `std::ostream`

    ---------------
    Helper adapters
    ---------------
    - `FunctionAdapter<T>`: an adapter made of two callables
    - `DeferredAdapter<T>`: forwards to an adapter bound after construction;
      the registry hands these out to break cycles in recursive types
*/

#include <expected>
#include <functional>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"
#include "stanza/writer.hpp"

/// @defgroup StanzaAdapter Adapters
/// @ingroup Stanza
/// @brief Converters between C++ values and JSON

namespace Stanza {

    /// @ingroup StanzaAdapter
    /// @brief Type-erased base of every adapter.
    class JsonAdapterBase {
    public:
        virtual ~JsonAdapterBase() = default;

        /// @brief Identity for diagnostics, e.g. `GeneratedJsonAdapter(NestedClasses)`.
        [[nodiscard]] virtual std::string to_string() const = 0;
    };

    /// @ingroup StanzaAdapter
    /// @brief Converter between `T` and JSON.
    template<class T>
    class JsonAdapter : public JsonAdapterBase {
    public:
        using value_type = T;

        /// @brief Reads one value.
        /// @throws MalformedJsonError, JsonDataError, MissingPropertiesError
        virtual T from_json(JsonReader& reader) const = 0;

        /// @brief Writes one value.
        virtual void to_json(JsonWriter& writer, const T& value) const = 0;

        /// @brief Decodes a complete document.
        ///
        /// @details
        /// Text after the top-level value other than whitespace, or comments
        /// when allowed, is a `MalformedJsonError` (`trailing_characters`).
        /// An adapter that returns before consuming its whole value leaves
        /// tokens behind, which is a `JsonDataError` at the path it stopped.
        T parse(std::string_view text, const ParseOptions& opts = {}) const {
            JsonReader reader{ text, opts };
            T out = from_json(reader);
            if (reader.peek() != token::end_document) throw JsonDataError{ "JSON document was not fully consumed.", reader.path() };
            return out;
        }

        /// @brief Like `parse`, but returns conversion failures instead of throwing them.
        std::expected<T, ConvertError> try_parse(std::string_view text, const ParseOptions& opts = {}) const {
            try {
                return parse(text, opts);
            } catch (const MalformedJsonError& e) {
                return std::unexpected(ConvertError{ ConvertError::code::malformed_json, e.what(), {}, e.error() });
            } catch (const JsonDataError& e) {
                return std::unexpected(ConvertError{ ConvertError::code::unexpected_data, e.what(), e.path(), std::nullopt });
            } catch (const MissingPropertiesError& e) {
                return std::unexpected(ConvertError{ ConvertError::code::missing_properties, e.what(), {}, std::nullopt });
            }
        }

        /// @brief Encodes @p value onto @p os.
        void dump(const T& value, std::ostream& os, const WriteOptions& opts = {}) const {
            JsonWriter writer{ os, opts };
            to_json(writer, value);
            if (!writer.is_complete()) throw std::logic_error{ to_string() + " wrote an incomplete document." };
        }

        /// @brief Encodes @p value to a string.
        std::string dump(const T& value, const WriteOptions& opts = {}) const {
            std::ostringstream os;
            dump(value, os, opts);
            return std::move(os).str();
        }
    };

    /// @ingroup StanzaAdapter
    /// @brief An adapter made of a decode and an encode callable.
    template<class T>
    class FunctionAdapter final : public JsonAdapter<T> {
    public:
        using from_fn = std::function<T(JsonReader&)>;
        using to_fn = std::function<void(JsonWriter&, const T&)>;

        FunctionAdapter(std::string name, from_fn from, to_fn to)
            : m_Name{ std::move(name) }, m_From{ std::move(from) }, m_To{ std::move(to) } {}

        T from_json(JsonReader& reader) const override { return m_From(reader); }
        void to_json(JsonWriter& writer, const T& value) const override { m_To(writer, value); }

        [[nodiscard]] std::string to_string() const override { return "FunctionAdapter(" + m_Name + ")"; }

    private:
        std::string m_Name;
        from_fn m_From;
        to_fn m_To;
    };

    /// @ingroup StanzaAdapter
    /// @brief Forwards to an adapter that is bound after construction.
    ///
    /// @details
    /// Handed out while the adapter of a recursive type is still being
    /// built. Using it before `bind` or after `release` throws
    /// `std::logic_error`.
    template<class T>
    class DeferredAdapter final : public JsonAdapter<T> {
    public:
        explicit DeferredAdapter(std::string type) : m_Type{ std::move(type) } {}

        void bind(std::shared_ptr<const JsonAdapter<T>> delegate) { m_Delegate = std::move(delegate); }
        void release() noexcept { m_Delegate.reset(); }

        T from_json(JsonReader& reader) const override { return delegate().from_json(reader); }
        void to_json(JsonWriter& writer, const T& value) const override { delegate().to_json(writer, value); }

        [[nodiscard]] std::string to_string() const override { return "DeferredJsonAdapter(" + m_Type + ")"; }

    private:
        const JsonAdapter<T>& delegate() const {
            if (!m_Delegate) throw std::logic_error{ to_string() + " used while unbound." };
            return *m_Delegate;
        }

        std::string m_Type;
        std::shared_ptr<const JsonAdapter<T>> m_Delegate;
    };

} // namespace Stanza
