#pragma once


/*
    --------------------------------------------
    Stanza::JsonWriter - Streaming token writer
    --------------------------------------------
    `JsonWriter` emits a JSON document onto a `std::ostream` one token at a
    time. It tracks the nesting of arrays and objects and inserts commas,
    name separators and indentation itself.

    ----------
    Operations
    ----------
    - `begin_object()` / `end_object()`, `begin_array()` / `end_array()`
    - `name(key)` inside an object, before every value
    - `value(...)` for strings, booleans, integers and doubles
    - `null_value()`

    -------
    Layout
    -------
    - Compact by default: `{"a":1,"b":[true,null]}`
    - With `WriteOptions::indent = "  "`:

        {
          "a": 1,
          "b": [
            true,
            null
          ]
        }

    - Doubles use the shortest representation that reads back to the same
      value; NaN and infinities are written as `null`

    Misusing the writer (a value without a name inside an object, closing the
    wrong container, a second top-level value) throws `std::logic_error`.
*/

#include <concepts>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaWriter Streaming Writer
/// @ingroup Stanza
/// @brief Push-style emitter driven by adapters

namespace Stanza {

    /// @ingroup StanzaWriter
    /// @brief Push writer of a single JSON document.
    class JsonWriter {
    public:
        /// @brief Creates a writer appending to @p os. The stream must outlive the writer.
        STANZA_API explicit JsonWriter(std::ostream& os, WriteOptions opts = {});

        JsonWriter(const JsonWriter&) = delete;
        JsonWriter& operator=(const JsonWriter&) = delete;

        STANZA_API JsonWriter& begin_object();
        STANZA_API JsonWriter& end_object();
        STANZA_API JsonWriter& begin_array();
        STANZA_API JsonWriter& end_array();

        /// @brief Names the next value of the enclosing object.
        STANZA_API JsonWriter& name(std::string_view key);

        STANZA_API JsonWriter& value(std::string_view s);
        JsonWriter& value(const char* s) { return value(std::string_view{ s }); }
        STANZA_API JsonWriter& value(bool b);
        STANZA_API JsonWriter& value(double d);
        STANZA_API JsonWriter& value(float f);

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        JsonWriter& value(I v) {
            if constexpr (std::is_signed_v<I>) return write_integer(static_cast<std::int64_t>(v));
            else return write_integer(static_cast<std::uint64_t>(v));
        }

        /// @brief Writes `null`, or drops the pending name when nulls are not serialized.
        STANZA_API JsonWriter& null_value();

        /// @brief True once a complete top-level value has been written.
        [[nodiscard]] STANZA_API bool is_complete() const noexcept;

        [[nodiscard]] const WriteOptions& options() const noexcept { return m_Options; }

    private:
        enum class scope : uint8_t {
            empty_document,
            nonempty_document,
            empty_array,
            nonempty_array,
            empty_object,
            dangling_name,
            nonempty_object,
        };

        STANZA_API JsonWriter& write_integer(std::int64_t v);
        STANZA_API JsonWriter& write_integer(std::uint64_t v);

        JsonWriter& open(scope empty, char bracket);
        JsonWriter& close(scope empty, scope nonempty, char bracket);
        void write_deferred_name();
        void before_name();
        void before_value();
        void newline();

        std::ostream& m_Out;
        WriteOptions m_Options;
        std::vector<scope> m_Stack;
        std::optional<std::string> m_DeferredName;
    };

} // namespace Stanza
