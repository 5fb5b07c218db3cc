#pragma once


/*
    --------------------------------------------
    Stanza::JsonReader - Streaming token reader
    --------------------------------------------
    `JsonReader` walks a UTF-8 JSON document one token at a time. Adapters
    pull exactly the tokens they expect and never see the text itself.

    ------
    Tokens
    ------
    - `peek()` classifies the next token without consuming it:
        * `begin_array`, `end_array`, `begin_object`, `end_object`
        * `name` (an object key), `string`, `number`, `boolean`, `null`
        * `end_document` once the top-level value has been consumed
    - Consuming operations must match the peeked token:
        * `begin_object()` / `end_object()`, `begin_array()` / `end_array()`
        * `next_name()`, `next_string()`, `next_boolean()`, `next_null()`
        * `next_double()`, `next_long()`, `next_int()`
        * `skip_value()` consumes one value of any shape
    - `has_next()` is true while the current array or object has elements left

    ------
    Errors
    ------
    - Syntax problems throw `MalformedJsonError` with a `ParseError` that
      carries the error code, byte offset, line and column
    - Consuming a token that is not the one present throws `JsonDataError`:
          Expected BEGIN_OBJECT but was STRING at path $.inner
    - `path()` reports where the reader currently is: `$`, `$.key`, `$.list[2]`

    -----
    Usage
    -----
        Stanza::JsonReader reader{ R"({"x":1,"tags":["a","b"]})" };
        reader.begin_object();
        while (reader.has_next()) {
            std::string key = reader.next_name();
            if (key == "x") x = reader.next_int();
            else reader.skip_value();
        }
        reader.end_object();

    A reader is single-use and not thread-safe; it borrows the text, which must
    outlive it.
*/

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaReader Streaming Reader
/// @ingroup Stanza
/// @brief Pull-style tokenizer consumed by adapters

namespace Stanza {

    /// @ingroup StanzaReader
    /// @brief The kind of the next token of a `JsonReader`.
    enum class token : uint8_t {
        begin_array,  ///< `[`
        end_array,    ///< `]`
        begin_object, ///< `{`
        end_object,   ///< `}`
        name,         ///< An object member name.
        string,       ///< A string value.
        number,       ///< A numeric value.
        boolean,      ///< `true` or `false`.
        null,         ///< `null`
        end_document, ///< The top-level value has been fully consumed.
    };

    /// @ingroup StanzaReader
    /// @brief Returns the upper-case token name used in messages, e.g. `"BEGIN_OBJECT"`.
    [[nodiscard]] STANZA_API std::string_view to_string(token t) noexcept;

    namespace detail {
        struct ReaderState;
    } // namespace detail

    /// @ingroup StanzaReader
    /// @brief Pull reader over a JSON document.
    class JsonReader {
    public:
        /// @brief Creates a reader over @p text. The text is borrowed, not copied.
        STANZA_API explicit JsonReader(std::string_view text, const ParseOptions& opts = {});
        STANZA_API ~JsonReader();

        STANZA_API JsonReader(JsonReader&& other) noexcept;
        STANZA_API JsonReader& operator=(JsonReader&& other) noexcept;

        JsonReader(const JsonReader&) = delete;
        JsonReader& operator=(const JsonReader&) = delete;

        /// @brief Classifies the next token without consuming it.
        /// @throws MalformedJsonError if the text at the cursor is not valid JSON.
        [[nodiscard]] STANZA_API token peek();

        /// @brief True if the current array or object has another element.
        [[nodiscard]] STANZA_API bool has_next();

        STANZA_API void begin_object();
        STANZA_API void end_object();
        STANZA_API void begin_array();
        STANZA_API void end_array();

        /// @brief Consumes an object member name and records it in the path.
        STANZA_API std::string next_name();

        /// @brief Consumes a string; a number is returned as its literal text.
        STANZA_API std::string next_string();

        STANZA_API bool next_boolean();
        STANZA_API void next_null();

        /// @brief Consumes a number, or a string holding one, as a double.
        STANZA_API double next_double();

        /// @brief Consumes an integral number, or a string holding one.
        ///
        /// @details
        /// Literals such as `1e2` are accepted when their value is integral
        /// and fits; `1.5` throws `JsonDataError`.
        STANZA_API std::int64_t next_long();

        /// @brief Like `next_long()`, range-checked to `int`.
        STANZA_API int next_int();

        /// @brief Consumes the next value, whatever its shape.
        ///
        /// @details
        /// Nested arrays and objects are consumed completely and still
        /// syntax-checked. When the next token is a name, only the name is
        /// skipped.
        STANZA_API void skip_value();

        /// @brief The location of the reader, e.g. `$.nestedList[1].key2`.
        [[nodiscard]] STANZA_API std::string path() const;

    private:
        std::unique_ptr<detail::ReaderState> m_State;
    };

} // namespace Stanza
