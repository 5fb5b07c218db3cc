#pragma once


/*
    -------------------------------------------------------
    Stanza errors - parse positions and conversion failures
    -------------------------------------------------------
    This header defines every failure a conversion can report.

    -------------------------------------
    Stanza::ParseError - syntax positions
    -------------------------------------
    `Stanza::ParseError` describes a syntax problem found by `JsonReader`:

    - `code errc`:
        * Failure category, one of:
            - `unexpected_character`
            - `invalid_number`
            - `invalid_string`
            - `invalid_escape`
            - `invalid_unicode_escape`
            - `unexpected_end_of_input`
            - `trailing_characters`
            - `depth_limit_exceeded`
    - `size_t offset`:
        * Byte index at which the reader gave up
    - `size_t line`, `size_t column`:
        * 1-based position of the error
    - `std::string msg`:
        * Description of the failure

    -----------------
    Exception classes
    -----------------
    Conversions are driven through a stack of nested adapters, so failures
    travel as exceptions. All of them derive from `Stanza::Error`:

    - `MalformedJsonError`:
        * The text is not JSON. Carries the `ParseError` unchanged
    - `JsonDataError`:
        * The text is JSON, but not of the shape or range the adapter expects
          (a string where a number was declared, an int out of range, ...)
        * Carries the reader path (`$.list[2]`)
    - `MissingPropertiesError`:
        * A record was decoded but required properties never appeared
        * All missing names are reported together, in declaration order
    - `UnsupportedTypeError`:
        * No factory of an `AdapterRegistry` produced an adapter

    ------------------------------------------
    Stanza::ConvertError - non-throwing result
    ------------------------------------------
    `JsonAdapter<T>::try_parse(...)` reports the same failures through
    `std::expected<T, ConvertError>` instead of throwing
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes, structures and exceptions produced by Stanza
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced while reading JSON text.
    ///
    /// @details
    /// A `ParseError` is attached to every `MalformedJsonError` thrown by
    /// `JsonReader`. Each error contains:
    ///
    /// - **errc**: which grammar rule the reader tripped over
    /// - **offset**: byte index into the document at the point of failure
    /// - **line**: 1-based line of that point, counting `\n` only
    /// - **column**: 1-based byte column within that line
    /// - **msg**: text suitable for a log line or `what()`
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories detected by the reader.
        ///
        /// @details
        /// Members:
        /// - `unexpected_character`
        ///     Encountered a character that is not valid in the current state.
        ///
        /// - `invalid_number`
        ///     Number format does not match JSON grammar. Examples: leading zeros
        ///     (`012`), malformed exponents (`1e+`), missing digits after decimal.
        ///
        /// - `invalid_string`
        ///     String literal violated JSON constraints (e.g. unescaped control
        ///     characters, invalid UTF-8).
        ///
        /// - `invalid_escape`
        ///     Invalid escape sequence inside a string (e.g. `\k`, `\xFF`).
        ///
        /// - `invalid_unicode_escape`
        ///     Invalid `\uXXXX` sequence, malformed hex digits, or unpaired surrogate.
        ///
        /// - `unexpected_end_of_input`
        ///     Input ended before a complete JSON value could be read.
        ///
        /// - `trailing_characters`
        ///     A complete JSON value was read, but non-whitespace characters
        ///     remain afterward. Also used for disallowed trailing commas.
        ///
        /// - `depth_limit_exceeded`
        ///     Nesting went deeper than `ParseOptions::max_depth`.
        enum class code : uint8_t {
            unexpected_character,   ///< Byte not allowed where the reader stands.
            invalid_number,         ///< Number token breaks the grammar.
            invalid_string,         ///< Control byte or bad UTF-8 inside quotes.
            invalid_escape,         ///< Backslash followed by an unknown letter.
            invalid_unicode_escape, ///< Bad hex digits or a lone surrogate.
            unexpected_end_of_input,///< Document stopped inside a value.
            trailing_characters,    ///< Text follows the top-level value.
            depth_limit_exceeded,   ///< Nesting went past ParseOptions::max_depth.
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte index of the failure.
        std::size_t line{};   ///< 1-based line.
        std::size_t column{}; ///< 1-based byte column.
        std::string msg{};    ///< Description used by MalformedJsonError::what().

        /// @ingroup StanzaError
        /// @brief Builds a `ParseError` at a reader position.
        ///
        /// @param c    Failure category.
        /// @param o    Byte index into the document.
        /// @param l    1-based line.
        /// @param col  1-based column.
        /// @param m    Description.
        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Returns the enumerator name of a parse error code, e.g. `"invalid_number"`.
    [[nodiscard]] STANZA_API std::string_view to_string(ParseError::code c) noexcept;

    /// @ingroup StanzaError
    /// @brief Common base of every conversion and resolution failure.
    class STANZA_API Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @ingroup StanzaError
    /// @brief The input is not well-formed JSON.
    ///
    /// @details
    /// Thrown by `JsonReader`. The message has the form
    /// `"<msg> at line <l>, column <c>"`; the structured position is available
    /// through `error()`.
    class STANZA_API MalformedJsonError : public Error {
    public:
        explicit MalformedJsonError(ParseError error);

        [[nodiscard]] const ParseError& error() const noexcept { return m_Error; }

    private:
        ParseError m_Error;
    };

    /// @ingroup StanzaError
    /// @brief Well-formed JSON that does not match what an adapter expects.
    ///
    /// @details
    /// The message ends with `" at path <path>"` when a path is known.
    class STANZA_API JsonDataError : public Error {
    public:
        JsonDataError(std::string_view msg, std::string path);

        [[nodiscard]] const std::string& path() const noexcept { return m_Path; }

    private:
        std::string m_Path;
    };

    /// @ingroup StanzaError
    /// @brief A decoded record lacks one or more required properties.
    ///
    /// @details
    /// The message is `prefix` followed by the declared field names joined by
    /// `", "`, in declaration order:
    ///
    ///     The following properties were null: string, integer, list
    class STANZA_API MissingPropertiesError : public Error {
    public:
        static constexpr std::string_view prefix = "The following properties were null: ";

        explicit MissingPropertiesError(std::vector<std::string> names);

        [[nodiscard]] const std::vector<std::string>& names() const noexcept { return m_Names; }

    private:
        std::vector<std::string> m_Names;
    };

    /// @ingroup StanzaError
    /// @brief No factory in a registry's chain produced an adapter.
    ///
    /// @details
    /// Carries the printable type name and the printable qualifiers of the
    /// requested `TypeDescriptor`. The default message is
    /// `"No JSON adapter for <type> annotated [<qualifiers>]"`.
    class STANZA_API UnsupportedTypeError : public Error {
    public:
        UnsupportedTypeError(std::string type, std::vector<std::string> qualifiers);
        UnsupportedTypeError(std::string type, std::vector<std::string> qualifiers, std::string_view reason);

        [[nodiscard]] const std::string& type() const noexcept { return m_Type; }
        [[nodiscard]] const std::vector<std::string>& qualifiers() const noexcept { return m_Qualifiers; }

    private:
        std::string m_Type;
        std::vector<std::string> m_Qualifiers;
    };

    /// @ingroup StanzaError
    /// @brief Failure reported by `JsonAdapter<T>::try_parse`.
    struct ConvertError {
        enum class code : uint8_t {
            malformed_json,     ///< `MalformedJsonError`
            unexpected_data,    ///< `JsonDataError`
            missing_properties, ///< `MissingPropertiesError`
        };

        code errc{};                       ///< Which failure occurred.
        std::string msg{};                 ///< The exception message.
        std::string path{};                ///< Reader path, when known.
        std::optional<ParseError> parse{}; ///< Syntax position for `malformed_json`.
    };

} // namespace Stanza
