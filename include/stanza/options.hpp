#pragma once


/*
    ----------------------------------
    Stanza reading and writing options
    ----------------------------------
    This header defines configuration structures that control the behavior
    of `JsonReader` (JSON text -> tokens) and `JsonWriter` (tokens -> JSON text)

    --------------------------------------
    Reading Options - Stanza::ParseOptions
    --------------------------------------
    `ParseOptions` tunes how `JsonReader` scans its input:

    - `bool allow_comments`:
        * When true, the reader accepts line (`// ...`) and block
          (`/ * ... * /`) comments in addition to standard JSON whitespace
        * When false (default, strict JSON), a comment is an
          `unexpected_character` error
    - `bool allow_trailing_commas`:
        * When true, the reader accepts trailing commas in arrays and objects
          e.g. `[1,2,]` or `{"a": 1,}`
        * When false (strict JSON), trailing commas are rejected
    - `size_t max_depth`:
        * Optional limit on nesting depth of arrays/objects
        * If exceeded, the reader fails with `depth_limit_exceeded`
        * A value of 0 is treated as no explicit limit

    --------------------------------------
    Writing Options - Stanza::WriteOptions
    --------------------------------------
    `WriteOptions` tunes how `JsonWriter` lays out its output:

    - `std::string indent`:
        * Empty (default): compact JSON without extra whitespace
        * Non-empty: one element per line, `indent` repeated once per nesting
          level, and `": "` between names and values
    - `bool serialize_nulls`:
        * When true (default), `"name": null` is written as is
        * When false, a name followed by a null value is dropped together
          with the value

    -----
    Usage
    -----
    - Reading:
        * `auto v = adapter->parse(text, ParseOptions{ .allow_comments = true })`
    - Writing:
        * `std::string json = adapter->dump(v, WriteOptions{ .indent = "  " })`

    These option structures are plain aggregates suitable for
    brace-initialization
*/


#include <cstddef>
#include <string>

/// @defgroup StanzaOptions Reading and Writing Options
/// @ingroup Stanza
/// @brief Configuration objects controlling reading and writing

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON reading behavior
    ///
    /// @details
    /// By default, the reader is strict according to RFC 8259.
    ///
    /// Example:
    /// @code
    /// ParseOptions opts;
    /// opts.allow_comments = true;
    /// opts.max_depth = 32;
    /// JsonReader reader{ text, opts };
    /// @endcode
    struct ParseOptions {
        bool allow_comments = false; ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        size_t max_depth = 0; ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration options controlling JSON writing.
    ///
    /// @details
    /// `indent`:
    ///   - Indentation unit written once per nesting level.
    ///   - An empty string (default) selects compact output.
    ///
    /// `serialize_nulls`:
    ///   - When `false`, object members whose value is null are omitted.
    ///
    /// Example:
    /// @code
    /// WriteOptions wo;
    /// wo.indent = "    ";
    /// std::string json = adapter->dump(v, wo);
    /// @endcode
    struct WriteOptions {
        std::string indent{};        ///< Indentation unit; empty means compact.
        bool serialize_nulls = true; ///< Write `null` members instead of dropping them.
    };

} // namespace Stanza
