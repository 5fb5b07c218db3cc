#include "stanza/reader.hpp"

#include <charconv>
#include <cctype>
#include <cmath>
#include <expected>
#include <limits>
#include <optional>
#include <utility>
#include <vector>


namespace Stanza {

    std::string_view to_string(token t) noexcept {
        switch (t) {
        case token::begin_array: return "BEGIN_ARRAY";
        case token::end_array: return "END_ARRAY";
        case token::begin_object: return "BEGIN_OBJECT";
        case token::end_object: return "END_OBJECT";
        case token::name: return "NAME";
        case token::string: return "STRING";
        case token::number: return "NUMBER";
        case token::boolean: return "BOOLEAN";
        case token::null: return "NULL";
        case token::end_document: return "END_DOCUMENT";
        }
        return "UNKNOWN";
    }

#pragma region Scanner
    // ================================
    // Character-level scanning
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct Scanner {
            std::string_view text;
            const ParseOptions& opts;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;

            Scanner(std::string_view t, const ParseOptions& o)
                : text{ t }, opts{ o } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (idx + 1 < text.size()) ? text[idx + 1] : '\0'; }

            char get() {
                if (eof()) return '\0';
                char c = text[idx++];
                if (c == '\n') {
                    line++;
                    column = 1;
                } else column++;
                return c;
            }

            bool consume(char c) {
                if (!eof() && peek() == c) {
                    get();
                    return true;
                }
                return false;
            }

            ParseError make_error(ParseError::code code, std::string_view msg) const {
                return ParseError::make(code, idx, line, column, msg);
            }
        };

        inline bool is_valid_utf8(std::string_view s, size_t& error_idx) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
            size_t i = 0;
            size_t n = s.size();

            auto fail = [&](size_t idx) { error_idx = idx; return false; };
            auto continuation = [&](size_t at) { return (data[at] & 0xC0) == 0x80; };

            while (i < n) {
                unsigned char c = data[i];

                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                if (c >= 0xC2 && c <= 0xDF) {
                    if (i + 1 >= n || !continuation(i + 1)) return fail(i);
                    i += 2;
                    continue;
                }

                if (c >= 0xE0 && c <= 0xEF) {
                    if (i + 2 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    if (c == 0xE0 && (c1 < 0xA0 || c1 > 0xBF)) return fail(i);
                    if (c == 0xED && (c1 < 0x80 || c1 > 0x9F)) return fail(i);
                    if (!continuation(i + 1) || !continuation(i + 2)) return fail(i);
                    i += 3;
                    continue;
                }

                if (c >= 0xF0 && c <= 0xF4) {
                    if (i + 3 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    if (c == 0xF0 && (c1 < 0x90 || c1 > 0xBF)) return fail(i);
                    if (c == 0xF4 && (c1 < 0x80 || c1 > 0x8F)) return fail(i);
                    if (!continuation(i + 1) || !continuation(i + 2) || !continuation(i + 3)) return fail(i);
                    i += 4;
                    continue;
                }

                return fail(i);
            }
            return true;
        }

        void append_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                // Invalid codepoint; replace with replacement character
                append_utf8(0xFFFDu, out);
            }
        }

        expected_void skip_ws_and_comments(Scanner& s) {
            while (!s.eof()) {
                char c = s.peek();

                if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                    s.get();
                    continue;
                }

                if (!s.opts.allow_comments || c != '/') break;

                char next = s.peek_next();
                if (next == '/') {
                    // Line comment
                    s.get();
                    s.get();
                    while (!s.eof() && s.peek() != '\n') {
                        s.get();
                    }
                    continue;
                } else if (next == '*') {
                    s.get();
                    s.get();
                    bool closed = false;
                    while (!s.eof()) {
                        char ch = s.get();
                        if (ch == '*' && s.peek() == '/') {
                            s.get();
                            closed = true;
                            break;
                        }
                    }
                    if (!closed) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated block comment"));
                    continue;
                } else {
                    break;
                }
            }
            return {};
        }

        expected_void parse_literal(Scanner& s, std::string_view literal, ParseError::code code, std::string_view fail_msg) {
            for (char expected : literal) {
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, fail_msg));
                char c = s.get();
                if (c != expected) return std::unexpected(s.make_error(code, fail_msg));
            }
            return {};
        }

        expected_t<std::string> parse_string(Scanner& s) {
            if (!s.consume('"')) return std::unexpected(s.make_error(ParseError::code::invalid_string, "Expected '\"' to start a string"));

            std::string out;

            while (!s.eof()) {
                char c = s.get();
                if (c == '"') {
                    size_t bad_idx = 0;
                    if (!detail::is_valid_utf8(out, bad_idx))
                        return std::unexpected(s.make_error(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string"));
                    return out;
                }
                if (static_cast<unsigned char>(c) < 0x20) return std::unexpected(s.make_error(ParseError::code::invalid_string, "Control character in string"));
                if (c == '\\') {
                    if (s.eof()) return std::unexpected(s.make_error(ParseError::code::invalid_escape, "Unfinished escape sequence"));
                    char esc = s.get();
                    switch (esc) {
                        case '"': out.push_back('"'); break;
                        case '\\': out.push_back('\\'); break;
                        case '/': out.push_back('/'); break;
                        case 'b': out.push_back('\b'); break;
                        case 'f': out.push_back('\f'); break;
                        case 'n': out.push_back('\n'); break;
                        case 'r': out.push_back('\r'); break;
                        case 't': out.push_back('\t'); break;
                        case 'u': {
                            auto parse_hex4 = [&](uint16_t& out_code) -> expected_void {
                                uint16_t val = 0;
                                for (int i = 0; i < 4; i++) {
                                    if (s.eof()) return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape"));
                                    char h = s.get();
                                    unsigned digit = 0;
                                    if (h >= '0' && h <= '9') digit = h - '0';
                                    else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                                    else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                                    else return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape"));
                                    val = static_cast<uint16_t>((val << 4) | digit);
                                }
                                out_code = val;
                                return {};
                            };

                            uint16_t first = 0;
                            if (auto r = parse_hex4(first); !r) return std::unexpected(r.error());

                            uint32_t codepoint = 0;

                            if (first >= 0xD800 && first <= 0xDBFF) {
                                if (!(s.consume('\\') && s.consume('u'))) return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate"));
                                uint16_t second = 0;
                                if (auto r = parse_hex4(second); !r) return std::unexpected(r.error());
                                if (!(second >= 0xDC00 && second <= 0xDFFF)) return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Invalid low surrogate"));
                                codepoint = 0x10000u + ((static_cast<uint32_t>(first - 0xD800) << 10) | (static_cast<uint32_t>(second - 0xDC00)));
                            } else if (first >= 0xDC00 && first <= 0xDFFF) return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate"));
                            else codepoint = first;

                            append_utf8(codepoint, out);
                            break;
                        }
                    default: return std::unexpected(s.make_error(ParseError::code::invalid_escape, "Invalid escape sequence"));
                    }
                } else {
                    out.push_back(c);
                }
            }

            return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated string"));
        }

        // Validates a number literal and returns its text; conversion is left
        // to the consuming call so integers keep their full precision.
        expected_t<std::string_view> scan_number(Scanner& s) {
            size_t start = s.idx;

            char c = s.peek();
            if (c == '-') {
                s.get();
                if (!std::isdigit(static_cast<unsigned char>(s.peek()))) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected digit after '-'"));
            }

            char first_digit = s.get();
            if (!std::isdigit(static_cast<unsigned char>(first_digit))) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Expected digit"));
            if (first_digit == '0' && std::isdigit(static_cast<unsigned char>(s.peek()))) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Leading zeros disallowed"));
            while (std::isdigit(static_cast<unsigned char>(s.peek()))) s.get();

            if (s.peek() == '.') {
                s.get();
                if (!std::isdigit(static_cast<unsigned char>(s.peek()))) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Expected digit after '.'"));
                while (std::isdigit(static_cast<unsigned char>(s.peek()))) s.get();
            }

            char p = s.peek();
            if (p == 'e' || p == 'E') {
                s.get();
                char sign = s.peek();
                if (sign == '+' || sign == '-') {
                    s.get();
                }
                if (!std::isdigit(static_cast<unsigned char>(s.peek()))) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Expected digit in exponent"));
                do {
                    s.get();
                    c = s.peek();
                } while (std::isdigit(static_cast<unsigned char>(c)));

                auto is_ws = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; };
                bool comment = s.opts.allow_comments && c == '/';
                if (!(c == '\0' || c == ',' || c == ']' || c == '}' || is_ws(c) || comment)) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Invalid character in exponent"));
            }

            auto num_sv = s.text.substr(start, s.idx - start);
            double value = 0.0;
            auto fc_res = std::from_chars(num_sv.data(), num_sv.data() + num_sv.size(), value);
            if (fc_res.ec == std::errc::invalid_argument) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Failed to parse number"));
            return num_sv;
        }

        enum class scope : uint8_t {
            empty_document,
            nonempty_document,
            empty_array,
            nonempty_array,
            empty_object,
            dangling_name,
            nonempty_object,
        };

        struct Frame {
            scope kind;
            std::string name{};
            size_t index = 0;
        };

        struct ReaderState {
            ParseOptions opts;
            Scanner scanner;
            std::vector<Frame> stack;
            std::optional<token> peeked;
            std::string peeked_text;
            bool peeked_bool = false;

            ReaderState(std::string_view text, const ParseOptions& o)
                : opts{ o }, scanner{ text, opts } {
                stack.push_back(Frame{ scope::empty_document });
            }

            [[noreturn]] void fail(ParseError::code code, std::string_view msg) const {
                throw MalformedJsonError{ scanner.make_error(code, msg) };
            }

            template<typename T>
            T check(expected_t<T> r) const {
                if (!r) throw MalformedJsonError{ std::move(r.error()) };
                return *std::move(r);
            }

            void check(expected_void r) const {
                if (!r) throw MalformedJsonError{ std::move(r.error()) };
            }

            token set(token t) {
                peeked = t;
                return t;
            }

            [[nodiscard]] size_t container_depth() const noexcept { return stack.size() - 1; }
        };

        bool is_array_scope(scope s) noexcept {
            return s == scope::empty_array || s == scope::nonempty_array;
        }

        token peek_value(ReaderState& st) {
            Scanner& s = st.scanner;
            st.check(skip_ws_and_comments(s));
            if (s.eof()) st.fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");
            char c = s.peek();
            switch (c) {
            case 'n': {
                st.check(parse_literal(s, "null", ParseError::code::unexpected_character, "Invalid 'null' literal"));
                return st.set(token::null);
            }
            case 't': {
                st.check(parse_literal(s, "true", ParseError::code::unexpected_character, "Invalid 'true' literal"));
                st.peeked_bool = true;
                return st.set(token::boolean);
            }
            case 'f': {
                st.check(parse_literal(s, "false", ParseError::code::unexpected_character, "Invalid 'false' literal"));
                st.peeked_bool = false;
                return st.set(token::boolean);
            }
            case '"': {
                st.peeked_text = st.check(parse_string(s));
                return st.set(token::string);
            }
            case '[':
            case '{': {
                if (st.opts.max_depth != 0 && st.container_depth() + 1 > st.opts.max_depth)
                    st.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                s.get();
                return st.set(c == '[' ? token::begin_array : token::begin_object);
            }
            default:
                if (c == '-' || (c >= '0' && c <= '9')) {
                    st.peeked_text = std::string{ st.check(scan_number(s)) };
                    return st.set(token::number);
                }
                else if (c == '.') st.fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                st.fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
            }
        }

        token do_peek(ReaderState& st) {
            Scanner& s = st.scanner;
            Frame& top = st.stack.back();
            st.check(skip_ws_and_comments(s));

            switch (top.kind) {
            case scope::empty_array:
                top.kind = scope::nonempty_array;
                if (s.consume(']')) return st.set(token::end_array);
                break;
            case scope::nonempty_array: {
                char c = s.peek();
                if (c == ']') {
                    s.get();
                    return st.set(token::end_array);
                }
                if (c == ',') {
                    s.get();
                    st.check(skip_ws_and_comments(s));
                    if (s.peek() == ']') {
                        if (!st.opts.allow_trailing_commas) st.fail(ParseError::code::trailing_characters, "Trailing commas not allowed");
                        s.get();
                        return st.set(token::end_array);
                    }
                    break;
                }
                if (s.eof()) st.fail(ParseError::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                st.fail(ParseError::code::unexpected_character, "Expected ',' or ']' in array");
            }
            case scope::empty_object:
            case scope::nonempty_object: {
                if (top.kind == scope::nonempty_object) {
                    char c = s.peek();
                    if (c == '}') {
                        s.get();
                        return st.set(token::end_object);
                    }
                    if (c != ',') {
                        if (s.eof()) st.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                        st.fail(ParseError::code::unexpected_character, "Expected ',' or '}' in object");
                    }
                    s.get();
                    st.check(skip_ws_and_comments(s));
                    if (st.opts.allow_trailing_commas && s.consume('}')) return st.set(token::end_object);
                } else if (s.consume('}')) {
                    return st.set(token::end_object);
                }
                if (s.eof()) st.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected '}' or string key");
                if (s.peek() != '"') st.fail(ParseError::code::unexpected_character, "Expected \" to start object key");
                st.peeked_text = st.check(parse_string(s));
                top.kind = scope::dangling_name;
                return st.set(token::name);
            }
            case scope::dangling_name: {
                if (s.eof()) st.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                if (s.peek() != ':') st.fail(ParseError::code::unexpected_character, "Expected ':' after object key");
                s.get();
                top.kind = scope::nonempty_object;
                break;
            }
            case scope::empty_document:
                top.kind = scope::nonempty_document;
                break;
            case scope::nonempty_document:
                if (s.eof()) return st.set(token::end_document);
                st.fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
            }
            return peek_value(st);
        }
    } // namespace detail
#pragma endregion
#pragma region Reader

    // ================================
    // Token-level operations
    // ================================

    namespace {
        [[noreturn]] void unexpected_token(const JsonReader& reader, std::string_view expected, token actual) {
            std::string msg = "Expected ";
            msg += expected;
            msg += " but was ";
            msg += to_string(actual);
            throw JsonDataError{ msg, reader.path() };
        }

        std::optional<std::int64_t> to_long(const std::string& text) {
            const char* first = text.data();
            const char* last = text.data() + text.size();

            std::int64_t out = 0;
            auto [ptr, ec] = std::from_chars(first, last, out);
            if (ec == std::errc{} && ptr == last) return out;

            // Integral values written with a fraction or exponent, e.g. 1e2.
            double d = 0.0;
            auto [dptr, dec] = std::from_chars(first, last, d);
            constexpr double lo = static_cast<double>(std::numeric_limits<std::int64_t>::min());
            constexpr double hi = 9223372036854775808.0; // 2^63
            if (dec != std::errc{} || dptr != last || std::trunc(d) != d || d < lo || d >= hi) return std::nullopt;
            return static_cast<std::int64_t>(d);
        }

        // Marks the peeked value as consumed and advances the array index.
        void consumed(detail::ReaderState& st) {
            st.peeked.reset();
            auto& top = st.stack.back();
            if (detail::is_array_scope(top.kind)) top.index++;
        }
    } // namespace

    JsonReader::JsonReader(std::string_view text, const ParseOptions& opts)
        : m_State{ std::make_unique<detail::ReaderState>(text, opts) } {}

    JsonReader::~JsonReader() = default;
    JsonReader::JsonReader(JsonReader&& other) noexcept = default;
    JsonReader& JsonReader::operator=(JsonReader&& other) noexcept = default;

    token JsonReader::peek() {
        auto& st = *m_State;
        if (st.peeked) return *st.peeked;
        return detail::do_peek(st);
    }

    bool JsonReader::has_next() {
        token t = peek();
        return t != token::end_object && t != token::end_array && t != token::end_document;
    }

    void JsonReader::begin_object() {
        token t = peek();
        if (t != token::begin_object) unexpected_token(*this, "BEGIN_OBJECT", t);
        m_State->peeked.reset();
        m_State->stack.push_back(detail::Frame{ detail::scope::empty_object });
    }

    void JsonReader::end_object() {
        token t = peek();
        if (t != token::end_object) unexpected_token(*this, "END_OBJECT", t);
        m_State->stack.pop_back();
        consumed(*m_State);
    }

    void JsonReader::begin_array() {
        token t = peek();
        if (t != token::begin_array) unexpected_token(*this, "BEGIN_ARRAY", t);
        m_State->peeked.reset();
        m_State->stack.push_back(detail::Frame{ detail::scope::empty_array });
    }

    void JsonReader::end_array() {
        token t = peek();
        if (t != token::end_array) unexpected_token(*this, "END_ARRAY", t);
        m_State->stack.pop_back();
        consumed(*m_State);
    }

    std::string JsonReader::next_name() {
        token t = peek();
        if (t != token::name) unexpected_token(*this, "a name", t);
        auto& st = *m_State;
        st.peeked.reset();
        st.stack.back().name = st.peeked_text;
        return std::move(st.peeked_text);
    }

    std::string JsonReader::next_string() {
        token t = peek();
        if (t != token::string && t != token::number) unexpected_token(*this, "a string", t);
        std::string out = std::move(m_State->peeked_text);
        consumed(*m_State);
        return out;
    }

    bool JsonReader::next_boolean() {
        token t = peek();
        if (t != token::boolean) unexpected_token(*this, "a boolean", t);
        bool out = m_State->peeked_bool;
        consumed(*m_State);
        return out;
    }

    void JsonReader::next_null() {
        token t = peek();
        if (t != token::null) unexpected_token(*this, "null", t);
        consumed(*m_State);
    }

    double JsonReader::next_double() {
        token t = peek();
        if (t != token::number && t != token::string) unexpected_token(*this, "a double", t);
        const std::string& text = m_State->peeked_text;
        double out = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (ec != std::errc{} || ptr != text.data() + text.size())
            throw JsonDataError{ "Expected a double but was " + text, path() };
        consumed(*m_State);
        return out;
    }

    std::int64_t JsonReader::next_long() {
        token t = peek();
        if (t != token::number && t != token::string) unexpected_token(*this, "a long", t);
        auto out = to_long(m_State->peeked_text);
        if (!out) throw JsonDataError{ "Expected a long but was " + m_State->peeked_text, path() };
        consumed(*m_State);
        return *out;
    }

    int JsonReader::next_int() {
        token t = peek();
        if (t != token::number && t != token::string) unexpected_token(*this, "an int", t);
        auto wide = to_long(m_State->peeked_text);
        if (!wide || *wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max())
            throw JsonDataError{ "Expected an int but was " + m_State->peeked_text, path() };
        consumed(*m_State);
        return static_cast<int>(*wide);
    }

    void JsonReader::skip_value() {
        size_t depth = 0;
        do {
            token t = peek();
            switch (t) {
            case token::begin_array: begin_array(); depth++; break;
            case token::begin_object: begin_object(); depth++; break;
            case token::end_array:
                if (depth == 0) unexpected_token(*this, "a value", t);
                end_array();
                depth--;
                break;
            case token::end_object:
                if (depth == 0) unexpected_token(*this, "a value", t);
                end_object();
                depth--;
                break;
            case token::name: (void)next_name(); break;
            case token::string:
            case token::number:
            case token::boolean:
            case token::null:
                consumed(*m_State);
                break;
            case token::end_document: unexpected_token(*this, "a value", t);
            }
        } while (depth > 0);
    }

    std::string JsonReader::path() const {
        std::string out = "$";
        const auto& stack = m_State->stack;
        for (size_t i = 1; i < stack.size(); i++) {
            const auto& frame = stack[i];
            if (detail::is_array_scope(frame.kind)) {
                out += '[';
                out += std::to_string(frame.index);
                out += ']';
            } else if (!frame.name.empty()) {
                out += '.';
                out += frame.name;
            }
        }
        return out;
    }
#pragma endregion

} // namespace Stanza
