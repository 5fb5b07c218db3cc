#include "stanza/writer.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <utility>


namespace Stanza {

    namespace {
        void dump_string(std::string_view s, std::ostream& os) {
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) {
                        // control characters -> \u00XX
                        static constexpr char hex[] = "0123456789ABCDEF";
                        os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    } else {
                        os.put(static_cast<char>(c));
                    }
                    break;
                }
            }
            os.put('"');
        }

        template<typename N>
        void dump_number(std::ostream& os, N n) {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n);
            if (ec != std::errc{}) throw std::logic_error{ "Number does not fit the conversion buffer." };
            os.write(buf, ptr - buf);
        }
    } // namespace

    JsonWriter::JsonWriter(std::ostream& os, WriteOptions opts)
        : m_Out{ os }, m_Options{ std::move(opts) } {
        m_Stack.push_back(scope::empty_document);
    }

#pragma region Structure

    JsonWriter& JsonWriter::begin_object() {
        return open(scope::empty_object, '{');
    }

    JsonWriter& JsonWriter::end_object() {
        return close(scope::empty_object, scope::nonempty_object, '}');
    }

    JsonWriter& JsonWriter::begin_array() {
        return open(scope::empty_array, '[');
    }

    JsonWriter& JsonWriter::end_array() {
        return close(scope::empty_array, scope::nonempty_array, ']');
    }

    JsonWriter& JsonWriter::name(std::string_view key) {
        if (m_DeferredName) throw std::logic_error{ "Nesting problem: name written twice." };
        scope top = m_Stack.back();
        if (top != scope::empty_object && top != scope::nonempty_object) throw std::logic_error{ "Nesting problem: name outside of an object." };
        m_DeferredName.emplace(key);
        return *this;
    }

    JsonWriter& JsonWriter::open(scope empty, char bracket) {
        write_deferred_name();
        before_value();
        m_Stack.push_back(empty);
        m_Out.put(bracket);
        return *this;
    }

    JsonWriter& JsonWriter::close(scope empty, scope nonempty, char bracket) {
        scope top = m_Stack.back();
        if (top != empty && top != nonempty) throw std::logic_error{ "Nesting problem." };
        if (m_DeferredName) throw std::logic_error{ "Dangling name: " + *m_DeferredName };
        m_Stack.pop_back();
        if (top == nonempty) newline();
        m_Out.put(bracket);
        return *this;
    }

    void JsonWriter::write_deferred_name() {
        if (!m_DeferredName) return;
        before_name();
        dump_string(*m_DeferredName, m_Out);
        m_DeferredName.reset();
    }

    void JsonWriter::before_name() {
        scope& top = m_Stack.back();
        if (top == scope::nonempty_object) m_Out.put(',');
        else if (top != scope::empty_object) throw std::logic_error{ "Nesting problem." };
        newline();
        top = scope::dangling_name;
    }

    void JsonWriter::before_value() {
        scope& top = m_Stack.back();
        switch (top) {
        case scope::nonempty_document:
            throw std::logic_error{ "JSON must have only one top-level value." };
        case scope::empty_document:
            top = scope::nonempty_document;
            break;
        case scope::empty_array:
            top = scope::nonempty_array;
            newline();
            break;
        case scope::nonempty_array:
            m_Out.put(',');
            newline();
            break;
        case scope::dangling_name:
            m_Out << (m_Options.indent.empty() ? ":" : ": ");
            top = scope::nonempty_object;
            break;
        case scope::empty_object:
        case scope::nonempty_object:
            throw std::logic_error{ "Nesting problem: value without a name inside an object." };
        }
    }

    void JsonWriter::newline() {
        if (m_Options.indent.empty()) return;
        m_Out.put('\n');
        for (size_t i = 1; i < m_Stack.size(); i++) m_Out << m_Options.indent;
    }

    bool JsonWriter::is_complete() const noexcept {
        return m_Stack.size() == 1 && m_Stack.back() == scope::nonempty_document;
    }

#pragma endregion
#pragma region Values

    JsonWriter& JsonWriter::value(std::string_view s) {
        write_deferred_name();
        before_value();
        dump_string(s, m_Out);
        return *this;
    }

    JsonWriter& JsonWriter::value(bool b) {
        write_deferred_name();
        before_value();
        m_Out << (b ? "true" : "false");
        return *this;
    }

    JsonWriter& JsonWriter::value(double d) {
        if (!std::isfinite(d)) return null_value();
        write_deferred_name();
        before_value();
        dump_number(m_Out, d);
        return *this;
    }

    JsonWriter& JsonWriter::value(float f) {
        if (!std::isfinite(f)) return null_value();
        write_deferred_name();
        before_value();
        dump_number(m_Out, f);
        return *this;
    }

    JsonWriter& JsonWriter::write_integer(std::int64_t v) {
        write_deferred_name();
        before_value();
        dump_number(m_Out, v);
        return *this;
    }

    JsonWriter& JsonWriter::write_integer(std::uint64_t v) {
        write_deferred_name();
        before_value();
        dump_number(m_Out, v);
        return *this;
    }

    JsonWriter& JsonWriter::null_value() {
        if (m_DeferredName && !m_Options.serialize_nulls) {
            m_DeferredName.reset();
            return *this;
        }
        write_deferred_name();
        before_value();
        m_Out << "null";
        return *this;
    }

#pragma endregion

} // namespace Stanza
