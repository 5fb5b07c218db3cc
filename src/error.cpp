#include "stanza/error.hpp"

#include <utility>

namespace Stanza {

    namespace {
        std::string describe_parse_error(const ParseError& e) {
            std::string out = e.msg;
            out += " at line ";
            out += std::to_string(e.line);
            out += ", column ";
            out += std::to_string(e.column);
            return out;
        }

        std::string describe_data_error(std::string_view msg, const std::string& path) {
            std::string out{ msg };
            if (!path.empty()) {
                out += " at path ";
                out += path;
            }
            return out;
        }

        std::string join(const std::vector<std::string>& parts) {
            std::string out;
            for (size_t i = 0; i < parts.size(); i++) {
                if (i != 0) out += ", ";
                out += parts[i];
            }
            return out;
        }

        std::string describe_unsupported(const std::string& type, const std::vector<std::string>& qualifiers) {
            std::string out = "No JSON adapter for " + type;
            if (!qualifiers.empty()) out += " annotated [" + join(qualifiers) + "]";
            return out;
        }
    } // namespace

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(ParseError::code c) noexcept {
        switch (c) {
        case ParseError::code::unexpected_character: return "unexpected_character";
        case ParseError::code::invalid_number: return "invalid_number";
        case ParseError::code::invalid_string: return "invalid_string";
        case ParseError::code::invalid_escape: return "invalid_escape";
        case ParseError::code::invalid_unicode_escape: return "invalid_unicode_escape";
        case ParseError::code::unexpected_end_of_input: return "unexpected_end_of_input";
        case ParseError::code::trailing_characters: return "trailing_characters";
        case ParseError::code::depth_limit_exceeded: return "depth_limit_exceeded";
        }
        return "unknown";
    }

    MalformedJsonError::MalformedJsonError(ParseError error)
        : Error{ describe_parse_error(error) }, m_Error{ std::move(error) } {}

    JsonDataError::JsonDataError(std::string_view msg, std::string path)
        : Error{ describe_data_error(msg, path) }, m_Path{ std::move(path) } {}

    MissingPropertiesError::MissingPropertiesError(std::vector<std::string> names)
        : Error{ std::string{ prefix } + join(names) }, m_Names{ std::move(names) } {}

    UnsupportedTypeError::UnsupportedTypeError(std::string type, std::vector<std::string> qualifiers)
        : Error{ describe_unsupported(type, qualifiers) }, m_Type{ std::move(type) }, m_Qualifiers{ std::move(qualifiers) } {}

    UnsupportedTypeError::UnsupportedTypeError(std::string type, std::vector<std::string> qualifiers, std::string_view reason)
        : Error{ describe_unsupported(type, qualifiers) + ": " + std::string{ reason } }, m_Type{ std::move(type) }, m_Qualifiers{ std::move(qualifiers) } {}

} // namespace Stanza
