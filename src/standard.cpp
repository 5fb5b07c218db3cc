#include "stanza/standard.hpp"

#include <charconv>
#include <cmath>


namespace Stanza {

    bool BooleanAdapter::from_json(JsonReader& reader) const {
        return reader.next_boolean();
    }

    void BooleanAdapter::to_json(JsonWriter& writer, const bool& value) const {
        writer.value(value);
    }

    std::string BooleanAdapter::to_string() const {
        return "JsonAdapter(bool)";
    }

    char CharAdapter::from_json(JsonReader& reader) const {
        std::string path = reader.path();
        std::string s = reader.next_string();
        if (s.size() != 1) throw JsonDataError{ "Expected a char but was \"" + s + "\"", path };
        return s.front();
    }

    void CharAdapter::to_json(JsonWriter& writer, const char& value) const {
        writer.value(std::string_view{ &value, 1 });
    }

    std::string CharAdapter::to_string() const {
        return "JsonAdapter(char)";
    }

    std::string StringAdapter::from_json(JsonReader& reader) const {
        return reader.next_string();
    }

    void StringAdapter::to_json(JsonWriter& writer, const std::string& value) const {
        writer.value(std::string_view{ value });
    }

    std::string StringAdapter::to_string() const {
        return "JsonAdapter(std::string)";
    }

    double DoubleAdapter::from_json(JsonReader& reader) const {
        return reader.next_double();
    }

    void DoubleAdapter::to_json(JsonWriter& writer, const double& value) const {
        writer.value(value);
    }

    std::string DoubleAdapter::to_string() const {
        return "JsonAdapter(double)";
    }

    float FloatAdapter::from_json(JsonReader& reader) const {
        return static_cast<float>(reader.next_double());
    }

    void FloatAdapter::to_json(JsonWriter& writer, const float& value) const {
        writer.value(value);
    }

    std::string FloatAdapter::to_string() const {
        return "JsonAdapter(float)";
    }

    std::uint64_t detail::next_unsigned(JsonReader& reader) {
        std::string path = reader.path();
        token t = reader.peek();
        if (t != token::number && t != token::string) {
            throw JsonDataError{ "Expected an unsigned integer but was " + std::string{ Stanza::to_string(t) }, path };
        }
        std::string text = reader.next_string();
        const char* first = text.data();
        const char* last = text.data() + text.size();

        std::uint64_t out = 0;
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec == std::errc{} && ptr == last) return out;

        // Same integral spellings next_long() accepts, e.g. 1e2 or 7.0.
        double d = 0.0;
        auto [dptr, dec] = std::from_chars(first, last, d);
        constexpr double hi = 18446744073709551616.0; // 2^64
        if (dec != std::errc{} || dptr != last || std::trunc(d) != d || d < 0.0 || d >= hi)
            throw JsonDataError{ "Expected an unsigned integer but was " + text, path };
        return static_cast<std::uint64_t>(d);
    }

} // namespace Stanza
