#include "stanza/qualifier.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <utility>


namespace Stanza {

#pragma region QualifierValue

    element_kind QualifierValue::kind() const noexcept {
        return static_cast<element_kind>(m_Storage.index());
    }

    bool QualifierValue::operator==(const QualifierValue& other) const noexcept {
        if (m_Storage.index() != other.m_Storage.index()) return false;
        if (kind() == element_kind::floating)
            return std::bit_cast<std::uint64_t>(as_double()) == std::bit_cast<std::uint64_t>(other.as_double());
        return m_Storage == other.m_Storage;
    }

    std::size_t QualifierValue::hash() const noexcept {
        std::size_t seed = m_Storage.index();
        std::visit([&seed](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::same_as<V, double>) detail::hash_combine(seed, std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(v)));
            else if constexpr (std::same_as<V, TypeRef>) detail::hash_combine(seed, std::hash<std::type_index>{}(v.id));
            else if constexpr (std::same_as<V, EnumRef>) {
                detail::hash_combine(seed, std::hash<std::type_index>{}(v.type));
                detail::hash_combine(seed, std::hash<std::int64_t>{}(v.ordinal));
            }
            else if constexpr (std::same_as<V, Bytes>) {
                detail::hash_combine(seed, v.size());
                for (auto b : v) detail::hash_combine(seed, b);
            }
            else if constexpr (std::same_as<V, Array>) {
                detail::hash_combine(seed, v.size());
                for (const auto& e : v) detail::hash_combine(seed, e.hash());
            }
            else detail::hash_combine(seed, std::hash<V>{}(v));
        }, m_Storage);
        return seed;
    }

    std::string QualifierValue::to_string() const {
        return std::visit([](const auto& v) -> std::string {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::same_as<V, std::string>) return '"' + v + '"';
            else if constexpr (std::same_as<V, std::int64_t>) return std::to_string(v);
            else if constexpr (std::same_as<V, double>) {
                char buf[64];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                return ec == std::errc{} ? std::string(buf, ptr) : std::string{ "NaN" };
            }
            else if constexpr (std::same_as<V, bool>) return v ? "true" : "false";
            else if constexpr (std::same_as<V, TypeRef>) return v.name;
            else if constexpr (std::same_as<V, EnumRef>) return v.name;
            else {
                std::string out = "{";
                for (size_t i = 0; i < v.size(); i++) {
                    if (i != 0) out += ", ";
                    if constexpr (std::same_as<V, Bytes>) out += std::to_string(static_cast<int>(static_cast<std::int8_t>(v[i])));
                    else out += v[i].to_string();
                }
                out += '}';
                return out;
            }
        }, m_Storage);
    }

#pragma endregion
#pragma region QualifierMarker

    QualifierMarker::QualifierMarker(std::string name, std::vector<QualifierElement> elements)
        : m_Name{ std::move(name) }, m_Elements{ std::move(elements) }, m_Hash{ std::hash<std::string>{}(m_Name) } {
        for (const auto& e : m_Elements) {
            detail::hash_combine(m_Hash, std::hash<std::string>{}(e.name));
            detail::hash_combine(m_Hash, e.value.hash());
        }
    }

    const QualifierValue& QualifierMarker::at(std::string_view name) const {
        auto it = std::find_if(m_Elements.begin(), m_Elements.end(), [name](const QualifierElement& e) { return e.name == name; });
        if (it == m_Elements.end()) throw std::out_of_range{ "@" + m_Name + " has no element " + std::string{ name } };
        return it->value;
    }

    bool QualifierMarker::operator==(const QualifierMarker& other) const noexcept {
        return m_Hash == other.m_Hash && m_Name == other.m_Name && m_Elements == other.m_Elements;
    }

    std::string QualifierMarker::to_string() const {
        std::string out = "@" + m_Name;
        if (m_Elements.empty()) return out;
        out += '(';
        for (size_t i = 0; i < m_Elements.size(); i++) {
            if (i != 0) out += ", ";
            out += m_Elements[i].name;
            out += '=';
            out += m_Elements[i].value.to_string();
        }
        out += ')';
        return out;
    }

    std::size_t hash_value(const QualifierSet& set) noexcept {
        // Sum, so iteration order does not matter.
        std::size_t h = set.size();
        for (const auto& m : set) h += m.hash();
        return h;
    }

    std::vector<std::string> describe(const QualifierSet& set) {
        std::vector<std::string> out;
        out.reserve(set.size());
        for (const auto& m : set) out.push_back(m.to_string());
        std::sort(out.begin(), out.end());
        return out;
    }

#pragma endregion
#pragma region QualifierDeclaration

    namespace {
        std::string_view to_string(element_kind k) noexcept {
            switch (k) {
            case element_kind::string: return "string";
            case element_kind::integer: return "integer";
            case element_kind::floating: return "floating";
            case element_kind::boolean: return "boolean";
            case element_kind::type: return "type";
            case element_kind::enumeration: return "enumeration";
            case element_kind::bytes: return "bytes";
            case element_kind::array: return "array";
            }
            return "unknown";
        }

        void check_kind(const std::string& tag, const ElementSpec& spec, const QualifierValue& value) {
            if (value.kind() == spec.kind) return;
            std::string msg = "@" + tag + "." + spec.name + " expects ";
            msg += to_string(spec.kind);
            msg += " but was given ";
            msg += to_string(value.kind());
            throw std::invalid_argument{ msg };
        }
    } // namespace

    QualifierDeclaration::QualifierDeclaration(std::string name, std::vector<ElementSpec> elements)
        : m_Name{ std::move(name) }, m_Elements{ std::move(elements) } {
        for (size_t i = 0; i < m_Elements.size(); i++) {
            const auto& spec = m_Elements[i];
            for (size_t j = 0; j < i; j++) {
                if (m_Elements[j].name == spec.name) throw std::invalid_argument{ "@" + m_Name + " declares element " + spec.name + " twice" };
            }
            if (spec.default_value) check_kind(m_Name, spec, *spec.default_value);
        }
    }

    QualifierMarker QualifierDeclaration::make(std::vector<QualifierElement> values) const {
        for (size_t i = 0; i < values.size(); i++) {
            const auto& given = values[i];
            auto spec = std::find_if(m_Elements.begin(), m_Elements.end(), [&](const ElementSpec& s) { return s.name == given.name; });
            if (spec == m_Elements.end()) throw std::invalid_argument{ "@" + m_Name + " has no element " + given.name };
            check_kind(m_Name, *spec, given.value);
            for (size_t j = 0; j < i; j++) {
                if (values[j].name == given.name) throw std::invalid_argument{ "@" + m_Name + "." + given.name + " given twice" };
            }
        }

        std::vector<QualifierElement> resolved;
        resolved.reserve(m_Elements.size());
        for (const auto& spec : m_Elements) {
            auto given = std::find_if(values.begin(), values.end(), [&](const QualifierElement& e) { return e.name == spec.name; });
            if (given != values.end()) resolved.push_back(std::move(*given));
            else if (spec.default_value) resolved.push_back(QualifierElement{ spec.name, *spec.default_value });
            else throw std::invalid_argument{ "@" + m_Name + "." + spec.name + " has no value and no default" };
        }
        return QualifierMarker{ m_Name, std::move(resolved) };
    }

#pragma endregion

} // namespace Stanza
