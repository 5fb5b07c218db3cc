#include "stanza/type.hpp"

#include <cstdlib>
#include <memory>
#include <utility>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif


namespace Stanza {

    namespace {
        std::size_t compute_hash(const RawType& raw, const std::vector<TypeDescriptor>& arguments, const QualifierSet& qualifiers) {
            std::size_t seed = std::hash<std::type_index>{}(raw.id);
            for (const auto& arg : arguments) detail::hash_combine(seed, arg.hash());
            detail::hash_combine(seed, hash_value(qualifiers));
            return seed;
        }
    } // namespace

    std::string detail::demangle(const char* name) {
#if defined(__GNUG__)
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> readable{ abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free };
        if (status == 0 && readable) return readable.get();
#endif
        // MSVC names are already readable.
        return name;
    }

    TypeDescriptor::TypeDescriptor(RawType raw, std::vector<TypeDescriptor> arguments, QualifierSet qualifiers)
        : m_Raw{ std::move(raw) }, m_Arguments{ std::move(arguments) }, m_Qualifiers{ std::move(qualifiers) },
          m_Hash{ compute_hash(m_Raw, m_Arguments, m_Qualifiers) } {}

    TypeDescriptor TypeDescriptor::with_qualifiers(QualifierSet qualifiers) const {
        return TypeDescriptor{ m_Raw, m_Arguments, std::move(qualifiers) };
    }

    bool TypeDescriptor::operator==(const TypeDescriptor& other) const {
        return m_Hash == other.m_Hash
            && m_Raw == other.m_Raw
            && m_Arguments == other.m_Arguments
            && m_Qualifiers == other.m_Qualifiers;
    }

    std::string TypeDescriptor::to_string() const {
        std::string out = m_Raw.name;
        if (m_Arguments.empty()) return out;
        out += '<';
        for (size_t i = 0; i < m_Arguments.size(); i++) {
            if (i != 0) out += ", ";
            out += m_Arguments[i].to_string();
        }
        out += '>';
        return out;
    }

} // namespace Stanza
