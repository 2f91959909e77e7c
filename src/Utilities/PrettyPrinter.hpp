//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Writes a JSON document with one field per line so the configuration file stays readable by hand.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <ostream>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t DefaultIndent = 4;

void Print(boost::json::value const& json, std::ostream& os, std::size_t indent = DefaultIndent);

namespace detail {
void PrintValue(boost::json::value const& json, std::ostream& os, std::size_t indent, std::size_t depth);
}

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

inline void JSON::Print(boost::json::value const& json, std::ostream& os, std::size_t indent)
{
    detail::PrintValue(json, os, indent, 0);
    os << '\n';
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::detail::PrintValue(
    boost::json::value const& json, std::ostream& os, std::size_t indent, std::size_t depth)
{
    std::string const outer(depth * indent, ' ');
    std::string const inner((depth + 1) * indent, ' ');

    if (auto const* const pObject = json.if_object(); pObject) {
        if (pObject->empty()) { os << "{}"; return; }
        os << "{\n";
        bool first = true;
        for (auto const& entry : *pObject) {
            if (!first) { os << ",\n"; }
            first = false;
            os << inner << boost::json::serialize(entry.key()) << ": ";
            PrintValue(entry.value(), os, indent, depth + 1);
        }
        os << '\n' << outer << '}';
        return;
    }

    if (auto const* const pArray = json.if_array(); pArray) {
        if (pArray->empty()) { os << "[]"; return; }
        os << "[\n";
        bool first = true;
        for (auto const& element : *pArray) {
            if (!first) { os << ",\n"; }
            first = false;
            os << inner;
            PrintValue(element, os, indent, depth + 1);
        }
        os << '\n' << outer << ']';
        return;
    }

    os << boost::json::serialize(json); // Scalars are already in their compact form.
}

//----------------------------------------------------------------------------------------------------------------------
