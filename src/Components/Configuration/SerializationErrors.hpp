//----------------------------------------------------------------------------------------------------------------------
// File: SerializationErrors.hpp
// Description: Builders for the messages attached to configuration status codes. Fields are identified by their path
// through the configuration groups (e.g. heartbeat.failure_timeout).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename... Segments>
concept FieldPath = (std::convertible_to<Segments, std::string_view> && ...);

template<typename... Segments> requires FieldPath<Segments...>
[[nodiscard]] std::string JoinFieldPath(Segments const&... segments)
{
    std::string path;
    auto const Append = [&path] (std::string_view segment) {
        if (!path.empty()) { path.push_back('.'); }
        path.append(segment);
    };
    (Append(segments), ...);
    return path;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Segments> requires FieldPath<Segments...>
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Segments const&... segments)
{
    constexpr std::string_view Vowels = "aeiou";
    std::string_view const article = (!type.empty() && Vowels.find(type.front()) != Vowels.npos) ? "an" : "a";
    return fmt::format("Expected '{}' to be {} {}.", JoinFieldPath(segments...), article, type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Segments> requires FieldPath<Segments...>
[[nodiscard]] std::string CreateInvalidValueMessage(Segments const&... segments)
{
    return fmt::format("The value provided for '{}' is not supported.", JoinFieldPath(segments...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Segments> requires FieldPath<Segments...>
[[nodiscard]] std::string CreateOutOfRangeMessage(std::string_view range, Segments const&... segments)
{
    return fmt::format("The value provided for '{}' must be within {}.", JoinFieldPath(segments...), range);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Segments> requires FieldPath<Segments...>
[[nodiscard]] std::string CreateOrderingMessage(
    std::string_view lesser, std::string_view greater, Segments const&... segments)
{
    auto const group = JoinFieldPath(segments...);
    return fmt::format("Expected '{}.{}' to be greater than '{}.{}'.", group, greater, group, lesser);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
