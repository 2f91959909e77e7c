//----------------------------------------------------------------------------------------------------------------------
// File: Field.hpp
// Description: Named configuration values. Each field carries its own validator and knows whether it still holds
// the default, so that only values that differ from the defaults are written back.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <chrono>
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename T>
concept FieldNameTag = requires(T t)
{
    { static_cast<std::string_view>(t) } -> std::same_as<std::string_view>;
};

// Durations are written as a count and a unit postfix, "ms", "s", "min", or "h" (e.g. "250ms", "2min").
[[nodiscard]] std::optional<std::chrono::milliseconds> ParseDuration(std::string_view value);
[[nodiscard]] std::string FormatDuration(std::chrono::milliseconds const& value);

template<std::size_t Size> struct SnakeCaseName;

template<FieldNameTag NameTag, typename ValueType> class Field;
template<FieldNameTag NameTag> class DurationField;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The snake case form of a camel case identifier, computed at compile time (e.g. MaxDemandFactor becomes
// max_demand_factor). An underscore is only inserted where a capital letter follows a lowercase one.
//----------------------------------------------------------------------------------------------------------------------
template<std::size_t Size>
struct Configuration::SnakeCaseName
{
    constexpr explicit SnakeCaseName(char const (&identifier)[Size])
    {
        auto const IsUpper = [] (char c) { return c >= 'A' && c <= 'Z'; };
        auto const IsLower = [] (char c) { return c >= 'a' && c <= 'z'; };
        for (std::size_t idx = 0; idx + 1 < Size; ++idx) {
            char const current = identifier[idx];
            if (!IsUpper(current)) { characters[length++] = current; continue; }
            if (idx != 0 && IsLower(identifier[idx - 1])) { characters[length++] = '_'; }
            characters[length++] = static_cast<char>(current - 'A' + 'a');
        }
    }

    [[nodiscard]] constexpr std::string_view View() const { return { characters.data(), length }; }

    std::array<char, Size * 2> characters{};
    std::size_t length = 0;
};

// Declares a tag type whose field name is the snake case form of the provided identifier.
#define DEFINE_FIELD_NAME(identifier) \
    struct identifier { \
        static constexpr Configuration::SnakeCaseName<sizeof(#identifier)> Name{ #identifier }; \
        constexpr operator std::string_view() const { return Name.View(); } \
    }

//----------------------------------------------------------------------------------------------------------------------

template<Configuration::FieldNameTag NameTag, typename ValueType>
class Configuration::Field
{
public:
    using FieldType = ValueType;
    using Validator = std::function<bool(FieldType const&)>;

    explicit Field(FieldType const& value, Validator const& validator = {})
        : m_value(value)
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(Field const& other) const { return m_value == other.m_value; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return NameTag{}; }

    [[nodiscard]] FieldType const& GetValue() const { return m_value; }
    [[nodiscard]] bool WouldMatchDefault(FieldType const& fallback) const { return m_value == fallback; }

    [[nodiscard]] bool SetValueFromConfig(FieldType const& value)
    {
        if (m_validator && !m_validator(value)) { return false; }
        m_value = value;
        return true;
    }

private:
    FieldType m_value;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: A field holding an interval or timeout, stored in the file in its textual form (e.g. "30s").
//----------------------------------------------------------------------------------------------------------------------
template<Configuration::FieldNameTag NameTag>
class Configuration::DurationField : public Configuration::Field<NameTag, std::chrono::milliseconds>
{
public:
    using Field<NameTag, std::chrono::milliseconds>::Field;
    using Field<NameTag, std::chrono::milliseconds>::SetValueFromConfig;

    [[nodiscard]] std::string GetSerializedValue() const { return FormatDuration(this->GetValue()); }

    [[nodiscard]] bool SetValueFromConfig(std::string_view serialized)
    {
        auto const optValue = ParseDuration(serialized);
        return optValue && SetValueFromConfig(*optValue);
    }
};

//----------------------------------------------------------------------------------------------------------------------
