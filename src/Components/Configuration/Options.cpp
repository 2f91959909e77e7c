//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string.hpp>
#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using namespace Configuration;

constexpr std::string_view FractionRange = "[0.0, 1.0]";

[[nodiscard]] bool IsAllowableInterval(std::chrono::milliseconds const& value);
[[nodiscard]] bool IsFraction(double value);

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
[[nodiscard]] DeserializationResult MergeDuration(
    boost::json::object const& json, std::string_view section, FieldType& field)
{
    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_string()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", section, field.GetFieldName()) };
    }

    auto const& value = itr->value().get_string();
    if (!field.SetValueFromConfig(std::string_view{ value.data(), value.size() })) {
        return { StatusCode::InputError, CreateInvalidValueMessage(section, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
[[nodiscard]] DeserializationResult MergeNumber(
    boost::json::object const& json, std::string_view section, FieldType& field, std::string_view range)
{
    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    double number = 0.0;
    auto const& value = itr->value();
    switch (value.kind()) {
        case boost::json::kind::double_: number = value.get_double(); break;
        case boost::json::kind::int64: number = static_cast<double>(value.get_int64()); break;
        case boost::json::kind::uint64: number = static_cast<double>(value.get_uint64()); break;
        default:
            return {
                StatusCode::DecodeError, CreateMismatchedValueTypeMessage("number", section, field.GetFieldName())
            };
    }

    if (!field.SetValueFromConfig(number)) {
        return { StatusCode::InputError, CreateOutOfRangeMessage(range, section, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
[[nodiscard]] DeserializationResult MergeBoolean(
    boost::json::object const& json, std::string_view section, FieldType& field)
{
    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_bool()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("boolean", section, field.GetFieldName()) };
    }

    [[maybe_unused]] bool const success = field.SetValueFromConfig(itr->value().get_bool());
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

void WriteGroup(boost::json::object& json, std::string_view symbol, boost::json::object&& group);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Heartbeat::Heartbeat()
    : Heartbeat(Defaults::HeartbeatInterval, Defaults::FailureTimeout)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Heartbeat::Heartbeat(
    std::chrono::milliseconds const& interval, std::chrono::milliseconds const& failureTimeout)
    : m_interval(interval, local::IsAllowableInterval)
    , m_failureTimeout(failureTimeout, local::IsAllowableInterval)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Heartbeat::operator==(Heartbeat const& other) const noexcept
{
    return m_interval == other.m_interval && m_failureTimeout == other.m_failureTimeout;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Heartbeat::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "heartbeat": {
    //     "interval": Optional String,
    //     "failure_timeout": Optional String
    // },
    if (auto const status = local::MergeDuration(json, Symbol, m_interval); status.first != StatusCode::Success) {
        return status;
    }

    return local::MergeDuration(json, Symbol, m_failureTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Heartbeat::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (!m_interval.WouldMatchDefault(Defaults::HeartbeatInterval)) {
        group[m_interval.GetFieldName()] = m_interval.GetSerializedValue();
    }
    if (!m_failureTimeout.WouldMatchDefault(Defaults::FailureTimeout)) {
        group[m_failureTimeout.GetFieldName()] = m_failureTimeout.GetSerializedValue();
    }
    local::WriteGroup(json, Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Heartbeat::AreOptionsAllowable() const
{
    // A node must be allowed to miss at least one heartbeat before being considered failed.
    if (m_failureTimeout.GetValue() <= m_interval.GetValue()) {
        return {
            StatusCode::InputError,
            CreateOrderingMessage(m_interval.GetFieldName(), m_failureTimeout.GetFieldName(), Symbol)
        };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Heartbeat::GetInterval() const
{
    return m_interval.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Heartbeat::GetFailureTimeout() const
{
    return m_failureTimeout.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Detection::Detection()
    : m_partitionInterval(Defaults::PartitionInterval, local::IsAllowableInterval)
    , m_byzantineInterval(Defaults::ByzantineInterval, local::IsAllowableInterval)
    , m_byzantineThreshold(Defaults::ByzantineThreshold, local::IsFraction)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Detection::operator==(Detection const& other) const noexcept
{
    return m_partitionInterval == other.m_partitionInterval &&
           m_byzantineInterval == other.m_byzantineInterval &&
           m_byzantineThreshold == other.m_byzantineThreshold;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Detection::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "detection": {
    //     "partition_interval": Optional String,
    //     "byzantine_interval": Optional String,
    //     "byzantine_threshold": Optional Number
    // },
    if (auto status = local::MergeDuration(json, Symbol, m_partitionInterval); status.first != StatusCode::Success) {
        return status;
    }

    if (auto status = local::MergeDuration(json, Symbol, m_byzantineInterval); status.first != StatusCode::Success) {
        return status;
    }

    return local::MergeNumber(json, Symbol, m_byzantineThreshold, local::FractionRange);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Detection::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (!m_partitionInterval.WouldMatchDefault(Defaults::PartitionInterval)) {
        group[m_partitionInterval.GetFieldName()] = m_partitionInterval.GetSerializedValue();
    }
    if (!m_byzantineInterval.WouldMatchDefault(Defaults::ByzantineInterval)) {
        group[m_byzantineInterval.GetFieldName()] = m_byzantineInterval.GetSerializedValue();
    }
    if (!m_byzantineThreshold.WouldMatchDefault(Defaults::ByzantineThreshold)) {
        group[m_byzantineThreshold.GetFieldName()] = m_byzantineThreshold.GetValue();
    }
    local::WriteGroup(json, Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Detection::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" }; // Each field is range checked as it is set.
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Detection::GetPartitionInterval() const
{
    return m_partitionInterval.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Detection::GetByzantineInterval() const
{
    return m_byzantineInterval.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

double Configuration::Options::Detection::GetByzantineThreshold() const { return m_byzantineThreshold.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Balancing::Balancing()
    : m_enabled(Defaults::BalancingEnabled)
    , m_interval(Defaults::BalancingInterval, local::IsAllowableInterval)
    , m_deviationThreshold(Defaults::DeviationThreshold, local::IsFraction)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Balancing::operator==(Balancing const& other) const noexcept
{
    return m_enabled == other.m_enabled &&
           m_interval == other.m_interval &&
           m_deviationThreshold == other.m_deviationThreshold;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Balancing::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "balancing": {
    //     "enabled": Optional Boolean,
    //     "interval": Optional String,
    //     "deviation_threshold": Optional Number
    // },
    if (auto const status = local::MergeBoolean(json, Symbol, m_enabled); status.first != StatusCode::Success) {
        return status;
    }

    if (auto const status = local::MergeDuration(json, Symbol, m_interval); status.first != StatusCode::Success) {
        return status;
    }

    return local::MergeNumber(json, Symbol, m_deviationThreshold, local::FractionRange);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Balancing::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (!m_enabled.WouldMatchDefault(Defaults::BalancingEnabled)) {
        group[m_enabled.GetFieldName()] = m_enabled.GetValue();
    }
    if (!m_interval.WouldMatchDefault(Defaults::BalancingInterval)) {
        group[m_interval.GetFieldName()] = m_interval.GetSerializedValue();
    }
    if (!m_deviationThreshold.WouldMatchDefault(Defaults::DeviationThreshold)) {
        group[m_deviationThreshold.GetFieldName()] = m_deviationThreshold.GetValue();
    }
    local::WriteGroup(json, Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Balancing::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Balancing::IsEnabled() const { return m_enabled.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Balancing::GetInterval() const
{
    return m_interval.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

double Configuration::Options::Balancing::GetDeviationThreshold() const { return m_deviationThreshold.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Migration::Migration()
    : Migration(Defaults::AutoMigration, Defaults::PreferLiveMigration)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Migration::Migration(bool autoMigration, bool preferLive)
    : m_autoMigration(autoMigration)
    , m_preferLive(preferLive)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Migration::operator==(Migration const& other) const noexcept
{
    return m_autoMigration == other.m_autoMigration && m_preferLive == other.m_preferLive;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Migration::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "migration": {
    //     "auto_migration": Optional Boolean,
    //     "prefer_live": Optional Boolean
    // },
    if (auto const status = local::MergeBoolean(json, Symbol, m_autoMigration); status.first != StatusCode::Success) {
        return status;
    }

    return local::MergeBoolean(json, Symbol, m_preferLive);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Migration::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (!m_autoMigration.WouldMatchDefault(Defaults::AutoMigration)) {
        group[m_autoMigration.GetFieldName()] = m_autoMigration.GetValue();
    }
    if (!m_preferLive.WouldMatchDefault(Defaults::PreferLiveMigration)) {
        group[m_preferLive.GetFieldName()] = m_preferLive.GetValue();
    }
    local::WriteGroup(json, Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Migration::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" };  // There are no requirements for this set of options.
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Migration::UseAutoMigration() const { return m_autoMigration.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Migration::PreferLive() const { return m_preferLive.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Market::Market()
    : m_pricingEnabled(Defaults::PricingEnabled)
    , m_matchingInterval(Defaults::MatchingInterval, local::IsAllowableInterval)
    , m_maxDemandFactor(Defaults::MaxDemandFactor, [] (double value) { return value >= 1.0; })
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Market::operator==(Market const& other) const noexcept
{
    return m_pricingEnabled == other.m_pricingEnabled &&
           m_matchingInterval == other.m_matchingInterval &&
           m_maxDemandFactor == other.m_maxDemandFactor;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Market::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "market": {
    //     "pricing_enabled": Optional Boolean,
    //     "matching_interval": Optional String,
    //     "max_demand_factor": Optional Number
    // },
    if (auto const status = local::MergeBoolean(json, Symbol, m_pricingEnabled); status.first != StatusCode::Success) {
        return status;
    }

    if (auto status = local::MergeDuration(json, Symbol, m_matchingInterval); status.first != StatusCode::Success) {
        return status;
    }

    return local::MergeNumber(json, Symbol, m_maxDemandFactor, "[1.0, inf)");
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Market::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (!m_pricingEnabled.WouldMatchDefault(Defaults::PricingEnabled)) {
        group[m_pricingEnabled.GetFieldName()] = m_pricingEnabled.GetValue();
    }
    if (!m_matchingInterval.WouldMatchDefault(Defaults::MatchingInterval)) {
        group[m_matchingInterval.GetFieldName()] = m_matchingInterval.GetSerializedValue();
    }
    if (!m_maxDemandFactor.WouldMatchDefault(Defaults::MaxDemandFactor)) {
        group[m_maxDemandFactor.GetFieldName()] = m_maxDemandFactor.GetValue();
    }
    local::WriteGroup(json, Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Market::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Market::IsPricingEnabled() const { return m_pricingEnabled.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Market::GetMatchingInterval() const
{
    return m_matchingInterval.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

double Configuration::Options::Market::GetMaxDemandFactor() const { return m_maxDemandFactor.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::chrono::milliseconds> Configuration::ParseDuration(std::string_view value)
{
    enum class Unit : std::uint32_t { Milliseconds, Seconds, Minutes, Hours };

    static std::array<std::pair<std::string_view, Unit>, 4> const units = {
        std::make_pair("ms", Unit::Milliseconds),
        std::make_pair("s", Unit::Seconds),
        std::make_pair("min", Unit::Minutes),
        std::make_pair("h", Unit::Hours),
    };

    auto const trimmed = boost::algorithm::trim_copy(std::string{ value });

    // Find the first instance of a non-numeric character.
    auto const first = std::ranges::find_if(trimmed, [] (unsigned char c) { return std::isalpha(c); });
    if (first == trimmed.end() || first == trimmed.begin()) { return {}; } // A count and postfix must be provided.

    std::string_view const postfix{ first, trimmed.end() };
    auto const entry = std::ranges::find_if(units, [&postfix] (auto const& unit) {
        return boost::algorithm::iequals(postfix, unit.first);
    });
    if (entry == units.end()) { return {}; }

    try {
        auto count = boost::lexical_cast<std::uint64_t>(trimmed.data(), trimmed.size() - postfix.size());
        switch (entry->second) {
            case Unit::Hours: count *= 60; [[fallthrough]];
            case Unit::Minutes: count *= 60; [[fallthrough]];
            case Unit::Seconds: count *= 1000; [[fallthrough]];
            case Unit::Milliseconds: break;
        }
        return std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(count) };
    } catch (boost::bad_lexical_cast const&) {
        return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::FormatDuration(std::chrono::milliseconds const& value)
{
    using namespace std::chrono_literals;
    static std::array<std::pair<std::chrono::milliseconds, std::string_view>, 3> const units = {
        std::make_pair(std::chrono::milliseconds{ 1h }, "h"),
        std::make_pair(std::chrono::milliseconds{ 1min }, "min"),
        std::make_pair(std::chrono::milliseconds{ 1s }, "s"),
    };

    // Use the largest unit that represents the value exactly.
    for (auto const& [unit, postfix] : units) {
        if (value.count() != 0 && value.count() % unit.count() == 0) {
            return std::to_string(value.count() / unit.count()).append(postfix);
        }
    }

    return std::to_string(value.count()).append("ms");
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsAllowableInterval(std::chrono::milliseconds const& value)
{
    return value > std::chrono::milliseconds::zero() && value <= std::chrono::hours{ 24 };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsFraction(double value) { return value >= 0.0 && value <= 1.0; }

//----------------------------------------------------------------------------------------------------------------------

void local::WriteGroup(boost::json::object& json, std::string_view symbol, boost::json::object&& group)
{
    if (!group.empty()) { json.emplace(symbol, std::move(group)); }
}

//----------------------------------------------------------------------------------------------------------------------
