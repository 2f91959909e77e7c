//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The option groups read from the coordinator's configuration file. Each group merges its own section of
// the file, validates itself, and writes back the values that differ from the defaults.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Heartbeat;
class Detection;
class Balancing;
class Migration;
class Market;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(AutoMigration);
DEFINE_FIELD_NAME(Balancing);
DEFINE_FIELD_NAME(ByzantineInterval);
DEFINE_FIELD_NAME(ByzantineThreshold);
DEFINE_FIELD_NAME(DeviationThreshold);
DEFINE_FIELD_NAME(Detection);
DEFINE_FIELD_NAME(Enabled);
DEFINE_FIELD_NAME(FailureTimeout);
DEFINE_FIELD_NAME(Heartbeat);
DEFINE_FIELD_NAME(Interval);
DEFINE_FIELD_NAME(Market);
DEFINE_FIELD_NAME(MatchingInterval);
DEFINE_FIELD_NAME(MaxDemandFactor);
DEFINE_FIELD_NAME(Migration);
DEFINE_FIELD_NAME(PartitionInterval);
DEFINE_FIELD_NAME(PreferLive);
DEFINE_FIELD_NAME(PricingEnabled);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The cadence of liveness checks and the silence after which a node is considered failed.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Heartbeat
{
public:
    static constexpr std::string_view Symbol = Symbols::Heartbeat{};

    Heartbeat();
    Heartbeat(std::chrono::milliseconds const& interval, std::chrono::milliseconds const& failureTimeout);

    [[nodiscard]] bool operator==(Heartbeat const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::milliseconds const& GetInterval() const;
    [[nodiscard]] std::chrono::milliseconds const& GetFailureTimeout() const;

private:
    DurationField<Symbols::Interval> m_interval;
    DurationField<Symbols::FailureTimeout> m_failureTimeout;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The cadence and sensitivity of the partition and byzantine detectors.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Detection
{
public:
    static constexpr std::string_view Symbol = Symbols::Detection{};

    Detection();

    [[nodiscard]] bool operator==(Detection const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::milliseconds const& GetPartitionInterval() const;
    [[nodiscard]] std::chrono::milliseconds const& GetByzantineInterval() const;
    [[nodiscard]] double GetByzantineThreshold() const;

private:
    DurationField<Symbols::PartitionInterval> m_partitionInterval;
    DurationField<Symbols::ByzantineInterval> m_byzantineInterval;
    Field<Symbols::ByzantineThreshold, double> m_byzantineThreshold;
};

//----------------------------------------------------------------------------------------------------------------------

class Configuration::Options::Balancing
{
public:
    static constexpr std::string_view Symbol = Symbols::Balancing{};

    Balancing();

    [[nodiscard]] bool operator==(Balancing const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] bool IsEnabled() const;
    [[nodiscard]] std::chrono::milliseconds const& GetInterval() const;
    [[nodiscard]] double GetDeviationThreshold() const;

private:
    Field<Symbols::Enabled, bool> m_enabled;
    DurationField<Symbols::Interval> m_interval;
    Field<Symbols::DeviationThreshold, double> m_deviationThreshold;
};

//----------------------------------------------------------------------------------------------------------------------

class Configuration::Options::Migration
{
public:
    static constexpr std::string_view Symbol = Symbols::Migration{};

    Migration();
    Migration(bool autoMigration, bool preferLive);

    [[nodiscard]] bool operator==(Migration const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] bool UseAutoMigration() const;
    [[nodiscard]] bool PreferLive() const;

private:
    Field<Symbols::AutoMigration, bool> m_autoMigration;
    Field<Symbols::PreferLive, bool> m_preferLive;
};

//----------------------------------------------------------------------------------------------------------------------

class Configuration::Options::Market
{
public:
    static constexpr std::string_view Symbol = Symbols::Market{};

    Market();

    [[nodiscard]] bool operator==(Market const& other) const noexcept;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] bool IsPricingEnabled() const;
    [[nodiscard]] std::chrono::milliseconds const& GetMatchingInterval() const;
    [[nodiscard]] double GetMaxDemandFactor() const;

private:
    Field<Symbols::PricingEnabled, bool> m_pricingEnabled;
    DurationField<Symbols::MatchingInterval> m_matchingInterval;
    Field<Symbols::MaxDemandFactor, double> m_maxDemandFactor;
};

//----------------------------------------------------------------------------------------------------------------------
