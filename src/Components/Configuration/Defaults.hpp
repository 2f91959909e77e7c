//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description: The values used for any option absent from the configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

constexpr std::string_view Version = "0.1.0";

constexpr auto HeartbeatInterval = std::chrono::milliseconds{ 10'000 };
constexpr auto FailureTimeout = std::chrono::milliseconds{ 30'000 };

constexpr auto PartitionInterval = std::chrono::milliseconds{ 30'000 };
constexpr auto ByzantineInterval = std::chrono::milliseconds{ 60'000 };
constexpr double ByzantineThreshold = 0.33;

constexpr bool BalancingEnabled = true;
constexpr auto BalancingInterval = std::chrono::milliseconds{ 120'000 };
constexpr double DeviationThreshold = 0.2;

constexpr bool AutoMigration = true;
constexpr bool PreferLiveMigration = true;

constexpr bool PricingEnabled = false;
constexpr auto MatchingInterval = std::chrono::milliseconds{ 5'000 };
constexpr double MaxDemandFactor = 2.0;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
