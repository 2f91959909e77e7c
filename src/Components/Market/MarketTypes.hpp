//----------------------------------------------------------------------------------------------------------------------
// File: MarketTypes.hpp
// Description: The offers, requests, and agreements exchanged when nodes trade spare capacity.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Market {
//----------------------------------------------------------------------------------------------------------------------

using Duration = std::chrono::milliseconds;

enum class PricingModel : std::uint8_t { Fixed, Dynamic, UsageBased };

enum class AgreementStatus : std::uint8_t { Pending, Active, Completed, Cancelled, Disputed };

struct ServiceLevel;
struct Offer;
struct Request;
struct Agreement;
struct UsageRecord;

[[nodiscard]] bool IsTransitionAllowed(AgreementStatus from, AgreementStatus to);

[[nodiscard]] std::string_view ToString(PricingModel model);
[[nodiscard]] std::string_view ToString(AgreementStatus status);

//----------------------------------------------------------------------------------------------------------------------
} // Market namespace
//----------------------------------------------------------------------------------------------------------------------

struct Market::ServiceLevel
{
    // Returns true when this level is at least as good as the required one in every dimension.
    [[nodiscard]] bool Satisfies(ServiceLevel const& required) const;

    double availability = 0.0;
    Duration maxLatency = Duration::max();
    std::uint64_t minThroughputMbps = 0;
};

//----------------------------------------------------------------------------------------------------------------------

struct Market::Offer
{
    [[nodiscard]] bool IsExpired(TimeUtils::Timepoint now) const { return now >= expires; }

    std::string identifier;
    Node::Identifier provider;
    Asset::Type type = Asset::Type::Cpu;
    double amount = 0.0;
    double price = 0.0; // Per unit-hour.
    Duration minCommitment{ 0 };
    Duration maxCommitment = Duration::max();
    ServiceLevel serviceLevel;
    PricingModel pricing = PricingModel::Fixed;
    TimeUtils::Timepoint expires = TimeUtils::Timepoint::max();
};

//----------------------------------------------------------------------------------------------------------------------

struct Market::Request
{
    [[nodiscard]] bool IsExpired(TimeUtils::Timepoint now) const { return now >= expires; }

    std::string identifier;
    Node::Identifier consumer;
    Asset::Type type = Asset::Type::Cpu;
    double amount = 0.0;
    double maxPrice = 0.0; // Per unit-hour.
    Duration duration{ 0 };
    ServiceLevel minimumService;
    TimeUtils::Timepoint expires = TimeUtils::Timepoint::max();
};

//----------------------------------------------------------------------------------------------------------------------

struct Market::Agreement
{
    std::string identifier;
    std::string offer;
    std::string request;
    Node::Identifier provider;
    Node::Identifier consumer;
    Asset::Type type = Asset::Type::Cpu;
    double amount = 0.0;
    double rate = 0.0;
    double price = 0.0;
    double demandFactor = 1.0;
    PricingModel pricing = PricingModel::Fixed;
    ServiceLevel serviceLevel;
    TimeUtils::Timepoint started;
    Duration duration{ 0 };
    AgreementStatus status = AgreementStatus::Pending;
    std::optional<std::string> dispute;
};

//----------------------------------------------------------------------------------------------------------------------

struct Market::UsageRecord
{
    std::string agreement;
    TimeUtils::Timepoint recorded;
    double amount = 0.0;
    Duration duration{ 0 };
    double cost = 0.0;
};

//----------------------------------------------------------------------------------------------------------------------
