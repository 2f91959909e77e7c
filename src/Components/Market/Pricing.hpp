//----------------------------------------------------------------------------------------------------------------------
// File: Pricing.hpp
// Description: Converts an agreed rate into the price of a commitment or of a period of recorded usage.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MarketTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Market::Pricing {
//----------------------------------------------------------------------------------------------------------------------

constexpr double MinimumDemandFactor = 1.0;
constexpr double UsageDiscount = 0.8;

// Fixed is rate * amount * hours. Dynamic scales the fixed price by the demand factor and usage based pricing applies
// the usage discount.
[[nodiscard]] double Calculate(
    PricingModel model, double rate, double amount, Duration duration, double demandFactor = MinimumDemandFactor);

// The ratio of open requests to open offers, bounded to [1.0, maximum]. Without any offers the maximum applies.
[[nodiscard]] double DemandFactor(std::size_t requests, std::size_t offers, double maximum);

//----------------------------------------------------------------------------------------------------------------------
} // Market::Pricing namespace
//----------------------------------------------------------------------------------------------------------------------
