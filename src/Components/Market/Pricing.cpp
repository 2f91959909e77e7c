//----------------------------------------------------------------------------------------------------------------------
// File: Pricing.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Pricing.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
//----------------------------------------------------------------------------------------------------------------------

double Market::Pricing::Calculate(
    PricingModel model, double rate, double amount, Duration duration, double demandFactor)
{
    double const fixed = rate * amount * TimeUtils::ToHours(duration);
    switch (model) {
        case PricingModel::Fixed: return fixed;
        case PricingModel::Dynamic: return fixed * demandFactor;
        case PricingModel::UsageBased: return fixed * UsageDiscount;
    }
    return fixed;
}

//----------------------------------------------------------------------------------------------------------------------

double Market::Pricing::DemandFactor(std::size_t requests, std::size_t offers, double maximum)
{
    double const upper = std::max(maximum, MinimumDemandFactor);
    if (offers == 0) { return upper; }
    double const ratio = static_cast<double>(requests) / static_cast<double>(offers);
    return std::clamp(ratio, MinimumDemandFactor, upper);
}

//----------------------------------------------------------------------------------------------------------------------
