//----------------------------------------------------------------------------------------------------------------------
// File: MarketTypes.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "MarketTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

bool Market::ServiceLevel::Satisfies(ServiceLevel const& required) const
{
    return availability >= required.availability &&
        maxLatency <= required.maxLatency &&
        minThroughputMbps >= required.minThroughputMbps;
}

//----------------------------------------------------------------------------------------------------------------------

bool Market::IsTransitionAllowed(AgreementStatus from, AgreementStatus to)
{
    switch (from) {
        case AgreementStatus::Pending:
            return to == AgreementStatus::Active || to == AgreementStatus::Cancelled;
        case AgreementStatus::Active:
            return to == AgreementStatus::Completed ||
                to == AgreementStatus::Cancelled ||
                to == AgreementStatus::Disputed;
        default: break;
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Market::ToString(PricingModel model)
{
    switch (model) {
        case PricingModel::Fixed: return "fixed";
        case PricingModel::Dynamic: return "dynamic";
        case PricingModel::UsageBased: return "usage-based";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Market::ToString(AgreementStatus status)
{
    switch (status) {
        case AgreementStatus::Pending: return "pending";
        case AgreementStatus::Active: return "active";
        case AgreementStatus::Completed: return "completed";
        case AgreementStatus::Cancelled: return "cancelled";
        case AgreementStatus::Disputed: return "disputed";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
