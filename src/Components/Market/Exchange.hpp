//----------------------------------------------------------------------------------------------------------------------
// File: Exchange.hpp
// Description: Matches requests for capacity against the offers made by providers. Offers and requests are kept in
// first-in first-out order and each queue is guarded separately. A request is consumed by at most one agreement.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MarketTypes.hpp"
#include "Utilities/Result.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Market {
//----------------------------------------------------------------------------------------------------------------------

class Exchange;

//----------------------------------------------------------------------------------------------------------------------
} // Market namespace
//----------------------------------------------------------------------------------------------------------------------

class Market::Exchange final
{
public:
    // When dynamic pricing is disabled every agreement is priced with the minimum demand factor.
    Exchange(double maxDemandFactor, bool dynamicPricing);

    Exchange(Exchange const&) = delete;
    Exchange& operator=(Exchange const&) = delete;

    // Queues the offer and attempts to match the pending requests. Provides the offer's identifier.
    [[nodiscard]] Mesh::Expected<std::string> SubmitOffer(
        Offer offer, TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    // Provides the offers compatible with the request at the time of submission, then queues the request and attempts
    // to match it.
    [[nodiscard]] Mesh::Expected<std::vector<Offer>> SubmitRequest(
        Request request, TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    std::vector<Agreement> Match(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    Mesh::Result CancelAgreement(std::string const& identifier);
    Mesh::Result CompleteAgreement(std::string const& identifier);
    Mesh::Result DisputeAgreement(std::string const& identifier, std::string const& reason);

    [[nodiscard]] Mesh::Expected<UsageRecord> RecordUsage(
        std::string const& identifier,
        double amount,
        Duration duration,
        TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    std::size_t PurgeExpired(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    [[nodiscard]] std::vector<Offer> Offers() const;
    [[nodiscard]] std::vector<Request> Requests() const;
    [[nodiscard]] std::vector<Agreement> Agreements() const;
    [[nodiscard]] std::optional<Agreement> FetchAgreement(std::string const& identifier) const;
    [[nodiscard]] std::vector<UsageRecord> Usage(std::string const& identifier) const;

    [[nodiscard]] std::size_t OfferCount() const;
    [[nodiscard]] std::size_t RequestCount() const;

private:
    [[nodiscard]] static bool IsCompatible(Offer const& offer, Request const& request, TimeUtils::Timepoint now);

    Mesh::Result Transition(std::string const& identifier, AgreementStatus status);

    std::shared_ptr<spdlog::logger> m_logger;
    double const m_maxDemandFactor;
    bool const m_dynamicPricing;

    mutable std::shared_mutex m_offersMutex;
    std::deque<Offer> m_offers;

    mutable std::shared_mutex m_requestsMutex;
    std::deque<Request> m_requests;

    mutable std::shared_mutex m_agreementsMutex;
    std::vector<Agreement> m_agreements;

    mutable std::shared_mutex m_usageMutex;
    std::vector<UsageRecord> m_usage;
};

//----------------------------------------------------------------------------------------------------------------------
