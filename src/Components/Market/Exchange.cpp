//----------------------------------------------------------------------------------------------------------------------
// File: Exchange.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Exchange.hpp"
#include "Pricing.hpp"
#include "Utilities/CryptoUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cassert>
#include <iterator>
#include <map>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t IdentifierBytes = 16;

[[nodiscard]] std::optional<std::string> GenerateIdentifier();
[[nodiscard]] Mesh::Result Validate(Market::Offer const& offer);
[[nodiscard]] Mesh::Result Validate(Market::Request const& request);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Market::Exchange::Exchange(double maxDemandFactor, bool dynamicPricing)
    : m_logger(spdlog::get(Logger::Name::Market.data()))
    , m_maxDemandFactor(maxDemandFactor)
    , m_dynamicPricing(dynamicPricing)
    , m_offersMutex()
    , m_offers()
    , m_requestsMutex()
    , m_requests()
    , m_agreementsMutex()
    , m_agreements()
    , m_usageMutex()
    , m_usage()
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<std::string> Market::Exchange::SubmitOffer(Offer offer, TimeUtils::Timepoint now)
{
    if (auto const result = local::Validate(offer); !result) { return result; }
    if (offer.IsExpired(now)) { return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "offer has already expired" }; }

    if (offer.identifier.empty()) {
        auto optIdentifier = local::GenerateIdentifier();
        if (!optIdentifier) {
            return Mesh::Result{ Mesh::ErrorCode::InvalidState, "unable to generate an offer identifier" };
        }
        offer.identifier = std::move(*optIdentifier);
    }

    std::string identifier = offer.identifier;
    {
        std::scoped_lock lock(m_offersMutex);
        m_logger->debug(
            "Queued offer {} of {} {} at {} per unit-hour.",
            identifier, offer.amount, Asset::ToString(offer.type), offer.price);
        m_offers.emplace_back(std::move(offer));
    }

    Match(now);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<std::vector<Market::Offer>> Market::Exchange::SubmitRequest(Request request, TimeUtils::Timepoint now)
{
    if (auto const result = local::Validate(request); !result) { return result; }
    if (request.IsExpired(now)) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "request has already expired" };
    }

    if (request.identifier.empty()) {
        auto optIdentifier = local::GenerateIdentifier();
        if (!optIdentifier) {
            return Mesh::Result{ Mesh::ErrorCode::InvalidState, "unable to generate a request identifier" };
        }
        request.identifier = std::move(*optIdentifier);
    }

    std::vector<Offer> compatible;
    {
        std::shared_lock lock(m_offersMutex);
        std::ranges::copy_if(m_offers, std::back_inserter(compatible), [&request, &now] (Offer const& offer) {
            return offer.type == request.type && offer.price <= request.maxPrice && !offer.IsExpired(now);
        });
    }

    {
        std::scoped_lock lock(m_requestsMutex);
        m_logger->debug(
            "Queued request {} for {} {} up to {} per unit-hour.",
            request.identifier, request.amount, Asset::ToString(request.type), request.maxPrice);
        m_requests.emplace_back(std::move(request));
    }

    Match(now);
    return compatible;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::Agreement> Market::Exchange::Match(TimeUtils::Timepoint now)
{
    std::vector<Agreement> created;
    {
        std::scoped_lock lock(m_requestsMutex, m_offersMutex);

        // Demand is measured against the queues as they stood before this round of matching.
        std::map<Asset::Type, std::pair<std::size_t, std::size_t>> demand;
        for (auto const& request : m_requests) { ++demand[request.type].first; }
        for (auto const& offer : m_offers) { ++demand[offer.type].second; }

        for (auto requestItr = m_requests.begin(); requestItr != m_requests.end();) {
            auto const& request = *requestItr;
            auto const offerItr = std::ranges::find_if(m_offers, [&request, &now] (Offer const& offer) {
                return IsCompatible(offer, request, now);
            });

            if (offerItr == m_offers.end()) { ++requestItr; continue; }

            auto optIdentifier = local::GenerateIdentifier();
            if (!optIdentifier) {
                m_logger->error("Unable to generate an agreement identifier for request {}.", request.identifier);
                ++requestItr;
                continue;
            }

            auto const& [requests, offers] = demand[request.type];
            double const factor = m_dynamicPricing ?
                Pricing::DemandFactor(requests, offers, m_maxDemandFactor) : Pricing::MinimumDemandFactor;

            Agreement agreement{
                .identifier = std::move(*optIdentifier),
                .offer = offerItr->identifier,
                .request = request.identifier,
                .provider = offerItr->provider,
                .consumer = request.consumer,
                .type = request.type,
                .amount = request.amount,
                .rate = offerItr->price,
                .price = Pricing::Calculate(
                    offerItr->pricing, offerItr->price, request.amount, request.duration, factor),
                .demandFactor = factor,
                .pricing = offerItr->pricing,
                .serviceLevel = offerItr->serviceLevel,
                .started = now,
                .duration = request.duration,
                .status = AgreementStatus::Active,
                .dispute = {}
            };

            m_logger->info(
                "Matched request {} with offer {}. [agreement={}, price={:.4f}]",
                agreement.request, agreement.offer, agreement.identifier, agreement.price);

            offerItr->amount -= request.amount;
            if (offerItr->amount <= 0.0) { m_offers.erase(offerItr); }
            requestItr = m_requests.erase(requestItr);

            created.emplace_back(std::move(agreement));
        }
    }

    if (!created.empty()) {
        std::scoped_lock lock(m_agreementsMutex);
        m_agreements.insert(m_agreements.end(), created.begin(), created.end());
    }

    return created;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Market::Exchange::CancelAgreement(std::string const& identifier)
{
    return Transition(identifier, AgreementStatus::Cancelled);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Market::Exchange::CompleteAgreement(std::string const& identifier)
{
    return Transition(identifier, AgreementStatus::Completed);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Market::Exchange::DisputeAgreement(std::string const& identifier, std::string const& reason)
{
    if (auto const result = Transition(identifier, AgreementStatus::Disputed); !result) { return result; }

    std::scoped_lock lock(m_agreementsMutex);
    auto const itr = std::ranges::find(m_agreements, identifier, &Agreement::identifier);
    if (itr != m_agreements.end()) { itr->dispute = reason; }
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Market::UsageRecord> Market::Exchange::RecordUsage(
    std::string const& identifier, double amount, Duration duration, TimeUtils::Timepoint now)
{
    if (amount < 0.0 || duration.count() < 0) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "usage must not be negative" };
    }

    auto const optAgreement = FetchAgreement(identifier);
    if (!optAgreement) {
        return Mesh::Result{ Mesh::ErrorCode::NotFound, fmt::format("agreement {} does not exist", identifier) };
    }

    if (optAgreement->status != AgreementStatus::Active) {
        return Mesh::Result{
            Mesh::ErrorCode::InvalidState,
            fmt::format("agreement {} is {}", identifier, ToString(optAgreement->status)) };
    }

    UsageRecord record{
        .agreement = identifier,
        .recorded = now,
        .amount = amount,
        .duration = duration,
        .cost = Pricing::Calculate(
            optAgreement->pricing, optAgreement->rate, amount, duration, optAgreement->demandFactor)
    };

    {
        std::scoped_lock lock(m_usageMutex);
        m_usage.emplace_back(record);
    }

    return record;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Market::Exchange::PurgeExpired(TimeUtils::Timepoint now)
{
    std::size_t purged = 0;
    {
        std::scoped_lock lock(m_offersMutex);
        purged += std::erase_if(m_offers, [&now] (Offer const& offer) { return offer.IsExpired(now); });
    }

    {
        std::scoped_lock lock(m_requestsMutex);
        purged += std::erase_if(m_requests, [&now] (Request const& request) { return request.IsExpired(now); });
    }

    if (purged != 0) { m_logger->debug("Purged {} expired market entries.", purged); }
    return purged;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::Offer> Market::Exchange::Offers() const
{
    std::shared_lock lock(m_offersMutex);
    return { m_offers.begin(), m_offers.end() };
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::Request> Market::Exchange::Requests() const
{
    std::shared_lock lock(m_requestsMutex);
    return { m_requests.begin(), m_requests.end() };
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::Agreement> Market::Exchange::Agreements() const
{
    std::shared_lock lock(m_agreementsMutex);
    return m_agreements;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Market::Agreement> Market::Exchange::FetchAgreement(std::string const& identifier) const
{
    std::shared_lock lock(m_agreementsMutex);
    auto const itr = std::ranges::find(m_agreements, identifier, &Agreement::identifier);
    if (itr == m_agreements.end()) { return {}; }
    return *itr;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::UsageRecord> Market::Exchange::Usage(std::string const& identifier) const
{
    std::vector<UsageRecord> records;
    std::shared_lock lock(m_usageMutex);
    std::ranges::copy_if(m_usage, std::back_inserter(records), [&identifier] (UsageRecord const& record) {
        return record.agreement == identifier;
    });
    return records;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Market::Exchange::OfferCount() const
{
    std::shared_lock lock(m_offersMutex);
    return m_offers.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Market::Exchange::RequestCount() const
{
    std::shared_lock lock(m_requestsMutex);
    return m_requests.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Market::Exchange::IsCompatible(Offer const& offer, Request const& request, TimeUtils::Timepoint now)
{
    return offer.type == request.type &&
        request.maxPrice >= offer.price &&
        !offer.IsExpired(now) && !request.IsExpired(now) &&
        offer.amount >= request.amount &&
        request.duration >= offer.minCommitment && request.duration <= offer.maxCommitment &&
        offer.serviceLevel.Satisfies(request.minimumService);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Market::Exchange::Transition(std::string const& identifier, AgreementStatus status)
{
    std::scoped_lock lock(m_agreementsMutex);
    auto const itr = std::ranges::find(m_agreements, identifier, &Agreement::identifier);
    if (itr == m_agreements.end()) {
        return Mesh::Result{ Mesh::ErrorCode::NotFound, fmt::format("agreement {} does not exist", identifier) };
    }

    if (!IsTransitionAllowed(itr->status, status)) {
        return Mesh::Result{
            Mesh::ErrorCode::InvalidState,
            fmt::format(
                "agreement {} can not move from {} to {}", identifier, ToString(itr->status), ToString(status)) };
    }

    m_logger->info("Agreement {} is now {}.", identifier, ToString(status));
    itr->status = status;
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::GenerateIdentifier()
{
    std::array<std::uint8_t, IdentifierBytes> bytes{ 0 };
    if (!CryptoUtils::FillRandom(bytes)) { return {}; }
    return CryptoUtils::ToHex(bytes);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result local::Validate(Market::Offer const& offer)
{
    if (offer.amount <= 0.0) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "offer amount must be positive" };
    }
    if (offer.price < 0.0) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "offer price must not be negative" };
    }
    if (offer.minCommitment > offer.maxCommitment) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "offer commitment bounds are inverted" };
    }
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result local::Validate(Market::Request const& request)
{
    if (request.amount <= 0.0) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "request amount must be positive" };
    }
    if (request.maxPrice < 0.0) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "request price must not be negative" };
    }
    if (request.duration.count() <= 0) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "request duration must be positive" };
    }
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------
