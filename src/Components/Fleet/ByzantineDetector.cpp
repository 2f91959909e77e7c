//----------------------------------------------------------------------------------------------------------------------
// File: ByzantineDetector.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ByzantineDetector.hpp"
#include "Components/Asset/StateStore.hpp"
#include "Components/Node/Registry.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <map>
#include <optional>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Returns the status held by a strict majority of the observers other than the excluded node.
[[nodiscard]] std::optional<Asset::Status> FindMajority(
    Asset::ReportMap const& reports, Node::Identifier const& excluded);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Fleet::ByzantineDetector::ByzantineDetector(
    std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider, double threshold)
    : m_spRegistry(spServiceProvider->Fetch<Node::Registry>().lock())
    , m_spStateStore(spServiceProvider->Fetch<Asset::StateStore>().lock())
    , m_spEventPublisher(spServiceProvider->Fetch<Event::Publisher>().lock())
    , m_logger(spdlog::get(Logger::Name::Fleet.data()))
    , m_threshold(threshold)
{
    assert(m_spRegistry);
    assert(m_spStateStore);
    assert(m_spEventPublisher);
    assert(m_logger);
    m_spEventPublisher->Advertise(Event::Type::ByzantineDetected);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Fleet::Assessment> Fleet::ByzantineDetector::Evaluate()
{
    std::vector<Asset::DistributedState> states;
    m_spStateStore->ForEach([&states] (Asset::DistributedState const& state) {
        states.emplace_back(state);
        return CallbackIteration::Continue;
    });

    std::vector<Assessment> assessments;
    for (auto const& info : m_spRegistry->Snapshot()) {
        if (info.status == Node::Status::Failed) { continue; }

        Assessment assessment{ .node = info.identifier };
        for (auto const& state : states) {
            auto const itr = state.reports.find(info.identifier);
            if (itr == state.reports.end()) { continue; }
            ++assessment.observed;

            auto const& [observer, reported] = *itr;
            auto const optMajority = local::FindMajority(state.reports, info.identifier);
            if (optMajority && *optMajority != reported) {
                ++assessment.suspicious;
                assessment.evidence.emplace_back(fmt::format(
                    "asset {} reported as {} while the majority reported {}",
                    state.asset, Asset::ToString(reported), Asset::ToString(*optMajority)));
            }
        }

        if (info.metrics.successRate < MinimumSuccessRate) {
            ++assessment.suspicious;
            assessment.evidence.emplace_back(fmt::format("success rate of {:.2f}", info.metrics.successRate));
        }

        assessment.ratio = static_cast<double>(assessment.suspicious) /
            static_cast<double>(std::max<std::uint32_t>(assessment.observed, 1));
        assessment.flagged = assessment.ratio > m_threshold;

        if (assessment.flagged) {
            auto const exchanged = m_spRegistry->ExchangeStatus(info.identifier, Node::Status::Suspected);
            auto const pPrevious = std::get_if<Node::Status>(&exchanged);
            if (pPrevious && *pPrevious != Node::Status::Suspected) {
                m_logger->warn(
                    "Node {} is suspected of byzantine behavior. [suspicious={}, observed={}, ratio={:.2f}]",
                    info.identifier, assessment.suspicious, assessment.observed, assessment.ratio);
                auto const published = m_spEventPublisher->Publish<Event::Type::ByzantineDetected>(
                    info.identifier, assessment.evidence);
                if (!published) {
                    m_logger->warn(
                        "Unable to publish the suspicion of node {}, the event channel is closed.", info.identifier);
                }
            }
        } else if (info.status == Node::Status::Suspected) {
            // Suspicion is advisory. A node that no longer exceeds the threshold is eligible for placement again.
            auto const exchanged = m_spRegistry->ExchangeStatus(
                info.identifier, Node::Status::Active, Node::Status::Suspected);
            auto const pPrevious = std::get_if<Node::Status>(&exchanged);
            if (pPrevious && *pPrevious == Node::Status::Suspected) {
                m_logger->info("Node {} is no longer suspected of byzantine behavior. [ratio={:.2f}]",
                    info.identifier, assessment.ratio);
            }
        }

        assessments.emplace_back(std::move(assessment));
    }

    return assessments;
}

//----------------------------------------------------------------------------------------------------------------------

double Fleet::ByzantineDetector::GetThreshold() const { return m_threshold; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Asset::Status> local::FindMajority(Asset::ReportMap const& reports, Node::Identifier const& excluded)
{
    std::map<Asset::Status, std::size_t> tally;
    std::size_t others = 0;
    for (auto const& [observer, status] : reports) {
        if (observer == excluded) { continue; }
        ++tally[status];
        ++others;
    }

    for (auto const& [status, count] : tally) {
        if (count * 2 > others) { return status; }
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------
