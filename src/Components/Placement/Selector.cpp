//----------------------------------------------------------------------------------------------------------------------
// File: Selector.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Selector.hpp"
#include "Components/Node/Registry.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] double FreeRatio(double available, double capacity);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Placement::Selector::Selector(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider)
    : m_spRegistry(spServiceProvider->Fetch<Node::Registry>().lock())
    , m_logger(spdlog::get(Logger::Name::Placement.data()))
{
    assert(m_spRegistry);
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Placement::Candidate> Placement::Selector::Select(Asset::Type type, Node::Resources const& demand) const
{
    auto selected = Select(m_spRegistry->Snapshot(), type, demand);
    if (auto const pCandidate = std::get_if<Candidate>(&selected); pCandidate) {
        m_logger->debug(
            "Selected node {} to host a {} allocation. [score={:.4f}]",
            pCandidate->node, Asset::ToString(type), pCandidate->score);
    } else {
        m_logger->warn(
            "Unable to place a {} allocation: {}", Asset::ToString(type), std::get<Mesh::Result>(selected).what());
    }
    return selected;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Placement::Candidate> Placement::Selector::Select(
    std::vector<Node::Info> const& snapshot, Asset::Type type, Node::Resources const& demand)
{
    bool eligible = false;
    std::optional<Candidate> optSelected;
    for (auto const& info : snapshot) {
        if (info.status != Node::Status::Active || !info.capabilities.Supports(type)) { continue; }
        eligible = true;

        if (!info.available.CanFit(demand)) { continue; }

        // Only a strictly better score replaces the current selection, earlier nodes win ties.
        double const score = Score(info);
        if (!optSelected || score > optSelected->score) {
            optSelected = Candidate{ .node = info.identifier, .score = score };
        }
    }

    if (!eligible) { return Mesh::Result{ Mesh::ErrorCode::AllocationFailed, "no eligible node" }; }
    if (!optSelected) { return Mesh::Result{ Mesh::ErrorCode::AllocationFailed, "insufficient resources" }; }
    return *optSelected;
}

//----------------------------------------------------------------------------------------------------------------------

double Placement::Selector::Score(Node::Info const& info)
{
    auto const& available = info.available;
    auto const& capabilities = info.capabilities;

    double const cpu = local::FreeRatio(available.cpuCores, static_cast<double>(capabilities.cpuCores));
    double const memory = local::FreeRatio(
        static_cast<double>(available.memoryBytes), static_cast<double>(capabilities.memoryBytes));
    double const latency = 1.0 / (1.0 + info.metrics.averageResponseMs / 1000.0);

    double const score =
        Weight::Cpu * cpu + Weight::Memory * memory +
        Weight::Reliability * info.metrics.successRate + Weight::Latency * latency;

    return score * info.identifier.GetTrustScore();
}

//----------------------------------------------------------------------------------------------------------------------

double local::FreeRatio(double available, double capacity)
{
    if (capacity <= 0.0) { return 0.0; }
    return available / capacity;
}

//----------------------------------------------------------------------------------------------------------------------
