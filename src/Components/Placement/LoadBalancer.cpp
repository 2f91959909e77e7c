//----------------------------------------------------------------------------------------------------------------------
// File: LoadBalancer.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "LoadBalancer.hpp"
#include "Components/Asset/StateStore.hpp"
#include "Components/Node/Registry.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <numeric>
#include <set>
//----------------------------------------------------------------------------------------------------------------------

Placement::LoadBalancer::LoadBalancer(
    std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider,
    double deviationThreshold,
    MigrateFunction const& migrate)
    : m_spRegistry(spServiceProvider->Fetch<Node::Registry>().lock())
    , m_spStateStore(spServiceProvider->Fetch<Asset::StateStore>().lock())
    , m_logger(spdlog::get(Logger::Name::Placement.data()))
    , m_threshold(deviationThreshold)
    , m_migrate(migrate)
{
    assert(m_spRegistry);
    assert(m_spStateStore);
    assert(m_logger);
    assert(m_migrate);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Placement::Move> Placement::LoadBalancer::Plan() const
{
    std::vector<Node::Info> active;
    m_spRegistry->ForEach([&active] (Node::Info const& info) {
        if (info.status == Node::Status::Active) { active.emplace_back(info); }
        return CallbackIteration::Continue;
    });

    if (active.size() < 2) { return {}; }

    double const average = std::accumulate(active.begin(), active.end(), 0.0, [] (double sum, Node::Info const& info) {
        return sum + Load(info);
    }) / static_cast<double>(active.size());

    std::vector<Node::Info> overloaded;
    std::vector<Node::Info> candidates;
    for (auto const& info : active) {
        double const load = Load(info);
        if (load > average + m_threshold) { overloaded.emplace_back(info); }
        else if (load < average) { candidates.emplace_back(info); }
    }

    auto const byLoad = [] (Node::Info const& lhs, Node::Info const& rhs) { return Load(lhs) < Load(rhs); };
    std::ranges::stable_sort(overloaded, [&byLoad] (auto const& lhs, auto const& rhs) { return byLoad(rhs, lhs); });
    std::ranges::stable_sort(candidates, byLoad);

    std::vector<Move> moves;
    std::set<Node::Identifier> claimed;
    for (auto const& source : overloaded) {
        for (auto const& asset : m_spStateStore->HostedBy(source.identifier)) {
            auto const optState = m_spStateStore->Fetch(asset);
            if (!optState) { continue; }

            auto const itr = std::ranges::find_if(candidates, [&] (Node::Info const& target) {
                return !claimed.contains(target.identifier) &&
                    target.capabilities.Supports(asset.GetType()) &&
                    target.available.CanFit(optState->demand);
            });

            if (itr != candidates.end()) {
                claimed.emplace(itr->identifier);
                moves.emplace_back(Move{ .asset = asset, .source = source.identifier, .target = itr->identifier });
                break;
            }
        }
    }

    return moves;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Placement::Move> Placement::LoadBalancer::Balance()
{
    std::vector<Move> applied;
    for (auto const& move : Plan()) {
        if (auto const result = m_migrate(move.asset, move.target, Migration::Reason::LoadBalancing); !result) {
            m_logger->warn("Unable to rebalance asset {} onto {}: {}", move.asset, move.target, result.what());
            continue;
        }
        applied.emplace_back(move);
    }

    if (!applied.empty()) {
        m_logger->info("Rebalanced {} allocation(s) across the fleet.", applied.size());
    }

    return applied;
}

//----------------------------------------------------------------------------------------------------------------------

double Placement::LoadBalancer::GetDeviationThreshold() const { return m_threshold; }

//----------------------------------------------------------------------------------------------------------------------

double Placement::LoadBalancer::Load(Node::Info const& info)
{
    return (info.metrics.cpuUtilization + info.metrics.memoryUtilization) / 2.0;
}

//----------------------------------------------------------------------------------------------------------------------
