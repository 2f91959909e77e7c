//----------------------------------------------------------------------------------------------------------------------
// File: LoadBalancer.hpp
// Description: Periodically relieves nodes whose load deviates above the fleet average by moving one allocation per
// overloaded node to the least loaded node that can host it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Components/Migration/MigrationTypes.hpp"
#include "Components/Node/NodeInfo.hpp"
#include "Utilities/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Asset { class StateStore; }
namespace Mesh { class ServiceProvider; }
namespace Node { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Placement {
//----------------------------------------------------------------------------------------------------------------------

struct Move;

class LoadBalancer;

//----------------------------------------------------------------------------------------------------------------------
} // Placement namespace
//----------------------------------------------------------------------------------------------------------------------

struct Placement::Move
{
    Asset::Identifier asset;
    Node::Identifier source;
    Node::Identifier target;
};

//----------------------------------------------------------------------------------------------------------------------

class Placement::LoadBalancer final
{
public:
    using MigrateFunction = std::function<
        Mesh::Result(Asset::Identifier const&, Node::Identifier const&, Migration::Reason)>;

    LoadBalancer(
        std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider,
        double deviationThreshold,
        MigrateFunction const& migrate);

    LoadBalancer(LoadBalancer const&) = delete;
    LoadBalancer& operator=(LoadBalancer const&) = delete;

    // Computes the moves for the current state of the fleet without applying them. A target receives at most one
    // allocation per round.
    [[nodiscard]] std::vector<Move> Plan() const;

    // Applies the planned moves and provides those that succeeded.
    std::vector<Move> Balance();

    [[nodiscard]] double GetDeviationThreshold() const;

    [[nodiscard]] static double Load(Node::Info const& info);

private:
    std::shared_ptr<Node::Registry> m_spRegistry;
    std::shared_ptr<Asset::StateStore> m_spStateStore;
    std::shared_ptr<spdlog::logger> m_logger;
    double const m_threshold;
    MigrateFunction m_migrate;
};

//----------------------------------------------------------------------------------------------------------------------
