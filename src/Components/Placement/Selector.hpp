//----------------------------------------------------------------------------------------------------------------------
// File: Selector.hpp
// Description: Chooses the node that should host an allocation. Nodes are ranked by their free capacity, reliability,
// and responsiveness weighted by trust. Ties resolve to the node that joined first.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Decision.hpp"
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Node/NodeInfo.hpp"
#include "Utilities/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Mesh { class ServiceProvider; }
namespace Node { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Placement {
//----------------------------------------------------------------------------------------------------------------------

class Selector;

//----------------------------------------------------------------------------------------------------------------------
} // Placement namespace
//----------------------------------------------------------------------------------------------------------------------

class Placement::Selector final
{
public:
    struct Weight
    {
        static constexpr double Cpu = 0.3;
        static constexpr double Memory = 0.3;
        static constexpr double Reliability = 0.2;
        static constexpr double Latency = 0.2;
    };

    explicit Selector(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider);

    [[nodiscard]] Mesh::Expected<Candidate> Select(Asset::Type type, Node::Resources const& demand = {}) const;

    [[nodiscard]] static Mesh::Expected<Candidate> Select(
        std::vector<Node::Info> const& snapshot, Asset::Type type, Node::Resources const& demand = {});

    [[nodiscard]] static double Score(Node::Info const& info);

private:
    std::shared_ptr<Node::Registry> m_spRegistry;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
