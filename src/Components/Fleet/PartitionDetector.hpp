//----------------------------------------------------------------------------------------------------------------------
// File: PartitionDetector.hpp
// Description: Detects groups of nodes that can no longer reach the main component of the mesh and tracks them until
// every member has returned to service.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Topology.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Mesh { class ServiceProvider; }
namespace Node { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Fleet {
//----------------------------------------------------------------------------------------------------------------------

class PartitionDetector;

//----------------------------------------------------------------------------------------------------------------------
} // Fleet namespace
//----------------------------------------------------------------------------------------------------------------------

class Fleet::PartitionDetector final
{
public:
    explicit PartitionDetector(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider);

    PartitionDetector(PartitionDetector const&) = delete;
    PartitionDetector& operator=(PartitionDetector const&) = delete;

    // The component containing the local node is always treated as the main component.
    void SetLocalNode(Node::Identifier const& identifier);

    // Computes the connected components of the reachable nodes, restores partitioned nodes that rejoined the main
    // component, opens partitions for newly separated groups, and heals partitions whose members are active again.
    // Returns the partitions opened during this evaluation.
    std::vector<Partition> Evaluate(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    // Returns the identifiers of the partitions healed by this call.
    std::vector<std::string> CheckHealing(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    // Records a partition observed outside of this detector. Returns false if it is already known.
    bool Track(Partition const& partition);

    [[nodiscard]] std::vector<Partition> Partitions() const;
    [[nodiscard]] std::vector<Partition> OpenPartitions() const;

private:
    using Component = std::vector<Node::Info>;

    [[nodiscard]] std::vector<Component> FindComponents(std::vector<Node::Info> const& nodes) const;
    [[nodiscard]] std::size_t FindMainComponent(std::vector<Component> const& components) const;
    [[nodiscard]] bool IsOpen(MemberSet const& members) const;

    std::shared_ptr<Node::Registry> m_spRegistry;
    std::shared_ptr<Topology> m_spTopology;
    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::shared_mutex m_mutex;
    std::optional<Node::Identifier> m_optLocalNode;
    std::vector<Partition> m_partitions;
};

//----------------------------------------------------------------------------------------------------------------------
