//----------------------------------------------------------------------------------------------------------------------
// File: Topology.hpp
// Description: Pairwise reachability, latency, and bandwidth observations supplied by the networking layer along with
// the partition records opened by the partition detector.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Node/NodeInfo.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Fleet {
//----------------------------------------------------------------------------------------------------------------------

using NodePair = std::pair<Node::Identifier, Node::Identifier>;
using MemberSet = std::set<Node::Identifier>;

struct Probe;
struct Partition;
struct NetworkTopology;

class Topology;

//----------------------------------------------------------------------------------------------------------------------
} // Fleet namespace
//----------------------------------------------------------------------------------------------------------------------

struct Fleet::Probe
{
    bool reachable = true;
    double latencyMs = 0.0;
    double bandwidthMbps = 0.0;
    TimeUtils::Timepoint observed;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: A set of nodes that has lost contact with the main component. The identifier is derived from the sorted
// member identifiers and the detection time. A partition heals once and stays in the history afterwards.
//----------------------------------------------------------------------------------------------------------------------
struct Fleet::Partition
{
    [[nodiscard]] static std::optional<Partition> Create(MemberSet const& members, TimeUtils::Timepoint detected);

    std::string identifier;
    MemberSet members;
    TimeUtils::Timepoint detected;
    bool healed = false;
    std::optional<TimeUtils::Timepoint> healedAt;
};

//----------------------------------------------------------------------------------------------------------------------

struct Fleet::NetworkTopology
{
    std::vector<Node::Info> nodes;
    std::vector<Partition> partitions;
    std::map<NodePair, double> latency;
    std::map<NodePair, double> bandwidth;
    std::map<NodePair, bool> reachability;
    TimeUtils::Timepoint updated;
};

//----------------------------------------------------------------------------------------------------------------------

class Fleet::Topology final
{
public:
    Topology();

    Topology(Topology const&) = delete;
    Topology& operator=(Topology const&) = delete;

    void RecordProbe(
        Node::Identifier const& from,
        Node::Identifier const& to,
        bool reachable,
        double latencyMs,
        double bandwidthMbps,
        TimeUtils::Timepoint observed = TimeUtils::GetSystemTimepoint());

    // Nodes are considered connected unless the most recent probe in either direction reported them unreachable.
    [[nodiscard]] bool AreConnected(Node::Identifier const& first, Node::Identifier const& second) const;
    [[nodiscard]] std::optional<Probe> GetProbe(Node::Identifier const& from, Node::Identifier const& to) const;
    [[nodiscard]] std::size_t ProbeCount() const;

    void Forget(Node::Identifier const& identifier);

    [[nodiscard]] NetworkTopology Snapshot(
        std::vector<Node::Info>&& nodes, std::vector<Partition>&& partitions) const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<NodePair, Probe> m_probes;
    TimeUtils::Timepoint m_updated;
};

//----------------------------------------------------------------------------------------------------------------------
