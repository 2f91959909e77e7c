//----------------------------------------------------------------------------------------------------------------------
// File: Topology.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Topology.hpp"
#include "Utilities/CryptoUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

std::optional<Fleet::Partition> Fleet::Partition::Create(MemberSet const& members, TimeUtils::Timepoint detected)
{
    // The member set is ordered, so the digest is independent of the order in which members were discovered.
    std::vector<std::uint8_t> content;
    content.reserve(members.size() * std::tuple_size_v<Node::IdentifierBytes>);
    for (auto const& member : members) {
        auto const& bytes = member.GetBytes();
        content.insert(content.end(), bytes.begin(), bytes.end());
    }

    auto const timestamp = TimeUtils::TimepointToTimestamp(detected).count();
    auto const pTimestamp = reinterpret_cast<std::uint8_t const*>(&timestamp);

    auto const optDigest = CryptoUtils::Sha256({ content, { pTimestamp, sizeof(timestamp) } });
    if (!optDigest) { return {}; }

    return Partition{
        .identifier = CryptoUtils::ToHex(*optDigest),
        .members = members,
        .detected = detected,
        .healed = false,
        .healedAt = {}
    };
}

//----------------------------------------------------------------------------------------------------------------------

Fleet::Topology::Topology()
    : m_mutex()
    , m_probes()
    , m_updated(TimeUtils::GetSystemTimepoint())
{
}

//----------------------------------------------------------------------------------------------------------------------

void Fleet::Topology::RecordProbe(
    Node::Identifier const& from,
    Node::Identifier const& to,
    bool reachable,
    double latencyMs,
    double bandwidthMbps,
    TimeUtils::Timepoint observed)
{
    std::scoped_lock lock(m_mutex);
    m_probes.insert_or_assign(NodePair{ from, to }, Probe{ reachable, latencyMs, bandwidthMbps, observed });
    m_updated = std::max(m_updated, observed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Fleet::Topology::AreConnected(Node::Identifier const& first, Node::Identifier const& second) const
{
    std::shared_lock lock(m_mutex);
    auto const forward = m_probes.find(NodePair{ first, second });
    auto const reverse = m_probes.find(NodePair{ second, first });

    bool const hasForward = forward != m_probes.end();
    bool const hasReverse = reverse != m_probes.end();
    if (!hasForward && !hasReverse) { return true; }
    if (!hasReverse) { return forward->second.reachable; }
    if (!hasForward) { return reverse->second.reachable; }

    auto const& [forwardKey, forwardProbe] = *forward;
    auto const& [reverseKey, reverseProbe] = *reverse;
    if (forwardProbe.observed == reverseProbe.observed) {
        return forwardProbe.reachable && reverseProbe.reachable;
    }
    return (forwardProbe.observed > reverseProbe.observed) ? forwardProbe.reachable : reverseProbe.reachable;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Fleet::Probe> Fleet::Topology::GetProbe(Node::Identifier const& from, Node::Identifier const& to) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_probes.find(NodePair{ from, to }); itr != m_probes.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Fleet::Topology::ProbeCount() const
{
    std::shared_lock lock(m_mutex);
    return m_probes.size();
}

//----------------------------------------------------------------------------------------------------------------------

void Fleet::Topology::Forget(Node::Identifier const& identifier)
{
    std::scoped_lock lock(m_mutex);
    std::erase_if(m_probes, [&identifier] (auto const& entry) {
        auto const& [pair, probe] = entry;
        return pair.first == identifier || pair.second == identifier;
    });
}

//----------------------------------------------------------------------------------------------------------------------

Fleet::NetworkTopology Fleet::Topology::Snapshot(
    std::vector<Node::Info>&& nodes, std::vector<Partition>&& partitions) const
{
    NetworkTopology topology{
        .nodes = std::move(nodes),
        .partitions = std::move(partitions),
        .latency = {},
        .bandwidth = {},
        .reachability = {},
        .updated = {}
    };

    std::shared_lock lock(m_mutex);
    for (auto const& [pair, probe] : m_probes) {
        topology.latency.emplace(pair, probe.latencyMs);
        topology.bandwidth.emplace(pair, probe.bandwidthMbps);
        topology.reachability.emplace(pair, probe.reachable);
    }
    topology.updated = m_updated;

    return topology;
}

//----------------------------------------------------------------------------------------------------------------------
