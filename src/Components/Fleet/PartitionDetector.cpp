//----------------------------------------------------------------------------------------------------------------------
// File: PartitionDetector.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PartitionDetector.hpp"
#include "Components/Node/Registry.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <deque>
#include <iterator>
#include <mutex>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsReachableStatus(Node::Status status);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Fleet::PartitionDetector::PartitionDetector(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider)
    : m_spRegistry(spServiceProvider->Fetch<Node::Registry>().lock())
    , m_spTopology(spServiceProvider->Fetch<Topology>().lock())
    , m_spEventPublisher(spServiceProvider->Fetch<Event::Publisher>().lock())
    , m_logger(spdlog::get(Logger::Name::Fleet.data()))
    , m_mutex()
    , m_optLocalNode()
    , m_partitions()
{
    assert(m_spRegistry);
    assert(m_spTopology);
    assert(m_spEventPublisher);
    assert(m_logger);
    {
        using enum Event::Type;
        m_spEventPublisher->Advertise({ PartitionDetected, PartitionHealed });
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Fleet::PartitionDetector::SetLocalNode(Node::Identifier const& identifier)
{
    std::scoped_lock lock(m_mutex);
    m_optLocalNode = identifier;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Fleet::Partition> Fleet::PartitionDetector::Evaluate(TimeUtils::Timepoint now)
{
    std::vector<Node::Info> candidates;
    m_spRegistry->ForEach([&candidates] (Node::Info const& info) {
        if (local::IsReachableStatus(info.status)) { candidates.emplace_back(info); }
        return CallbackIteration::Continue;
    });

    std::vector<Partition> opened;
    if (candidates.empty()) { return opened; }

    auto const components = FindComponents(candidates);
    auto const main = FindMainComponent(components);

    for (std::size_t idx = 0; idx < components.size(); ++idx) {
        auto const& component = components[idx];
        if (idx == main) {
            // Nodes that can reach the main component again are returned to service.
            for (auto const& info : component) {
                if (info.status != Node::Status::Partitioned) { continue; }
                if (m_spRegistry->SetStatus(info.identifier, Node::Status::Active)) {
                    m_logger->info("Node {} has rejoined the main component.", info.identifier);
                }
            }
            continue;
        }

        MemberSet members;
        for (auto const& info : component) {
            if (info.status == Node::Status::Active) { members.emplace(info.identifier); }
        }

        if (members.empty() || IsOpen(members)) { continue; }

        auto optPartition = Partition::Create(members, now);
        if (!optPartition) {
            m_logger->error("Unable to derive an identifier for a partition of {} nodes.", members.size());
            continue;
        }

        for (auto const& member : members) {
            [[maybe_unused]] auto const exchanged = m_spRegistry->ExchangeStatus(member, Node::Status::Partitioned);
        }

        {
            std::scoped_lock lock(m_mutex);
            m_partitions.emplace_back(*optPartition);
        }

        m_logger->warn("Detected partition {} containing {} nodes.", optPartition->identifier, members.size());
        if (!m_spEventPublisher->Publish<Event::Type::PartitionDetected>(*optPartition)) {
            m_logger->warn("Unable to publish partition {}, the event channel is closed.", optPartition->identifier);
        }

        opened.emplace_back(std::move(*optPartition));
    }

    [[maybe_unused]] auto const healed = CheckHealing(now);

    return opened;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> Fleet::PartitionDetector::CheckHealing(TimeUtils::Timepoint now)
{
    std::vector<std::string> healed;
    {
        std::scoped_lock lock(m_mutex);
        for (auto& partition : m_partitions) {
            if (partition.healed) { continue; }

            // Members that have left the mesh no longer hold the partition open.
            bool const recovered = std::ranges::all_of(partition.members, [this] (Node::Identifier const& member) {
                auto const optInfo = m_spRegistry->Fetch(member);
                return !optInfo || optInfo->status == Node::Status::Active;
            });

            if (!recovered) { continue; }

            partition.healed = true;
            partition.healedAt = now;
            healed.emplace_back(partition.identifier);
        }
    }

    for (auto const& identifier : healed) {
        m_logger->info("Partition {} has healed.", identifier);
        if (!m_spEventPublisher->Publish<Event::Type::PartitionHealed>(identifier)) {
            m_logger->warn("Unable to publish the healing of partition {}, the event channel is closed.", identifier);
        }
    }

    return healed;
}

//----------------------------------------------------------------------------------------------------------------------

bool Fleet::PartitionDetector::Track(Partition const& partition)
{
    std::scoped_lock lock(m_mutex);
    bool const known = std::ranges::any_of(m_partitions, [&partition] (Partition const& existing) {
        return existing.identifier == partition.identifier;
    });

    if (known) { return false; }
    m_partitions.emplace_back(partition);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Fleet::Partition> Fleet::PartitionDetector::Partitions() const
{
    std::shared_lock lock(m_mutex);
    return m_partitions;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Fleet::Partition> Fleet::PartitionDetector::OpenPartitions() const
{
    std::vector<Partition> open;
    std::shared_lock lock(m_mutex);
    std::ranges::copy_if(m_partitions, std::back_inserter(open), [] (Partition const& partition) {
        return !partition.healed;
    });
    return open;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Fleet::PartitionDetector::Component> Fleet::PartitionDetector::FindComponents(
    std::vector<Node::Info> const& nodes) const
{
    std::vector<Component> components;
    std::vector<bool> visited(nodes.size(), false);

    // Breadth first search seeded in registry order, so component membership and ordering are deterministic.
    for (std::size_t seed = 0; seed < nodes.size(); ++seed) {
        if (visited[seed]) { continue; }

        Component component;
        std::deque<std::size_t> frontier{ seed };
        visited[seed] = true;
        while (!frontier.empty()) {
            auto const current = frontier.front();
            frontier.pop_front();
            component.emplace_back(nodes[current]);

            for (std::size_t next = 0; next < nodes.size(); ++next) {
                if (visited[next]) { continue; }
                if (!m_spTopology->AreConnected(nodes[current].identifier, nodes[next].identifier)) { continue; }
                visited[next] = true;
                frontier.emplace_back(next);
            }
        }

        components.emplace_back(std::move(component));
    }

    return components;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Fleet::PartitionDetector::FindMainComponent(std::vector<Component> const& components) const
{
    std::optional<Node::Identifier> optLocalNode;
    {
        std::shared_lock lock(m_mutex);
        optLocalNode = m_optLocalNode;
    }

    if (optLocalNode) {
        for (std::size_t idx = 0; idx < components.size(); ++idx) {
            bool const containsLocal = std::ranges::any_of(components[idx], [&optLocalNode] (Node::Info const& info) {
                return info.identifier == *optLocalNode;
            });
            if (containsLocal) { return idx; }
        }
    }

    // Without the local node the largest component is the main one, the first encountered wins a tie.
    std::size_t main = 0;
    for (std::size_t idx = 1; idx < components.size(); ++idx) {
        if (components[idx].size() > components[main].size()) { main = idx; }
    }
    return main;
}

//----------------------------------------------------------------------------------------------------------------------

bool Fleet::PartitionDetector::IsOpen(MemberSet const& members) const
{
    std::shared_lock lock(m_mutex);
    return std::ranges::any_of(m_partitions, [&members] (Partition const& partition) {
        return !partition.healed && partition.members == members;
    });
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsReachableStatus(Node::Status status)
{
    return status == Node::Status::Active || status == Node::Status::Partitioned;
}

//----------------------------------------------------------------------------------------------------------------------
