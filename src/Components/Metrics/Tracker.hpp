//----------------------------------------------------------------------------------------------------------------------
// File: Tracker.hpp
// Description: Maintains the fleet wide counters. The tracker is updated only by the event processor thread, while
// snapshots may be requested from any thread. The health of each known node is remembered so repeated membership
// events for the same node are only counted once.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Identifier/NodeIdentifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <memory>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

namespace Mesh { class ServiceProvider; }

//----------------------------------------------------------------------------------------------------------------------
namespace Metrics {
//----------------------------------------------------------------------------------------------------------------------

struct Snapshot;

class Tracker;

//----------------------------------------------------------------------------------------------------------------------
} // Metrics namespace
//----------------------------------------------------------------------------------------------------------------------

struct Metrics::Snapshot
{
    std::uint64_t totalNodes = 0;
    std::uint64_t healthyNodes = 0;
    std::uint64_t failedNodes = 0;
    std::uint64_t partitionsDetected = 0;
    std::uint64_t partitionsHealed = 0;
    std::uint64_t successfulMigrations = 0;
    std::uint64_t failedMigrations = 0;
    std::uint64_t byzantineNodes = 0;
    std::uint64_t processedEvents = 0;
};

//----------------------------------------------------------------------------------------------------------------------

class Metrics::Tracker final
{
public:
    // Subscribes to every coordinator event, it must be constructed before subscriptions are suspended.
    explicit Tracker(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider);

    Tracker(Tracker const&) = delete;
    Tracker& operator=(Tracker const&) = delete;

    [[nodiscard]] Snapshot GetSnapshot() const;

private:
    using Counter = std::atomic<std::uint64_t>;
    using HealthMap = std::unordered_map<Node::Identifier, bool, Node::Hasher>;

    static void Increment(Counter& counter);
    static void Decrement(Counter& counter);

    void OnNodeJoined(Node::Identifier const& identifier);
    void OnNodeLeft(Node::Identifier const& identifier);
    void OnNodeFailed(Node::Identifier const& identifier);

    HealthMap m_health;

    Counter m_totalNodes;
    Counter m_healthyNodes;
    Counter m_failedNodes;
    Counter m_partitionsDetected;
    Counter m_partitionsHealed;
    Counter m_successfulMigrations;
    Counter m_failedMigrations;
    Counter m_byzantineNodes;
    Counter m_processedEvents;
};

//----------------------------------------------------------------------------------------------------------------------
