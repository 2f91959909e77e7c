//----------------------------------------------------------------------------------------------------------------------
// File: Tracker.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Tracker.hpp"
#include "Components/Event/Publisher.hpp"
#include "MeshNode/ServiceProvider.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Metrics::Tracker::Tracker(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider)
    : m_health()
    , m_totalNodes(0)
    , m_healthyNodes(0)
    , m_failedNodes(0)
    , m_partitionsDetected(0)
    , m_partitionsHealed(0)
    , m_successfulMigrations(0)
    , m_failedMigrations(0)
    , m_byzantineNodes(0)
    , m_processedEvents(0)
{
    auto const spEventPublisher = spServiceProvider->Fetch<Event::Publisher>().lock();
    assert(spEventPublisher);

    using enum Event::Type;
    spEventPublisher->Subscribe<NodeJoined>([this] (auto const& identifier, auto const&) { OnNodeJoined(identifier); });
    spEventPublisher->Subscribe<NodeLeft>([this] (auto const& identifier, auto const&) { OnNodeLeft(identifier); });
    spEventPublisher->Subscribe<NodeFailed>([this] (auto const& identifier, auto const&) { OnNodeFailed(identifier); });

    spEventPublisher->Subscribe<PartitionDetected>([this] (auto const&) {
        Increment(m_partitionsDetected);
        Increment(m_processedEvents);
    });

    spEventPublisher->Subscribe<PartitionHealed>([this] (auto const&) {
        Increment(m_partitionsHealed);
        Increment(m_processedEvents);
    });

    spEventPublisher->Subscribe<MigrationStarted>([this] (auto const&, auto const&, auto const&) {
        Increment(m_processedEvents);
    });

    spEventPublisher->Subscribe<MigrationCompleted>([this] (auto const&, auto const&) {
        Increment(m_successfulMigrations);
        Increment(m_processedEvents);
    });

    spEventPublisher->Subscribe<MigrationFailed>([this] (auto const&, auto const&) {
        Increment(m_failedMigrations);
        Increment(m_processedEvents);
    });

    spEventPublisher->Subscribe<ByzantineDetected>([this] (auto const&, auto const&) {
        Increment(m_byzantineNodes);
        Increment(m_processedEvents);
    });
}

//----------------------------------------------------------------------------------------------------------------------

Metrics::Snapshot Metrics::Tracker::GetSnapshot() const
{
    return Snapshot{
        .totalNodes = m_totalNodes.load(),
        .healthyNodes = m_healthyNodes.load(),
        .failedNodes = m_failedNodes.load(),
        .partitionsDetected = m_partitionsDetected.load(),
        .partitionsHealed = m_partitionsHealed.load(),
        .successfulMigrations = m_successfulMigrations.load(),
        .failedMigrations = m_failedMigrations.load(),
        .byzantineNodes = m_byzantineNodes.load(),
        .processedEvents = m_processedEvents.load()
    };
}

//----------------------------------------------------------------------------------------------------------------------

void Metrics::Tracker::Increment(Counter& counter) { counter.fetch_add(1); }

//----------------------------------------------------------------------------------------------------------------------

void Metrics::Tracker::Decrement(Counter& counter)
{
    // Only the event processor writes the counters, so a load followed by a store cannot lose an update.
    if (auto const value = counter.load(); value != 0) { counter.store(value - 1); }
}

//----------------------------------------------------------------------------------------------------------------------

void Metrics::Tracker::OnNodeJoined(Node::Identifier const& identifier)
{
    // A known node that rejoins is only counted as healthy again if it had been lost.
    auto const [itr, emplaced] = m_health.try_emplace(identifier, true);
    if (emplaced) {
        Increment(m_totalNodes);
        Increment(m_healthyNodes);
    } else if (!itr->second) {
        itr->second = true;
        Increment(m_healthyNodes);
    }
    Increment(m_processedEvents);
}

//----------------------------------------------------------------------------------------------------------------------

void Metrics::Tracker::OnNodeLeft(Node::Identifier const& identifier)
{
    if (auto const itr = m_health.find(identifier); itr != m_health.end()) {
        Decrement(m_totalNodes);
        if (itr->second) { Decrement(m_healthyNodes); }
        m_health.erase(itr);
    }
    Increment(m_processedEvents);
}

//----------------------------------------------------------------------------------------------------------------------

void Metrics::Tracker::OnNodeFailed(Node::Identifier const& identifier)
{
    if (auto const itr = m_health.find(identifier); itr != m_health.end() && itr->second) {
        itr->second = false;
        Decrement(m_healthyNodes);
        Increment(m_failedNodes);
    }
    Increment(m_processedEvents);
}

//----------------------------------------------------------------------------------------------------------------------
