//----------------------------------------------------------------------------------------------------------------------
// File: Coordinator.hpp
// Description: The multi-node coordination engine. The coordinator owns the registry, the detectors, the placement and
// migration components, and the resource market. It exposes the operations used by the rest of the node and runs the
// periodic detection, balancing, and matching loops.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/StateStore.hpp"
#include "Components/Configuration/Settings.hpp"
#include "Components/Event/Events.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Fleet/Topology.hpp"
#include "Components/Market/MarketTypes.hpp"
#include "Components/Metrics/Tracker.hpp"
#include "Components/Migration/MigrationTypes.hpp"
#include "Components/Node/NodeInfo.hpp"
#include "Components/Placement/Decision.hpp"
#include "Utilities/Result.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

namespace Event { class Processor; }
namespace Fleet { class ByzantineDetector; class HeartbeatMonitor; class PartitionDetector; }
namespace Market { class Exchange; }
namespace Migration { class Migrator; }
namespace Node { class Registry; }
namespace Placement { class LoadBalancer; class Selector; }
namespace Scheduler { class PeriodicTask; }

class IMigrationTransport;

//----------------------------------------------------------------------------------------------------------------------
namespace Mesh {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;
class Coordinator;

// The descriptor the local node registers with when joining the mesh.
[[nodiscard]] Node::Capabilities GetDefaultLocalCapabilities();

//----------------------------------------------------------------------------------------------------------------------
} // Mesh namespace
//----------------------------------------------------------------------------------------------------------------------

class Mesh::Coordinator final
{
public:
    enum class State : std::uint8_t { Standby, Active, Stopped };

    static constexpr std::string_view LeaveReason = "Graceful shutdown";

    // When no transport is supplied, allocations are moved with the in-process transport.
    explicit Coordinator(
        Configuration::Settings const& settings, std::shared_ptr<IMigrationTransport> const& spTransport = {});
    ~Coordinator();

    Coordinator(Coordinator const&) = delete;
    Coordinator(Coordinator&&) = delete;
    Coordinator& operator=(Coordinator const&) = delete;
    Coordinator& operator=(Coordinator&&) = delete;

    // Starts the event processor and the periodic tasks. A coordinator may only be initialized once.
    Result Initialize(Node::Identifier const& local);
    void Shutdown();

    Result JoinNetwork();
    Result JoinNetwork(Node::Capabilities const& capabilities, Node::Location const& location = {});
    Result LeaveNetwork();

    Result RegisterNode(
        Node::Identifier const& identifier,
        Node::Capabilities const& capabilities,
        Node::Location const& location = {});
    Result UpdateHeartbeat(
        Node::Identifier const& identifier, TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());
    Result UpdateMetrics(Node::Identifier const& identifier, Node::PerformanceMetrics const& metrics);
    void RecordProbe(
        Node::Identifier const& from,
        Node::Identifier const& to,
        bool reachable,
        double latencyMs,
        double bandwidthMbps);

    [[nodiscard]] Expected<Placement::Decision> AllocateAsset(
        Asset::Identifier const& asset, Placement::ConsensusVerdict const& verdict, Node::Resources const& demand = {});
    Result ReleaseAsset(Asset::Identifier const& asset);
    Result ReportAssetState(Asset::Identifier const& asset, Node::Identifier const& observer, Asset::Status status);
    [[nodiscard]] Expected<Asset::DistributedState> SyncAssetState(Asset::Identifier const& asset) const;

    Result MigrateAsset(
        Asset::Identifier const& asset,
        Node::Identifier const& target,
        Migration::Reason reason = Migration::Reason::Manual);
    [[nodiscard]] std::optional<Migration::Status> GetMigrationStatus(Asset::Identifier const& asset) const;
    [[nodiscard]] std::vector<Migration::Status> GetMigrationHistory(Asset::Identifier const& asset) const;
    Result CancelMigration(Asset::Identifier const& asset);

    // Re-places every allocation whose primary is the provided node. Each allocation is attempted independently and
    // the first error encountered is provided. Allocations that have already moved are left untouched.
    Result HandleNodeFailure(Node::Identifier const& node);

    [[nodiscard]] std::vector<Node::Identifier> DetectByzantineNodes() const;

    [[nodiscard]] Expected<std::vector<Market::Offer>> RequestResources(Market::Request const& request);
    Result OfferResources(Market::Offer const& offer);
    Result CancelAgreement(std::string const& identifier);
    [[nodiscard]] Expected<Market::UsageRecord> RecordUsage(
        std::string const& identifier, double amount, Market::Duration duration);
    [[nodiscard]] std::vector<Market::Agreement> Agreements() const;

    [[nodiscard]] Fleet::NetworkTopology GetTopology() const;
    [[nodiscard]] std::optional<Node::Info> GetNode(Node::Identifier const& identifier) const;
    [[nodiscard]] Metrics::Snapshot GetMetrics() const;

    // Injects an externally observed event into the event channel.
    template<Event::Type SpecificType, typename... Arguments>
    Result HandleEvent(Arguments&&... arguments);

    // The bodies of the periodic tasks. They may also be driven directly (e.g. by an external scheduler).
    std::vector<Node::Identifier> CheckHeartbeats(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());
    std::vector<Fleet::Partition> CheckPartitions(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());
    std::vector<Node::Identifier> CheckByzantineBehavior();
    std::size_t BalanceLoad();
    std::vector<Market::Agreement> MatchMarket(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    [[nodiscard]] State GetState() const;
    [[nodiscard]] std::optional<Node::Identifier> GetLocalNode() const;
    [[nodiscard]] Configuration::Settings const& GetSettings() const;

private:
    void CreateStaticResources();
    void CreatePeriodicTasks();
    void OnNodeFailed(Node::Identifier const& node);

    // Schedules and executes the movement of an allocation to the target. The target is reserved before the primary
    // changes, the source is released afterwards.
    Result Relocate(Asset::DistributedState const& state, Node::Identifier const& target, Migration::Reason reason);
    Result CommitMigration(Migration::Plan const& plan, Node::Resources const& demand);

    Configuration::Settings const m_settings;
    std::shared_ptr<spdlog::logger> m_logger;

    std::atomic<State> m_state;
    mutable std::mutex m_lifecycleMutex;
    std::optional<Node::Identifier> m_optLocalNode;

    std::shared_ptr<ServiceProvider> m_spServiceProvider;
    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<Asset::StateStore> m_spStateStore;
    std::shared_ptr<Fleet::Topology> m_spTopology;
    std::shared_ptr<Node::Registry> m_spRegistry;
    std::shared_ptr<Metrics::Tracker> m_spTracker;
    std::shared_ptr<Event::Processor> m_spEventProcessor;
    std::shared_ptr<Fleet::HeartbeatMonitor> m_spHeartbeatMonitor;
    std::shared_ptr<Fleet::PartitionDetector> m_spPartitionDetector;
    std::shared_ptr<Fleet::ByzantineDetector> m_spByzantineDetector;
    std::shared_ptr<Placement::Selector> m_spSelector;
    std::shared_ptr<Placement::LoadBalancer> m_spLoadBalancer;
    std::shared_ptr<IMigrationTransport> m_spTransport;
    std::shared_ptr<Migration::Migrator> m_spMigrator;
    std::shared_ptr<Market::Exchange> m_spExchange;

    std::vector<std::unique_ptr<Scheduler::PeriodicTask>> m_tasks;
};

//----------------------------------------------------------------------------------------------------------------------

template<Event::Type SpecificType, typename... Arguments>
Mesh::Result Mesh::Coordinator::HandleEvent(Arguments&&... arguments)
{
    if (!m_spEventPublisher->Publish<SpecificType>(std::forward<Arguments>(arguments)...)) {
        return Result{
            ErrorCode::NetworkError,
            fmt::format("Unable to publish {}, the event channel has been closed.", Event::ToString(SpecificType))
        };
    }
    return Result{};
}

//----------------------------------------------------------------------------------------------------------------------
