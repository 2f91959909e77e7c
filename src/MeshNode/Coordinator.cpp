//----------------------------------------------------------------------------------------------------------------------
// File: Coordinator.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Coordinator.hpp"
#include "ServiceProvider.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Processor.hpp"
#include "Components/Fleet/ByzantineDetector.hpp"
#include "Components/Fleet/HeartbeatMonitor.hpp"
#include "Components/Fleet/PartitionDetector.hpp"
#include "Components/Market/Exchange.hpp"
#include "Components/Migration/LocalTransport.hpp"
#include "Components/Migration/Migrator.hpp"
#include "Components/Node/Registry.hpp"
#include "Components/Placement/LoadBalancer.hpp"
#include "Components/Placement/Selector.hpp"
#include "Components/Scheduler/PeriodicTask.hpp"
#include "Interfaces/MigrationTransport.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint64_t GiB = 1024ull * 1024ull * 1024ull;
constexpr std::uint64_t TiB = 1024ull * GiB;

[[nodiscard]] Mesh::Result AssetNotFound(Asset::Identifier const& asset);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Node::Capabilities Mesh::GetDefaultLocalCapabilities()
{
    Node::Capabilities capabilities;
    capabilities.cpuCores = 8;
    capabilities.memoryBytes = 16 * local::GiB;
    capabilities.gpuDevices = 1;
    capabilities.storageBytes = local::TiB;
    capabilities.bandwidthMbps = 1'000;
    capabilities.assetTypes = { Asset::Type::Cpu, Asset::Type::Memory, Asset::Type::Gpu, Asset::Type::Storage };
    capabilities.features.tpm = true;
    capabilities.features.hardwareRng = true;
    capabilities.features.nvme = true;
    capabilities.software = { "docker", "kubernetes", "hypermesh" };
    return capabilities;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Coordinator::Coordinator(
    Configuration::Settings const& settings, std::shared_ptr<IMigrationTransport> const& spTransport)
    : m_settings(settings)
    , m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_state(State::Standby)
    , m_lifecycleMutex()
    , m_optLocalNode()
    , m_spServiceProvider(std::make_shared<ServiceProvider>())
    , m_spEventPublisher(std::make_shared<Event::Publisher>())
    , m_spStateStore(std::make_shared<Asset::StateStore>())
    , m_spTopology(std::make_shared<Fleet::Topology>())
    , m_spRegistry()
    , m_spTracker()
    , m_spEventProcessor()
    , m_spHeartbeatMonitor()
    , m_spPartitionDetector()
    , m_spByzantineDetector()
    , m_spSelector()
    , m_spLoadBalancer()
    , m_spTransport(spTransport ? spTransport : std::make_shared<Migration::LocalTransport>())
    , m_spMigrator()
    , m_spExchange()
    , m_tasks()
{
    assert(m_logger);
    CreateStaticResources();
    CreatePeriodicTasks();
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Coordinator::~Coordinator()
{
    Shutdown();
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::Initialize(Node::Identifier const& local)
{
    std::scoped_lock lock(m_lifecycleMutex);
    if (m_state != State::Standby) {
        return Result{ ErrorCode::InvalidState, "The coordinator has already been initialized." };
    }

    m_optLocalNode = local;
    m_spPartitionDetector->SetLocalNode(local);

    if (!m_spEventProcessor->Startup()) {
        return Result{ ErrorCode::InvalidState, "Failed to start the event processor." };
    }

    for (auto const& upTask : m_tasks) {
        if (!upTask->Startup()) { m_logger->warn("Failed to start the {} task.", upTask->GetName()); }
    }

    m_state = State::Active;
    m_logger->info("Coordinator initialized for local node {}.", local);

    return Result{};
}

//----------------------------------------------------------------------------------------------------------------------

void Mesh::Coordinator::Shutdown()
{
    std::scoped_lock lock(m_lifecycleMutex);
    if (m_state == State::Stopped) { return; }

    // The tasks are stopped first so that no tick publishes into a closed channel.
    for (auto const& upTask : m_tasks) { [[maybe_unused]] bool const stopped = upTask->Shutdown(); }
    [[maybe_unused]] bool const stopped = m_spEventProcessor->Shutdown();

    m_state = State::Stopped;
    m_logger->info("Coordinator shutdown complete.");
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::JoinNetwork() { return JoinNetwork(GetDefaultLocalCapabilities()); }

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::JoinNetwork(Node::Capabilities const& capabilities, Node::Location const& location)
{
    auto const optLocalNode = GetLocalNode();
    if (!optLocalNode) {
        return Result{ ErrorCode::InvalidState, "The coordinator must be initialized before joining the network." };
    }

    if (m_spEventPublisher->IsClosed()) {
        return Result{ ErrorCode::NetworkError, "Unable to announce the local node, the event channel is closed." };
    }

    return m_spRegistry->Join(*optLocalNode, capabilities, location);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::LeaveNetwork()
{
    auto const optLocalNode = GetLocalNode();
    if (!optLocalNode) {
        return Result{ ErrorCode::InvalidState, "The coordinator must be initialized before leaving the network." };
    }

    if (m_spEventPublisher->IsClosed()) {
        return Result{ ErrorCode::NetworkError, "Unable to announce the departure, the event channel is closed." };
    }

    return m_spRegistry->Leave(*optLocalNode, std::string{ LeaveReason });
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::RegisterNode(
    Node::Identifier const& identifier, Node::Capabilities const& capabilities, Node::Location const& location)
{
    return m_spRegistry->Join(identifier, capabilities, location);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::UpdateHeartbeat(Node::Identifier const& identifier, TimeUtils::Timepoint now)
{
    return m_spRegistry->UpdateHeartbeat(identifier, now);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::UpdateMetrics(
    Node::Identifier const& identifier, Node::PerformanceMetrics const& metrics)
{
    return m_spRegistry->UpdateMetrics(identifier, metrics);
}

//----------------------------------------------------------------------------------------------------------------------

void Mesh::Coordinator::RecordProbe(
    Node::Identifier const& from, Node::Identifier const& to, bool reachable, double latencyMs, double bandwidthMbps)
{
    m_spTopology->RecordProbe(from, to, reachable, latencyMs, bandwidthMbps);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Placement::Decision> Mesh::Coordinator::AllocateAsset(
    Asset::Identifier const& asset, Placement::ConsensusVerdict const& verdict, Node::Resources const& demand)
{
    if (!verdict.approved) {
        return Result{ ErrorCode::AllocationFailed, "consensus verdict rejected the allocation" };
    }

    if (m_spStateStore->Contains(asset)) {
        return Result{ ErrorCode::Conflict, fmt::format("asset {} is already allocated", asset) };
    }

    auto const selected = m_spSelector->Select(asset.GetType(), demand);
    if (auto const* const pError = std::get_if<Result>(&selected); pError) { return *pError; }
    auto const& candidate = std::get<Placement::Candidate>(selected);

    if (auto const result = m_spRegistry->Reserve(candidate.node, demand); !result) { return result; }

    auto const now = TimeUtils::GetSystemTimepoint();
    Asset::DistributedState state{
        .asset = asset,
        .primary = candidate.node,
        .reports = { { candidate.node, Asset::Status::Allocated } },
        .demand = demand,
        .updated = now
    };

    if (!m_spStateStore->Insert(std::move(state))) {
        // Another caller allocated the asset while the node was being selected.
        if (auto const result = m_spRegistry->Release(candidate.node, demand); !result) {
            m_logger->warn("Failed to return the reservation on {}: {}", candidate.node, result.what());
        }
        return Result{ ErrorCode::Conflict, fmt::format("asset {} is already allocated", asset) };
    }

    Placement::Decision decision{
        .asset = asset,
        .target = candidate.node,
        .score = candidate.score,
        .decided = now,
        .participants = {},
        .signatures = {}
    };

    for (auto const& [node, signature] : verdict.attestations) {
        decision.participants.emplace_back(node);
        decision.signatures.emplace_back(signature);
    }

    m_logger->info("Allocated asset {} on {} with a score of {:.3f}.", asset, candidate.node, candidate.score);

    return decision;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::ReleaseAsset(Asset::Identifier const& asset)
{
    auto const optState = m_spStateStore->Extract(asset);
    if (!optState) { return local::AssetNotFound(asset); }

    if (auto const result = m_spRegistry->Release(optState->primary, optState->demand); !result) {
        // The host may have left the mesh, in which case there is nothing to return.
        m_logger->debug("Unable to return the capacity of asset {} to {}: {}", asset, optState->primary, result.what());
    }

    m_logger->info("Released asset {} from {}.", asset, optState->primary);
    return Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::ReportAssetState(
    Asset::Identifier const& asset, Node::Identifier const& observer, Asset::Status status)
{
    return m_spStateStore->Report(asset, observer, status);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Asset::DistributedState> Mesh::Coordinator::SyncAssetState(Asset::Identifier const& asset) const
{
    auto optState = m_spStateStore->Fetch(asset);
    if (!optState) { return local::AssetNotFound(asset); }
    return std::move(*optState);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::MigrateAsset(
    Asset::Identifier const& asset, Node::Identifier const& target, Migration::Reason reason)
{
    auto const optState = m_spStateStore->Fetch(asset);
    if (!optState) { return local::AssetNotFound(asset); }

    if (optState->primary == target) { return Result{}; } // The asset is already where it was requested to be.

    auto const optTarget = m_spRegistry->Fetch(target);
    if (!optTarget || optTarget->status != Node::Status::Active) {
        return Result{ ErrorCode::NetworkError, fmt::format("node {} is unreachable", target) };
    }

    return Relocate(*optState, target, reason);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Migration::Status> Mesh::Coordinator::GetMigrationStatus(Asset::Identifier const& asset) const
{
    return m_spMigrator->Active(asset);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Migration::Status> Mesh::Coordinator::GetMigrationHistory(Asset::Identifier const& asset) const
{
    return m_spMigrator->History(asset);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::CancelMigration(Asset::Identifier const& asset) { return m_spMigrator->Cancel(asset); }

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::HandleNodeFailure(Node::Identifier const& node)
{
    auto const hosted = m_spStateStore->HostedBy(node);
    m_logger->info("Re-placing {} asset(s) hosted by {}.", hosted.size(), node);

    Result first;
    auto const record = [&first] (Result const& result) { if (!result && first) { first = result; } };

    for (auto const& asset : hosted) {
        // The state is fetched again as the asset may have moved or been released since the scan.
        auto const optState = m_spStateStore->Fetch(asset);
        if (!optState || optState->primary != node) { continue; }

        auto const selected = m_spSelector->Select(asset.GetType(), optState->demand);
        if (auto const* const pError = std::get_if<Result>(&selected); pError) {
            m_logger->warn("Unable to re-place asset {}: {}", asset, pError->what());
            record(*pError);
            continue;
        }

        auto const& candidate = std::get<Placement::Candidate>(selected);
        if (candidate.node == node) { continue; } // The node is still the best host, e.g. it has recovered.

        record(Relocate(*optState, candidate.node, Migration::Reason::NodeFailure));
    }

    return first;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Node::Identifier> Mesh::Coordinator::DetectByzantineNodes() const
{
    std::vector<Node::Identifier> suspected;
    m_spRegistry->ForEach([&suspected] (Node::Info const& info) -> CallbackIteration {
        if (info.status == Node::Status::Suspected) { suspected.emplace_back(info.identifier); }
        return CallbackIteration::Continue;
    });
    return suspected;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<std::vector<Market::Offer>> Mesh::Coordinator::RequestResources(Market::Request const& request)
{
    return m_spExchange->SubmitRequest(request);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::OfferResources(Market::Offer const& offer)
{
    auto const submitted = m_spExchange->SubmitOffer(offer);
    if (auto const* const pError = std::get_if<Result>(&submitted); pError) { return *pError; }
    return Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::CancelAgreement(std::string const& identifier)
{
    return m_spExchange->CancelAgreement(identifier);
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Market::UsageRecord> Mesh::Coordinator::RecordUsage(
    std::string const& identifier, double amount, Market::Duration duration)
{
    return m_spExchange->RecordUsage(identifier, amount, duration);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::Agreement> Mesh::Coordinator::Agreements() const { return m_spExchange->Agreements(); }

//----------------------------------------------------------------------------------------------------------------------

Fleet::NetworkTopology Mesh::Coordinator::GetTopology() const
{
    return m_spTopology->Snapshot(m_spRegistry->Snapshot(), m_spPartitionDetector->OpenPartitions());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Node::Info> Mesh::Coordinator::GetNode(Node::Identifier const& identifier) const
{
    return m_spRegistry->Fetch(identifier);
}

//----------------------------------------------------------------------------------------------------------------------

Metrics::Snapshot Mesh::Coordinator::GetMetrics() const { return m_spTracker->GetSnapshot(); }

//----------------------------------------------------------------------------------------------------------------------

std::vector<Node::Identifier> Mesh::Coordinator::CheckHeartbeats(TimeUtils::Timepoint now)
{
    return m_spHeartbeatMonitor->Scan(now);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Fleet::Partition> Mesh::Coordinator::CheckPartitions(TimeUtils::Timepoint now)
{
    auto opened = m_spPartitionDetector->Evaluate(now);
    auto const healed = m_spPartitionDetector->CheckHealing(now);
    if (!opened.empty() || !healed.empty()) {
        m_logger->debug("Partition check opened {} and healed {} partition(s).", opened.size(), healed.size());
    }
    return opened;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Node::Identifier> Mesh::Coordinator::CheckByzantineBehavior()
{
    std::vector<Node::Identifier> flagged;
    for (auto const& assessment : m_spByzantineDetector->Evaluate()) {
        if (assessment.flagged) { flagged.emplace_back(assessment.node); }
    }
    return flagged;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Mesh::Coordinator::BalanceLoad() { return m_spLoadBalancer->Balance().size(); }

//----------------------------------------------------------------------------------------------------------------------

std::vector<Market::Agreement> Mesh::Coordinator::MatchMarket(TimeUtils::Timepoint now)
{
    auto agreements = m_spExchange->Match(now);
    if (auto const purged = m_spExchange->PurgeExpired(now); purged != 0) {
        m_logger->debug("Purged {} expired market entries.", purged);
    }
    return agreements;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Coordinator::State Mesh::Coordinator::GetState() const { return m_state; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Node::Identifier> Mesh::Coordinator::GetLocalNode() const
{
    std::scoped_lock lock(m_lifecycleMutex);
    return m_optLocalNode;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Settings const& Mesh::Coordinator::GetSettings() const { return m_settings; }

//----------------------------------------------------------------------------------------------------------------------

void Mesh::Coordinator::CreateStaticResources()
{
    m_spServiceProvider->Register(m_spEventPublisher);
    m_spServiceProvider->Register(m_spStateStore);
    m_spServiceProvider->Register(m_spTopology);

    m_spRegistry = std::make_shared<Node::Registry>(m_spServiceProvider);
    m_spServiceProvider->Register(m_spRegistry);

    // The tracker and the failure reaction subscribe to the channel, they must exist before the processor starts.
    m_spTracker = std::make_shared<Metrics::Tracker>(m_spServiceProvider);
    m_spServiceProvider->Register(m_spTracker);

    if (m_settings.migration.UseAutoMigration()) {
        m_spEventPublisher->Subscribe<Event::Type::NodeFailed>(
            [this] (Node::Identifier const& node, TimeUtils::Timepoint) { OnNodeFailed(node); });
    }

    m_spEventProcessor = std::make_shared<Event::Processor>(m_spServiceProvider);

    m_spHeartbeatMonitor = std::make_shared<Fleet::HeartbeatMonitor>(
        m_spServiceProvider, m_settings.heartbeat.GetFailureTimeout());
    m_spPartitionDetector = std::make_shared<Fleet::PartitionDetector>(m_spServiceProvider);
    m_spByzantineDetector = std::make_shared<Fleet::ByzantineDetector>(
        m_spServiceProvider, m_settings.detection.GetByzantineThreshold());

    m_spSelector = std::make_shared<Placement::Selector>(m_spServiceProvider);
    m_spServiceProvider->Register(m_spSelector);

    m_spMigrator = std::make_shared<Migration::Migrator>(m_spTransport, m_settings.migration.PreferLive());
    m_spServiceProvider->Register(m_spMigrator);

    m_spLoadBalancer = std::make_shared<Placement::LoadBalancer>(
        m_spServiceProvider,
        m_settings.balancing.GetDeviationThreshold(),
        [this] (Asset::Identifier const& asset, Node::Identifier const& target, Migration::Reason reason) {
            return MigrateAsset(asset, target, reason);
        });

    m_spExchange = std::make_shared<Market::Exchange>(
        m_settings.market.GetMaxDemandFactor(), m_settings.market.IsPricingEnabled());
    m_spServiceProvider->Register(m_spExchange);
}

//----------------------------------------------------------------------------------------------------------------------

void Mesh::Coordinator::CreatePeriodicTasks()
{
    auto const spFleetLogger = spdlog::get(Logger::Name::Fleet.data());
    auto const spPlacementLogger = spdlog::get(Logger::Name::Placement.data());
    auto const spMarketLogger = spdlog::get(Logger::Name::Market.data());
    assert(spFleetLogger && spPlacementLogger && spMarketLogger);

    m_tasks.emplace_back(std::make_unique<Scheduler::PeriodicTask>(
        "heartbeat monitor", m_settings.heartbeat.GetInterval(), [this] { CheckHeartbeats(); }, spFleetLogger));

    m_tasks.emplace_back(std::make_unique<Scheduler::PeriodicTask>(
        "partition detector",
        m_settings.detection.GetPartitionInterval(),
        [this] { CheckPartitions(); },
        spFleetLogger));

    m_tasks.emplace_back(std::make_unique<Scheduler::PeriodicTask>(
        "byzantine detector",
        m_settings.detection.GetByzantineInterval(),
        [this] { CheckByzantineBehavior(); },
        spFleetLogger));

    if (m_settings.balancing.IsEnabled()) {
        m_tasks.emplace_back(std::make_unique<Scheduler::PeriodicTask>(
            "load balancer", m_settings.balancing.GetInterval(), [this] { BalanceLoad(); }, spPlacementLogger));
    }

    m_tasks.emplace_back(std::make_unique<Scheduler::PeriodicTask>(
        "market matcher", m_settings.market.GetMatchingInterval(), [this] { MatchMarket(); }, spMarketLogger));
}

//----------------------------------------------------------------------------------------------------------------------

void Mesh::Coordinator::OnNodeFailed(Node::Identifier const& node)
{
    if (auto const result = HandleNodeFailure(node); !result) {
        m_logger->warn("Automatic re-placement for failed node {} was incomplete: {}", node, result.what());
    }
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::Relocate(
    Asset::DistributedState const& state, Node::Identifier const& target, Migration::Reason reason)
{
    auto const& asset = state.asset;
    auto const plan = m_spMigrator->CreatePlan(asset, state.primary, target, reason, state.demand.memoryBytes);
    if (auto const result = m_spMigrator->Schedule(plan); !result) { return result; }

    // Another migration may have moved the asset between the caller's read and the plan being scheduled.
    auto const optCurrent = m_spStateStore->Fetch(asset);
    if (!optCurrent || optCurrent->primary != state.primary) {
        if (auto const result = m_spMigrator->Cancel(asset); !result) {
            m_logger->warn("Failed to withdraw the migration plan for asset {}: {}", asset, result.what());
        }
        if (!optCurrent) { return local::AssetNotFound(asset); }
        return Result{
            ErrorCode::Conflict, fmt::format("asset {} was moved to {} before the migration started",
                asset, optCurrent->primary) };
    }

    if (!m_spEventPublisher->Publish<Event::Type::MigrationStarted>(asset, state.primary, target)) {
        if (auto const result = m_spMigrator->Cancel(asset); !result) {
            m_logger->warn("Failed to withdraw the migration plan for asset {}: {}", asset, result.what());
        }
        return Result{ ErrorCode::NetworkError, "Unable to announce the migration, the event channel is closed." };
    }

    auto const result = m_spMigrator->Execute(asset, [this, &state] (Migration::Plan const& plan) {
        return CommitMigration(plan, state.demand);
    });

    bool const published = (result) ?
        m_spEventPublisher->Publish<Event::Type::MigrationCompleted>(asset, target) :
        m_spEventPublisher->Publish<Event::Type::MigrationFailed>(asset, std::string{ result.what() });

    if (!published && result) {
        return Result{ ErrorCode::NetworkError, "Unable to announce the migration, the event channel is closed." };
    }

    return result;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Mesh::Coordinator::CommitMigration(Migration::Plan const& plan, Node::Resources const& demand)
{
    if (auto const result = m_spRegistry->Reserve(plan.target, demand); !result) { return result; }

    // The exchange fails if the asset no longer lives on the planned source, leaving its current host untouched.
    if (auto const result = m_spStateStore->ExchangePrimary(plan.asset, plan.source, plan.target); !result) {
        if (auto const released = m_spRegistry->Release(plan.target, demand); !released) {
            m_logger->warn("Failed to return the reservation on {}: {}", plan.target, released.what());
        }
        return result;
    }

    if (auto const result = m_spStateStore->Report(plan.asset, plan.target, Asset::Status::Active); !result) {
        m_logger->debug("Unable to record the new host report for asset {}: {}", plan.asset, result.what());
    }

    // The source may have already left the mesh, in which case its capacity no longer needs to be returned.
    if (auto const result = m_spRegistry->Release(plan.source, demand); !result) {
        m_logger->debug("Unable to return the capacity of asset {} to {}: {}", plan.asset, plan.source, result.what());
    }

    return Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result local::AssetNotFound(Asset::Identifier const& asset)
{
    return Mesh::Result{ Mesh::ErrorCode::AssetNotFound, fmt::format("asset {} is not allocated", asset) };
}

//----------------------------------------------------------------------------------------------------------------------
