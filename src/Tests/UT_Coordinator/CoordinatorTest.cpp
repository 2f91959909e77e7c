//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Parser.hpp"
#include "Interfaces/MigrationTransport.hpp"
#include "MeshNode/Coordinator.hpp"
#include "Tests/UT_Node/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class DroppingTransport;
class RelocatingTransport;

[[nodiscard]] Configuration::Settings CreateSettings(bool autoMigration = false);
[[nodiscard]] Placement::ConsensusVerdict CreateVerdict(bool approved);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

using namespace std::chrono_literals;

auto const Local = Node::Test::CreateIdentifier(0x01);
auto const Alpha = Node::Test::CreateIdentifier(0x0A);
auto const Beta = Node::Test::CreateIdentifier(0x0B);
auto const Gamma = Node::Test::CreateIdentifier(0x0C);

auto const Allocation = Node::Test::CreateAssetIdentifier(0xA0);

constexpr auto Deadline = 5s;

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

using namespace std::chrono_literals;

//----------------------------------------------------------------------------------------------------------------------

class local::DroppingTransport : public IMigrationTransport
{
public:
    // IMigrationTransport {
    [[nodiscard]] virtual Mesh::Result Prepare(Migration::Plan const&) override { return Mesh::Result{}; }

    [[nodiscard]] virtual Mesh::Expected<std::uint64_t> Transfer(Migration::Plan const&) override
    {
        return Mesh::Result{ Mesh::ErrorCode::NetworkError, "connection reset by peer" };
    }

    [[nodiscard]] virtual Mesh::Result Verify(Migration::Plan const&, std::uint64_t) override
    {
        return Mesh::Result{};
    }
    // } IMigrationTransport
};

//----------------------------------------------------------------------------------------------------------------------

// Moves the allocation to another host through the coordinator while its data is being transferred.
class local::RelocatingTransport : public IMigrationTransport
{
public:
    RelocatingTransport() : m_pCoordinator(nullptr) {}

    void Attach(Mesh::Coordinator* pCoordinator) { m_pCoordinator = pCoordinator; }

    // IMigrationTransport {
    [[nodiscard]] virtual Mesh::Result Prepare(Migration::Plan const&) override { return Mesh::Result{}; }

    [[nodiscard]] virtual Mesh::Expected<std::uint64_t> Transfer(Migration::Plan const& plan) override
    {
        // A slow source keeps the reallocation off of the node the asset was released from.
        if (auto const result = m_pCoordinator->UpdateMetrics(plan.source, { .averageResponseMs = 1'000.0 }); !result) {
            return result;
        }
        if (auto const result = m_pCoordinator->ReleaseAsset(plan.asset); !result) { return result; }

        auto const allocated = m_pCoordinator->AllocateAsset(
            plan.asset, local::CreateVerdict(true), Node::Test::CreateDemand(1.0));
        if (auto const pError = std::get_if<Mesh::Result>(&allocated); pError) { return *pError; }

        return std::uint64_t{ 0 };
    }

    [[nodiscard]] virtual Mesh::Result Verify(Migration::Plan const&, std::uint64_t) override
    {
        return Mesh::Result{};
    }
    // } IMigrationTransport

private:
    Mesh::Coordinator* m_pCoordinator;
};

//----------------------------------------------------------------------------------------------------------------------

class CoordinatorSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_upCoordinator = std::make_unique<Mesh::Coordinator>(local::CreateSettings());
        ASSERT_TRUE(m_upCoordinator->Initialize(test::Local));
    }

    void TearDown() override { m_upCoordinator->Shutdown(); }

    // Registers a large and a small node, so the large node is preferred for new allocations.
    void RegisterFleet()
    {
        ASSERT_TRUE(m_upCoordinator->RegisterNode(test::Alpha, Node::Test::CreateCapabilities(8)));
        ASSERT_TRUE(m_upCoordinator->RegisterNode(test::Beta, Node::Test::CreateCapabilities(2)));
    }

    void Allocate(Asset::Identifier const& asset, Node::Identifier const& expected, double cores = 1.0)
    {
        auto const allocated = m_upCoordinator->AllocateAsset(
            asset, local::CreateVerdict(true), Node::Test::CreateDemand(cores));
        ASSERT_TRUE(std::holds_alternative<Placement::Decision>(allocated));
        ASSERT_EQ(std::get<Placement::Decision>(allocated).target, expected);
    }

    [[nodiscard]] Node::Identifier FetchPrimary(Asset::Identifier const& asset) const
    {
        auto const synced = m_upCoordinator->SyncAssetState(asset);
        if (auto const pState = std::get_if<Asset::DistributedState>(&synced); pState) { return pState->primary; }
        return {};
    }

    std::unique_ptr<Mesh::Coordinator> m_upCoordinator;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(CoordinatorLifecycleSuite, LifecycleTest)
{
    Mesh::Coordinator coordinator{ local::CreateSettings() };
    EXPECT_EQ(coordinator.GetState(), Mesh::Coordinator::State::Standby);
    EXPECT_FALSE(coordinator.GetLocalNode());

    // The local node is only known once the coordinator has been initialized.
    EXPECT_EQ(coordinator.JoinNetwork(), Mesh::ErrorCode::InvalidState);
    EXPECT_EQ(coordinator.LeaveNetwork(), Mesh::ErrorCode::InvalidState);

    EXPECT_TRUE(coordinator.Initialize(test::Local));
    EXPECT_EQ(coordinator.GetState(), Mesh::Coordinator::State::Active);
    EXPECT_EQ(coordinator.GetLocalNode(), test::Local);
    EXPECT_EQ(coordinator.Initialize(test::Alpha), Mesh::ErrorCode::InvalidState);
    EXPECT_EQ(coordinator.GetLocalNode(), test::Local);

    EXPECT_TRUE(coordinator.JoinNetwork());
    auto const optLocal = coordinator.GetNode(test::Local);
    ASSERT_TRUE(optLocal);
    EXPECT_EQ(optLocal->status, Node::Status::Active);
    EXPECT_EQ(optLocal->capabilities.cpuCores, Mesh::GetDefaultLocalCapabilities().cpuCores);

    EXPECT_TRUE(coordinator.LeaveNetwork());
    EXPECT_FALSE(coordinator.GetNode(test::Local));

    coordinator.Shutdown();
    EXPECT_EQ(coordinator.GetState(), Mesh::Coordinator::State::Stopped);
    coordinator.Shutdown();
    EXPECT_EQ(coordinator.GetState(), Mesh::Coordinator::State::Stopped);

    // Once the event channel has closed the local node can no longer be announced.
    EXPECT_EQ(coordinator.JoinNetwork(), Mesh::ErrorCode::NetworkError);
    EXPECT_EQ(coordinator.Initialize(test::Local), Mesh::ErrorCode::InvalidState);
    EXPECT_EQ(
        coordinator.HandleEvent<Event::Type::PartitionHealed>(std::string{ "partition" }),
        Mesh::ErrorCode::NetworkError);

    auto const metrics = coordinator.GetMetrics();
    EXPECT_EQ(metrics.totalNodes, 0);
    EXPECT_EQ(metrics.processedEvents, 2);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, RegisterNodeTest)
{
    RegisterFleet();

    auto const optAlpha = m_upCoordinator->GetNode(test::Alpha);
    ASSERT_TRUE(optAlpha);
    EXPECT_EQ(optAlpha->capabilities.cpuCores, 8);
    EXPECT_DOUBLE_EQ(optAlpha->available.cpuCores, 8.0);

    EXPECT_TRUE(m_upCoordinator->UpdateMetrics(test::Alpha, { .cpuUtilization = 0.5, .memoryUtilization = 0.25 }));
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->metrics.cpuUtilization, 0.5);

    EXPECT_EQ(m_upCoordinator->UpdateHeartbeat(test::Gamma), Mesh::ErrorCode::NotFound);
    EXPECT_EQ(m_upCoordinator->UpdateMetrics(test::Gamma, {}), Mesh::ErrorCode::NotFound);
    EXPECT_FALSE(m_upCoordinator->GetNode(test::Gamma));

    auto const topology = m_upCoordinator->GetTopology();
    EXPECT_EQ(topology.nodes.size(), 2);
    EXPECT_TRUE(topology.partitions.empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, AllocateAssetTest)
{
    RegisterFleet();

    auto const rejected = m_upCoordinator->AllocateAsset(
        test::Allocation, local::CreateVerdict(false), Node::Test::CreateDemand(1.0));
    ASSERT_TRUE(std::holds_alternative<Mesh::Result>(rejected));
    EXPECT_EQ(std::get<Mesh::Result>(rejected), Mesh::ErrorCode::AllocationFailed);
    EXPECT_TRUE(std::holds_alternative<Mesh::Result>(m_upCoordinator->SyncAssetState(test::Allocation)));

    auto const allocated = m_upCoordinator->AllocateAsset(
        test::Allocation, local::CreateVerdict(true), Node::Test::CreateDemand(2.0));
    ASSERT_TRUE(std::holds_alternative<Placement::Decision>(allocated));

    auto const& decision = std::get<Placement::Decision>(allocated);
    EXPECT_EQ(decision.asset, test::Allocation);
    EXPECT_EQ(decision.target, test::Alpha);
    EXPECT_GT(decision.score, 0.0);
    ASSERT_EQ(decision.participants.size(), 2);
    EXPECT_EQ(decision.participants[0], test::Alpha);
    EXPECT_EQ(decision.participants[1], test::Beta);
    EXPECT_EQ(decision.signatures.size(), 2);

    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->available.cpuCores, 6.0);

    auto const synced = m_upCoordinator->SyncAssetState(test::Allocation);
    ASSERT_TRUE(std::holds_alternative<Asset::DistributedState>(synced));
    auto const& state = std::get<Asset::DistributedState>(synced);
    EXPECT_EQ(state.primary, test::Alpha);
    EXPECT_DOUBLE_EQ(state.demand.cpuCores, 2.0);
    ASSERT_EQ(state.reports.size(), 1);
    EXPECT_EQ(state.reports.begin()->second, Asset::Status::Allocated);

    // An asset may only be allocated once.
    auto const duplicate = m_upCoordinator->AllocateAsset(
        test::Allocation, local::CreateVerdict(true), Node::Test::CreateDemand(1.0));
    ASSERT_TRUE(std::holds_alternative<Mesh::Result>(duplicate));
    EXPECT_EQ(std::get<Mesh::Result>(duplicate), Mesh::ErrorCode::Conflict);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->available.cpuCores, 6.0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, AllocateWithoutCapacityTest)
{
    auto const empty = m_upCoordinator->AllocateAsset(test::Allocation, local::CreateVerdict(true));
    ASSERT_TRUE(std::holds_alternative<Mesh::Result>(empty));
    EXPECT_EQ(std::get<Mesh::Result>(empty).GetMessage(), "no eligible node");

    RegisterFleet();
    auto const oversized = m_upCoordinator->AllocateAsset(
        test::Allocation, local::CreateVerdict(true), Node::Test::CreateDemand(16.0));
    ASSERT_TRUE(std::holds_alternative<Mesh::Result>(oversized));
    EXPECT_EQ(std::get<Mesh::Result>(oversized), Mesh::ErrorCode::AllocationFailed);
    EXPECT_FALSE(std::holds_alternative<Asset::DistributedState>(m_upCoordinator->SyncAssetState(test::Allocation)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, ReleaseAssetTest)
{
    RegisterFleet();
    Allocate(test::Allocation, test::Alpha, 4.0);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->available.cpuCores, 4.0);

    EXPECT_TRUE(m_upCoordinator->ReleaseAsset(test::Allocation));
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->available.cpuCores, 8.0);
    EXPECT_EQ(m_upCoordinator->ReleaseAsset(test::Allocation), Mesh::ErrorCode::AssetNotFound);

    // A released asset may be allocated again.
    Allocate(test::Allocation, test::Alpha);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, ReportAssetStateTest)
{
    RegisterFleet();
    EXPECT_EQ(
        m_upCoordinator->ReportAssetState(test::Allocation, test::Beta, Asset::Status::Active),
        Mesh::ErrorCode::AssetNotFound);

    Allocate(test::Allocation, test::Alpha);
    EXPECT_TRUE(m_upCoordinator->ReportAssetState(test::Allocation, test::Alpha, Asset::Status::Active));
    EXPECT_TRUE(m_upCoordinator->ReportAssetState(test::Allocation, test::Beta, Asset::Status::Active));

    auto const synced = m_upCoordinator->SyncAssetState(test::Allocation);
    ASSERT_TRUE(std::holds_alternative<Asset::DistributedState>(synced));
    auto const& reports = std::get<Asset::DistributedState>(synced).reports;
    ASSERT_EQ(reports.size(), 2);
    EXPECT_EQ(reports.at(test::Alpha), Asset::Status::Active);
    EXPECT_EQ(reports.at(test::Beta), Asset::Status::Active);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, MigrateAssetTest)
{
    RegisterFleet();
    EXPECT_EQ(m_upCoordinator->MigrateAsset(test::Allocation, test::Beta), Mesh::ErrorCode::AssetNotFound);

    Allocate(test::Allocation, test::Alpha);

    // Moving an asset to where it already lives is a no-op.
    EXPECT_TRUE(m_upCoordinator->MigrateAsset(test::Allocation, test::Alpha));
    EXPECT_TRUE(m_upCoordinator->GetMigrationHistory(test::Allocation).empty());

    EXPECT_EQ(m_upCoordinator->MigrateAsset(test::Allocation, test::Gamma), Mesh::ErrorCode::NetworkError);

    EXPECT_TRUE(m_upCoordinator->MigrateAsset(test::Allocation, test::Beta));
    EXPECT_EQ(FetchPrimary(test::Allocation), test::Beta);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->available.cpuCores, 8.0);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Beta)->available.cpuCores, 1.0);
    EXPECT_FALSE(m_upCoordinator->GetMigrationStatus(test::Allocation));

    auto const history = m_upCoordinator->GetMigrationHistory(test::Allocation);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.front().state, Migration::State::Completed);
    EXPECT_EQ(history.front().plan.source, test::Alpha);
    EXPECT_EQ(history.front().plan.target, test::Beta);
    EXPECT_EQ(history.front().plan.reason, Migration::Reason::Manual);
    EXPECT_EQ(history.front().plan.strategy, Migration::Strategy::LiveMigration);

    EXPECT_EQ(m_upCoordinator->CancelMigration(test::Allocation), Mesh::ErrorCode::NotFound);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, MigrateToFullNodeTest)
{
    RegisterFleet();
    Allocate(test::Allocation, test::Alpha, 4.0);

    // The target can not host the allocation, so the move fails and the asset stays in place.
    EXPECT_EQ(m_upCoordinator->MigrateAsset(test::Allocation, test::Beta), Mesh::ErrorCode::AllocationFailed);
    EXPECT_EQ(FetchPrimary(test::Allocation), test::Alpha);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Alpha)->available.cpuCores, 4.0);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Beta)->available.cpuCores, 2.0);

    auto const history = m_upCoordinator->GetMigrationHistory(test::Allocation);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.front().state, Migration::State::Failed);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, NodeFailureTest)
{
    RegisterFleet();
    Allocate(test::Allocation, test::Alpha);

    // A slow small node keeps the second allocation on the large node.
    ASSERT_TRUE(m_upCoordinator->UpdateMetrics(test::Beta, { .averageResponseMs = 1'000.0 }));
    auto const secondary = Node::Test::CreateAssetIdentifier(0xA1);
    Allocate(secondary, test::Alpha);

    // Only the small node keeps reporting, so only the large node exceeds the failure timeout.
    auto const later = TimeUtils::GetSystemTimepoint() + 31s;
    ASSERT_TRUE(m_upCoordinator->UpdateHeartbeat(test::Beta, later));
    auto const failed = m_upCoordinator->CheckHeartbeats(later);
    ASSERT_EQ(failed.size(), 1);
    EXPECT_EQ(failed.front(), test::Alpha);
    EXPECT_EQ(m_upCoordinator->GetNode(test::Alpha)->status, Node::Status::Failed);
    EXPECT_TRUE(m_upCoordinator->CheckHeartbeats(later).empty());

    // Automatic migration is disabled, the assets remain on the failed node until the failure is handled.
    EXPECT_EQ(FetchPrimary(test::Allocation), test::Alpha);

    EXPECT_TRUE(m_upCoordinator->HandleNodeFailure(test::Alpha));
    EXPECT_EQ(FetchPrimary(test::Allocation), test::Beta);
    EXPECT_EQ(FetchPrimary(secondary), test::Beta);
    EXPECT_DOUBLE_EQ(m_upCoordinator->GetNode(test::Beta)->available.cpuCores, 0.0);

    auto const history = m_upCoordinator->GetMigrationHistory(test::Allocation);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.front().plan.reason, Migration::Reason::NodeFailure);
    EXPECT_EQ(history.front().state, Migration::State::Completed);

    // Handling the failure again has nothing left to move.
    EXPECT_TRUE(m_upCoordinator->HandleNodeFailure(test::Alpha));

    m_upCoordinator->Shutdown();
    auto const metrics = m_upCoordinator->GetMetrics();
    EXPECT_EQ(metrics.totalNodes, 2);
    EXPECT_EQ(metrics.healthyNodes, 1);
    EXPECT_EQ(metrics.failedNodes, 1);
    EXPECT_EQ(metrics.successfulMigrations, 2);
    EXPECT_EQ(metrics.failedMigrations, 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, NodeFailureWithoutCapacityTest)
{
    RegisterFleet();
    Allocate(test::Allocation, test::Alpha, 4.0);

    auto const later = TimeUtils::GetSystemTimepoint() + 31s;
    ASSERT_TRUE(m_upCoordinator->UpdateHeartbeat(test::Beta, later));
    ASSERT_EQ(m_upCoordinator->CheckHeartbeats(later).size(), 1);

    EXPECT_EQ(m_upCoordinator->HandleNodeFailure(test::Alpha), Mesh::ErrorCode::AllocationFailed);
    EXPECT_EQ(FetchPrimary(test::Allocation), test::Alpha);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, MembershipMetricsTest)
{
    ASSERT_TRUE(m_upCoordinator->JoinNetwork(Node::Test::CreateCapabilities(4)));
    RegisterFleet();

    auto const later = TimeUtils::GetSystemTimepoint() + 31s;
    ASSERT_TRUE(m_upCoordinator->UpdateHeartbeat(test::Beta, later));
    ASSERT_EQ(m_upCoordinator->CheckHeartbeats(later).size(), 2);

    // The failed node rejoins and the healthy node registers a second time, neither adds to the fleet size.
    ASSERT_TRUE(m_upCoordinator->RegisterNode(test::Alpha, Node::Test::CreateCapabilities(8)));
    EXPECT_EQ(m_upCoordinator->GetNode(test::Alpha)->status, Node::Status::Active);
    ASSERT_TRUE(m_upCoordinator->RegisterNode(test::Beta, Node::Test::CreateCapabilities(2)));

    // The local node leaves while it is still marked failed.
    EXPECT_EQ(m_upCoordinator->GetNode(test::Local)->status, Node::Status::Failed);
    ASSERT_TRUE(m_upCoordinator->LeaveNetwork());

    m_upCoordinator->Shutdown();
    auto const metrics = m_upCoordinator->GetMetrics();
    EXPECT_EQ(metrics.totalNodes, 2);
    EXPECT_EQ(metrics.healthyNodes, 2);
    EXPECT_EQ(metrics.failedNodes, 2);
    EXPECT_EQ(metrics.processedEvents, 8);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CoordinatorAutomaticMigrationSuite, NodeFailureTest)
{
    Mesh::Coordinator coordinator{ local::CreateSettings(true) };
    ASSERT_TRUE(coordinator.Initialize(test::Local));
    ASSERT_TRUE(coordinator.RegisterNode(test::Alpha, Node::Test::CreateCapabilities(8)));
    ASSERT_TRUE(coordinator.RegisterNode(test::Beta, Node::Test::CreateCapabilities(2)));

    auto const allocated = coordinator.AllocateAsset(
        test::Allocation, local::CreateVerdict(true), Node::Test::CreateDemand(1.0));
    ASSERT_TRUE(std::holds_alternative<Placement::Decision>(allocated));
    ASSERT_EQ(std::get<Placement::Decision>(allocated).target, test::Alpha);

    auto const later = TimeUtils::GetSystemTimepoint() + 31s;
    ASSERT_TRUE(coordinator.UpdateHeartbeat(test::Beta, later));
    ASSERT_EQ(coordinator.CheckHeartbeats(later).size(), 1);

    // The failure is handled on the event processor's thread.
    auto const primary = [&coordinator] () -> Node::Identifier {
        auto const synced = coordinator.SyncAssetState(test::Allocation);
        if (auto const pState = std::get_if<Asset::DistributedState>(&synced); pState) { return pState->primary; }
        return {};
    };

    auto const deadline = std::chrono::steady_clock::now() + test::Deadline;
    while (primary() != test::Beta && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(primary(), test::Beta);

    coordinator.Shutdown();
    auto const metrics = coordinator.GetMetrics();
    EXPECT_EQ(metrics.failedNodes, 1);
    EXPECT_EQ(metrics.successfulMigrations, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CoordinatorTransportSuite, FailedTransferTest)
{
    Mesh::Coordinator coordinator{ local::CreateSettings(), std::make_shared<local::DroppingTransport>() };
    ASSERT_TRUE(coordinator.Initialize(test::Local));
    ASSERT_TRUE(coordinator.RegisterNode(test::Alpha, Node::Test::CreateCapabilities(8)));
    ASSERT_TRUE(coordinator.RegisterNode(test::Beta, Node::Test::CreateCapabilities(2)));

    auto const allocated = coordinator.AllocateAsset(
        test::Allocation, local::CreateVerdict(true), Node::Test::CreateDemand(1.0));
    ASSERT_TRUE(std::holds_alternative<Placement::Decision>(allocated));

    EXPECT_EQ(coordinator.MigrateAsset(test::Allocation, test::Beta), Mesh::ErrorCode::NetworkError);
    EXPECT_DOUBLE_EQ(coordinator.GetNode(test::Beta)->available.cpuCores, 2.0);

    auto const history = coordinator.GetMigrationHistory(test::Allocation);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.front().state, Migration::State::Failed);
    ASSERT_TRUE(history.front().error);
    EXPECT_NE(history.front().error->find("connection reset by peer"), std::string::npos);

    auto const synced = coordinator.SyncAssetState(test::Allocation);
    ASSERT_TRUE(std::holds_alternative<Asset::DistributedState>(synced));
    EXPECT_EQ(std::get<Asset::DistributedState>(synced).primary, test::Alpha);

    coordinator.Shutdown();
    auto const metrics = coordinator.GetMetrics();
    EXPECT_EQ(metrics.successfulMigrations, 0);
    EXPECT_EQ(metrics.failedMigrations, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CoordinatorTransportSuite, ConcurrentRelocationTest)
{
    auto const spTransport = std::make_shared<local::RelocatingTransport>();
    Mesh::Coordinator coordinator{ local::CreateSettings(), spTransport };
    spTransport->Attach(&coordinator);

    ASSERT_TRUE(coordinator.Initialize(test::Local));
    ASSERT_TRUE(coordinator.RegisterNode(test::Alpha, Node::Test::CreateCapabilities(8)));
    ASSERT_TRUE(coordinator.RegisterNode(test::Beta, Node::Test::CreateCapabilities(2)));
    ASSERT_TRUE(coordinator.RegisterNode(test::Gamma, Node::Test::CreateCapabilities(4)));

    auto const allocated = coordinator.AllocateAsset(
        test::Allocation, local::CreateVerdict(true), Node::Test::CreateDemand(1.0));
    ASSERT_TRUE(std::holds_alternative<Placement::Decision>(allocated));
    ASSERT_EQ(std::get<Placement::Decision>(allocated).target, test::Alpha);

    // The asset lands on the small node during the transfer, so the planned move from the large node is refused.
    EXPECT_EQ(coordinator.MigrateAsset(test::Allocation, test::Gamma), Mesh::ErrorCode::Conflict);

    auto const synced = coordinator.SyncAssetState(test::Allocation);
    ASSERT_TRUE(std::holds_alternative<Asset::DistributedState>(synced));
    EXPECT_EQ(std::get<Asset::DistributedState>(synced).primary, test::Beta);

    EXPECT_DOUBLE_EQ(coordinator.GetNode(test::Alpha)->available.cpuCores, 8.0);
    EXPECT_DOUBLE_EQ(coordinator.GetNode(test::Beta)->available.cpuCores, 1.0);
    EXPECT_DOUBLE_EQ(coordinator.GetNode(test::Gamma)->available.cpuCores, 4.0);

    auto const history = coordinator.GetMigrationHistory(test::Allocation);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.front().state, Migration::State::Failed);

    coordinator.Shutdown();
    EXPECT_EQ(coordinator.GetMetrics().failedMigrations, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, PartitionTest)
{
    ASSERT_TRUE(m_upCoordinator->JoinNetwork(Node::Test::CreateCapabilities(4)));
    RegisterFleet();

    m_upCoordinator->RecordProbe(test::Local, test::Beta, false, 0.0, 0.0);
    m_upCoordinator->RecordProbe(test::Alpha, test::Beta, false, 0.0, 0.0);

    auto const opened = m_upCoordinator->CheckPartitions();
    ASSERT_EQ(opened.size(), 1);
    EXPECT_EQ(opened.front().members, Fleet::MemberSet{ test::Beta });
    EXPECT_EQ(m_upCoordinator->GetNode(test::Beta)->status, Node::Status::Partitioned);
    EXPECT_TRUE(m_upCoordinator->CheckPartitions().empty());

    auto const divided = m_upCoordinator->GetTopology();
    ASSERT_EQ(divided.partitions.size(), 1);
    EXPECT_FALSE(divided.partitions.front().healed);
    EXPECT_EQ(divided.partitions.front().members, Fleet::MemberSet{ test::Beta });

    m_upCoordinator->RecordProbe(test::Local, test::Beta, true, 12.0, 100.0);
    m_upCoordinator->RecordProbe(test::Alpha, test::Beta, true, 15.0, 100.0);
    EXPECT_TRUE(m_upCoordinator->CheckPartitions().empty());
    EXPECT_EQ(m_upCoordinator->GetNode(test::Beta)->status, Node::Status::Active);

    // Healed partitions are no longer part of the topology.
    auto const topology = m_upCoordinator->GetTopology();
    EXPECT_TRUE(topology.partitions.empty());
    EXPECT_DOUBLE_EQ(topology.latency.at({ test::Local, test::Beta }), 12.0);
    EXPECT_TRUE(topology.reachability.at({ test::Alpha, test::Beta }));

    m_upCoordinator->Shutdown();
    auto const metrics = m_upCoordinator->GetMetrics();
    EXPECT_EQ(metrics.partitionsDetected, 1);
    EXPECT_EQ(metrics.partitionsHealed, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, ByzantineDetectionTest)
{
    RegisterFleet();
    EXPECT_TRUE(m_upCoordinator->CheckByzantineBehavior().empty());
    EXPECT_TRUE(m_upCoordinator->DetectByzantineNodes().empty());

    ASSERT_TRUE(m_upCoordinator->UpdateMetrics(test::Beta, { .successRate = 0.2 }));
    auto const flagged = m_upCoordinator->CheckByzantineBehavior();
    ASSERT_EQ(flagged.size(), 1);
    EXPECT_EQ(flagged.front(), test::Beta);

    auto const suspected = m_upCoordinator->DetectByzantineNodes();
    ASSERT_EQ(suspected.size(), 1);
    EXPECT_EQ(suspected.front(), test::Beta);
    EXPECT_EQ(m_upCoordinator->GetNode(test::Beta)->status, Node::Status::Suspected);

    m_upCoordinator->Shutdown();
    EXPECT_EQ(m_upCoordinator->GetMetrics().byzantineNodes, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, BalanceLoadTest)
{
    RegisterFleet();
    Allocate(test::Allocation, test::Alpha);
    ASSERT_TRUE(m_upCoordinator->RegisterNode(test::Gamma, Node::Test::CreateCapabilities(8)));

    ASSERT_TRUE(m_upCoordinator->UpdateMetrics(test::Alpha, { .cpuUtilization = 0.9, .memoryUtilization = 0.9 }));
    ASSERT_TRUE(m_upCoordinator->UpdateMetrics(test::Beta, { .cpuUtilization = 0.3, .memoryUtilization = 0.3 }));
    ASSERT_TRUE(m_upCoordinator->UpdateMetrics(test::Gamma, { .cpuUtilization = 0.1, .memoryUtilization = 0.1 }));

    EXPECT_EQ(m_upCoordinator->BalanceLoad(), 1);
    EXPECT_EQ(FetchPrimary(test::Allocation), test::Gamma);

    auto const history = m_upCoordinator->GetMigrationHistory(test::Allocation);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.front().plan.reason, Migration::Reason::LoadBalancing);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CoordinatorSuite, MarketTest)
{
    Market::Offer offer;
    offer.provider = test::Alpha;
    offer.type = Asset::Type::Cpu;
    offer.amount = 4.0;
    offer.price = 0.10;
    EXPECT_TRUE(m_upCoordinator->OfferResources(offer));

    Market::Request request;
    request.consumer = test::Beta;
    request.type = Asset::Type::Cpu;
    request.amount = 4.0;
    request.maxPrice = 0.10;
    request.duration = 2h;

    auto const compatible = m_upCoordinator->RequestResources(request);
    ASSERT_TRUE(std::holds_alternative<std::vector<Market::Offer>>(compatible));
    EXPECT_EQ(std::get<std::vector<Market::Offer>>(compatible).size(), 1);

    auto const agreements = m_upCoordinator->Agreements();
    ASSERT_EQ(agreements.size(), 1);
    EXPECT_DOUBLE_EQ(agreements.front().price, 0.8);
    EXPECT_TRUE(m_upCoordinator->MatchMarket().empty());

    auto const usage = m_upCoordinator->RecordUsage(agreements.front().identifier, 2.0, 1h);
    ASSERT_TRUE(std::holds_alternative<Market::UsageRecord>(usage));
    EXPECT_DOUBLE_EQ(std::get<Market::UsageRecord>(usage).cost, 0.2);

    EXPECT_TRUE(m_upCoordinator->CancelAgreement(agreements.front().identifier));
    EXPECT_EQ(m_upCoordinator->CancelAgreement(agreements.front().identifier), Mesh::ErrorCode::InvalidState);

    Market::Offer invalid = offer;
    invalid.amount = -1.0;
    EXPECT_EQ(m_upCoordinator->OfferResources(invalid), Mesh::ErrorCode::InvalidArgument);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Settings local::CreateSettings(bool autoMigration)
{
    Configuration::Parser parser;
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    auto settings = parser.GetSettings();
    settings.migration = Configuration::Options::Migration{ autoMigration, settings.migration.PreferLive() };
    return settings;
}

//----------------------------------------------------------------------------------------------------------------------

Placement::ConsensusVerdict local::CreateVerdict(bool approved)
{
    Placement::ConsensusVerdict verdict{ .approved = approved, .attestations = {} };
    if (approved) {
        verdict.attestations.emplace_back(Placement::Attestation{ .node = test::Alpha, .signature = { 0x01, 0x02 } });
        verdict.attestations.emplace_back(Placement::Attestation{ .node = test::Beta, .signature = { 0x03, 0x04 } });
    }
    return verdict;
}

//----------------------------------------------------------------------------------------------------------------------
