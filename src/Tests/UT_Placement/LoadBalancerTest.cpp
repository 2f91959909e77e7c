//----------------------------------------------------------------------------------------------------------------------
#include "Components/Placement/LoadBalancer.hpp"
#include "Tests/UT_Node/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr double DeviationThreshold = 0.2;

auto const Busy = Node::Test::CreateIdentifier(0x0A);
auto const Idle = Node::Test::CreateIdentifier(0x0B);
auto const Moderate = Node::Test::CreateIdentifier(0x0C);
auto const Crowded = Node::Test::CreateIdentifier(0x0D);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class LoadBalancerSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_upBalancer = std::make_unique<Placement::LoadBalancer>(
            m_resources.GetServiceProvider(), test::DeviationThreshold,
            [this] (Asset::Identifier const& asset, Node::Identifier const& target, Migration::Reason reason) {
                EXPECT_EQ(reason, Migration::Reason::LoadBalancing);
                m_requested.emplace_back(Placement::Move{ .asset = asset, .source = {}, .target = target });
                return m_result;
            });
    }

    void Join(Node::Identifier const& identifier, double utilization)
    {
        auto const& spRegistry = m_resources.GetRegistry();
        ASSERT_TRUE(spRegistry->Join(identifier, Node::Test::CreateCapabilities(8)));
        ASSERT_TRUE(spRegistry->UpdateMetrics(
            identifier, { .cpuUtilization = utilization, .memoryUtilization = utilization }));
    }

    Node::Test::ServiceResources m_resources;
    std::unique_ptr<Placement::LoadBalancer> m_upBalancer;
    std::vector<Placement::Move> m_requested;
    Mesh::Result m_result;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, LoadTest)
{
    Node::Info info;
    info.metrics.cpuUtilization = 0.8;
    info.metrics.memoryUtilization = 0.4;
    EXPECT_DOUBLE_EQ(Placement::LoadBalancer::Load(info), 0.6);
    EXPECT_DOUBLE_EQ(m_upBalancer->GetDeviationThreshold(), test::DeviationThreshold);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, BalancedFleetTest)
{
    Join(test::Busy, 0.5);
    Join(test::Idle, 0.4);
    Join(test::Moderate, 0.45);
    m_resources.Place(Node::Test::CreateAssetIdentifier(0x01), test::Busy);

    EXPECT_TRUE(m_upBalancer->Plan().empty());
    EXPECT_TRUE(m_upBalancer->Balance().empty());
    EXPECT_TRUE(m_requested.empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, SingleNodeTest)
{
    Join(test::Busy, 0.95);
    m_resources.Place(Node::Test::CreateAssetIdentifier(0x01), test::Busy);
    EXPECT_TRUE(m_upBalancer->Plan().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, MoveToLeastLoadedTest)
{
    Join(test::Busy, 0.9);
    Join(test::Moderate, 0.3);
    Join(test::Idle, 0.2);

    auto const asset = Node::Test::CreateAssetIdentifier(0x01);
    m_resources.Place(asset, test::Busy, Node::Test::CreateDemand(1.0));

    auto const moves = m_upBalancer->Plan();
    ASSERT_EQ(moves.size(), 1);
    EXPECT_EQ(moves.front().asset, asset);
    EXPECT_EQ(moves.front().source, test::Busy);
    EXPECT_EQ(moves.front().target, test::Idle);

    auto const applied = m_upBalancer->Balance();
    ASSERT_EQ(applied.size(), 1);
    ASSERT_EQ(m_requested.size(), 1);
    EXPECT_EQ(m_requested.front().asset, asset);
    EXPECT_EQ(m_requested.front().target, test::Idle);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, TargetClaimedOncePerRoundTest)
{
    Join(test::Busy, 0.9);
    Join(test::Crowded, 0.9);
    Join(test::Idle, 0.0);
    Join(test::Moderate, 0.1);

    m_resources.Place(Node::Test::CreateAssetIdentifier(0x01), test::Busy);
    m_resources.Place(Node::Test::CreateAssetIdentifier(0x02), test::Crowded);

    auto const moves = m_upBalancer->Plan();
    ASSERT_EQ(moves.size(), 2);
    EXPECT_NE(moves[0].target, moves[1].target);
    EXPECT_EQ(moves[0].target, test::Idle);
    EXPECT_EQ(moves[1].target, test::Moderate);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, TargetCapacityTest)
{
    Join(test::Busy, 0.9);
    Join(test::Idle, 0.1);
    Join(test::Moderate, 0.2);

    // The demand can not fit on any underloaded node.
    m_resources.Place(Node::Test::CreateAssetIdentifier(0x01), test::Busy, Node::Test::CreateDemand(16.0));
    EXPECT_TRUE(m_upBalancer->Plan().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(LoadBalancerSuite, FailedMigrationTest)
{
    Join(test::Busy, 0.9);
    Join(test::Idle, 0.1);
    Join(test::Moderate, 0.2);
    m_resources.Place(Node::Test::CreateAssetIdentifier(0x01), test::Busy);

    m_result = Mesh::Result{ Mesh::ErrorCode::MigrationInProgress };
    EXPECT_TRUE(m_upBalancer->Balance().empty());
    EXPECT_EQ(m_requested.size(), 1);
}

//----------------------------------------------------------------------------------------------------------------------
