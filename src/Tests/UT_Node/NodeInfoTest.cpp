//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Node/NodeInfo.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------

TEST(NodeInfoSuite, StatusTransitionTest)
{
    using enum Node::Status;
    EXPECT_TRUE(Node::IsTransitionAllowed(Active, Failed));
    EXPECT_TRUE(Node::IsTransitionAllowed(Active, Partitioned));
    EXPECT_TRUE(Node::IsTransitionAllowed(Partitioned, Active));
    EXPECT_TRUE(Node::IsTransitionAllowed(Suspected, Active));
    EXPECT_FALSE(Node::IsTransitionAllowed(Maintenance, Degraded));

    // A failed node can only return through an explicit join.
    for (auto const status : { Active, Degraded, Maintenance, Suspected, Partitioned }) {
        EXPECT_FALSE(Node::IsTransitionAllowed(Failed, status));
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NodeInfoSuite, ResourceFitTest)
{
    auto const capabilities = Node::Test::CreateCapabilities(4);
    auto available = Node::Resources::FromCapabilities(capabilities);
    EXPECT_DOUBLE_EQ(available.cpuCores, 4.0);
    EXPECT_EQ(available.memoryBytes, 8 * Node::Test::GiB);

    EXPECT_TRUE(available.CanFit(Node::Test::CreateDemand(4.0)));
    EXPECT_FALSE(available.CanFit(Node::Test::CreateDemand(4.5)));
    EXPECT_FALSE(available.CanFit(Node::Test::CreateDemand(1.0, 9 * Node::Test::GiB)));

    available.Subtract(Node::Test::CreateDemand(2.5, Node::Test::GiB));
    EXPECT_DOUBLE_EQ(available.cpuCores, 1.5);
    EXPECT_EQ(available.memoryBytes, 7 * Node::Test::GiB);
    EXPECT_TRUE(available.IsWithin(capabilities));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NodeInfoSuite, ResourceReleaseClampTest)
{
    auto const capabilities = Node::Test::CreateCapabilities(4);
    auto available = Node::Resources::FromCapabilities(capabilities);
    available.Subtract(Node::Test::CreateDemand(1.0));

    // Releasing more than was reserved never exceeds the capabilities.
    available.Add(Node::Test::CreateDemand(3.0, 4 * Node::Test::GiB), capabilities);
    EXPECT_EQ(available, Node::Resources::FromCapabilities(capabilities));
    EXPECT_TRUE(available.IsWithin(capabilities));
}

//----------------------------------------------------------------------------------------------------------------------
