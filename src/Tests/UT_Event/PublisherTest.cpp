//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Events.hpp"
#include "Components/Event/Processor.hpp"
#include "Components/Event/Publisher.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Tests/UT_Node/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

auto const Identifier = Node::Test::CreateIdentifier(0x01);
auto const Allocation = Node::Test::CreateAssetIdentifier(0xA0);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, SubscribeAndDispatchTest)
{
    Event::Publisher publisher;

    std::vector<std::string> reasons;
    EXPECT_TRUE(publisher.Subscribe<Event::Type::NodeLeft>(
        [&reasons] (Node::Identifier const& identifier, std::string const& reason) {
            EXPECT_EQ(identifier, test::Identifier);
            reasons.emplace_back(reason);
        }));

    EXPECT_TRUE(publisher.IsSubscribed(Event::Type::NodeLeft));
    EXPECT_FALSE(publisher.IsSubscribed(Event::Type::NodeJoined));
    EXPECT_EQ(publisher.ListenerCount(), 1);

    EXPECT_TRUE(publisher.Publish<Event::Type::NodeLeft>(test::Identifier, std::string{ "maintenance" }));
    EXPECT_TRUE(publisher.Publish<Event::Type::NodeLeft>(test::Identifier, std::string{ "shutdown" }));
    EXPECT_EQ(publisher.EventCount(), 2);
    EXPECT_TRUE(reasons.empty());

    EXPECT_EQ(publisher.Dispatch(), 2);
    EXPECT_EQ(publisher.EventCount(), 0);
    EXPECT_EQ(reasons, (std::vector<std::string>{ "maintenance", "shutdown" }));

    EXPECT_EQ(publisher.Dispatch(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, MultipleListenersTest)
{
    Event::Publisher publisher;

    std::uint32_t first = 0;
    std::uint32_t second = 0;
    EXPECT_TRUE(publisher.Subscribe<Event::Type::MigrationCompleted>(
        [&first] (Asset::Identifier const&, Node::Identifier const&) { ++first; }));
    EXPECT_TRUE(publisher.Subscribe<Event::Type::MigrationCompleted>(
        [&second] (Asset::Identifier const&, Node::Identifier const&) { ++second; }));

    EXPECT_TRUE(publisher.Publish<Event::Type::MigrationCompleted>(test::Allocation, test::Identifier));
    EXPECT_EQ(publisher.Dispatch(), 1);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, UnsubscribedEventTest)
{
    Event::Publisher publisher;

    // An event nobody listens for is accepted and discarded.
    EXPECT_TRUE(publisher.Publish<Event::Type::PartitionHealed>(std::string{ "partition" }));
    EXPECT_EQ(publisher.EventCount(), 0);
    EXPECT_EQ(publisher.Dispatch(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, OrderingAcrossTypesTest)
{
    Event::Publisher publisher;

    std::vector<Event::Type> received;
    EXPECT_TRUE(publisher.Subscribe<Event::Type::MigrationStarted>(
        [&received] (Asset::Identifier const&, Node::Identifier const&, Node::Identifier const&) {
            received.emplace_back(Event::Type::MigrationStarted);
        }));
    EXPECT_TRUE(publisher.Subscribe<Event::Type::MigrationFailed>(
        [&received] (Asset::Identifier const&, std::string const&) {
            received.emplace_back(Event::Type::MigrationFailed);
        }));

    auto const target = Node::Test::CreateIdentifier(0x02);
    EXPECT_TRUE(publisher.Publish<Event::Type::MigrationStarted>(test::Allocation, test::Identifier, target));
    EXPECT_TRUE(publisher.Publish<Event::Type::MigrationFailed>(test::Allocation, std::string{ "link dropped" }));
    EXPECT_TRUE(publisher.Publish<Event::Type::MigrationStarted>(test::Allocation, test::Identifier, target));

    EXPECT_EQ(publisher.Dispatch(), 3);
    EXPECT_EQ(received, (std::vector<Event::Type>{
        Event::Type::MigrationStarted, Event::Type::MigrationFailed, Event::Type::MigrationStarted }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, SuspendSubscriptionsTest)
{
    Event::Publisher publisher;
    publisher.SuspendSubscriptions();

    EXPECT_FALSE(publisher.Subscribe<Event::Type::NodeFailed>(
        [] (Node::Identifier const&, TimeUtils::Timepoint) { }));
    EXPECT_FALSE(publisher.IsSubscribed(Event::Type::NodeFailed));
    EXPECT_EQ(publisher.ListenerCount(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, CloseTest)
{
    Event::Publisher publisher;
    EXPECT_TRUE(publisher.Subscribe<Event::Type::PartitionHealed>([] (std::string const&) { }));

    EXPECT_TRUE(publisher.Publish<Event::Type::PartitionHealed>(std::string{ "partition" }));
    EXPECT_FALSE(publisher.IsClosed());

    publisher.Close();
    EXPECT_TRUE(publisher.IsClosed());
    EXPECT_FALSE(publisher.Publish<Event::Type::PartitionHealed>(std::string{ "partition" }));

    // Events accepted before the close remain available.
    EXPECT_TRUE(publisher.AwaitEvents());
    EXPECT_EQ(publisher.Dispatch(), 1);
    EXPECT_FALSE(publisher.AwaitEvents());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PublisherSuite, AdvertiseTest)
{
    Event::Publisher publisher;
    EXPECT_FALSE(publisher.IsAdvertised(Event::Type::NodeJoined));

    publisher.Advertise(Event::Type::NodeJoined);
    publisher.Advertise({ Event::Type::NodeLeft, Event::Type::NodeJoined });
    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::NodeJoined));
    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::NodeLeft));
    EXPECT_EQ(publisher.AdvertisedCount(), 2);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ProcessorSuite, DrainOnShutdownTest)
{
    auto const spServiceProvider = std::make_shared<Mesh::ServiceProvider>();
    auto const spPublisher = std::make_shared<Event::Publisher>();
    spServiceProvider->Register(spPublisher);

    // Listeners run on the processor's thread. The results are read only after the worker has been joined.
    std::vector<std::string> healed;
    EXPECT_TRUE(spPublisher->Subscribe<Event::Type::PartitionHealed>([&healed] (std::string const& identifier) {
        healed.emplace_back(identifier);
    }));

    Event::Processor processor{ spServiceProvider };
    EXPECT_FALSE(processor.IsActive());
    EXPECT_TRUE(processor.Startup());
    EXPECT_TRUE(processor.IsActive());
    EXPECT_TRUE(processor.Startup());

    EXPECT_FALSE(spPublisher->Subscribe<Event::Type::PartitionHealed>([] (std::string const&) { }));

    constexpr std::uint32_t Published = 64;
    for (std::uint32_t idx = 0; idx < Published; ++idx) {
        EXPECT_TRUE(spPublisher->Publish<Event::Type::PartitionHealed>(std::to_string(idx)));
    }

    EXPECT_TRUE(processor.Shutdown());
    EXPECT_FALSE(processor.IsActive());
    EXPECT_EQ(processor.DispatchedCount(), Published);
    EXPECT_EQ(spPublisher->EventCount(), 0);

    ASSERT_EQ(healed.size(), Published);
    for (std::uint32_t idx = 0; idx < Published; ++idx) {
        EXPECT_EQ(healed[idx], std::to_string(idx));
    }

    EXPECT_FALSE(spPublisher->Publish<Event::Type::PartitionHealed>(std::string{ "late" }));
    EXPECT_FALSE(processor.Startup());
}

//----------------------------------------------------------------------------------------------------------------------
