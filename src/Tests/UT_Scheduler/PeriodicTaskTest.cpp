//----------------------------------------------------------------------------------------------------------------------
#include "Components/Scheduler/PeriodicTask.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Polls the task until it has ticked the expected number of times or the deadline passes.
[[nodiscard]] bool AwaitTicks(Scheduler::PeriodicTask const& task, std::uint64_t expected);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

using namespace std::chrono_literals;

constexpr auto ShortInterval = 5ms;
constexpr auto Deadline = 5s;

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

using namespace std::chrono_literals;

//----------------------------------------------------------------------------------------------------------------------

TEST(PeriodicTaskSuite, TickTest)
{
    std::atomic_uint32_t invoked = 0;
    Scheduler::PeriodicTask task{
        "counter", test::ShortInterval, [&invoked] { ++invoked; }, spdlog::get(Logger::Name::Core.data()) };

    EXPECT_EQ(task.GetName(), "counter");
    EXPECT_EQ(task.GetInterval(), test::ShortInterval);
    EXPECT_FALSE(task.IsActive());
    EXPECT_EQ(task.TickCount(), 0);

    EXPECT_TRUE(task.Startup());
    EXPECT_TRUE(task.IsActive());
    EXPECT_TRUE(task.Startup()); // Starting an active task has no effect.

    EXPECT_TRUE(local::AwaitTicks(task, 3));
    EXPECT_TRUE(task.Shutdown());
    EXPECT_FALSE(task.IsActive());

    // No further ticks occur once the task has been stopped.
    auto const ticks = task.TickCount();
    EXPECT_EQ(invoked.load(), ticks);
    std::this_thread::sleep_for(test::ShortInterval * 4);
    EXPECT_EQ(task.TickCount(), ticks);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeriodicTaskSuite, PromptShutdownTest)
{
    std::atomic_uint32_t invoked = 0;
    Scheduler::PeriodicTask task{ "idle", 1h, [&invoked] { ++invoked; }, spdlog::get(Logger::Name::Core.data()) };
    EXPECT_TRUE(task.Startup());

    // The sleeping worker must be woken rather than waiting out the interval.
    auto const start = std::chrono::steady_clock::now();
    EXPECT_TRUE(task.Shutdown());
    EXPECT_LT(std::chrono::steady_clock::now() - start, test::Deadline);
    EXPECT_EQ(invoked.load(), 0);
    EXPECT_EQ(task.TickCount(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeriodicTaskSuite, FailedTickTest)
{
    std::atomic_uint32_t invoked = 0;
    Scheduler::PeriodicTask task{
        "faulty",
        test::ShortInterval,
        [&invoked] {
            ++invoked;
            throw std::runtime_error("tick failed");
        },
        spdlog::get(Logger::Name::Core.data()) };

    // A throwing tick is counted and the task keeps running.
    EXPECT_TRUE(task.Startup());
    EXPECT_TRUE(local::AwaitTicks(task, 3));
    EXPECT_TRUE(task.IsActive());
    EXPECT_TRUE(task.Shutdown());
    EXPECT_GE(invoked.load(), 3);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeriodicTaskSuite, InvalidIntervalTest)
{
    Scheduler::PeriodicTask task{ "invalid", 0ms, [] { }, spdlog::get(Logger::Name::Core.data()) };
    EXPECT_FALSE(task.Startup());
    EXPECT_FALSE(task.IsActive());
    EXPECT_TRUE(task.Shutdown());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeriodicTaskSuite, DestructionTest)
{
    std::atomic_uint32_t invoked = 0;
    {
        Scheduler::PeriodicTask task{
            "scoped", test::ShortInterval, [&invoked] { ++invoked; }, spdlog::get(Logger::Name::Core.data()) };
        EXPECT_TRUE(task.Startup());
        EXPECT_TRUE(local::AwaitTicks(task, 1));
    }

    // The worker has been joined, so the count is stable.
    auto const ticks = invoked.load();
    std::this_thread::sleep_for(test::ShortInterval * 4);
    EXPECT_EQ(invoked.load(), ticks);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::AwaitTicks(Scheduler::PeriodicTask const& task, std::uint64_t expected)
{
    auto const deadline = std::chrono::steady_clock::now() + test::Deadline;
    while (task.TickCount() < expected) {
        if (std::chrono::steady_clock::now() > deadline) { return false; }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
