//----------------------------------------------------------------------------------------------------------------------
// File: PeriodicTask.hpp
// Description: Runs a unit of work on a dedicated thread each time the interval elapses. The worker sleeps on a
// condition variable so a shutdown request wakes it immediately. A tick in progress always runs to completion.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class PeriodicTask;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::PeriodicTask final
{
public:
    using Callback = std::function<void()>;

    PeriodicTask(
        std::string_view name,
        std::chrono::milliseconds interval,
        Callback const& callback,
        std::shared_ptr<spdlog::logger> const& logger);
    ~PeriodicTask();

    PeriodicTask(PeriodicTask const&) = delete;
    PeriodicTask& operator=(PeriodicTask const&) = delete;

    bool Startup();
    bool Shutdown();

    [[nodiscard]] std::string const& GetName() const;
    [[nodiscard]] std::chrono::milliseconds GetInterval() const;
    [[nodiscard]] bool IsActive() const;
    [[nodiscard]] std::uint64_t TickCount() const;

private:
    void Execute();
    void Tick();

    std::string const m_name;
    std::chrono::milliseconds const m_interval;
    Callback const m_callback;
    std::shared_ptr<spdlog::logger> m_logger;

    std::atomic<std::uint64_t> m_ticks;
    bool m_process;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------
