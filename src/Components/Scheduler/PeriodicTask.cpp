//----------------------------------------------------------------------------------------------------------------------
// File: PeriodicTask.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PeriodicTask.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <exception>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::PeriodicTask::PeriodicTask(
    std::string_view name,
    std::chrono::milliseconds interval,
    Callback const& callback,
    std::shared_ptr<spdlog::logger> const& logger)
    : m_name(name)
    , m_interval(interval)
    , m_callback(callback)
    , m_logger(logger)
    , m_ticks(0)
    , m_process(false)
    , m_mutex()
    , m_cv()
    , m_worker()
{
    assert(m_callback);
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::PeriodicTask::~PeriodicTask()
{
    if (m_worker.joinable()) {
        Shutdown();
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::PeriodicTask::Startup()
{
    if (m_interval <= std::chrono::milliseconds::zero()) { return false; }

    if (!m_worker.joinable()) {
        {
            std::scoped_lock lock(m_mutex);
            m_process = true;
        }
        m_worker = std::thread(&PeriodicTask::Execute, this);
        m_logger->debug("Started the {} task with an interval of {}ms.", m_name, m_interval.count());
    }
    return m_worker.joinable();
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::PeriodicTask::Shutdown()
{
    {
        std::scoped_lock lock(m_mutex);
        m_process = false;
    }

    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
        m_logger->debug("Stopped the {} task after {} ticks.", m_name, m_ticks.load());
    }

    return !m_worker.joinable();
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Scheduler::PeriodicTask::GetName() const { return m_name; }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Scheduler::PeriodicTask::GetInterval() const { return m_interval; }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::PeriodicTask::IsActive() const { return m_worker.joinable(); }

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Scheduler::PeriodicTask::TickCount() const { return m_ticks.load(); }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::PeriodicTask::Execute()
{
    do {
        {
            std::unique_lock lock(m_mutex);
            auto const stop = std::chrono::steady_clock::now() + m_interval;
            auto const terminate = m_cv.wait_until(lock, stop, [&]{ return !m_process; });
            // Terminate thread if the timeout was not reached
            if (terminate) {
                return;
            }
        }

        Tick();
    } while(true);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::PeriodicTask::Tick()
{
    // A failed tick is reported and the work is retried on the next interval.
    try {
        std::invoke(m_callback);
    } catch (std::exception const& exception) {
        m_logger->error("The {} task failed to complete a tick: {}", m_name, exception.what());
    }
    ++m_ticks;
}

//----------------------------------------------------------------------------------------------------------------------
