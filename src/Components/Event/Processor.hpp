//----------------------------------------------------------------------------------------------------------------------
// File: Processor.hpp
// Description: The single consumer of the event channel. The processor drains the publisher's queue in publication
// order on its own thread until the channel is closed and every remaining event has been dispatched.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <memory>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

namespace Mesh { class ServiceProvider; }

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

class Processor;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::Processor final
{
public:
    explicit Processor(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider);
    ~Processor();

    Processor(Processor const&) = delete;
    Processor& operator=(Processor const&) = delete;

    // Suspends subscriptions on the publisher and starts consuming events.
    bool Startup();

    // Closes the channel and waits for the queued events to be dispatched.
    bool Shutdown();

    [[nodiscard]] bool IsActive() const;
    [[nodiscard]] std::size_t DispatchedCount() const;

private:
    void Process();

    SharedPublisher m_spEventPublisher;
    std::shared_ptr<spdlog::logger> m_logger;
    std::atomic<std::size_t> m_dispatched;
    std::thread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------
