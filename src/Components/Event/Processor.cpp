//----------------------------------------------------------------------------------------------------------------------
// File: Processor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Processor.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Event::Processor::Processor(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider)
    : m_spEventPublisher(spServiceProvider->Fetch<Event::Publisher>().lock())
    , m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_dispatched(0)
    , m_worker()
{
    assert(m_spEventPublisher);
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Event::Processor::~Processor()
{
    if (m_worker.joinable()) {
        Shutdown();
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Processor::Startup()
{
    if (m_spEventPublisher->IsClosed()) { return false; }

    if (!m_worker.joinable()) {
        m_spEventPublisher->SuspendSubscriptions();
        m_worker = std::thread(&Processor::Process, this);
        m_logger->debug("Event processor started with {} subscribed event types.", m_spEventPublisher->ListenerCount());
    }
    return m_worker.joinable();
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Processor::Shutdown()
{
    m_spEventPublisher->Close();

    if (m_worker.joinable()) {
        m_worker.join();
        m_logger->debug("Event processor stopped after dispatching {} events.", m_dispatched.load());
    }

    return !m_worker.joinable();
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Processor::IsActive() const { return m_worker.joinable(); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Processor::DispatchedCount() const { return m_dispatched.load(); }

//----------------------------------------------------------------------------------------------------------------------

void Event::Processor::Process()
{
    // The channel reports no further work only after it has been closed and the final events have been drained.
    while (m_spEventPublisher->AwaitEvents()) {
        m_dispatched += m_spEventPublisher->Dispatch();
    }
}

//----------------------------------------------------------------------------------------------------------------------
