//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Event::Publisher::Publisher()
    : m_hasSuspendedSubscriptions(false)
    , m_listeners()
    , m_eventsMutex()
    , m_eventsCondition()
    , m_events()
    , m_closed(false)
    , m_advertisedMutex()
    , m_advertised()
{
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::SuspendSubscriptions() { m_hasSuspendedSubscriptions = true; }

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Advertise(Type type)
{
    std::scoped_lock lock(m_advertisedMutex);
    m_advertised.emplace(type);
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Advertise(EventAdvertisements&& advertised)
{
    std::scoped_lock lock(m_advertisedMutex);
    m_advertised.merge(advertised);
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsSubscribed(Type type) const { return m_listeners.contains(type); }

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsAdvertised(Type type) const
{
    std::shared_lock lock(m_advertisedMutex);
    return m_advertised.contains(type);
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsClosed() const
{
    std::scoped_lock lock(m_eventsMutex);
    return m_closed;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::EventCount() const
{
    std::scoped_lock lock(m_eventsMutex);
    return m_events.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::ListenerCount() const { return m_listeners.size(); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::AdvertisedCount() const
{
    std::shared_lock lock(m_advertisedMutex);
    return m_advertised.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::AwaitEvents()
{
    std::unique_lock lock(m_eventsMutex);
    m_eventsCondition.wait(lock, [this] { return m_closed || !m_events.empty(); });
    return !m_events.empty();
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Close()
{
    {
        std::scoped_lock lock(m_eventsMutex);
        m_closed = true;
    }
    m_eventsCondition.notify_all(); // Wake the processor so that it can drain the remaining events.
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::Dispatch()
{
    // The queue is swapped out so that publishers are not blocked while the listeners run.
    auto const events = (std::scoped_lock{ m_eventsMutex }, std::exchange(m_events, {}));
    for (auto const& upEventProxy : events) {
        // Only events with at least one listener are ever queued.
        auto const itr = m_listeners.find(upEventProxy->GetType());
        assert(itr != m_listeners.end() && !itr->second.empty());
        for (auto const& listener : itr->second) { listener(upEventProxy); }
    }
    return events.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::Publish(Type type, EventProxy&& upEventProxy)
{
    {
        std::scoped_lock lock(m_eventsMutex);
        if (m_closed) { return false; }
        if (!IsSubscribed(type)) { return true; } // Nothing is listening, the event is accepted and discarded.
        m_events.emplace_back(std::move(upEventProxy));
    }

    m_eventsCondition.notify_one();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
