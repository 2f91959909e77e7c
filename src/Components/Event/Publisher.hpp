//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.hpp
// Description: Handle the subscription and publishing of events.
// Notes: Event subscriptions are not thread safe. Only the thread that creates the publisher is allowed to subscribe
// and it must suspend subscriptions before the event processor or any publishing thread is started. Publishing and
// dispatching may happen from any thread afterwards. Once the channel has been closed every publish is rejected.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Events.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <concepts>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

class Publisher;

using SharedPublisher = std::shared_ptr<Publisher>;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::Publisher
{
public:
    using EventAdvertisements = std::set<Type>;

    Publisher();
    ~Publisher() = default;

    Publisher(Publisher const&) = delete;
    Publisher(Publisher&& ) = delete;
    Publisher& operator=(Publisher const&) = delete;
    Publisher& operator=(Publisher&&) = delete;

    // Fails once subscriptions have been suspended. Listeners are invoked with the event's content, if any.
    template<Type SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        if (m_hasSuspendedSubscriptions) { return false; }

        m_listeners[SpecificType].emplace_back([callback] (EventProxy const& upEventProxy) {
            assert(upEventProxy && upEventProxy->GetType() == SpecificType);
            if constexpr (MessageWithContent<SpecificType>) {
                auto const pEvent = static_cast<Event::Message<SpecificType> const*>(upEventProxy.get());
                std::apply(callback, pEvent->GetContent());
            } else {
                std::invoke(callback);
            }
        });
        return true;
    }

    void SuspendSubscriptions();

    void Advertise(Type type);
    void Advertise(EventAdvertisements&& advertised);

    // Returns false when the channel has been closed. An accepted event without listeners is dropped.
    template<Type SpecificType, typename... Arguments>
    [[nodiscard]] bool Publish(Arguments&&... arguments)
    {
        static_assert(MessageWithContent<SpecificType> || sizeof...(Arguments) == 0);
        return Publish(
            SpecificType, std::make_unique<Event::Message<SpecificType>>(std::forward<Arguments>(arguments)...));
    }

    [[nodiscard]] bool IsSubscribed(Type type) const;
    [[nodiscard]] bool IsAdvertised(Type type) const;
    [[nodiscard]] bool IsClosed() const;

    [[nodiscard]] std::size_t EventCount() const;
    [[nodiscard]] std::size_t ListenerCount() const;
    [[nodiscard]] std::size_t AdvertisedCount() const;

    // Blocks until there are queued events or the channel is closed. Returns false only when the channel has been
    // closed and no events remain.
    [[nodiscard]] bool AwaitEvents();
    void Close();

    std::size_t Dispatch();

private:
    using EventProxy = std::unique_ptr<IMessage>;
    using EventQueue = std::deque<EventProxy>;
    using ListenerProxy = std::function<void(EventProxy const& upEventProxy)>;
    using Listeners = std::unordered_map<Type, std::vector<ListenerProxy>>;

    [[nodiscard]] bool Publish(Type type, EventProxy&& upEventProxy);

    std::atomic_bool m_hasSuspendedSubscriptions;
    Listeners m_listeners;

    mutable std::mutex m_eventsMutex;
    std::condition_variable m_eventsCondition;
    EventQueue m_events;
    bool m_closed;

    mutable std::shared_mutex m_advertisedMutex;
    EventAdvertisements m_advertised;
};

//----------------------------------------------------------------------------------------------------------------------
