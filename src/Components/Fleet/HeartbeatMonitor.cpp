//----------------------------------------------------------------------------------------------------------------------
// File: HeartbeatMonitor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "HeartbeatMonitor.hpp"
#include "Components/Node/Registry.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

Fleet::HeartbeatMonitor::HeartbeatMonitor(
    std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider, std::chrono::milliseconds failureTimeout)
    : m_spRegistry(spServiceProvider->Fetch<Node::Registry>().lock())
    , m_spEventPublisher(spServiceProvider->Fetch<Event::Publisher>().lock())
    , m_logger(spdlog::get(Logger::Name::Fleet.data()))
    , m_failureTimeout(failureTimeout)
{
    assert(m_spRegistry);
    assert(m_spEventPublisher);
    assert(m_logger);
    m_spEventPublisher->Advertise(Event::Type::NodeFailed);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Node::Identifier> Fleet::HeartbeatMonitor::Scan(TimeUtils::Timepoint now)
{
    using Expired = std::pair<Node::Identifier, std::chrono::milliseconds>;

    std::vector<Expired> expired;
    m_spRegistry->ForEach([&] (Node::Info const& info) {
        auto const silence = std::chrono::duration_cast<std::chrono::milliseconds>(now - info.lastHeartbeat);
        if (info.status != Node::Status::Failed && silence > m_failureTimeout) {
            expired.emplace_back(info.identifier, silence);
        }
        return CallbackIteration::Continue;
    });

    std::vector<Node::Identifier> failed;
    for (auto const& [identifier, silence] : expired) {
        // A node that failed or left since it was read is skipped.
        auto const exchanged = m_spRegistry->ExchangeStatus(identifier, Node::Status::Failed);
        auto const pPrevious = std::get_if<Node::Status>(&exchanged);
        if (!pPrevious || *pPrevious == Node::Status::Failed) { continue; }

        m_logger->warn(
            "Node {} missed its heartbeat for {}ms and has been marked failed.", identifier, silence.count());
        if (!m_spEventPublisher->Publish<Event::Type::NodeFailed>(identifier, now)) {
            m_logger->warn("Unable to publish the failure of node {}, the event channel is closed.", identifier);
        }
        failed.emplace_back(identifier);
    }

    return failed;
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Fleet::HeartbeatMonitor::GetFailureTimeout() const { return m_failureTimeout; }

//----------------------------------------------------------------------------------------------------------------------
