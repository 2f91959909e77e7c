//----------------------------------------------------------------------------------------------------------------------
// File: HeartbeatMonitor.hpp
// Description: Marks nodes whose heartbeat has not been refreshed within the failure timeout as failed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Publisher.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Mesh { class ServiceProvider; }
namespace Node { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Fleet {
//----------------------------------------------------------------------------------------------------------------------

class HeartbeatMonitor;

//----------------------------------------------------------------------------------------------------------------------
} // Fleet namespace
//----------------------------------------------------------------------------------------------------------------------

class Fleet::HeartbeatMonitor final
{
public:
    HeartbeatMonitor(
        std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider, std::chrono::milliseconds failureTimeout);

    HeartbeatMonitor(HeartbeatMonitor const&) = delete;
    HeartbeatMonitor& operator=(HeartbeatMonitor const&) = delete;

    // A node fails when the time since its last heartbeat is strictly greater than the timeout. Returns the nodes that
    // transitioned to failed during this scan, a node that is already failed is never reported again.
    std::vector<Node::Identifier> Scan(TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    [[nodiscard]] std::chrono::milliseconds GetFailureTimeout() const;

private:
    std::shared_ptr<Node::Registry> m_spRegistry;
    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::milliseconds const m_failureTimeout;
};

//----------------------------------------------------------------------------------------------------------------------
