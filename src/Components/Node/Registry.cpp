//----------------------------------------------------------------------------------------------------------------------
// File: Registry.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Registry.hpp"
#include "MeshNode/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Mesh::Result NotRegistered(Node::Identifier const& identifier);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Node::Registry::Registry(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider)
    : m_spEventPublisher(spServiceProvider->Fetch<Event::Publisher>().lock())
    , m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_nodesMutex()
    , m_nodes()
{
    assert(m_spEventPublisher);
    assert(m_logger);
    {
        using enum Event::Type;
        m_spEventPublisher->Advertise({ NodeJoined, NodeLeft });
    }
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::Join(
    Identifier const& identifier, Capabilities const& capabilities, Location const& location, TimeUtils::Timepoint now)
{
    {
        std::scoped_lock lock(m_nodesMutex);
        auto& index = m_nodes.get<IdentifierIndex>();
        if (auto const itr = index.find(identifier); itr != index.end()) {
            // A known node is reactivated, the availability it had is kept but must fit the new capabilities.
            index.modify(itr, [&] (Info& info) {
                info.identifier = identifier;
                info.capabilities = capabilities;
                info.status = Status::Active;
                info.lastHeartbeat = now;
                info.location = location;
                info.available.ClampTo(capabilities);
            });
            m_logger->info("Node {} rejoined the mesh.", identifier);
        } else {
            m_nodes.get<JoinIndex>().push_back(Info{
                .identifier = identifier,
                .capabilities = capabilities,
                .status = Status::Active,
                .lastHeartbeat = now,
                .location = location,
                .available = Resources::FromCapabilities(capabilities),
                .metrics = {}
            });
            m_logger->info("Node {} joined the mesh.", identifier);
        }
    }

    if (!m_spEventPublisher->Publish<Event::Type::NodeJoined>(identifier, capabilities)) {
        return Mesh::Result{ Mesh::ErrorCode::NetworkError, "event channel closed" };
    }

    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::Leave(Identifier const& identifier, std::string const& reason)
{
    {
        std::scoped_lock lock(m_nodesMutex);
        auto& index = m_nodes.get<IdentifierIndex>();
        auto const itr = index.find(identifier);
        if (itr == index.end()) { return local::NotRegistered(identifier); }
        index.erase(itr);
    }

    m_logger->info("Node {} left the mesh. [reason={}]", identifier, reason);
    if (!m_spEventPublisher->Publish<Event::Type::NodeLeft>(identifier, reason)) {
        return Mesh::Result{ Mesh::ErrorCode::NetworkError, "event channel closed" };
    }

    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::UpdateHeartbeat(Identifier const& identifier, TimeUtils::Timepoint now)
{
    return Modify(identifier, [&now] (Info& info) {
        info.lastHeartbeat = now;
        return Mesh::Result{};
    });
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::SetStatus(Identifier const& identifier, Status status)
{
    auto const exchanged = ExchangeStatus(identifier, status);
    if (auto const pError = std::get_if<Mesh::Result>(&exchanged); pError) { return *pError; }
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<Node::Status> Node::Registry::ExchangeStatus(
    Identifier const& identifier, Status status, std::optional<Status> const& optExpected)
{
    Status previous = status;
    bool applied = false;
    auto const result = Modify(identifier, [&] (Info& info) {
        previous = info.status;
        if (info.status == status) { return Mesh::Result{}; }
        if (optExpected && info.status != *optExpected) { return Mesh::Result{}; }
        if (!IsTransitionAllowed(info.status, status)) {
            return Mesh::Result{
                Mesh::ErrorCode::InvalidState,
                fmt::format("transition from {} to {} is not allowed", ToString(info.status), ToString(status)) };
        }
        info.status = status;
        applied = true;
        return Mesh::Result{};
    });

    if (!result) {
        m_logger->warn("Rejected status change for node {}: {}", identifier, result.what());
        return result;
    }

    if (applied) {
        m_logger->debug("Node {} status changed from {} to {}.", identifier, ToString(previous), ToString(status));
    }

    return previous;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::UpdateMetrics(Identifier const& identifier, PerformanceMetrics const& metrics)
{
    return Modify(identifier, [&metrics] (Info& info) {
        info.metrics = metrics;
        return Mesh::Result{};
    });
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::SetTrustScore(Identifier const& identifier, double trust)
{
    return Modify(identifier, [&trust] (Info& info) {
        info.identifier.SetTrustScore(trust);
        return Mesh::Result{};
    });
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::Reserve(Identifier const& identifier, Resources const& demand)
{
    return Modify(identifier, [&demand] (Info& info) {
        if (!info.available.CanFit(demand)) {
            return Mesh::Result{ Mesh::ErrorCode::AllocationFailed, "insufficient resources" };
        }
        info.available.Subtract(demand);
        return Mesh::Result{};
    });
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::Release(Identifier const& identifier, Resources const& demand)
{
    return Modify(identifier, [&demand] (Info& info) {
        info.available.Add(demand, info.capabilities);
        return Mesh::Result{};
    });
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Node::Info> Node::Registry::Fetch(Identifier const& identifier) const
{
    std::shared_lock lock(m_nodesMutex);
    auto const& index = m_nodes.get<IdentifierIndex>();
    if (auto const itr = index.find(identifier); itr != index.end()) { return *itr; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Node::Info> Node::Registry::Snapshot() const
{
    std::shared_lock lock(m_nodesMutex);
    auto const& index = m_nodes.get<JoinIndex>();
    return std::vector<Info>(index.begin(), index.end());
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Registry::ForEach(ForEachFunction const& callback) const
{
    std::shared_lock lock(m_nodesMutex);
    for (auto const& info : m_nodes.get<JoinIndex>()) {
        if (callback(info) != CallbackIteration::Continue) { break; }
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Registry::Contains(Identifier const& identifier) const
{
    std::shared_lock lock(m_nodesMutex);
    return m_nodes.get<IdentifierIndex>().count(identifier) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Node::Registry::Count() const
{
    std::shared_lock lock(m_nodesMutex);
    return m_nodes.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Node::Registry::CountByStatus(Status status) const
{
    std::shared_lock lock(m_nodesMutex);
    auto const& index = m_nodes.get<JoinIndex>();
    return static_cast<std::size_t>(std::count_if(index.begin(), index.end(), [&status] (Info const& info) {
        return info.status == status;
    }));
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Node::Registry::Modify(Identifier const& identifier, Modifier const& modifier)
{
    std::scoped_lock lock(m_nodesMutex);
    auto& index = m_nodes.get<IdentifierIndex>();
    auto const itr = index.find(identifier);
    if (itr == index.end()) { return local::NotRegistered(identifier); }

    Mesh::Result result;
    index.modify(itr, [&] (Info& info) { result = modifier(info); });
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result local::NotRegistered(Node::Identifier const& identifier)
{
    return Mesh::Result{ Mesh::ErrorCode::NotFound, fmt::format("node {} is not registered", identifier) };
}

//----------------------------------------------------------------------------------------------------------------------
