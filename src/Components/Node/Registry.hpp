//----------------------------------------------------------------------------------------------------------------------
// File: Registry.hpp
// Description: The authoritative record of the nodes participating in the mesh. Every mutation is atomic with respect
// to the registry's lock. Events are published after the lock has been released.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "NodeInfo.hpp"
#include "Components/Event/Publisher.hpp"
#include "Utilities/CallbackIteration.hpp"
#include "Utilities/Result.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index/tag.hpp>
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Mesh { class ServiceProvider; }

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

class Registry;

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::Registry final
{
public:
    using ForEachFunction = std::function<CallbackIteration(Info const&)>;

    explicit Registry(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider);

    Registry(Registry const&) = delete;
    Registry& operator=(Registry const&) = delete;

    Mesh::Result Join(
        Identifier const& identifier,
        Capabilities const& capabilities,
        Location const& location = {},
        TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    Mesh::Result Leave(Identifier const& identifier, std::string const& reason);

    Mesh::Result UpdateHeartbeat(
        Identifier const& identifier, TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());
    Mesh::Result SetStatus(Identifier const& identifier, Status status);

    // Applies a validated status change and provides the status the node held beforehand. When an expected status is
    // provided, the change is only applied if the node still holds it.
    [[nodiscard]] Mesh::Expected<Status> ExchangeStatus(
        Identifier const& identifier, Status status, std::optional<Status> const& optExpected = {});
    Mesh::Result UpdateMetrics(Identifier const& identifier, PerformanceMetrics const& metrics);
    Mesh::Result SetTrustScore(Identifier const& identifier, double trust);

    Mesh::Result Reserve(Identifier const& identifier, Resources const& demand);
    Mesh::Result Release(Identifier const& identifier, Resources const& demand);

    [[nodiscard]] std::optional<Info> Fetch(Identifier const& identifier) const;
    [[nodiscard]] std::vector<Info> Snapshot() const;
    bool ForEach(ForEachFunction const& callback) const;

    [[nodiscard]] bool Contains(Identifier const& identifier) const;
    [[nodiscard]] std::size_t Count() const;
    [[nodiscard]] std::size_t CountByStatus(Status status) const;

private:
    struct JoinIndex {};
    struct IdentifierIndex {};

    using NodeTrackingMap = boost::multi_index_container<
        Info,
        boost::multi_index::indexed_by<
            boost::multi_index::sequenced<boost::multi_index::tag<JoinIndex>>,
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<IdentifierIndex>,
                boost::multi_index::member<Info, Identifier, &Info::identifier>,
                Hasher>>>;

    using Modifier = std::function<Mesh::Result(Info&)>;

    // Applies the modifier to the identified record under the exclusive lock.
    Mesh::Result Modify(Identifier const& identifier, Modifier const& modifier);

    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::shared_mutex m_nodesMutex;
    NodeTrackingMap m_nodes;
};

//----------------------------------------------------------------------------------------------------------------------
