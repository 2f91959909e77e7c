//----------------------------------------------------------------------------------------------------------------------
// File: Migrator.hpp
// Description: Drives the staged movement of an allocation between nodes. At most one plan may be active for an asset.
// A plan that reaches a terminal state is archived to the history and removed from the active set.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MigrationTypes.hpp"
#include "Utilities/Result.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IMigrationTransport;

//----------------------------------------------------------------------------------------------------------------------
namespace Migration {
//----------------------------------------------------------------------------------------------------------------------

class Migrator;

//----------------------------------------------------------------------------------------------------------------------
} // Migration namespace
//----------------------------------------------------------------------------------------------------------------------

class Migration::Migrator final
{
public:
    // Applies the target side of the allocation during the switching stage. A failed commit must leave no change.
    using Commit = std::function<Mesh::Result(Plan const& plan)>;

    Migrator(std::shared_ptr<IMigrationTransport> const& spTransport, bool preferLive);

    Migrator(Migrator const&) = delete;
    Migrator& operator=(Migrator const&) = delete;

    [[nodiscard]] Plan CreatePlan(
        Asset::Identifier const& asset,
        Node::Identifier const& source,
        Node::Identifier const& target,
        Reason reason,
        std::uint64_t estimatedBytes = 0,
        TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint()) const;

    Mesh::Result Schedule(Plan const& plan);
    Mesh::Result Execute(Asset::Identifier const& asset, Commit const& commit);
    Mesh::Result Cancel(Asset::Identifier const& asset);

    [[nodiscard]] std::optional<Status> Active(Asset::Identifier const& asset) const;
    [[nodiscard]] std::size_t ActiveCount() const;
    [[nodiscard]] std::vector<Status> History() const;
    [[nodiscard]] std::vector<Status> History(Asset::Identifier const& asset) const;

    [[nodiscard]] Strategy GetPreferredStrategy() const;

private:
    using StatusUpdater = std::function<void(Status&)>;

    // Moves an active plan into the next state. Fails when the plan has been cancelled or the step is not allowed.
    Mesh::Result Advance(
        Asset::Identifier const& asset, State state, double progress, StatusUpdater const& updater = {});
    Mesh::Result Fail(Asset::Identifier const& asset, Mesh::Result const& cause);
    void Archive(Asset::Identifier const& asset);

    std::shared_ptr<IMigrationTransport> m_spTransport;
    std::shared_ptr<spdlog::logger> m_logger;
    Strategy const m_preferred;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<Asset::Identifier, Status, Asset::Hasher> m_active;
    std::vector<Status> m_history;
};

//----------------------------------------------------------------------------------------------------------------------
