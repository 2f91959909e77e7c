//----------------------------------------------------------------------------------------------------------------------
// File: Migrator.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Migrator.hpp"
#include "Interfaces/MigrationTransport.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <iterator>
#include <mutex>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

namespace Progress {

constexpr double Preparing = 0.0;
constexpr double Transferring = 50.0;
constexpr double Verifying = 75.0;
constexpr double Switching = 90.0;
constexpr double Completed = 100.0;

} // Progress namespace

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Migration::Migrator::Migrator(std::shared_ptr<IMigrationTransport> const& spTransport, bool preferLive)
    : m_spTransport(spTransport)
    , m_logger(spdlog::get(Logger::Name::Migration.data()))
    , m_preferred(preferLive ? Strategy::LiveMigration : Strategy::StopAndCopy)
    , m_mutex()
    , m_active()
    , m_history()
{
    assert(m_spTransport);
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Migration::Plan Migration::Migrator::CreatePlan(
    Asset::Identifier const& asset,
    Node::Identifier const& source,
    Node::Identifier const& target,
    Reason reason,
    std::uint64_t estimatedBytes,
    TimeUtils::Timepoint now) const
{
    // Recovering from a failure takes priority over every other kind of movement.
    std::uint32_t const priority = (reason == Reason::NodeFailure) ? 10 : (reason == Reason::Manual) ? 5 : 1;
    return Plan{
        .asset = asset,
        .source = source,
        .target = target,
        .strategy = m_preferred,
        .reason = reason,
        .estimatedDuration = std::chrono::milliseconds{ 0 },
        .estimatedBytes = estimatedBytes,
        .priority = priority,
        .created = now
    };
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::Migrator::Schedule(Plan const& plan)
{
    if (plan.source == plan.target) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidArgument, "source and target must differ" };
    }

    {
        std::scoped_lock lock(m_mutex);
        auto const [itr, emplaced] = m_active.try_emplace(plan.asset, Status{ .plan = plan });
        if (!emplaced) {
            return Mesh::Result{
                Mesh::ErrorCode::MigrationInProgress,
                fmt::format("asset {} already has an active migration", plan.asset) };
        }
    }

    m_logger->info(
        "Scheduled {} migration of asset {} from {} to {}. [reason={}]",
        ToString(plan.strategy), plan.asset, plan.source, plan.target, ToString(plan.reason));

    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::Migrator::Execute(Asset::Identifier const& asset, Commit const& commit)
{
    auto const optStatus = Active(asset);
    if (!optStatus) {
        return Mesh::Result{ Mesh::ErrorCode::NotFound, fmt::format("asset {} has no active migration", asset) };
    }

    auto const& plan = optStatus->plan;
    auto const now = TimeUtils::GetSystemTimepoint();

    if (auto const result = Advance(asset, State::Preparing, local::Progress::Preparing, [&now] (Status& status) {
        status.started = now;
    }); !result) { return result; }

    if (auto const result = m_spTransport->Prepare(plan); !result) { return Fail(asset, result); }

    auto const transferred = m_spTransport->Transfer(plan);
    if (auto const pError = std::get_if<Mesh::Result>(&transferred); pError) { return Fail(asset, *pError); }

    auto const bytes = std::get<std::uint64_t>(transferred);
    auto const RecordTransfer = [&bytes] (Status& status) { status.transferredBytes = bytes; };
    auto const transferring = Advance(asset, State::Transferring, local::Progress::Transferring, RecordTransfer);
    if (!transferring) { return transferring; }

    if (auto const result = Advance(asset, State::Verifying, local::Progress::Verifying); !result) { return result; }
    if (auto const result = m_spTransport->Verify(plan, bytes); !result) { return Fail(asset, result); }

    if (auto const result = Advance(asset, State::Switching, local::Progress::Switching); !result) { return result; }
    if (commit) {
        if (auto const result = commit(plan); !result) { return Fail(asset, result); }
    }

    if (auto const result = Advance(asset, State::Completed, local::Progress::Completed, [] (Status& status) {
        status.finished = TimeUtils::GetSystemTimepoint();
    }); !result) { return result; }

    Archive(asset);
    m_logger->info("Completed migration of asset {} to {}. [bytes={}]", asset, plan.target, bytes);

    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::Migrator::Cancel(Asset::Identifier const& asset)
{
    {
        std::scoped_lock lock(m_mutex);
        auto const itr = m_active.find(asset);
        if (itr == m_active.end()) {
            return Mesh::Result{ Mesh::ErrorCode::NotFound, fmt::format("asset {} has no active migration", asset) };
        }
        m_active.erase(itr);
    }

    // Data already copied to the target is left in place.
    m_logger->info("Cancelled the migration of asset {}.", asset);
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Migration::Status> Migration::Migrator::Active(Asset::Identifier const& asset) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_active.find(asset); itr != m_active.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Migration::Migrator::ActiveCount() const
{
    std::shared_lock lock(m_mutex);
    return m_active.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Migration::Status> Migration::Migrator::History() const
{
    std::shared_lock lock(m_mutex);
    return m_history;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Migration::Status> Migration::Migrator::History(Asset::Identifier const& asset) const
{
    std::vector<Status> history;
    std::shared_lock lock(m_mutex);
    std::ranges::copy_if(m_history, std::back_inserter(history), [&asset] (Status const& status) {
        return status.plan.asset == asset;
    });
    return history;
}

//----------------------------------------------------------------------------------------------------------------------

Migration::Strategy Migration::Migrator::GetPreferredStrategy() const { return m_preferred; }

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::Migrator::Advance(
    Asset::Identifier const& asset, State state, double progress, StatusUpdater const& updater)
{
    std::scoped_lock lock(m_mutex);
    auto const itr = m_active.find(asset);
    if (itr == m_active.end()) {
        return Mesh::Result{ Mesh::ErrorCode::InvalidState, fmt::format("migration of asset {} was cancelled", asset) };
    }

    auto& [key, status] = *itr;
    if (!IsTransitionAllowed(status.state, state)) {
        return Mesh::Result{
            Mesh::ErrorCode::InvalidState,
            fmt::format(
                "migration of asset {} can not move from {} to {}", asset, ToString(status.state), ToString(state)) };
    }

    status.state = state;
    status.progress = progress;
    if (updater) { updater(status); }

    m_logger->debug("Migration of asset {} is {}. [progress={}%]", asset, ToString(state), progress);
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::Migrator::Fail(Asset::Identifier const& asset, Mesh::Result const& cause)
{
    {
        std::scoped_lock lock(m_mutex);
        auto node = m_active.extract(asset);
        if (!node.empty()) {
            auto& status = node.mapped();
            status.state = State::Failed;
            status.error = cause.what();
            status.finished = TimeUtils::GetSystemTimepoint();
            m_history.emplace_back(std::move(status));
        }
    }

    m_logger->error("Migration of asset {} failed: {}", asset, cause.what());
    return cause;
}

//----------------------------------------------------------------------------------------------------------------------

void Migration::Migrator::Archive(Asset::Identifier const& asset)
{
    std::scoped_lock lock(m_mutex);
    if (auto node = m_active.extract(asset); !node.empty()) {
        m_history.emplace_back(std::move(node.mapped()));
    }
}

//----------------------------------------------------------------------------------------------------------------------
