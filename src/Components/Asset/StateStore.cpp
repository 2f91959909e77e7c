//----------------------------------------------------------------------------------------------------------------------
// File: StateStore.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StateStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Mesh::Result NotAllocated(Asset::Identifier const& asset);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Asset::StateStore::StateStore()
    : m_mutex()
    , m_states()
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Asset::StateStore::Insert(DistributedState&& state)
{
    std::scoped_lock lock(m_mutex);
    auto const key = state.asset;
    auto const [itr, emplaced] = m_states.try_emplace(key, std::move(state));
    return emplaced;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Asset::StateStore::Report(
    Identifier const& asset, Node::Identifier const& observer, Status status, TimeUtils::Timepoint now)
{
    std::scoped_lock lock(m_mutex);
    auto const itr = m_states.find(asset);
    if (itr == m_states.end()) { return local::NotAllocated(asset); }

    auto& [key, state] = *itr;
    state.reports.insert_or_assign(observer, status);
    state.updated = now;
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Asset::StateStore::ExchangePrimary(
    Identifier const& asset,
    Node::Identifier const& expected,
    Node::Identifier const& replacement,
    TimeUtils::Timepoint now)
{
    std::scoped_lock lock(m_mutex);
    auto const itr = m_states.find(asset);
    if (itr == m_states.end()) { return local::NotAllocated(asset); }

    auto& [key, state] = *itr;
    if (state.primary != expected) {
        return Mesh::Result{
            Mesh::ErrorCode::Conflict,
            fmt::format("asset {} is hosted by {}, not {}", asset, state.primary, expected) };
    }

    state.primary = replacement;
    state.updated = now;
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Asset::DistributedState> Asset::StateStore::Extract(Identifier const& asset)
{
    std::scoped_lock lock(m_mutex);
    auto node = m_states.extract(asset);
    if (node.empty()) { return {}; }
    return std::move(node.mapped());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Asset::DistributedState> Asset::StateStore::Fetch(Identifier const& asset) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_states.find(asset); itr != m_states.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Asset::Identifier> Asset::StateStore::HostedBy(Node::Identifier const& node) const
{
    std::vector<Identifier> hosted;
    std::shared_lock lock(m_mutex);
    for (auto const& [asset, state] : m_states) {
        if (state.primary == node) { hosted.emplace_back(asset); }
    }
    return hosted;
}

//----------------------------------------------------------------------------------------------------------------------

bool Asset::StateStore::ForEach(ForEachFunction const& callback) const
{
    std::shared_lock lock(m_mutex);
    for (auto const& [asset, state] : m_states) {
        if (callback(state) != CallbackIteration::Continue) { break; }
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Asset::StateStore::Contains(Identifier const& asset) const
{
    std::shared_lock lock(m_mutex);
    return m_states.contains(asset);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Asset::StateStore::Count() const
{
    std::shared_lock lock(m_mutex);
    return m_states.size();
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result local::NotAllocated(Asset::Identifier const& asset)
{
    return Mesh::Result{ Mesh::ErrorCode::AssetNotFound, fmt::format("asset {} is not allocated", asset) };
}

//----------------------------------------------------------------------------------------------------------------------
