//----------------------------------------------------------------------------------------------------------------------
// File: StateStore.hpp
// Description: The replicated view of each allocation. A state is created when an asset is allocated, updated on every
// observer report or migration, and removed when the asset is released.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "AssetTypes.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Components/Node/NodeInfo.hpp"
#include "Utilities/CallbackIteration.hpp"
#include "Utilities/Result.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Asset {
//----------------------------------------------------------------------------------------------------------------------

using ReportMap = std::unordered_map<Node::Identifier, Status, Node::Hasher>;

struct DistributedState;

class StateStore;

//----------------------------------------------------------------------------------------------------------------------
} // Asset namespace
//----------------------------------------------------------------------------------------------------------------------

struct Asset::DistributedState
{
    Identifier asset;
    Node::Identifier primary;
    ReportMap reports;
    Node::Resources demand;
    TimeUtils::Timepoint updated;
};

//----------------------------------------------------------------------------------------------------------------------

class Asset::StateStore final
{
public:
    using ForEachFunction = std::function<CallbackIteration(DistributedState const&)>;

    StateStore();

    StateStore(StateStore const&) = delete;
    StateStore& operator=(StateStore const&) = delete;

    // Returns false when a state for the asset already exists.
    [[nodiscard]] bool Insert(DistributedState&& state);

    Mesh::Result Report(
        Identifier const& asset,
        Node::Identifier const& observer,
        Status status,
        TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    // Moves the asset to the replacement only while it is still hosted by the expected primary.
    Mesh::Result ExchangePrimary(
        Identifier const& asset,
        Node::Identifier const& expected,
        Node::Identifier const& replacement,
        TimeUtils::Timepoint now = TimeUtils::GetSystemTimepoint());

    [[nodiscard]] std::optional<DistributedState> Extract(Identifier const& asset);

    [[nodiscard]] std::optional<DistributedState> Fetch(Identifier const& asset) const;
    [[nodiscard]] std::vector<Identifier> HostedBy(Node::Identifier const& node) const;
    bool ForEach(ForEachFunction const& callback) const;

    [[nodiscard]] bool Contains(Identifier const& asset) const;
    [[nodiscard]] std::size_t Count() const;

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<Identifier, DistributedState, Hasher> m_states;
};

//----------------------------------------------------------------------------------------------------------------------
