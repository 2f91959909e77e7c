//----------------------------------------------------------------------------------------------------------------------
// File: MigrationTypes.hpp
// Description: The plans and progress records used to move an allocation from one node to another.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Migration {
//----------------------------------------------------------------------------------------------------------------------

enum class Strategy : std::uint8_t { StopAndCopy, LiveMigration, IncrementalSync, Parallel };

enum class Reason : std::uint8_t { Manual, NodeFailure, LoadBalancing, Maintenance };

enum class State : std::uint8_t
{
    Pending, Preparing, Transferring, Verifying, Switching, Completed, Failed, Cancelled
};

struct Plan;
struct Status;

// Forward states advance one step at a time. Failed and Cancelled may be entered from any non-terminal state.
[[nodiscard]] bool IsTransitionAllowed(State from, State to);
[[nodiscard]] bool IsTerminal(State state);

[[nodiscard]] std::string_view ToString(Strategy strategy);
[[nodiscard]] std::string_view ToString(Reason reason);
[[nodiscard]] std::string_view ToString(State state);

//----------------------------------------------------------------------------------------------------------------------
} // Migration namespace
//----------------------------------------------------------------------------------------------------------------------

struct Migration::Plan
{
    Asset::Identifier asset;
    Node::Identifier source;
    Node::Identifier target;
    Strategy strategy = Strategy::LiveMigration;
    Reason reason = Reason::Manual;
    std::chrono::milliseconds estimatedDuration{ 0 };
    std::uint64_t estimatedBytes = 0;
    std::uint32_t priority = 0;
    TimeUtils::Timepoint created;
};

//----------------------------------------------------------------------------------------------------------------------

struct Migration::Status
{
    Plan plan;
    State state = State::Pending;
    double progress = 0.0;
    std::uint64_t transferredBytes = 0;
    std::optional<std::string> error;
    std::optional<TimeUtils::Timepoint> started;
    std::optional<TimeUtils::Timepoint> finished;
};

//----------------------------------------------------------------------------------------------------------------------
