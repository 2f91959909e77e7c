//----------------------------------------------------------------------------------------------------------------------
// File: MigrationTypes.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "MigrationTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

bool Migration::IsTransitionAllowed(State from, State to)
{
    if (IsTerminal(from)) { return false; }
    if (to == State::Failed || to == State::Cancelled) { return true; }

    switch (from) {
        case State::Pending: return to == State::Preparing;
        case State::Preparing: return to == State::Transferring;
        case State::Transferring: return to == State::Verifying;
        case State::Verifying: return to == State::Switching;
        case State::Switching: return to == State::Completed;
        default: break;
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

bool Migration::IsTerminal(State state)
{
    return state == State::Completed || state == State::Failed || state == State::Cancelled;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Migration::ToString(Strategy strategy)
{
    switch (strategy) {
        case Strategy::StopAndCopy: return "stop-and-copy";
        case Strategy::LiveMigration: return "live";
        case Strategy::IncrementalSync: return "incremental-sync";
        case Strategy::Parallel: return "parallel";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Migration::ToString(Reason reason)
{
    switch (reason) {
        case Reason::Manual: return "manual";
        case Reason::NodeFailure: return "node-failure";
        case Reason::LoadBalancing: return "load-balancing";
        case Reason::Maintenance: return "maintenance";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Migration::ToString(State state)
{
    switch (state) {
        case State::Pending: return "pending";
        case State::Preparing: return "preparing";
        case State::Transferring: return "transferring";
        case State::Verifying: return "verifying";
        case State::Switching: return "switching";
        case State::Completed: return "completed";
        case State::Failed: return "failed";
        case State::Cancelled: return "cancelled";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
