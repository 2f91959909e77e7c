//----------------------------------------------------------------------------------------------------------------------
// File: ExecutionToken.hpp
// Description: Tracks whether the coordinator process should keep running. The token may be signalled from a signal
// handler, it only uses lock free atomics.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Mesh {
//----------------------------------------------------------------------------------------------------------------------

enum class ExecutionStatus : std::uint32_t { Standby, Executing, RequestedShutdown };

class ExecutionToken;

//----------------------------------------------------------------------------------------------------------------------
} // Mesh namespace
//----------------------------------------------------------------------------------------------------------------------

class Mesh::ExecutionToken
{
public:
    constexpr ExecutionToken() noexcept : m_status(ExecutionStatus::Standby) {}

    [[nodiscard]] ExecutionStatus Status() const { return m_status; }
    [[nodiscard]] bool IsExecutionActive() const { return m_status == ExecutionStatus::Executing; }

    [[nodiscard]] bool RequestStart()
    {
        auto expected = ExecutionStatus::Standby;
        return m_status.compare_exchange_strong(expected, ExecutionStatus::Executing);
    }

    // Only an executing token may be stopped. Returns false if a stop has already been requested.
    [[nodiscard]] bool RequestStop()
    {
        auto expected = ExecutionStatus::Executing;
        return m_status.compare_exchange_strong(expected, ExecutionStatus::RequestedShutdown);
    }

private:
    std::atomic<ExecutionStatus> m_status;
    static_assert(std::atomic<ExecutionStatus>::is_always_lock_free);
};

//----------------------------------------------------------------------------------------------------------------------
