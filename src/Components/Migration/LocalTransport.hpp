//----------------------------------------------------------------------------------------------------------------------
// File: LocalTransport.hpp
// Description: An in-process transport for allocations whose state is tracked entirely by the coordinator. Every step
// succeeds and the estimated size of the plan is reported as transferred.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Interfaces/MigrationTransport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Migration {
//----------------------------------------------------------------------------------------------------------------------

class LocalTransport;

//----------------------------------------------------------------------------------------------------------------------
} // Migration namespace
//----------------------------------------------------------------------------------------------------------------------

class Migration::LocalTransport final : public IMigrationTransport
{
public:
    LocalTransport();

    // IMigrationTransport {
    [[nodiscard]] virtual Mesh::Result Prepare(Plan const& plan) override;
    [[nodiscard]] virtual Mesh::Expected<std::uint64_t> Transfer(Plan const& plan) override;
    [[nodiscard]] virtual Mesh::Result Verify(Plan const& plan, std::uint64_t transferred) override;
    // } IMigrationTransport

    [[nodiscard]] std::uint64_t TransferredBytes() const;

private:
    std::atomic<std::uint64_t> m_transferred;
};

//----------------------------------------------------------------------------------------------------------------------
