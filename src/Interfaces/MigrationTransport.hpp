//----------------------------------------------------------------------------------------------------------------------
// File: MigrationTransport.hpp
// Description: The data moving collaborator used by the migrator. Implementations own the wire details of copying an
// allocation's state between nodes.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Migration/MigrationTypes.hpp"
#include "Utilities/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

class IMigrationTransport
{
public:
    virtual ~IMigrationTransport() = default;

    [[nodiscard]] virtual Mesh::Result Prepare(Migration::Plan const& plan) = 0;

    // Provides the number of bytes copied to the target.
    [[nodiscard]] virtual Mesh::Expected<std::uint64_t> Transfer(Migration::Plan const& plan) = 0;

    [[nodiscard]] virtual Mesh::Result Verify(Migration::Plan const& plan, std::uint64_t transferred) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
