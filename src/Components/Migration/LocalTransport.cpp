//----------------------------------------------------------------------------------------------------------------------
// File: LocalTransport.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "LocalTransport.hpp"
//----------------------------------------------------------------------------------------------------------------------

Migration::LocalTransport::LocalTransport()
    : m_transferred(0)
{
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::LocalTransport::Prepare(Plan const&) { return Mesh::Result{}; }

//----------------------------------------------------------------------------------------------------------------------

Mesh::Expected<std::uint64_t> Migration::LocalTransport::Transfer(Plan const& plan)
{
    m_transferred += plan.estimatedBytes;
    return plan.estimatedBytes;
}

//----------------------------------------------------------------------------------------------------------------------

Mesh::Result Migration::LocalTransport::Verify(Plan const& plan, std::uint64_t transferred)
{
    if (transferred != plan.estimatedBytes) {
        return Mesh::Result{ Mesh::ErrorCode::NetworkError, "transferred size does not match the plan" };
    }
    return Mesh::Result{};
}

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Migration::LocalTransport::TransferredBytes() const { return m_transferred.load(); }

//----------------------------------------------------------------------------------------------------------------------
