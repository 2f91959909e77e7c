//----------------------------------------------------------------------------------------------------------------------
// File: NodeInfo.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "NodeInfo.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t StatusCount = 6;

// Rows are the current status and columns are the requested status, both in declaration order.
constexpr std::array<std::array<bool, StatusCount>, StatusCount> Transitions = {{
    //  Active, Degraded, Maintenance, Suspected, Failed, Partitioned
    {{ false, true, true, true, true, true }}, // Active
    {{ true, false, true, true, true, true }}, // Degraded
    {{ true, false, false, false, true, false }}, // Maintenance
    {{ true, false, true, false, true, false }}, // Suspected
    {{ false, false, false, false, false, false }}, // Failed
    {{ true, false, false, true, true, false }}, // Partitioned
}};

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
} // namespace
//----------------------------------------------------------------------------------------------------------------------

bool Node::IsTransitionAllowed(Status from, Status to)
{
    return local::Transitions[static_cast<std::size_t>(from)][static_cast<std::size_t>(to)];
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Node::ToString(Status status)
{
    switch (status) {
        case Status::Active: return "active";
        case Status::Degraded: return "degraded";
        case Status::Maintenance: return "maintenance";
        case Status::Suspected: return "suspected";
        case Status::Failed: return "failed";
        case Status::Partitioned: return "partitioned";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

Node::Resources Node::Resources::FromCapabilities(Capabilities const& capabilities)
{
    return Resources{
        .cpuCores = static_cast<double>(capabilities.cpuCores),
        .memoryBytes = capabilities.memoryBytes,
        .gpuUnits = capabilities.gpuDevices,
        .storageBytes = capabilities.storageBytes,
        .bandwidthMbps = capabilities.bandwidthMbps
    };
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Resources::CanFit(Resources const& demand) const
{
    return demand.cpuCores <= cpuCores &&
        demand.memoryBytes <= memoryBytes &&
        demand.gpuUnits <= gpuUnits &&
        demand.storageBytes <= storageBytes &&
        demand.bandwidthMbps <= bandwidthMbps;
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Resources::IsWithin(Capabilities const& capabilities) const
{
    return cpuCores >= 0.0 && FromCapabilities(capabilities).CanFit(*this);
}

//----------------------------------------------------------------------------------------------------------------------

void Node::Resources::Subtract(Resources const& demand)
{
    cpuCores = std::max(cpuCores - demand.cpuCores, 0.0);
    memoryBytes -= std::min(memoryBytes, demand.memoryBytes);
    gpuUnits -= std::min(gpuUnits, demand.gpuUnits);
    storageBytes -= std::min(storageBytes, demand.storageBytes);
    bandwidthMbps -= std::min(bandwidthMbps, demand.bandwidthMbps);
}

//----------------------------------------------------------------------------------------------------------------------

void Node::Resources::Add(Resources const& demand, Capabilities const& capabilities)
{
    cpuCores += demand.cpuCores;
    memoryBytes += demand.memoryBytes;
    gpuUnits += demand.gpuUnits;
    storageBytes += demand.storageBytes;
    bandwidthMbps += demand.bandwidthMbps;
    ClampTo(capabilities);
}

//----------------------------------------------------------------------------------------------------------------------

void Node::Resources::ClampTo(Capabilities const& capabilities)
{
    cpuCores = std::clamp(cpuCores, 0.0, static_cast<double>(capabilities.cpuCores));
    memoryBytes = std::min(memoryBytes, capabilities.memoryBytes);
    gpuUnits = std::min(gpuUnits, capabilities.gpuDevices);
    storageBytes = std::min(storageBytes, capabilities.storageBytes);
    bandwidthMbps = std::min(bandwidthMbps, capabilities.bandwidthMbps);
}

//----------------------------------------------------------------------------------------------------------------------
