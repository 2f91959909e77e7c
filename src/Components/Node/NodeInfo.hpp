//----------------------------------------------------------------------------------------------------------------------
// File: NodeInfo.hpp
// Description: The records describing a node's hardware, location, capacity, and health as tracked by the registry.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

enum class Status : std::uint8_t { Active, Degraded, Maintenance, Suspected, Failed, Partitioned };

struct HardwareFeatures;
struct Location;
struct Capabilities;
struct Resources;
struct PerformanceMetrics;
struct Info;

[[nodiscard]] bool IsTransitionAllowed(Status from, Status to);
[[nodiscard]] std::string_view ToString(Status status);

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

struct Node::HardwareFeatures
{
    bool sgx = false;
    bool sev = false;
    bool tpm = false;
    bool hardwareRng = false;
    bool nvme = false;
    bool rdma = false;
    bool sriov = false;
};

//----------------------------------------------------------------------------------------------------------------------

struct Node::Location
{
    std::string datacenter;
    std::string region;
    std::string country;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string zone;
};

//----------------------------------------------------------------------------------------------------------------------

struct Node::Capabilities
{
    [[nodiscard]] bool Supports(Asset::Type type) const { return assetTypes.contains(type); }

    std::uint32_t cpuCores = 0;
    std::uint64_t memoryBytes = 0;
    std::uint32_t gpuDevices = 0;
    std::uint64_t storageBytes = 0;
    std::uint64_t bandwidthMbps = 0;
    std::set<Asset::Type> assetTypes;
    HardwareFeatures features;
    std::vector<std::string> software;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The resources currently free on a node. The same shape describes the demand of an allocation.
//----------------------------------------------------------------------------------------------------------------------
struct Node::Resources
{
    [[nodiscard]] static Resources FromCapabilities(Capabilities const& capabilities);

    [[nodiscard]] bool operator==(Resources const& other) const = default;

    [[nodiscard]] bool CanFit(Resources const& demand) const;
    [[nodiscard]] bool IsWithin(Capabilities const& capabilities) const;

    // Subtraction expects the demand to fit, addition is clamped to the supplied capabilities.
    void Subtract(Resources const& demand);
    void Add(Resources const& demand, Capabilities const& capabilities);
    void ClampTo(Capabilities const& capabilities);

    double cpuCores = 0.0;
    std::uint64_t memoryBytes = 0;
    std::uint32_t gpuUnits = 0;
    std::uint64_t storageBytes = 0;
    std::uint64_t bandwidthMbps = 0;
};

//----------------------------------------------------------------------------------------------------------------------

struct Node::PerformanceMetrics
{
    double cpuUtilization = 0.0;
    double memoryUtilization = 0.0;
    double averageResponseMs = 0.0;
    double successRate = 1.0;
    std::uint32_t activeAssets = 0;
    std::uint64_t dataProcessedBytes = 0;
};

//----------------------------------------------------------------------------------------------------------------------

struct Node::Info
{
    Identifier identifier;
    Capabilities capabilities;
    Status status = Status::Active;
    TimeUtils::Timepoint lastHeartbeat;
    Location location;
    Resources available;
    PerformanceMetrics metrics;
};

//----------------------------------------------------------------------------------------------------------------------
