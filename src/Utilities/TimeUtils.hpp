//----------------------------------------------------------------------------------------------------------------------
// File: TimeUtils.hpp
// Description: Millisecond precision wall clock helpers shared by the detectors and records.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace TimeUtils {
//----------------------------------------------------------------------------------------------------------------------

using Timestamp = std::chrono::milliseconds;
using Timepoint = std::chrono::time_point<std::chrono::system_clock, Timestamp>;

[[nodiscard]] Timepoint GetSystemTimepoint();
[[nodiscard]] Timestamp TimepointToTimestamp(Timepoint const& timepoint);
[[nodiscard]] std::string TimepointToString(Timepoint const& timepoint);

template<typename Rep, typename Period>
[[nodiscard]] double ToHours(std::chrono::duration<Rep, Period> const& duration);

//----------------------------------------------------------------------------------------------------------------------
} // TimeUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::GetSystemTimepoint()
{
    return std::chrono::time_point_cast<Timestamp>(std::chrono::system_clock::now());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timestamp TimeUtils::TimepointToTimestamp(Timepoint const& timepoint)
{
    return std::chrono::duration_cast<Timestamp>(timepoint.time_since_epoch());
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string TimeUtils::TimepointToString(Timepoint const& timepoint)
{
    return std::to_string(TimepointToTimestamp(timepoint).count());
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Rep, typename Period>
double TimeUtils::ToHours(std::chrono::duration<Rep, Period> const& duration)
{
    return std::chrono::duration_cast<std::chrono::duration<double, std::ratio<3600>>>(duration).count();
}

//----------------------------------------------------------------------------------------------------------------------
