//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool CreateParentDirectories(std::filesystem::path const& filepath);
[[nodiscard]] bool IsWithinSizeLimit(std::filesystem::path const& filepath, std::uintmax_t limit);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateParentDirectories(std::filesystem::path const& filepath)
{
    auto const base = filepath.parent_path();
    if (base.empty()) { return true; } // A bare filename is relative to the working directory.

    std::error_code error;
    if (std::filesystem::exists(base, error)) { return true; }

    // Only the owning user should be able to inspect or change the coordinator's configuration.
    if (!std::filesystem::create_directories(base, error)) { return false; }
    std::filesystem::permissions(base, std::filesystem::perms::owner_all, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::IsWithinSizeLimit(std::filesystem::path const& filepath, std::uintmax_t limit)
{
    std::error_code error;
    auto const size = std::filesystem::file_size(filepath, error);
    return !error && size <= limit;
}

//----------------------------------------------------------------------------------------------------------------------
