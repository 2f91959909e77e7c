//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description: The command line options accepted by the coordinator executable.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view Initialize = "init";

    Options();

    [[nodiscard]] ParseCode Parse(std::int32_t argc, char const* const* argv);

    [[nodiscard]] std::string GenerateHelpText(std::string_view program) const;
    [[nodiscard]] std::string GenerateVersionText(std::string_view program) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] std::filesystem::path const& GetConfigPath() const;
    [[nodiscard]] bool InitializeRequested() const;

private:
    void SetupDescriptions();

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;

    spdlog::level::level_enum m_verbosity;
    std::filesystem::path m_configurationFilepath;
    bool m_initialize;
};

//----------------------------------------------------------------------------------------------------------------------
