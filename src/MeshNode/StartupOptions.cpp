//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

namespace options = boost::program_options;

constexpr std::uint32_t MinimumWidth = 80;
constexpr std::string_view DefaultProgram = "mesh_coordinator";

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> VerbosityLevels = {{
    { "trace", spdlog::level::trace },
    { "debug", spdlog::level::debug },
    { "info", spdlog::level::info },
    { "warning", spdlog::level::warn },
    { "error", spdlog::level::err },
    { "critical", spdlog::level::critical },
    { "none", spdlog::level::off },
}};

[[nodiscard]] std::uint32_t GetTerminalWidth();
[[nodiscard]] bool IsSupplied(options::variables_map const& supplied, std::string_view option);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_initialize(false)
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    using namespace local::options;
    std::uint32_t const width = local::GetTerminalWidth();

    std::string levels;
    for (auto const& [name, level] : local::VerbosityLevels) {
        levels.append(levels.empty() ? "" : ", ").append(name);
    }
    auto const verbosity = fmt::format("Sets the maximum log level for console output. Options: [{}]", levels);

    options_description general("General Options", width);
    general.add_options()
        (Help.data(), "Display this help text and exit.")
        (Version.data(), "Display the version information and exit.")
        (Verbosity.data(), value<std::string>()->value_name("<level>")->default_value("info"), verbosity.c_str())
        (Quiet.data(), bool_switch()->default_value(false), "Disables all output to the console.");

    options_description configuration("Configuration Options", width);
    configuration.add_options()
        (
            ConfigurationFilepath.data(),
            value<std::string>()->value_name("<filepath>"),
            "Set the configuration filepath. When omitted, the default options are used and nothing is written."
        )
        (
            Initialize.data(),
            bool_switch()->default_value(false),
            "Write the effective configuration to the configuration filepath and exit."
        );

    m_descriptions.add(general).add(configuration);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char const* const* argv)
{
    std::string const program = (argc > 0) ?
        std::filesystem::path(argv[0]).stem().string() : std::string{ local::DefaultProgram };

    try {
        auto const parsed = local::options::command_line_parser(argc, argv).options(m_descriptions).run();
        local::options::store(parsed, m_options);
        local::options::notify(m_options);
    } catch (local::options::error const& exception) {
        fmt::print("Unable to parse the startup options: {}.\n", exception.what());
        return ParseCode::Malformed;
    }

    if (local::IsSupplied(m_options, Help)) {
        fmt::print("{}\n", GenerateHelpText(program));
        return ParseCode::ExitRequested;
    }

    if (local::IsSupplied(m_options, Version)) {
        fmt::print("{}\n", GenerateVersionText(program));
        return ParseCode::ExitRequested;
    }

    bool const quiet = m_options[Quiet.data()].as<bool>();
    if (quiet && local::IsSupplied(m_options, Verbosity)) {
        fmt::print("The '{}' and '{}' options can not be used together.\n", Verbosity, Quiet);
        return ParseCode::Malformed;
    }

    auto const& level = m_options[Verbosity.data()].as<std::string>();
    auto const itr = std::ranges::find(local::VerbosityLevels, level, [] (auto const& entry) { return entry.first; });
    if (itr == local::VerbosityLevels.end()) {
        fmt::print("Unrecognized verbosity level '{}'.\n", level);
        return ParseCode::Malformed;
    }
    m_verbosity = (quiet) ? spdlog::level::off : itr->second;

    if (m_options.count(ConfigurationFilepath.data()) != 0) {
        m_configurationFilepath = m_options[ConfigurationFilepath.data()].as<std::string>();
        if (m_configurationFilepath.empty()) {
            fmt::print("The configuration filepath can not be empty.\n");
            return ParseCode::Malformed;
        }
    }

    m_initialize = m_options[Initialize.data()].as<bool>();
    if (m_initialize && m_configurationFilepath.empty()) {
        fmt::print("Writing the configuration requires the '{}' option.\n", ConfigurationFilepath);
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText(std::string_view program) const
{
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText(std::string_view program) const
{
    return fmt::format("{} ({}) {}", program, Mesh::Name, Mesh::Version);
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosity() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Startup::Options::GetConfigPath() const { return m_configurationFilepath; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::InitializeRequested() const { return m_initialize; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    // The width is unavailable when the output has been redirected.
    struct winsize size{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col == 0) { return MinimumWidth; }
    return std::max<std::uint32_t>(size.ws_col, MinimumWidth);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsSupplied(options::variables_map const& supplied, std::string_view option)
{
    auto const itr = supplied.find(std::string{ option });
    return itr != supplied.end() && !itr->second.defaulted();
}

//----------------------------------------------------------------------------------------------------------------------
