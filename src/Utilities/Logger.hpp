//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Registration of the named loggers used by the coordinator's components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

void Initialize(spdlog::level::level_enum verbosity = spdlog::level::debug, bool useStdOutSink = true);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view Fleet = "fleet";
constexpr std::string_view Placement = "placement";
constexpr std::string_view Migration = "migration";
constexpr std::string_view Market = "market";

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

std::string Generate(std::string_view color, std::string_view tag);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Fleet = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Placement = "\x1b[1;38;2;178;102;255m";
constexpr std::string_view Migration = "\x1b[1;38;2;255;153;51m";
constexpr std::string_view Market = "\x1b[1;38;2;255;102;178m";

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Critical = "\x1b[1;38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";
constexpr spdlog::string_view_t Trace = "\x1b[38;2;255;255;255m";

constexpr std::string_view Reset = "\x1b[0m";

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    using Registration = std::pair<std::string_view, std::string_view>;
    constexpr std::array<Registration, 5> Loggers = {
        Registration{ Name::Core, Color::Core },
        Registration{ Name::Fleet, Color::Fleet },
        Registration{ Name::Placement, Color::Placement },
        Registration{ Name::Migration, Color::Migration },
        Registration{ Name::Market, Color::Market },
    };

    // The loggers are process wide, subsequent calls (e.g. from multiple test suites) only update the level.
    if (!spdlog::get(Name::Core.data())) {
        auto const spConsoleSink = (useStdOutSink) ? Color::CreateTrueColorConsole() : nullptr;
        for (auto const& [name, color] : Loggers) {
            auto const spLogger = std::make_shared<spdlog::logger>(name.data());
            if (spConsoleSink) { spLogger->sinks().emplace_back(spConsoleSink); }
            spLogger->set_pattern(Pattern::Generate(color, name));
            spdlog::register_logger(spLogger);
        }
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    spdlog::apply_all([&spSink] (std::shared_ptr<spdlog::logger> const& spLogger) {
        spLogger->sinks().emplace_back(spSink);
    });
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Logger::Pattern::Generate(std::string_view color, std::string_view tag)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    oss << TagOpen << color << tag << Color::Reset << TagClose << TagSeperator;
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> Logger::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::always);
    spColorSink->set_color(spdlog::level::info, Color::Info);
    spColorSink->set_color(spdlog::level::warn, Color::Warn);
    spColorSink->set_color(spdlog::level::err, Color::Error);
    spColorSink->set_color(spdlog::level::critical, Color::Critical);
    spColorSink->set_color(spdlog::level::debug, Color::Debug);
    spColorSink->set_color(spdlog::level::trace, Color::Trace);

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
