//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads, validates, and writes back the coordinator's JSON configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "Options.hpp"
#include "Settings.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Version);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    Parser();
    explicit Parser(std::filesystem::path const& filepath);

    Parser(Parser const&) = delete;
    Parser& operator=(Parser const&) = delete;

    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] Options::Heartbeat const& GetHeartbeatOptions() const;
    [[nodiscard]] Options::Detection const& GetDetectionOptions() const;
    [[nodiscard]] Options::Balancing const& GetBalancingOptions() const;
    [[nodiscard]] Options::Migration const& GetMigrationOptions() const;
    [[nodiscard]] Options::Market const& GetMarketOptions() const;
    [[nodiscard]] Settings GetSettings() const;

    [[nodiscard]] bool Validated() const;

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();

    template<typename OptionsType>
    [[nodiscard]] DeserializationResult MergeSection(boost::json::object const& json, OptionsType& options);

    [[nodiscard]] ValidationResult ValidateOptions();

    std::shared_ptr<spdlog::logger> m_logger;

    Field<Symbols::Version, std::string> m_version;
    std::filesystem::path m_filepath;

    Options::Heartbeat m_heartbeat;
    Options::Detection m_detection;
    Options::Balancing m_balancing;
    Options::Migration m_migration;
    Options::Market m_market;

    bool m_validated;
};

//----------------------------------------------------------------------------------------------------------------------
