//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <fstream>
#include <sstream>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema. Every section is optional, absent values take the defaults.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "heartbeat": {
//     "interval": Optional String,
//     "failure_timeout": Optional String
// },
// "detection": {
//     "partition_interval": Optional String,
//     "byzantine_interval": Optional String,
//     "byzantine_threshold": Optional Number
// },
// "balancing": {
//     "enabled": Optional Boolean,
//     "interval": Optional String,
//     "deviation_threshold": Optional Number
// },
// "migration": {
//     "auto_migration": Optional Boolean,
//     "prefer_live": Optional Boolean
// },
// "market": {
//     "pricing_enabled": Optional Boolean,
//     "matching_interval": Optional String,
//     "max_demand_factor": Optional Number
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser()
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_version(std::string{ Defaults::Version }, [] (std::string const& value) { return !value.empty(); })
    , m_filepath()
    , m_heartbeat()
    , m_detection()
    , m_balancing()
    , m_migration()
    , m_market()
    , m_validated(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : Parser()
{
    m_filepath = filepath;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    return ValidateOptions();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    if (m_filepath.empty()) { return { StatusCode::FileError, "A configuration file path has not been provided." }; }

    if (!FileUtils::CreateParentDirectories(m_filepath)) {
        return { StatusCode::FileError, "Failed to create the configuration directory." };
    }

    boost::json::object json;
    json[m_version.GetFieldName()] = m_version.GetValue();

    if (auto const status = m_heartbeat.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_detection.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_balancing.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_migration.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_market.Write(json); status.first != StatusCode::Success) { return status; }

    std::ofstream os(m_filepath, std::ofstream::out | std::ofstream::trunc);
    if (os.fail()) { return { StatusCode::FileError, "Failed to open the configuration file for writing." }; }

    JSON::Print(json, os);
    os.close();
    if (os.fail()) { return { StatusCode::FileError, "Failed to write the configuration file." }; }

    m_logger->debug("Wrote configuration file to {}.", m_filepath.string());

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Heartbeat const& Configuration::Parser::GetHeartbeatOptions() const { return m_heartbeat; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Detection const& Configuration::Parser::GetDetectionOptions() const { return m_detection; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Balancing const& Configuration::Parser::GetBalancingOptions() const { return m_balancing; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Migration const& Configuration::Parser::GetMigrationOptions() const { return m_migration; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Market const& Configuration::Parser::GetMarketOptions() const { return m_market; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Settings Configuration::Parser::GetSettings() const
{
    return Settings{
        .heartbeat = m_heartbeat,
        .detection = m_detection,
        .balancing = m_balancing,
        .migration = m_migration,
        .market = m_market
    };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // Filesystem usage is disabled.
    if (m_validated) { return { StatusCode::Success, "" }; } // The file has already been processed.

    std::error_code error;
    if (!std::filesystem::exists(m_filepath, error)) {
        return {
            StatusCode::FileError, fmt::format("Failed to locate a configuration file at {}.", m_filepath.string())
        };
    }

    if (!FileUtils::IsWithinSizeLimit(m_filepath, Defaults::FileSizeLimit)) {
        return {
            StatusCode::FileError,
            fmt::format("The configuration file exceeds the {} byte limit.", Defaults::FileSizeLimit)
        };
    }

    m_logger->debug("Reading configuration file at {}.", m_filepath.string());
    return Deserialize();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    try {
        boost::json::parse_options options;
        options.allow_comments = true;
        options.allow_trailing_commas = true;

        std::stringstream buffer;
        {
            std::ifstream reader{ m_filepath };
            if (reader.fail()) [[unlikely]] {
                return { StatusCode::FileError, "Failed to open the configuration file for reading." };
            }
            buffer << reader.rdbuf();
        }

        auto const serialized = buffer.str();
        if (serialized.empty()) { return { StatusCode::DecodeError, "The configuration file is empty." }; }

        boost::json::error_code error;
        auto const document = boost::json::parse(serialized, error, boost::json::storage_ptr{}, options);
        if (error) { return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." }; }

        auto const* const pJson = document.if_object();
        if (!pJson) { return { StatusCode::DecodeError, "The configuration file must contain a JSON object." }; }

        if (auto const itr = pJson->find(m_version.GetFieldName()); itr != pJson->end()) {
            if (!itr->value().is_string()) {
                return {
                    StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_version.GetFieldName())
                };
            }
            auto const& version = itr->value().get_string();
            if (!m_version.SetValueFromConfig(std::string{ version.data(), version.size() })) {
                return { StatusCode::InputError, CreateInvalidValueMessage(m_version.GetFieldName()) };
            }
        }

        if (auto const status = MergeSection(*pJson, m_heartbeat); status.first != StatusCode::Success) {
            return status;
        }
        if (auto const status = MergeSection(*pJson, m_detection); status.first != StatusCode::Success) {
            return status;
        }
        if (auto const status = MergeSection(*pJson, m_balancing); status.first != StatusCode::Success) {
            return status;
        }
        if (auto const status = MergeSection(*pJson, m_migration); status.first != StatusCode::Success) {
            return status;
        }
        if (auto const status = MergeSection(*pJson, m_market); status.first != StatusCode::Success) {
            return status;
        }
    } catch (std::exception const& exception) {
        return {
            StatusCode::DecodeError,
            fmt::format("Encountered an unexpected error while reading the configuration file: {}", exception.what())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename OptionsType>
Configuration::DeserializationResult Configuration::Parser::MergeSection(
    boost::json::object const& json, OptionsType& options)
{
    static_assert(OptionsType::IsOptional());

    auto const itr = json.find(OptionsType::GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; } // The defaults will be used for the section.

    if (!itr->value().is_object()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", OptionsType::GetFieldName()) };
    }

    return options.Merge(itr->value().get_object());
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (auto const status = m_heartbeat.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_detection.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_balancing.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_migration.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_market.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
