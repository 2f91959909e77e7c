//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Coordinator.hpp"
#include "ExecutionToken.hpp"
#include "StartupOptions.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/core/quick_exit.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace Signal {
//----------------------------------------------------------------------------------------------------------------------

Mesh::ExecutionToken ExecutionToken;

extern "C" void OnShutdownRequested(std::int32_t signal);

//----------------------------------------------------------------------------------------------------------------------
} // Signal namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr auto ExecutionCheckInterval = std::chrono::milliseconds{ 100 };

std::unique_ptr<Configuration::Parser> CreateParser(Startup::Options const& options);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

extern "C" void Signal::OnShutdownRequested(std::int32_t signal)
{
    // If the coordinator hasn't started there is no additional cleanup required (std::exit() is not signal safe).
    if (!ExecutionToken.IsExecutionActive()) { boost::quick_exit(signal); }
    [[maybe_unused]] bool const result = ExecutionToken.RequestStop();
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    if (SIG_ERR == std::signal(SIGINT, Signal::OnShutdownRequested)) { return 1; }
    if (SIG_ERR == std::signal(SIGTERM, Signal::OnShutdownRequested)) { return 1; }

    Startup::Options options;
    switch (options.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    Logger::Initialize(options.GetVerbosity());
    auto const logger = spdlog::get(Logger::Name::Core.data());

    auto const upParser = local::CreateParser(options);
    if (!upParser) { return 1; }
    if (options.InitializeRequested()) { return 0; }

    auto const optLocal = Node::GenerateIdentifier();
    if (!optLocal) {
        logger->critical("Failed to generate an identifier for the local node!");
        return 1;
    }

    logger->info("Welcome to the {} (v{})!", Mesh::Name, Mesh::Version);
    logger->info("Node Identifier: {}", optLocal->ToString());

    Mesh::Coordinator coordinator(upParser->GetSettings());
    if (auto const result = coordinator.Initialize(*optLocal); !result) {
        logger->critical("Failed to initialize the coordinator: {}", result.what());
        return 1;
    }

    if (!Signal::ExecutionToken.RequestStart()) {
        coordinator.Shutdown();
        return 1;
    }

    if (auto const result = coordinator.JoinNetwork(); !result) {
        logger->critical("Failed to join the network: {}", result.what());
        coordinator.Shutdown();
        return 1;
    }

    // The local node refreshes its own liveness, all other work is driven by the coordinator's periodic tasks.
    auto const interval = upParser->GetHeartbeatOptions().GetInterval();
    auto next = std::chrono::steady_clock::now() + interval;
    while (Signal::ExecutionToken.IsExecutionActive()) {
        std::this_thread::sleep_for(local::ExecutionCheckInterval);
        if (auto const now = std::chrono::steady_clock::now(); now >= next) {
            if (auto const result = coordinator.UpdateHeartbeat(*optLocal); !result) {
                logger->warn("Failed to refresh the local heartbeat: {}", result.what());
            }
            next = now + interval;
        }
    }

    logger->info("A shutdown has been requested, leaving the network.");
    if (auto const result = coordinator.LeaveNetwork(); !result) {
        logger->warn("Failed to notify the network of the departure: {}", result.what());
    }

    coordinator.Shutdown();
    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Configuration::Parser> local::CreateParser(Startup::Options const& options)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());
    auto const& filepath = options.GetConfigPath();
    auto upParser = std::make_unique<Configuration::Parser>(filepath);

    // Initializing writes the effective configuration, an existing file is merged with the defaults first.
    if (options.InitializeRequested()) {
        if (std::filesystem::exists(filepath)) {
            if (auto const [status, error] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
                logger->critical("Failed to read the configuration: {}", error);
                return nullptr;
            }
        }

        if (auto const [status, error] = upParser->Serialize(); status != Configuration::StatusCode::Success) {
            logger->critical("Failed to write the configuration: {}", error);
            return nullptr;
        }

        logger->info("Wrote the configuration file to {}.", upParser->GetFilepath().string());
        return upParser;
    }

    if (upParser->FilesystemDisabled()) { logger->info("A configuration file was not provided, using the defaults."); }

    if (auto const [status, error] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
        logger->critical("Failed to read the configuration: {}", error);
        return nullptr;
    }

    return upParser;
}

//----------------------------------------------------------------------------------------------------------------------
