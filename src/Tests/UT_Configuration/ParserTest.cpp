//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Parser.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

void WriteFile(std::filesystem::path const& filepath, std::string_view content);
[[nodiscard]] std::string ReadFile(std::filesystem::path const& filepath);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view GoodConfiguration = R"(
{
    // Tuned for a small lab fleet.
    "version": "0.1.0",
    "heartbeat": { "interval": "5s", "failure_timeout": "15s" },
    "detection": {
        "partition_interval": "1min",
        "byzantine_interval": "2min",
        "byzantine_threshold": 0.5
    },
    "balancing": { "enabled": false, "interval": "1h", "deviation_threshold": 0.1 },
    "migration": { "auto_migration": false, "prefer_live": false },
    "market": { "pricing_enabled": true, "matching_interval": "10s", "max_demand_factor": 3, },
}
)";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

using namespace std::chrono_literals;

//----------------------------------------------------------------------------------------------------------------------

class ConfigurationParserSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        auto const pInfo = testing::UnitTest::GetInstance()->current_test_info();
        m_directory = std::filesystem::temp_directory_path() / "mesh_coordinator_ut_configuration" / pInfo->name();
        std::filesystem::remove_all(m_directory);
        ASSERT_TRUE(std::filesystem::create_directories(m_directory));
        m_filepath = m_directory / "config.json";
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(m_directory, error);
    }

    std::filesystem::path m_directory;
    std::filesystem::path m_filepath;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, DisabledFilesystemTest)
{
    Configuration::Parser parser;
    EXPECT_TRUE(parser.FilesystemDisabled());
    EXPECT_FALSE(parser.Validated());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());

    auto const settings = parser.GetSettings();
    EXPECT_EQ(settings.heartbeat.GetInterval(), Configuration::Defaults::HeartbeatInterval);
    EXPECT_EQ(settings.heartbeat.GetFailureTimeout(), Configuration::Defaults::FailureTimeout);
    EXPECT_EQ(settings.detection.GetPartitionInterval(), Configuration::Defaults::PartitionInterval);
    EXPECT_EQ(settings.detection.GetByzantineInterval(), Configuration::Defaults::ByzantineInterval);
    EXPECT_DOUBLE_EQ(settings.detection.GetByzantineThreshold(), Configuration::Defaults::ByzantineThreshold);
    EXPECT_EQ(settings.balancing.IsEnabled(), Configuration::Defaults::BalancingEnabled);
    EXPECT_EQ(settings.balancing.GetInterval(), Configuration::Defaults::BalancingInterval);
    EXPECT_DOUBLE_EQ(settings.balancing.GetDeviationThreshold(), Configuration::Defaults::DeviationThreshold);
    EXPECT_EQ(settings.migration.UseAutoMigration(), Configuration::Defaults::AutoMigration);
    EXPECT_EQ(settings.migration.PreferLive(), Configuration::Defaults::PreferLiveMigration);
    EXPECT_EQ(settings.market.IsPricingEnabled(), Configuration::Defaults::PricingEnabled);
    EXPECT_EQ(settings.market.GetMatchingInterval(), Configuration::Defaults::MatchingInterval);
    EXPECT_DOUBLE_EQ(settings.market.GetMaxDemandFactor(), Configuration::Defaults::MaxDemandFactor);

    // There is nowhere to write the options without a file.
    EXPECT_EQ(parser.Serialize().first, Configuration::StatusCode::FileError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, ParseGoodFileTest)
{
    local::WriteFile(m_filepath, test::GoodConfiguration);

    Configuration::Parser parser{ m_filepath };
    EXPECT_FALSE(parser.FilesystemDisabled());
    EXPECT_FALSE(parser.Validated());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());

    EXPECT_EQ(parser.GetVersion(), "0.1.0");
    EXPECT_EQ(parser.GetHeartbeatOptions().GetInterval(), 5s);
    EXPECT_EQ(parser.GetHeartbeatOptions().GetFailureTimeout(), 15s);
    EXPECT_EQ(parser.GetDetectionOptions().GetPartitionInterval(), 1min);
    EXPECT_EQ(parser.GetDetectionOptions().GetByzantineInterval(), 2min);
    EXPECT_DOUBLE_EQ(parser.GetDetectionOptions().GetByzantineThreshold(), 0.5);
    EXPECT_FALSE(parser.GetBalancingOptions().IsEnabled());
    EXPECT_EQ(parser.GetBalancingOptions().GetInterval(), 1h);
    EXPECT_DOUBLE_EQ(parser.GetBalancingOptions().GetDeviationThreshold(), 0.1);
    EXPECT_FALSE(parser.GetMigrationOptions().UseAutoMigration());
    EXPECT_FALSE(parser.GetMigrationOptions().PreferLive());
    EXPECT_TRUE(parser.GetMarketOptions().IsPricingEnabled());
    EXPECT_EQ(parser.GetMarketOptions().GetMatchingInterval(), 10s);
    EXPECT_DOUBLE_EQ(parser.GetMarketOptions().GetMaxDemandFactor(), 3.0);

    // A second fetch of an unchanged file is a no-op.
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, PartialFileTest)
{
    local::WriteFile(m_filepath, R"({ "heartbeat": { "failure_timeout": "45s" } })");

    Configuration::Parser parser{ m_filepath };
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(parser.GetHeartbeatOptions().GetInterval(), Configuration::Defaults::HeartbeatInterval);
    EXPECT_EQ(parser.GetHeartbeatOptions().GetFailureTimeout(), 45s);
    EXPECT_EQ(parser.GetVersion(), Configuration::Defaults::Version);
    EXPECT_EQ(parser.GetMarketOptions(), Configuration::Options::Market{});
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, ParseMissingFileTest)
{
    Configuration::Parser parser{ m_directory / "missing.json" };
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);
    EXPECT_FALSE(parser.Validated());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, ParseMalformedFileTest)
{
    auto const expectDecodeError = [this] (std::string_view content) {
        local::WriteFile(m_filepath, content);
        Configuration::Parser parser{ m_filepath };
        auto const [status, message] = parser.FetchOptions();
        EXPECT_EQ(status, Configuration::StatusCode::DecodeError) << content;
        EXPECT_FALSE(message.empty());
        EXPECT_FALSE(parser.Validated());
    };

    expectDecodeError("");
    expectDecodeError(R"({ "heartbeat": { "interval": )");
    expectDecodeError(R"([ "heartbeat" ])");
    expectDecodeError(R"({ "version": 1 })");
    expectDecodeError(R"({ "heartbeat": "10s" })");
    expectDecodeError(R"({ "heartbeat": { "interval": 10 } })");
    expectDecodeError(R"({ "detection": { "byzantine_threshold": "high" } })");
    expectDecodeError(R"({ "balancing": { "enabled": "yes" } })");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, ParseInvalidValuesTest)
{
    auto const expectInputError = [this] (std::string_view content) {
        local::WriteFile(m_filepath, content);
        Configuration::Parser parser{ m_filepath };
        auto const [status, message] = parser.FetchOptions();
        EXPECT_EQ(status, Configuration::StatusCode::InputError) << content;
        EXPECT_FALSE(message.empty());
        EXPECT_FALSE(parser.Validated());
    };

    expectInputError(R"({ "version": "" })");
    expectInputError(R"({ "heartbeat": { "interval": "10 parsecs" } })");
    expectInputError(R"({ "heartbeat": { "interval": "s" } })");
    expectInputError(R"({ "heartbeat": { "interval": "0s" } })");
    expectInputError(R"({ "heartbeat": { "interval": "25h" } })");
    expectInputError(R"({ "detection": { "byzantine_threshold": 1.5 } })");
    expectInputError(R"({ "balancing": { "deviation_threshold": -0.1 } })");
    expectInputError(R"({ "market": { "max_demand_factor": 0.5 } })");

    // A node must be allowed to miss a heartbeat before it is declared failed.
    expectInputError(R"({ "heartbeat": { "interval": "30s", "failure_timeout": "30s" } })");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, FileSizeLimitTest)
{
    std::string padding(Configuration::Defaults::FileSizeLimit, ' ');
    local::WriteFile(m_filepath, "{" + padding + "}");

    Configuration::Parser parser{ m_filepath };
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, SerializeNonDefaultValuesTest)
{
    local::WriteFile(m_filepath, R"(
    {
        "heartbeat": { "interval": "90s", "failure_timeout": "2min" },
        "detection": { "byzantine_threshold": 0.33 },
        "migration": { "auto_migration": true, "prefer_live": false },
        "market": { "pricing_enabled": true }
    })");

    {
        Configuration::Parser parser{ m_filepath };
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
        EXPECT_EQ(parser.Serialize().first, Configuration::StatusCode::Success);
    }

    auto const serialized = local::ReadFile(m_filepath);
    EXPECT_NE(serialized.find("\"90s\""), std::string::npos);
    EXPECT_NE(serialized.find("\"2min\""), std::string::npos);
    EXPECT_NE(serialized.find("\"prefer_live\""), std::string::npos);
    EXPECT_NE(serialized.find("\"pricing_enabled\""), std::string::npos);

    // Values that match the defaults are omitted.
    EXPECT_EQ(serialized.find("\"auto_migration\""), std::string::npos);
    EXPECT_EQ(serialized.find("\"detection\""), std::string::npos);
    EXPECT_EQ(serialized.find("\"balancing\""), std::string::npos);

    Configuration::Parser reader{ m_filepath };
    EXPECT_EQ(reader.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(reader.GetHeartbeatOptions().GetInterval(), 90s);
    EXPECT_EQ(reader.GetHeartbeatOptions().GetFailureTimeout(), 2min);
    EXPECT_TRUE(reader.GetMigrationOptions().UseAutoMigration());
    EXPECT_FALSE(reader.GetMigrationOptions().PreferLive());
    EXPECT_TRUE(reader.GetMarketOptions().IsPricingEnabled());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, SerializeDefaultsTest)
{
    // The file and its parent directories are created from the defaults.
    auto const nested = m_directory / "nested" / "config.json";
    Configuration::Parser parser{ nested };
    EXPECT_EQ(parser.Serialize().first, Configuration::StatusCode::Success);
    ASSERT_TRUE(std::filesystem::exists(nested));

    auto const serialized = local::ReadFile(nested);
    EXPECT_NE(serialized.find("\"version\""), std::string::npos);
    EXPECT_EQ(serialized.find("\"heartbeat\""), std::string::npos);

    Configuration::Parser reader{ nested };
    EXPECT_EQ(reader.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(reader.GetMigrationOptions(), Configuration::Options::Migration{});
    EXPECT_EQ(reader.GetHeartbeatOptions(), Configuration::Options::Heartbeat{});
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, MigrationOptionsTest)
{
    Configuration::Options::Migration const manual{ false, Configuration::Defaults::PreferLiveMigration };
    EXPECT_FALSE(manual.UseAutoMigration());
    EXPECT_EQ(manual.PreferLive(), Configuration::Defaults::PreferLiveMigration);
    EXPECT_FALSE(manual == Configuration::Options::Migration{});
    EXPECT_EQ(manual.AreOptionsAllowable().first, Configuration::StatusCode::Success);
}

//----------------------------------------------------------------------------------------------------------------------

void local::WriteFile(std::filesystem::path const& filepath, std::string_view content)
{
    std::ofstream writer{ filepath, std::ofstream::out | std::ofstream::trunc };
    ASSERT_TRUE(writer.good());
    writer << content;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ReadFile(std::filesystem::path const& filepath)
{
    std::ifstream reader{ filepath };
    std::stringstream buffer;
    buffer << reader.rdbuf();
    return buffer.str();
}

//----------------------------------------------------------------------------------------------------------------------
