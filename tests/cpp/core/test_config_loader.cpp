/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the relay configuration loader
 */

#include "core/config_loader.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        // Unique directory per test so parallel ctest runs do not collide
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("media_relay_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// loadRelayConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalseWithDefaults) {
    RelayConfig config;
    config.rembHighBandwidth = 1;
    EXPECT_FALSE(loadRelayConfig("/nonexistent/path/config.json", config, false));

    EXPECT_EQ(config.rembLowBandwidth, 30000u);
    EXPECT_EQ(config.rembHighBandwidth, 100000u);
    EXPECT_EQ(config.rateWindowMs, 3000);
    EXPECT_EQ(config.keyframeIntervalMs, 1000);
    EXPECT_EQ(config.statIntervalMs, 3000);
    EXPECT_EQ(config.packetQueueCapacity, 1000u);
    EXPECT_EQ(config.retransmitCacheSize, 1024u);
    EXPECT_EQ(config.receiveMtu, 8192u);
    EXPECT_EQ(config.maxSubscriberErrors, 100);
    EXPECT_TRUE(config.iceServers.empty());
}

TEST_F(ConfigLoaderTest, LoadEmptyObjectKeepsDefaults) {
    writeConfig("{}");
    RelayConfig config;
    EXPECT_TRUE(loadRelayConfig(testConfigPath, config, false));
    EXPECT_EQ(config.packetQueueCapacity, 1000u);
}

TEST_F(ConfigLoaderTest, LoadMalformedJsonReturnsFalse) {
    writeConfig("{ \"relay\": { \"rembLowBandwidth\": ");
    RelayConfig config;
    EXPECT_FALSE(loadRelayConfig(testConfigPath, config, false));
    EXPECT_EQ(config.rembLowBandwidth, 30000u);
}

TEST_F(ConfigLoaderTest, LoadNonObjectReturnsFalse) {
    writeConfig("[1, 2, 3]");
    RelayConfig config;
    EXPECT_FALSE(loadRelayConfig(testConfigPath, config, false));
}

TEST_F(ConfigLoaderTest, LoadRelaySection) {
    writeConfig(R"({
        "logging": {"level": "debug"},
        "relay": {
            "iceServers": ["stun:stun.example.org:3478"],
            "rembLowBandwidth": 10000,
            "rembHighBandwidth": 200000,
            "keyframeIntervalMs": 500,
            "packetQueueCapacity": 64,
            "retransmitCacheSize": 256,
            "maxSubscriberErrors": 5
        }
    })");
    RelayConfig config;
    ASSERT_TRUE(loadRelayConfig(testConfigPath, config, false));
    ASSERT_EQ(config.iceServers.size(), 1u);
    EXPECT_EQ(config.iceServers[0], "stun:stun.example.org:3478");
    EXPECT_EQ(config.rembLowBandwidth, 10000u);
    EXPECT_EQ(config.rembHighBandwidth, 200000u);
    EXPECT_EQ(config.keyframeIntervalMs, 500);
    EXPECT_EQ(config.packetQueueCapacity, 64u);
    EXPECT_EQ(config.retransmitCacheSize, 256u);
    EXPECT_EQ(config.maxSubscriberErrors, 5);
    // Untouched keys keep defaults
    EXPECT_EQ(config.rateWindowMs, 3000);
}

TEST_F(ConfigLoaderTest, InvalidRelaySectionFallsBackToDefaults) {
    writeConfig(R"({"relay": {"rembLowBandwidth": 500000, "rembHighBandwidth": 1000}})");
    RelayConfig config;
    EXPECT_FALSE(loadRelayConfig(testConfigPath, config, false));
    EXPECT_EQ(config.rembLowBandwidth, 30000u);
    EXPECT_EQ(config.rembHighBandwidth, 100000u);
}

// ============================================================
// Fallback reporting goes through the relay logger
// ============================================================

class ConfigLoaderLoggingTest : public ConfigLoaderTest {
   protected:
    void SetUp() override {
        ConfigLoaderTest::SetUp();
        logger = media_relay::logging::getLogger();
        sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        sink->set_pattern("%l %v");
        logger->sinks().push_back(sink);
    }

    void TearDown() override {
        auto& sinks = logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
        ConfigLoaderTest::TearDown();
    }

    std::ostringstream captured;
    std::shared_ptr<spdlog::logger> logger;
    spdlog::sink_ptr sink;
};

TEST_F(ConfigLoaderLoggingTest, InvalidSectionIsLoggedAsWarning) {
    writeConfig(R"({"relay": {"receiveMtu": 10}})");
    RelayConfig config;
    EXPECT_FALSE(loadRelayConfig(testConfigPath, config, true));
    EXPECT_EQ(config.receiveMtu, RelayConfig{}.receiveMtu);

    std::string output = captured.str();
    EXPECT_NE(output.find("warning Config: receiveMtu must be at least 1200, using defaults"),
              std::string::npos)
        << output;
}

TEST_F(ConfigLoaderLoggingTest, ParseFailureIsLoggedAsError) {
    writeConfig("{ \"relay\": ");
    RelayConfig config;
    EXPECT_FALSE(loadRelayConfig(testConfigPath, config, true));

    std::string output = captured.str();
    EXPECT_NE(output.find("error Config: Failed to parse"), std::string::npos) << output;
}

TEST_F(ConfigLoaderLoggingTest, QuietLoadLogsNothing) {
    writeConfig("[1, 2, 3]");
    RelayConfig config;
    EXPECT_FALSE(loadRelayConfig(testConfigPath, config, false));
    EXPECT_TRUE(captured.str().empty());
}

// ============================================================
// relayConfigFromJson / validation tests
// ============================================================

TEST(RelayConfigJsonTest, RejectsWrongType) {
    RelayConfig config;
    std::string error;
    EXPECT_FALSE(relayConfigFromJson({{"packetQueueCapacity", "big"}}, config, error));
    EXPECT_FALSE(error.empty());
}

TEST(RelayConfigJsonTest, RejectsZeroCapacity) {
    RelayConfig config;
    std::string error;
    EXPECT_FALSE(relayConfigFromJson({{"packetQueueCapacity", 0}}, config, error));
    EXPECT_NE(error.find("packetQueueCapacity"), std::string::npos);
}

TEST(RelayConfigJsonTest, RejectsNonPositiveInterval) {
    RelayConfig config;
    std::string error;
    EXPECT_FALSE(relayConfigFromJson({{"keyframeIntervalMs", 0}}, config, error));
}

TEST(RelayConfigJsonTest, RejectsSmallMtu) {
    RelayConfig config;
    std::string error;
    EXPECT_FALSE(relayConfigFromJson({{"receiveMtu", 500}}, config, error));
}

TEST(RelayConfigJsonTest, FailedParseLeavesConfigUntouched) {
    RelayConfig config;
    config.keyframeIntervalMs = 250;
    std::string error;
    EXPECT_FALSE(relayConfigFromJson({{"keyframeIntervalMs", -1}}, config, error));
    EXPECT_EQ(config.keyframeIntervalMs, 250);
}

TEST(RelayConfigJsonTest, ToJsonRoundTripsThroughParser) {
    RelayConfig original;
    original.iceServers = {"stun:a", "turn:b"};
    original.rembLowBandwidth = 12000;
    original.statIntervalMs = 1500;

    RelayConfig parsed;
    std::string error;
    ASSERT_TRUE(relayConfigFromJson(relayConfigToJson(original), parsed, error)) << error;
    EXPECT_EQ(parsed.iceServers, original.iceServers);
    EXPECT_EQ(parsed.rembLowBandwidth, 12000u);
    EXPECT_EQ(parsed.statIntervalMs, 1500);
}
