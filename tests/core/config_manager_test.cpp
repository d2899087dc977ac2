// StreamProv - Dedicated stream provisioning service
// Tests for Configuration Manager
//
// Tests cover:
// - Parse JSON and YAML configuration file formats
// - STREAMPROV_* environment variable overrides
// - Validation with field-level error messages
// - Defaults when the configuration file is absent
// - Effective configuration reported through the log callback

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "streamprov/core/config_manager.hpp"

namespace streamprov {
namespace core {
namespace test {

namespace fs = std::filesystem;

// =============================================================================
// Test Fixtures
// =============================================================================

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir_ = fs::path(::testing::TempDir()) / ("streamprov_config_" + std::to_string(stamp));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
        for (const auto& name : setEnvVars_) {
            unsetenv(name.c_str());
        }
    }

    std::string writeConfigFile(const std::string& filename, const std::string& content) {
        const fs::path path = testDir_ / filename;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    void setEnvVar(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        setEnvVars_.push_back(name);
    }

    fs::path testDir_;
    std::vector<std::string> setEnvVars_;
    ConfigManager manager_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigManagerTest, DefaultsMatchDocumentedValues) {
    ASSERT_TRUE(manager_.loadDefaults().isSuccess());
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.pool.rangeStart, 8100);
    EXPECT_EQ(config.pool.rangeEnd, 8200);
    EXPECT_EQ(config.defaults.bitrate, 128u);
    EXPECT_EQ(config.defaults.maxListeners, 100u);
    EXPECT_EQ(config.defaults.sampleRate, 44100u);
    EXPECT_EQ(config.defaults.genre, "Various");
    EXPECT_TRUE(config.defaults.publicServer);
    EXPECT_EQ(config.streamingServer.hostname, "localhost");
    EXPECT_EQ(config.streamingServer.adminPort, 8000);
    EXPECT_EQ(config.streamingServer.requestTimeoutMs, 10000u);
    EXPECT_EQ(config.database.path, "streamprov.db");
    EXPECT_EQ(config.logging.level, LogLevel::Info);
    EXPECT_EQ(config.monitoring.sampleIntervalMs, 5000u);
    EXPECT_FALSE(config.provisioning.kickSourceOnSuspend);
    EXPECT_TRUE(config.provisioning.verifyAfterProvision);
}

TEST_F(ConfigManagerTest, DefaultsNeedAnAdminPassword) {
    ASSERT_TRUE(manager_.loadDefaults().isSuccess());

    auto valid = manager_.validate();
    ASSERT_TRUE(valid.isError());
    EXPECT_EQ(valid.error().code, ConfigError::Code::ValidationError);
    EXPECT_EQ(valid.error().field, "streamingServer.adminPassword");
}

TEST_F(ConfigManagerTest, PublicHostFallsBackToHostname) {
    StreamingServerConfig server;
    server.hostname = "dnas.internal";
    EXPECT_EQ(server.effectivePublicHost(), "dnas.internal");
    server.publicHost = "radio.example.com";
    EXPECT_EQ(server.effectivePublicHost(), "radio.example.com");
}

// =============================================================================
// JSON
// =============================================================================

TEST_F(ConfigManagerTest, LoadsJsonFile) {
    const std::string path = writeConfigFile("streamprov.json", R"({
        "pool": { "rangeStart": 9000, "rangeEnd": 9049 },
        "defaults": { "bitrate": 192, "genre": "Jazz", "publicServer": false },
        "streamingServer": {
            "hostname": "dnas.internal",
            "adminPort": 8500,
            "adminPassword": "s3cret",
            "publicHost": "radio.example.com",
            "configFilePath": "/etc/sc_serv/streams.conf"
        },
        "database": { "path": "/var/lib/streamprov/state.db" },
        "logging": { "level": "debug", "enableJson": true },
        "monitoring": { "sampleIntervalMs": 2500 },
        "provisioning": { "kickSourceOnSuspend": true, "workerThreads": 2 }
    })");

    ASSERT_TRUE(manager_.loadFromFile(path).isSuccess());
    ASSERT_TRUE(manager_.validate().isSuccess());
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.pool.rangeStart, 9000);
    EXPECT_EQ(config.pool.rangeEnd, 9049);
    EXPECT_EQ(config.defaults.bitrate, 192u);
    EXPECT_EQ(config.defaults.maxListeners, 100u);
    EXPECT_EQ(config.defaults.genre, "Jazz");
    EXPECT_FALSE(config.defaults.publicServer);
    EXPECT_EQ(config.streamingServer.adminPort, 8500);
    EXPECT_EQ(config.streamingServer.adminPassword, "s3cret");
    EXPECT_EQ(config.streamingServer.effectivePublicHost(), "radio.example.com");
    EXPECT_EQ(config.streamingServer.configFilePath, "/etc/sc_serv/streams.conf");
    EXPECT_EQ(config.database.path, "/var/lib/streamprov/state.db");
    EXPECT_EQ(config.logging.level, LogLevel::Debug);
    EXPECT_TRUE(config.logging.enableJson);
    EXPECT_EQ(config.monitoring.sampleIntervalMs, 2500u);
    EXPECT_TRUE(config.provisioning.kickSourceOnSuspend);
    EXPECT_EQ(config.provisioning.workerThreads, 2u);
}

TEST_F(ConfigManagerTest, MalformedJsonIsParseError) {
    auto result = manager_.loadFromJsonString(R"({ "pool": { "rangeStart": 9000, })");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
}

TEST_F(ConfigManagerTest, WrongTypeNamesTheField) {
    auto result = manager_.loadFromJsonString(R"({ "pool": { "rangeStart": "low" } })");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "pool.rangeStart");
}

TEST_F(ConfigManagerTest, PortOutOfRangeRejected) {
    auto result = manager_.loadFromJsonString(R"({ "pool": { "rangeEnd": 70000 } })");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "pool.rangeEnd");
}

TEST_F(ConfigManagerTest, UnknownLogLevelRejected) {
    auto result = manager_.loadFromJsonString(R"({ "logging": { "level": "verbose" } })");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "logging.level");
}

// =============================================================================
// YAML
// =============================================================================

TEST_F(ConfigManagerTest, LoadsYamlFile) {
    const std::string path = writeConfigFile("streamprov.yaml",
        "# provisioning service\n"
        "pool:\n"
        "  rangeStart: 8300\n"
        "  rangeEnd: 8399   # inclusive\n"
        "streamingServer:\n"
        "  hostname: dnas.internal\n"
        "  adminPassword: 12345\n"
        "  name: \"main\"\n"
        "monitoring:\n"
        "  enabled: false\n"
        "  recentSampleLimit: 50\n");

    ASSERT_TRUE(manager_.loadFromFile(path).isSuccess());
    ASSERT_TRUE(manager_.validate().isSuccess());
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.pool.rangeStart, 8300);
    EXPECT_EQ(config.pool.rangeEnd, 8399);
    EXPECT_EQ(config.streamingServer.hostname, "dnas.internal");
    EXPECT_EQ(config.streamingServer.adminPassword, "12345");
    EXPECT_EQ(config.streamingServer.name, "main");
    EXPECT_FALSE(config.monitoring.enabled);
    EXPECT_EQ(config.monitoring.recentSampleLimit, 50u);
}

TEST_F(ConfigManagerTest, YamlTabIndentationRejectedWithLine) {
    auto result = manager_.loadFromYamlString("pool:\n\trangeStart: 8100\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
    EXPECT_EQ(result.error().line, 2);
}

TEST_F(ConfigManagerTest, YamlLineWithoutColonRejected) {
    auto result = manager_.loadFromYamlString("pool:\n  rangeStart 8100\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().line, 2);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ConfigManagerTest, MissingFileReported) {
    auto result = manager_.loadFromFile((testDir_ / "absent.json").string());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(ConfigManagerTest, UnsupportedExtensionReported) {
    const std::string path = writeConfigFile("streamprov.ini", "[pool]\n");
    auto result = manager_.loadFromFile(path);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::UnsupportedFormat);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigManagerTest, InvertedPoolRangeRejected) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "pool": { "rangeStart": 9000, "rangeEnd": 8999 },
        "streamingServer": { "adminPassword": "x" }
    })").isSuccess());

    auto valid = manager_.validate();
    ASSERT_TRUE(valid.isError());
    EXPECT_EQ(valid.error().field, "pool.rangeStart");
}

TEST_F(ConfigManagerTest, PrivilegedPortsRejected) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "pool": { "rangeStart": 80, "rangeEnd": 90 },
        "streamingServer": { "adminPassword": "x" }
    })").isSuccess());
    EXPECT_TRUE(manager_.validate().isError());
}

TEST_F(ConfigManagerTest, RequestTimeoutBounds) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "streamingServer": { "adminPassword": "x", "requestTimeoutMs": 50 }
    })").isSuccess());
    auto valid = manager_.validate();
    ASSERT_TRUE(valid.isError());
    EXPECT_EQ(valid.error().field, "streamingServer.requestTimeoutMs");
}

TEST_F(ConfigManagerTest, SampleIntervalLowerBound) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "streamingServer": { "adminPassword": "x" },
        "monitoring": { "sampleIntervalMs": 10 }
    })").isSuccess());
    auto valid = manager_.validate();
    ASSERT_TRUE(valid.isError());
    EXPECT_EQ(valid.error().field, "monitoring.sampleIntervalMs");
}

// =============================================================================
// Environment overrides
// =============================================================================

TEST_F(ConfigManagerTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "pool": { "rangeStart": 9000, "rangeEnd": 9100 },
        "database": { "path": "file.db" }
    })").isSuccess());

    setEnvVar("STREAMPROV_DB_PATH", "/tmp/override.db");
    setEnvVar("STREAMPROV_PORT_RANGE_START", "9500");
    setEnvVar("STREAMPROV_PORT_RANGE_END", "9599");
    setEnvVar("STREAMPROV_SERVER_ADMIN_PASSWORD", "from-env");
    setEnvVar("STREAMPROV_LOG_LEVEL", "warning");
    setEnvVar("STREAMPROV_LOG_JSON", "true");
    setEnvVar("STREAMPROV_MONITOR_INTERVAL_MS", "1000");
    setEnvVar("STREAMPROV_KICK_SOURCE_ON_SUSPEND", "yes");
    manager_.applyEnvironmentOverrides();

    ASSERT_TRUE(manager_.validate().isSuccess());
    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.database.path, "/tmp/override.db");
    EXPECT_EQ(config.pool.rangeStart, 9500);
    EXPECT_EQ(config.pool.rangeEnd, 9599);
    EXPECT_EQ(config.streamingServer.adminPassword, "from-env");
    EXPECT_EQ(config.logging.level, LogLevel::Warning);
    EXPECT_TRUE(config.logging.enableJson);
    EXPECT_EQ(config.monitoring.sampleIntervalMs, 1000u);
    EXPECT_TRUE(config.provisioning.kickSourceOnSuspend);
}

TEST_F(ConfigManagerTest, InvalidEnvironmentValueIgnoredAndReported) {
    std::vector<std::string> messages;
    manager_.setLogCallback([&messages](const std::string& message) { messages.push_back(message); });
    ASSERT_TRUE(manager_.loadDefaults().isSuccess());

    setEnvVar("STREAMPROV_PORT_RANGE_START", "not-a-port");
    manager_.applyEnvironmentOverrides();

    EXPECT_EQ(manager_.getConfig().pool.rangeStart, 8100);
    bool warned = false;
    for (const auto& message : messages) {
        if (message.find("Invalid STREAMPROV_PORT_RANGE_START") != std::string::npos) {
            warned = true;
        }
    }
    EXPECT_TRUE(warned);
}

TEST_F(ConfigManagerTest, PasswordNeverLogged) {
    std::vector<std::string> messages;
    manager_.setLogCallback([&messages](const std::string& message) { messages.push_back(message); });

    setEnvVar("STREAMPROV_SERVER_ADMIN_PASSWORD", "hunter2-secret");
    manager_.applyEnvironmentOverrides();

    for (const auto& message : messages) {
        EXPECT_EQ(message.find("hunter2-secret"), std::string::npos) << message;
    }
}

// =============================================================================
// Dump
// =============================================================================

TEST_F(ConfigManagerTest, DumpMasksSecrets) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "streamingServer": { "adminPassword": "topsecret", "hostname": "dnas.internal" }
    })").isSuccess());

    const std::string json = manager_.dumpConfig(ConfigFormat::JSON);
    EXPECT_EQ(json.find("topsecret"), std::string::npos);
    EXPECT_NE(json.find("********"), std::string::npos);
    EXPECT_NE(json.find("dnas.internal"), std::string::npos);

    const std::string yaml = manager_.dumpConfig(ConfigFormat::YAML);
    EXPECT_EQ(yaml.find("topsecret"), std::string::npos);
    EXPECT_NE(yaml.find("hostname: \"dnas.internal\""), std::string::npos);
}

TEST_F(ConfigManagerTest, DumpedJsonLoadsBack) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({
        "pool": { "rangeStart": 9100, "rangeEnd": 9199 },
        "defaults": { "genre": "Talk" }
    })").isSuccess());

    ConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromJsonString(manager_.dumpConfig(ConfigFormat::JSON)).isSuccess());
    EXPECT_EQ(reloaded.getConfig().pool.rangeStart, 9100);
    EXPECT_EQ(reloaded.getConfig().defaults.genre, "Talk");
}

} // namespace test
} // namespace core
} // namespace streamprov
