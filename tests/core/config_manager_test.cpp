// Orexa - Game Server Supervisor
// Tests for Configuration Manager
//
// Tests cover:
// - Parse JSON and YAML configuration file formats
// - Environment variable overrides
// - Validation with the offending field named
// - Defaults when no configuration file is given
// - Logging of the effective configuration

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "orexa/core/config_manager.hpp"

namespace orexa {
namespace core {
namespace test {

namespace fs = std::filesystem;

// =============================================================================
// Test Fixtures
// =============================================================================

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("orexa_config_test_" + std::to_string(getpid()));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);

        for (const auto& envVar : setEnvVars_) {
            unsetenv(envVar.c_str());
        }
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path path = testDir_ / name;
        std::ofstream out(path);
        out << content;
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

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    ASSERT_TRUE(manager_.loadDefaults().isSuccess());
    ASSERT_TRUE(manager_.validate().isSuccess());

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.supervisor.baseDir, ".");
    EXPECT_EQ(config.supervisor.stopTimeoutSeconds, 30u);
    EXPECT_EQ(config.supervisor.metricsIntervalMs, 2000u);
    EXPECT_EQ(config.supervisor.backupCheckIntervalSeconds, 60u);
    EXPECT_EQ(config.supervisor.restartWarningMs, 10000u);
    EXPECT_EQ(config.supervisor.restartSettleMs, 3000u);
    EXPECT_EQ(config.supervisor.javaPath, "java");
    EXPECT_EQ(config.console.bufferCapacity, 2000u);
    EXPECT_EQ(config.console.trimBatch, 200u);
    EXPECT_EQ(config.console.subscriberQueueCapacity, 1000u);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Info);
}

TEST_F(ConfigManagerTest, ArtifactMirrorDefaultsUnderBaseDir) {
    Configuration config;
    config.supervisor.baseDir = "/srv/orexa";
    EXPECT_EQ(config.artifactMirrorPath(), "/srv/orexa/artifacts");

    config.supervisor.artifactMirrorDir = "/mnt/mirror";
    EXPECT_EQ(config.artifactMirrorPath(), "/mnt/mirror");
}

// =============================================================================
// File Loading
// =============================================================================

TEST_F(ConfigManagerTest, LoadsJsonFile) {
    std::string path = writeFile("orexa.json", R"({
        "supervisor": {
            "baseDir": "/srv/orexa",
            "stopTimeoutSeconds": 45,
            "workerThreads": 8
        },
        "console": { "bufferCapacity": 500, "trimBatch": 50 },
        "logging": { "level": "debug", "enableJson": true }
    })");

    auto result = manager_.loadFromFile(path);
    ASSERT_TRUE(result.isSuccess()) << result.error().message;

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.supervisor.baseDir, "/srv/orexa");
    EXPECT_EQ(config.supervisor.stopTimeoutSeconds, 45u);
    EXPECT_EQ(config.supervisor.workerThreads, 8u);
    EXPECT_EQ(config.supervisor.metricsIntervalMs, 2000u);
    EXPECT_EQ(config.console.bufferCapacity, 500u);
    EXPECT_EQ(config.console.trimBatch, 50u);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Debug);
    EXPECT_TRUE(config.logging.enableJson);
}

TEST_F(ConfigManagerTest, LoadsYamlFile) {
    std::string path = writeFile("orexa.yaml",
        "supervisor:\n"
        "  baseDir: /var/lib/orexa\n"
        "  javaPath: /usr/lib/jvm/java-21/bin/java\n"
        "logging:\n"
        "  level: warn\n"
        "  enableFile: true\n"
        "  filePath: /var/log/orexa.log\n"
        "  compressRotated: true\n");

    auto result = manager_.loadFromFile(path);
    ASSERT_TRUE(result.isSuccess()) << result.error().message;

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.supervisor.baseDir, "/var/lib/orexa");
    EXPECT_EQ(config.supervisor.javaPath, "/usr/lib/jvm/java-21/bin/java");
    EXPECT_EQ(config.logging.level, LogLevelConfig::Warning);
    EXPECT_TRUE(config.logging.enableFile);
    EXPECT_EQ(config.logging.filePath, "/var/log/orexa.log");
    EXPECT_TRUE(config.logging.compressRotated);
}

TEST_F(ConfigManagerTest, MissingFileReportsFileNotFound) {
    auto result = manager_.loadFromFile((testDir_ / "absent.json").string());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(ConfigManagerTest, UnknownExtensionIsRejected) {
    std::string path = writeFile("orexa.toml", "baseDir = '.'\n");
    auto result = manager_.loadFromFile(path);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::UnsupportedFormat);
}

TEST_F(ConfigManagerTest, ParseErrorCarriesLine) {
    auto result = manager_.loadFromJsonString("{\n  \"supervisor\": {\n    \"baseDir\" \".\"\n  }\n}");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
    EXPECT_EQ(result.error().line, 3);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigManagerTest, WrongTypeNamesField) {
    auto result = manager_.loadFromJsonString(R"({"supervisor": {"stopTimeoutSeconds": "soon"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ValidationError);
    EXPECT_EQ(result.error().field, "supervisor.stopTimeoutSeconds");
}

TEST_F(ConfigManagerTest, TrimBatchLargerThanCapacityIsRejected) {
    auto result = manager_.loadFromJsonString(
        R"({"console": {"bufferCapacity": 100, "trimBatch": 200}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "console.trimBatch");
}

TEST_F(ConfigManagerTest, InvalidLevelIsRejected) {
    auto result = manager_.loadFromJsonString(R"({"logging": {"level": "verbose"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "logging.level");
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousValues) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({"supervisor": {"workerThreads": 6}})").isSuccess());
    ASSERT_TRUE(manager_.loadFromJsonString(R"({"supervisor": {"workerThreads": 0}})").isError());

    EXPECT_EQ(manager_.getConfig().supervisor.workerThreads, 6u);
}

TEST_F(ConfigManagerTest, FileLoggingRequiresPath) {
    Configuration config;
    config.logging.enableFile = true;
    manager_.setConfig(config);

    auto result = manager_.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "logging.filePath");
}

// =============================================================================
// Environment Overrides
// =============================================================================

TEST_F(ConfigManagerTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({"supervisor": {"baseDir": "/from/file"}})").isSuccess());

    setEnvVar("OREXA_BASE_DIR", "/from/env");
    setEnvVar("OREXA_STOP_TIMEOUT", "90");
    setEnvVar("OREXA_LOG_JSON", "on");
    setEnvVar("OREXA_LOG_FILE", "/tmp/orexa.log");
    manager_.applyEnvironmentOverrides();

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.supervisor.baseDir, "/from/env");
    EXPECT_EQ(config.supervisor.stopTimeoutSeconds, 90u);
    EXPECT_TRUE(config.logging.enableJson);
    EXPECT_TRUE(config.logging.enableFile);
    EXPECT_EQ(config.logging.filePath, "/tmp/orexa.log");
}

TEST_F(ConfigManagerTest, MalformedEnvironmentValueIsSkipped) {
    std::vector<std::string> messages;
    manager_.setLogCallback([&messages](const std::string& message) {
        messages.push_back(message);
    });

    setEnvVar("OREXA_WORKER_THREADS", "-3");
    manager_.applyEnvironmentOverrides();

    EXPECT_EQ(manager_.getConfig().supervisor.workerThreads, 4u);
    bool warned = std::any_of(messages.begin(), messages.end(), [](const std::string& m) {
        return m.find("Invalid OREXA_WORKER_THREADS") != std::string::npos;
    });
    EXPECT_TRUE(warned);
}

// =============================================================================
// Dump and Logging
// =============================================================================

TEST_F(ConfigManagerTest, JsonDumpLoadsBack) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({"supervisor": {"metricsIntervalMs": 500}})").isSuccess());
    std::string dumped = manager_.dumpConfig(ConfigFormat::JSON);

    ConfigManager other;
    ASSERT_TRUE(other.loadFromJsonString(dumped).isSuccess());
    EXPECT_EQ(other.getConfig().supervisor.metricsIntervalMs, 500u);
}

TEST_F(ConfigManagerTest, YamlDumpLoadsBack) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({"supervisor": {"javaPath": "/opt/java"}})").isSuccess());
    std::string dumped = manager_.dumpConfig(ConfigFormat::YAML);

    ConfigManager other;
    auto loaded = other.loadFromYamlString(dumped);
    ASSERT_TRUE(loaded.isSuccess()) << loaded.error().message;
    EXPECT_EQ(other.getConfig().supervisor.javaPath, "/opt/java");
}

TEST_F(ConfigManagerTest, LogsEffectiveConfiguration) {
    std::vector<std::string> messages;
    manager_.setLogCallback([&messages](const std::string& message) {
        messages.push_back(message);
    });

    manager_.logEffectiveConfig();

    bool hasBaseDir = std::any_of(messages.begin(), messages.end(), [](const std::string& m) {
        return m.find("supervisor.baseDir") != std::string::npos;
    });
    EXPECT_TRUE(hasBaseDir);
}

} // namespace test
} // namespace core
} // namespace orexa
