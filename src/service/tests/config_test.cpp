#include <gtest/gtest.h>

#include <fstream>

#include "../include/configmanager.hpp"
#include "../include/configvalidator.hpp"
#include "../include/environmentprocessor.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

TEST(EnvironmentProcessorTest, ExpandsNestedStrings) {
    EnvGuard home("ESPANSO_TEST_HOME", std::string("/home/tester"));
    json config = R"({
        "log_file": "$ENV{ESPANSO_TEST_HOME}/espanso.log",
        "logging": [{"type": "sync_file", "file": "$ENV{ESPANSO_TEST_HOME}/a"}],
        "retire_timeout_ms": 3000
    })"_json;

    EnvironmentProcessor().process(config);
    EXPECT_EQ(config["log_file"], "/home/tester/espanso.log");
    EXPECT_EQ(config["logging"][0]["file"], "/home/tester/a");
    EXPECT_EQ(config["retire_timeout_ms"], 3000);
}

TEST(EnvironmentProcessorTest, DefaultsAndUnknownVariables) {
    EnvGuard unset("ESPANSO_TEST_UNSET", std::nullopt);
    EnvironmentProcessor processor;
    EXPECT_EQ(processor.expand("$ENV{ESPANSO_TEST_UNSET:-/fallback}/x"),
              "/fallback/x");
    EXPECT_EQ(processor.expand("keep $ENV{ESPANSO_TEST_UNSET} as is"),
              "keep $ENV{ESPANSO_TEST_UNSET} as is");
    EXPECT_EQ(processor.expand("unterminated $ENV{X"), "unterminated $ENV{X");
}

TEST(ConfigValidatorTest, AcceptsCompleteConfig) {
    json config = R"({
        "logging": [{"type": "console", "level": "debug"},
                    {"type": "async_file", "file": "/tmp/espanso.log"}],
        "retire_timeout_ms": 5000,
        "retire_poll_interval_ms": 250,
        "runtime_dir": "/tmp/espanso"
    })"_json;
    EXPECT_TRUE(ConfigValidator().validateRoot(config));
}

TEST(ConfigValidatorTest, RejectsStructuralErrors) {
    ConfigValidator validator;
    EXPECT_THROW(validator.validateRoot(json::array()), std::runtime_error);
    EXPECT_THROW(validator.validateRoot(R"({"logging": {}})"_json),
                 std::runtime_error);
    EXPECT_THROW(validator.validateRoot(R"({"logging": [{"type": "syslog"}]})"_json),
                 std::runtime_error);
    EXPECT_THROW(validator.validateRoot(
                     R"({"logging": [{"type": "console", "level": "loud"}]})"_json),
                 std::runtime_error);
    EXPECT_THROW(validator.validateRoot(R"({"retire_timeout_ms": 0})"_json),
                 std::runtime_error);
    EXPECT_THROW(validator.validateRoot(R"({"retire_timeout_ms": "3000"})"_json),
                 std::runtime_error);
    EXPECT_THROW(validator.validateRoot(
                     R"({"retire_timeout_ms": 100, "retire_poll_interval_ms": 200})"_json),
                 std::runtime_error);
    EXPECT_THROW(validator.validateRoot(R"({"runtime_dir": ""})"_json),
                 std::runtime_error);
}

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override { ConfigManager::instance().reset(); }

    std::string writeConfig(const std::string &content) {
        auto path = dir_.path() / "espanso.json";
        std::ofstream(path) << content;
        return path.string();
    }

    TempRuntimeDir dir_;
};

TEST_F(ConfigManagerTest, DefaultsWithoutFile) {
    ServiceSettings settings = ConfigManager::instance().settings();
    EXPECT_TRUE(settings.loggers.empty());
    EXPECT_EQ(settings.retireTimeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(settings.retirePollInterval, std::chrono::milliseconds(200));
    EXPECT_FALSE(settings.paths.runtimeDir.has_value());
}

TEST_F(ConfigManagerTest, LoadsTypedSettings) {
    EnvGuard dir("ESPANSO_TEST_DIR", dir_.path().string());
    ConfigManager::instance().initialize(writeConfig(R"({
        "logging": [{"type": "sync_file", "level": "debug"}],
        "log_file": "$ENV{ESPANSO_TEST_DIR}/espanso.log",
        "retire_timeout_ms": 1000,
        "retire_poll_interval_ms": 50,
        "runtime_dir": "$ENV{ESPANSO_TEST_DIR}/runtime"
    })"));

    ServiceSettings settings = ConfigManager::instance().settings();
    ASSERT_EQ(settings.loggers.size(), 1u);
    EXPECT_EQ(settings.loggers[0].type, "sync_file");
    EXPECT_EQ(settings.loggers[0].level, "debug");
    EXPECT_FALSE(settings.loggers[0].file.has_value());
    EXPECT_EQ(settings.logFile, (dir_.path() / "espanso.log").string());
    EXPECT_EQ(settings.retireTimeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(settings.retirePollInterval, std::chrono::milliseconds(50));
    EXPECT_EQ(settings.paths.runtimeDir, dir_.path() / "runtime");
}

TEST_F(ConfigManagerTest, InvalidFileKeepsPreviousConfig) {
    ConfigManager::instance().initialize(
        writeConfig(R"({"retire_timeout_ms": 1234})"));

    EXPECT_THROW(ConfigManager::instance().initialize(writeConfig("{ broken")),
                 std::runtime_error);
    EXPECT_THROW(ConfigManager::instance().initialize(
                     (dir_.path() / "missing.json").string()),
                 std::runtime_error);
    EXPECT_EQ(ConfigManager::instance().settings().retireTimeout,
              std::chrono::milliseconds(1234));
}
