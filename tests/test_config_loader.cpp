#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config/config_loader.hpp"

using namespace codecred::config;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "codecred_config_test";
        std::filesystem::create_directories(testDir);
        configPath = testDir / "config.json";
        ClearEnv();
    }

    void TearDown() override {
        ClearEnv();
        std::filesystem::remove_all(testDir);
    }

    void ClearEnv() {
        for (const char* name : {"CODECRED_SANDBOX_BACKEND", "CODECRED_SANDBOX_INTERPRETER",
                                 "CODECRED_SANDBOX_IMAGE", "CODECRED_SANDBOX_TIMEOUT_S",
                                 "CODECRED_SANDBOX_MEMORY_MB", "CODECRED_SCORING_RELAX_EXECUTION_GATE",
                                 "CODECRED_SCORING_WEIGHTS", "CODECRED_LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }

    void WriteConfig(const std::string& text) {
        std::ofstream output(configPath);
        output << text;
    }

    std::filesystem::path testDir;
    std::filesystem::path configPath;
};

TEST_F(ConfigLoaderTest, MissingFileKeepsDefaults) {
    const auto config = LoadConfig(testDir / "absent.json");
    EXPECT_EQ(config.sandbox.backend, "process");
    EXPECT_EQ(config.sandbox.timeout_s, 5);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 100u);
    EXPECT_EQ(config.sandbox.cpu_period_us, 100000);
    EXPECT_EQ(config.sandbox.cpu_quota_us, 50000);
    EXPECT_TRUE(config.sandbox.network_disabled);
    EXPECT_FALSE(config.scoring.weights.has_value());
    EXPECT_FALSE(config.scoring.relax_execution_gate);
}

TEST_F(ConfigLoaderTest, ReadsSandboxScoringAndLogging) {
    WriteConfig(R"json({
        "sandbox": {"backend": "docker", "image": "python:3.12-slim", "timeoutS": 8,
                    "memoryLimitMb": 256, "networkDisabled": false},
        "scoring": {"weights": {"semantic": 1, "execution": 1}, "relaxExecutionGate": true},
        "logging": {"level": "debug"}
    })json");
    const auto config = LoadConfig(configPath);
    EXPECT_EQ(config.sandbox.backend, "docker");
    EXPECT_EQ(config.sandbox.image, "python:3.12-slim");
    EXPECT_EQ(config.sandbox.timeout_s, 8);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 256u);
    EXPECT_FALSE(config.sandbox.network_disabled);
    ASSERT_TRUE(config.scoring.weights.has_value());
    EXPECT_FALSE(config.scoring.weights->confidence.has_value());
    EXPECT_DOUBLE_EQ(*config.scoring.weights->semantic, 1.0);
    EXPECT_TRUE(config.scoring.relax_execution_gate);
    EXPECT_EQ(config.logging.level, codecred::utils::LogLevel::kDebug);
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    WriteConfig("{ not json");
    const auto config = LoadConfig(configPath);
    EXPECT_EQ(config.sandbox.backend, "process");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    WriteConfig(R"json({"sandbox": {"timeoutS": 8}})json");
    ::setenv("CODECRED_SANDBOX_TIMEOUT_S", "3", 1);
    ::setenv("CODECRED_SCORING_RELAX_EXECUTION_GATE", "yes", 1);
    ::setenv("CODECRED_SCORING_WEIGHTS", "1,1,,2", 1);
    const auto config = LoadConfig(configPath);
    EXPECT_EQ(config.sandbox.timeout_s, 3);
    EXPECT_TRUE(config.scoring.relax_execution_gate);
    ASSERT_TRUE(config.scoring.weights.has_value());
    EXPECT_DOUBLE_EQ(*config.scoring.weights->confidence, 1.0);
    EXPECT_FALSE(config.scoring.weights->semantic.has_value());
    EXPECT_DOUBLE_EQ(*config.scoring.weights->execution, 2.0);
}

TEST_F(ConfigLoaderTest, MalformedWeightListIsIgnored) {
    ::setenv("CODECRED_SCORING_WEIGHTS", "1,2", 1);
    const auto config = LoadConfig(testDir / "absent.json");
    EXPECT_FALSE(config.scoring.weights.has_value());
}
