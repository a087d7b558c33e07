#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "figi/config.hpp"
#include "figi/error.hpp"
#include "figi/logging.hpp"
#include "figi/service.hpp"

using namespace figi;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_config_path_ = "figi_test_config.yaml";
        unset_env();
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_config_path_)) {
            std::filesystem::remove(temp_config_path_);
        }
        unset_env();
    }

    void write_config(const std::string& content) {
        std::ofstream config_file(temp_config_path_);
        config_file << content;
    }

    static void unset_env() {
        unsetenv("FIGI_LOG_LEVEL");
        unsetenv("FIGI_LOG_FILE");
        unsetenv("FIGI_BUFFER_CAPACITY");
        unsetenv("FIGI_SEED");
    }

    std::string temp_config_path_;
};

TEST_F(ConfigTest, LoadValidConfig) {
    write_config(R"(
logging:
  level: "debug"
  file: "figi.log"
  console: false

pipeline:
  buffer_capacity: 250

generator:
  seed: 99
  default_count: 10
)");

    Config config = load_config(temp_config_path_);

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "figi.log");
    EXPECT_FALSE(config.logging.console);
    EXPECT_EQ(config.pipeline.buffer_capacity, 250u);
    EXPECT_EQ(config.generator.seed, 99u);
    EXPECT_EQ(config.generator.default_count, 10u);
    EXPECT_EQ(config.config_file, temp_config_path_);
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    write_config("pipeline:\n  buffer_capacity: 8\n");

    Config config = load_config(temp_config_path_);
    EXPECT_EQ(config.pipeline.buffer_capacity, 8u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.console);
    EXPECT_EQ(config.generator.seed, 0u);
    EXPECT_EQ(config.generator.default_count, 1u);
}

TEST_F(ConfigTest, LoadNonExistentConfig) {
    Config config = load_config("nonexistent.yaml");

    EXPECT_EQ(config.pipeline.buffer_capacity, 100u);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, LoadEmptyConfigPath) {
    Config config = load_config("");
    EXPECT_EQ(config.pipeline.buffer_capacity, 100u);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    write_config("pipeline: [unclosed\n");
    EXPECT_THROW(load_config(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, WrongTypeThrows) {
    write_config("pipeline:\n  buffer_capacity: lots\n");
    EXPECT_THROW(load_config(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, ZeroCapacityThrows) {
    write_config("pipeline:\n  buffer_capacity: 0\n");
    EXPECT_THROW(load_config(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, UnknownLogLevelThrows) {
    write_config("logging:\n  level: chatty\n");
    EXPECT_THROW(load_config(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("FIGI_LOG_LEVEL", "warning", 1);
    setenv("FIGI_BUFFER_CAPACITY", "32", 1);
    setenv("FIGI_SEED", "5", 1);

    Config config = load_config("");
    apply_env_overrides(config);

    EXPECT_EQ(config.logging.level, "warning");
    EXPECT_EQ(config.pipeline.buffer_capacity, 32u);
    EXPECT_EQ(config.generator.seed, 5u);
}

TEST_F(ConfigTest, NonNumericEnvironmentThrows) {
    setenv("FIGI_BUFFER_CAPACITY", "-3", 1);
    Config config;
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
}

TEST_F(ConfigTest, ServiceOptionsFromConfig) {
    Config config;
    config.pipeline.buffer_capacity = 12;

    ServiceOptions random_seed = to_service_options(config);
    EXPECT_EQ(random_seed.buffer_capacity, 12u);
    EXPECT_FALSE(random_seed.seed.has_value());

    config.generator.seed = 77;
    ServiceOptions fixed_seed = to_service_options(config);
    ASSERT_TRUE(fixed_seed.seed.has_value());
    EXPECT_EQ(*fixed_seed.seed, 77u);
}

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("Info"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("off"), LogLevel::OFF);
    EXPECT_THROW(parse_log_level(""), ConfigError);
}

TEST_F(ConfigTest, InitializeLoggingAppliesLevel) {
    LoggingConfig logging;
    logging.level = "critical";
    initialize_logging(logging);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::CRITICAL);

    logging.level = "error";
    initialize_logging(logging);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
}

// A log file path below a regular file can never be opened
TEST_F(ConfigTest, UnwritableLogFileThrowsIOError) {
    write_config("logging:\n  level: error\n");

    LoggingConfig logging;
    logging.level = "error";
    logging.file = temp_config_path_ + "/figi.log";

    try {
        initialize_logging(logging);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
    }
}
