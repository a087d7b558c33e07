#include "figi/config.hpp"
#include "figi/error.hpp"
#include "figi/logging.hpp"
#include "figi/service.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace figi {

namespace {

// Environment variable names
constexpr const char* ENV_LOG_LEVEL = "FIGI_LOG_LEVEL";
constexpr const char* ENV_LOG_FILE = "FIGI_LOG_FILE";
constexpr const char* ENV_BUFFER_CAPACITY = "FIGI_BUFFER_CAPACITY";
constexpr const char* ENV_SEED = "FIGI_SEED";

const char* get_env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

uint64_t parse_unsigned(const std::string& text, const std::string& key) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Expected a non-negative integer, got '" + text + "'", key);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigError("Value out of range: '" + text + "'", key);
    }
}

void validate(const Config& config) {
    if (config.pipeline.buffer_capacity == 0) {
        throw ConfigError("pipeline.buffer_capacity must be at least 1", "pipeline.buffer_capacity");
    }
    // Throws ConfigError on unknown names.
    parse_log_level(config.logging.level);
}

} // anonymous namespace

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    if (config_file.empty() || !std::filesystem::exists(config_file)) {
        return config;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(config_file);

        if (yaml["logging"]) {
            const auto& log = yaml["logging"];
            if (log["level"]) config.logging.level = log["level"].as<std::string>();
            if (log["file"]) config.logging.file = log["file"].as<std::string>();
            if (log["console"]) config.logging.console = log["console"].as<bool>();
        }

        if (yaml["pipeline"]) {
            const auto& pipeline = yaml["pipeline"];
            if (pipeline["buffer_capacity"]) {
                config.pipeline.buffer_capacity = pipeline["buffer_capacity"].as<std::size_t>();
            }
        }

        if (yaml["generator"]) {
            const auto& gen = yaml["generator"];
            if (gen["seed"]) config.generator.seed = gen["seed"].as<uint64_t>();
            if (gen["default_count"]) config.generator.default_count = gen["default_count"].as<uint32_t>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load configuration: " + std::string(e.what()), config_file,
                          "Check the YAML syntax and value types");
    }

    validate(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (const char* level = get_env(ENV_LOG_LEVEL)) {
        config.logging.level = level;
    }
    if (const char* file = get_env(ENV_LOG_FILE)) {
        config.logging.file = file;
    }
    if (const char* capacity = get_env(ENV_BUFFER_CAPACITY)) {
        config.pipeline.buffer_capacity =
            static_cast<std::size_t>(parse_unsigned(capacity, ENV_BUFFER_CAPACITY));
    }
    if (const char* seed = get_env(ENV_SEED)) {
        config.generator.seed = parse_unsigned(seed, ENV_SEED);
    }

    validate(config);
}

ServiceOptions to_service_options(const Config& config) {
    ServiceOptions options;
    options.buffer_capacity = config.pipeline.buffer_capacity;
    if (config.generator.seed != 0) {
        options.seed = config.generator.seed;
    }
    return options;
}

} // namespace figi
