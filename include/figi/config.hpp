#ifndef FIGI_CONFIG_HPP
#define FIGI_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace figi {

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
};

struct PipelineConfig {
    std::size_t buffer_capacity = 100;
};

struct GeneratorConfig {
    uint64_t seed = 0;          // 0: non-deterministic seeding
    uint32_t default_count = 1;
};

struct Config {
    LoggingConfig logging;
    PipelineConfig pipeline;
    GeneratorConfig generator;
    std::string config_file;
};

struct ServiceOptions;

// Load configuration from a YAML file. An empty path or a missing file yields
// the defaults. Throws ConfigError on malformed YAML or invalid values.
Config load_config(const std::string& config_file = "figi.yaml");

// FIGI_LOG_LEVEL, FIGI_LOG_FILE, FIGI_BUFFER_CAPACITY, FIGI_SEED
void apply_env_overrides(Config& config);

ServiceOptions to_service_options(const Config& config);

} // namespace figi

#endif // FIGI_CONFIG_HPP
