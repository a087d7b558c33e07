#include "figi/logging.hpp"
#include "figi/config.hpp"
#include "figi/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace figi {

namespace {

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARNING:  return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // anonymous namespace

class Logger::Impl {
public:
    Impl() {
        build(true, "");
    }

    // stdout is reserved for command output, so the console sink is stderr.
    void build(bool console, const std::string& filename) {
        std::vector<spdlog::sink_ptr> sinks;
        if (console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!filename.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false));
        }

        auto replacement = std::make_shared<spdlog::logger>("figi", sinks.begin(), sinks.end());
        replacement->set_level(to_spdlog(level));
        replacement->set_pattern(LOG_PATTERN);
        replacement->flush_on(spdlog::level::warn);

        std::lock_guard<std::mutex> lock(mutex);
        logger = std::move(replacement);
    }

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard<std::mutex> lock(mutex);
        return logger;
    }

    void set_level(LogLevel new_level) {
        std::lock_guard<std::mutex> lock(mutex);
        level = new_level;
        logger->set_level(to_spdlog(new_level));
    }

    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    LogLevel level = LogLevel::INFO;
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->get()->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->get()->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->get()->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->get()->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->get()->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->get()->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->level;
}

void Logger::configure_sinks(bool console, const std::string& filename) {
    try {
        pImpl->build(console, filename);
    } catch (const spdlog::spdlog_ex& e) {
        throw IOError("Cannot open log file", filename + ": " + e.what());
    }
}

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    if (lowered == "off") return LogLevel::OFF;

    throw ConfigError("Unknown log level: " + name, "logging.level",
                      "Use one of trace, debug, info, warning, error, critical, off");
}

void initialize_logging(const LoggingConfig& config) {
    auto& logger = Logger::getInstance();
    logger.set_level(parse_log_level(config.level));
    logger.configure_sinks(config.console, config.file);
}

} // namespace figi
