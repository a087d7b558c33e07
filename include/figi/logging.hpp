#ifndef FIGI_LOGGING_HPP
#define FIGI_LOGGING_HPP

#include <memory>
#include <string>

namespace figi {

struct LoggingConfig;

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

class Logger {
public:
    static Logger& getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Replace the sinks: stderr console output and/or an appending file.
    void configure_sinks(bool console, const std::string& filename);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Case-insensitive; accepts trace, debug, info, warning/warn, error, critical, off.
// Throws ConfigError on anything else.
LogLevel parse_log_level(const std::string& name);

void initialize_logging(const LoggingConfig& config);

} // namespace figi

#define LOG_TRACE(msg) figi::Logger::getInstance().trace(msg)
#define LOG_DEBUG(msg) figi::Logger::getInstance().debug(msg)
#define LOG_INFO(msg) figi::Logger::getInstance().info(msg)
#define LOG_WARNING(msg) figi::Logger::getInstance().warning(msg)
#define LOG_ERROR(msg) figi::Logger::getInstance().error(msg)
#define LOG_CRITICAL(msg) figi::Logger::getInstance().critical(msg)

#endif // FIGI_LOGGING_HPP
