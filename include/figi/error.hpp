#pragma once

#include <stdexcept>
#include <string>

namespace figi {

/**
 * Error reporting for everything outside the validation outcomes.
 *
 * A malformed symbol is never an error: validation reports it as an Outcome.
 * Exceptions are reserved for misuse of the API and for the environment
 * (configuration, input files).
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Configuration errors
    CONFIG_ERROR = 100,

    // I/O errors
    FILE_NOT_FOUND = 300,
    IO_ERROR = 301
};

class FigiException : public std::runtime_error {
public:
    explicit FigiException(ErrorCode code, const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "FIGI error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public FigiException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : FigiException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigError : public FigiException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : FigiException(ErrorCode::CONFIG_ERROR, message, context, suggestion) {}
};

class IOError : public FigiException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : FigiException(ErrorCode::IO_ERROR, message, context, suggestion) {}

protected:
    IOError(ErrorCode code, const std::string& message,
            const std::string& context, const std::string& suggestion)
        : FigiException(code, message, context, suggestion) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : IOError(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

#define FIGI_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw figi::InvalidArgumentError(message, __func__); } while (0)

#define FIGI_THROW_INVALID_ARG(message) \
    throw figi::InvalidArgumentError(message, __func__)

} // namespace figi
