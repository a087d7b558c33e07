#include "figi/cli_args.hpp"
#include "figi/error.hpp"

#include <stdexcept>

namespace figi {

std::vector<std::string> to_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

std::size_t parse_count_args(const std::vector<std::string>& args, std::size_t default_count) {
    std::size_t count = default_count;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-n" || arg == "--count") {
            if (i + 1 >= args.size()) {
                FIGI_THROW_INVALID_ARG("Missing value for " + arg);
            }
            const std::string& value = args[++i];
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                FIGI_THROW_INVALID_ARG("Invalid count: " + value);
            }
            try {
                count = static_cast<std::size_t>(std::stoull(value));
            } catch (const std::out_of_range&) {
                FIGI_THROW_INVALID_ARG("Count out of range: " + value);
            }
        } else {
            FIGI_THROW_INVALID_ARG("Unknown option: " + arg);
        }
    }

    return count;
}

std::string parse_validate_args(const std::vector<std::string>& args) {
    std::string input;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-s" || arg == "--string") {
            if (i + 1 >= args.size()) {
                FIGI_THROW_INVALID_ARG("Missing value for " + arg);
            }
            input = args[++i];
        } else {
            FIGI_THROW_INVALID_ARG("Unknown option: " + arg);
        }
    }

    return input;
}

std::optional<std::string> parse_valstream_args(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        FIGI_THROW_INVALID_ARG("valstream takes at most one input file");
    }
    if (args.empty()) {
        return std::nullopt;
    }
    return args.front();
}

} // namespace figi
