#pragma once
/**
 * Argument parsing for the figi subcommands
 *
 * Each parser takes the arguments following the command name and throws
 * InvalidArgumentError on a missing value, an unknown option or a malformed
 * number.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace figi {

std::vector<std::string> to_args(int argc, char* argv[]);

// generate, genstream: [-n|--count <count>]
std::size_t parse_count_args(const std::vector<std::string>& args, std::size_t default_count);

// validate: [-s|--string <string>]; an absent -s validates the empty string.
std::string parse_validate_args(const std::vector<std::string>& args);

// valstream: [file]; std::nullopt reads stdin.
std::optional<std::string> parse_valstream_args(const std::vector<std::string>& args);

} // namespace figi
