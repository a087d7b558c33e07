// =============================================================================
// figi CLI - OpenFIGI symbol validation and generation
// =============================================================================
//
// Usage:
//   figi [global options] <command> [options]
//
// Commands:
//   generate    Generate new symbols and print them all at once
//   genstream   Generate new symbols and print them one by one
//   validate    Check if a given string is a valid OpenFIGI symbol
//   valstream   Validate symbols from a file or stdin, one per line
//   help        Show usage
//   version     Show version information
//
// Examples:
//   figi generate -n 10
//   figi genstream -n 1000000 > symbols.txt
//   figi validate -s BBG00HLH6Y37
//   figi valstream symbols.txt
//   cat symbols.txt | figi -q valstream
//
// =============================================================================

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "figi/cli_args.hpp"
#include "figi/config.hpp"
#include "figi/error.hpp"
#include "figi/logging.hpp"
#include "figi/report.hpp"
#include "figi/service.hpp"

namespace figi::cli {
    int cmd_generate(int argc, char* argv[]);
    int cmd_genstream(int argc, char* argv[]);
    int cmd_validate(int argc, char* argv[]);
    int cmd_valstream(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"generate",  "Generate new OpenFIGI symbols and return them all at once", figi::cli::cmd_generate},
    {"genstream", "Generate new OpenFIGI symbols and return them as a stream", figi::cli::cmd_genstream},
    {"validate",  "Check if a given string is a valid OpenFIGI symbol", figi::cli::cmd_validate},
    {"valstream", "Validate symbols from a file or stdin as a stream", figi::cli::cmd_valstream},
    {"version",   "Show version information", figi::cli::cmd_version},
    {"help",      "Show this help message", figi::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "figi.yaml";
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;
static figi::Config g_config;
static std::unique_ptr<figi::FigiService> g_service;

namespace figi::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cerr << "OpenFIGI symbol toolkit\n";
    std::cerr << "Version " << FIGI_VERSION_STRING << "\n\n";
    std::cerr << "Usage: figi [global options] <command> [options]\n\n";
    std::cerr << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cerr << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cerr << ' ';
        std::cerr << cmd->description << "\n";
    }

    std::cerr << "\nCommand Options:\n";
    std::cerr << "  generate, genstream  -n <count>   Number of symbols (default: generator.default_count)\n";
    std::cerr << "  validate             -s <string>  String to validate\n";
    std::cerr << "  valstream            [file]       Input file, one symbol per line (default: stdin)\n";
    std::cerr << "\nGlobal Options:\n";
    std::cerr << "  -c, --config <file>     Configuration file (default: figi.yaml)\n";
    std::cerr << "  -v, --verbose           Debug logging\n";
    std::cerr << "  -q, --quiet             Log errors only\n";
    std::cerr << "\nEnvironment:\n";
    std::cerr << "  FIGI_LOG_LEVEL          Log level override\n";
    std::cerr << "  FIGI_LOG_FILE           Log file override\n";
    std::cerr << "  FIGI_BUFFER_CAPACITY    Stream buffer capacity override\n";
    std::cerr << "  FIGI_SEED               Fixed generator seed (0 = random)\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "figi " << FIGI_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Generation Commands
// =============================================================================

int cmd_generate(int argc, char* argv[]) {
    std::size_t count = parse_count_args(to_args(argc, argv), g_config.generator.default_count);

    write_symbols(g_service->generate(count), std::cout);

    return 0;
}

int cmd_genstream(int argc, char* argv[]) {
    std::size_t count = parse_count_args(to_args(argc, argv), g_config.generator.default_count);

    auto stream = g_service->generate_stream(count);
    std::size_t written = write_symbols(stream, std::cout);
    LOG_DEBUG("genstream: wrote " + std::to_string(written) + " symbol(s)");

    return 0;
}

// =============================================================================
// Validation Commands
// =============================================================================

int cmd_validate(int argc, char* argv[]) {
    std::string input = parse_validate_args(to_args(argc, argv));

    write_outcome(g_service->validate(input), std::cout);

    return 0;
}

int cmd_valstream(int argc, char* argv[]) {
    std::optional<std::string> path = parse_valstream_args(to_args(argc, argv));

    std::ifstream file;
    std::istream* input = &std::cin;

    if (path) {
        file.open(*path);
        if (!file.is_open()) {
            throw FileNotFoundError("Cannot open input file: " + *path, "valstream",
                                    "Check that the file exists and is readable");
        }
        input = &file;
        LOG_DEBUG("Validating symbols from " + *path);
    } else {
        LOG_DEBUG("Validating symbols from stdin");
    }

    auto stream = g_service->validate_stream(*input);
    std::size_t written = write_results(stream, std::cout);
    LOG_DEBUG("valstream: wrote " + std::to_string(written) + " result(s)");

    return 0;
}

} // namespace figi::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    int arg_idx = 1;
    bool config_given = false;

    while (arg_idx < argc && argv[arg_idx][0] == '-') {
        std::string arg = argv[arg_idx];
        if ((arg == "-c" || arg == "--config") && arg_idx + 1 < argc) {
            g_options.config_file = argv[++arg_idx];
            config_given = true;
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            figi::cli::cmd_help(0, nullptr);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            figi::cli::cmd_help(0, nullptr);
            return 1;
        }
        ++arg_idx;
    }

    if (arg_idx >= argc) {
        figi::cli::cmd_help(0, nullptr);
        return 1;
    }

    const Command* command = nullptr;
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (std::strcmp(cmd->name, argv[arg_idx]) == 0) {
            command = cmd;
            break;
        }
    }
    if (!command) {
        std::cerr << "Unknown command: " << argv[arg_idx] << "\n\n";
        figi::cli::cmd_help(0, nullptr);
        return 1;
    }

    try {
        if (config_given && !std::filesystem::exists(g_options.config_file)) {
            throw figi::FileNotFoundError("Configuration file not found: " + g_options.config_file);
        }
        g_config = figi::load_config(g_options.config_file);
        figi::apply_env_overrides(g_config);
        if (g_options.verbose) g_config.logging.level = "debug";
        if (g_options.quiet) g_config.logging.level = "error";
        figi::initialize_logging(g_config.logging);

        g_service = figi::FigiService::create(figi::to_service_options(g_config));

        return command->handler(argc - arg_idx - 1, argv + arg_idx + 1);
    } catch (const figi::FigiException& e) {
        LOG_ERROR(std::string("Error in ") + command->name + " command: " + e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal error in ") + command->name + " command: " + e.what());
        return 1;
    }
}
