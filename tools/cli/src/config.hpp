/**
 * @file config.hpp
 * @brief uuidcore-cli configuration and argument parsing
 */

#pragma once

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace uuidcore::cli {

/**
 * @brief CLI configuration
 */
struct CliConfig {
    bool json_mode = false;
    bool color = true;
    std::string log_level = "WARN";
    bool help = false;
    bool version = false;
    std::string error;                 ///< Set when parsing failed; implies help
    std::string command;               ///< First non-option argument
    std::vector<std::string> args;     ///< Everything after the command
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name, std::ostream& os = std::cout) {
    os << "uuidcore-cli - RFC 4122 UUID tool\n\n"
       << "Usage: " << program_name << " [OPTIONS] <command> [args]\n\n"
       << "Commands:\n"
       << "  generate [count]          Generate random (v4) UUIDs (default: 1)\n"
       << "  parse <text>              Print the canonical form of a UUID\n"
       << "  inspect <text>            Show variant, version and raw fields\n"
       << "  validate <text>           Check whether text is a UUID (exit 0/1)\n"
       << "  nil                       Print the nil UUID\n"
       << "  max                       Print the max UUID\n"
       << "  namespace <name>          Print a namespace UUID: dns, url, oid, x500\n"
       << "  encode <text>             Print the protobuf encoding as hex\n"
       << "  decode <hex>              Decode a protobuf encoding\n"
       << "\nOptions:\n"
       << "  --json                    Output in JSON format\n"
       << "  --log-level <level>       TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: WARN)\n"
       << "  --no-color                Disable colored log output\n"
       << "  --version                 Show version information\n"
       << "  --help, -h                Show this help message\n\n"
       << "Example:\n"
       << "  " << program_name << " generate 5\n"
       << "  " << program_name << " --json inspect 6ba7b810-9dad-11d1-80b4-00c04fd430c8\n";
}

/**
 * @brief Parse command line arguments
 *
 * Options are accepted until the first non-option argument, which names the
 * command; everything after it is passed to the command untouched.
 */
inline CliConfig parseArgs(int argc, char* argv[]) {
    CliConfig config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }
        if (std::strcmp(arg, "--version") == 0) {
            config.version = true;
            return config;
        }
        if (std::strcmp(arg, "--json") == 0) {
            config.json_mode = true;
            continue;
        }
        if (std::strcmp(arg, "--no-color") == 0) {
            config.color = false;
            continue;
        }
        if (std::strcmp(arg, "--log-level") == 0) {
            if (i + 1 >= argc) {
                config.error = std::string("Option ") + arg + " requires a value";
                config.help = true;
                return config;
            }
            config.log_level = argv[++i];
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            config.error = std::string("Unknown option ") + arg;
            config.help = true;
            return config;
        }

        config.command = arg;
        for (int j = i + 1; j < argc; ++j) {
            config.args.emplace_back(argv[j]);
        }
        return config;
    }

    if (config.command.empty()) {
        config.error = "No command given";
        config.help = true;
    }
    return config;
}

} // namespace uuidcore::cli
