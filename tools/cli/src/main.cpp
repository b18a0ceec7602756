/**
 * @file main.cpp
 * @brief uuidcore-cli entry point
 */

#include "command_parser.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "output_formatter.hpp"

#include <uuidcore/utils/logger.hpp>

#include <exception>
#include <iostream>

namespace {

void print_version() {
    std::cout << "uuidcore-cli version 1.0.0\n";
    std::cout << "Built with protobuf support\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace uuidcore;

    cli::CliConfig config = cli::parseArgs(argc, argv);

    if (config.help) {
        if (!config.error.empty()) {
            std::cerr << "Error: " << config.error << "\n\n";
            cli::printUsage(argv[0], std::cerr);
            return cli::EXIT_USAGE;
        }
        cli::printUsage(argv[0]);
        return 0;
    }
    if (config.version) {
        print_version();
        return 0;
    }

    auto& logger = utils::Logger::instance();
    logger.setColorEnabled(config.color);
    if (auto level = utils::parseLogLevel(config.log_level)) {
        logger.setLevel(*level);
    } else {
        LOG_WARN("Cli", "Unknown log level '{}', keeping {}",
                 config.log_level, utils::Logger::levelName(logger.getLevel()));
    }

    try {
        cli::OutputFormatter out(config.json_mode);
        cli::CommandParser parser;
        cli::register_commands(parser);
        return parser.execute(out, config.command, config.args);
    }
    catch (const std::exception& e) {
        LOG_ERROR("Cli", "Command {} failed: {}", config.command, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
