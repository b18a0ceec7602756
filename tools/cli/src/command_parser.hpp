/**
 * @file command_parser.hpp
 * @brief Command registry and dispatch for uuidcore-cli
 */

#pragma once

#include "output_formatter.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace uuidcore::cli {

/// Exit status for a command that ran but rejected its input
constexpr int EXIT_INPUT_ERROR = 1;
/// Exit status for an unknown command or wrong argument count
constexpr int EXIT_USAGE = 2;

/**
 * @brief Command handler function type
 */
using CommandHandler = std::function<int(OutputFormatter&, const std::vector<std::string>&)>;

/**
 * @brief Command metadata
 */
struct CommandInfo {
    std::string name;
    std::string description;
    std::string usage;
    size_t min_args = 0;
    size_t max_args = 0;
    CommandHandler handler;
};

/**
 * @brief Command registry with case-insensitive matching
 */
class CommandParser {
public:
    CommandParser();

    /**
     * @brief Register a command handler
     * @param name Command name (stored as uppercase)
     */
    void register_command(const std::string& name, CommandInfo info);

    /**
     * @brief Register a command alias, e.g. "GEN" for "GENERATE"
     */
    void register_alias(const std::string& alias, const std::string& target);

    /**
     * @brief Check the argument count and run the command
     * @return Handler exit code, or EXIT_USAGE if the command is unknown or
     *         the argument count is out of range
     */
    int execute(OutputFormatter& out, const std::string& command,
                const std::vector<std::string>& args) const;

    const CommandInfo* get_command_info(const std::string& command) const;

    /**
     * @brief All registered command names, sorted
     */
    std::vector<std::string> get_commands() const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliases_;

    std::string resolve_alias(const std::string& name) const;
};

} // namespace uuidcore::cli
