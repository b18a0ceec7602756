/**
 * @file commands.hpp
 * @brief uuidcore-cli command handlers
 */

#pragma once

#include "command_parser.hpp"

#include <string>
#include <vector>

namespace uuidcore::cli {

namespace commands {

int generate_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int parse_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int inspect_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int validate_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int nil_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int max_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int namespace_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int encode_cmd(OutputFormatter& out, const std::vector<std::string>& args);
int decode_cmd(OutputFormatter& out, const std::vector<std::string>& args);

} // namespace commands

/**
 * @brief Register every uuidcore-cli command with @p parser
 */
void register_commands(CommandParser& parser);

} // namespace uuidcore::cli
