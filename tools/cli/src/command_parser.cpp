/**
 * @file command_parser.cpp
 * @brief Command registry implementation with case-insensitive matching
 */

#include "command_parser.hpp"
#include "utils/string_utils.hpp"

#include <uuidcore/utils/logger.hpp>

#include <algorithm>

namespace uuidcore::cli {

CommandParser::CommandParser() {
    aliases_["GEN"] = "GENERATE";
    aliases_["NEW"] = "GENERATE";
    aliases_["NS"] = "NAMESPACE";
    aliases_["CHECK"] = "VALIDATE";
}

void CommandParser::register_command(const std::string& name, CommandInfo info) {
    std::string upper_name = utils::to_upper(name);
    info.name = upper_name;
    commands_[upper_name] = std::move(info);
}

void CommandParser::register_alias(const std::string& alias, const std::string& target) {
    aliases_[utils::to_upper(alias)] = utils::to_upper(target);
}

std::string CommandParser::resolve_alias(const std::string& name) const {
    std::string upper = utils::to_upper(name);
    auto it = aliases_.find(upper);
    if (it != aliases_.end()) {
        return it->second;
    }
    return upper;
}

int CommandParser::execute(OutputFormatter& out, const std::string& command,
                           const std::vector<std::string>& args) const {
    const CommandInfo* info = get_command_info(command);
    if (!info) {
        out.print_error("unknown command '" + command + "'");
        return EXIT_USAGE;
    }

    if (args.size() < info->min_args || args.size() > info->max_args) {
        out.print_error("wrong number of arguments for '" + utils::to_lower(info->name) +
                        "', usage: " + info->usage);
        return EXIT_USAGE;
    }

    LOG_DEBUG("Cli", "Dispatching {} with {} argument(s)", info->name, args.size());
    return info->handler(out, args);
}

const CommandInfo* CommandParser::get_command_info(const std::string& command) const {
    auto it = commands_.find(resolve_alias(command));
    if (it != commands_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::vector<std::string> CommandParser::get_commands() const {
    std::vector<std::string> result;
    result.reserve(commands_.size());
    for (const auto& [name, _] : commands_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace uuidcore::cli
