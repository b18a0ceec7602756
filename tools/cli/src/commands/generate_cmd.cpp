/**
 * @file generate_cmd.cpp
 * @brief GENERATE command - random (v4) UUIDs
 */

#include "../commands.hpp"

#include <uuidcore/core/uuid.hpp>

#include <stdexcept>

namespace uuidcore::cli::commands {

namespace {

constexpr unsigned long MAX_COUNT = 100000;

} // anonymous namespace

int generate_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    unsigned long count = 1;
    if (!args.empty()) {
        const std::string& text = args[0];
        size_t consumed = 0;
        try {
            count = std::stoul(text, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (text.empty() || consumed != text.size() || text[0] == '-' || count == 0 || count > MAX_COUNT) {
            out.print_error("count must be an integer between 1 and " + std::to_string(MAX_COUNT) +
                            ", got '" + text + "'");
            return EXIT_INPUT_ERROR;
        }
    }

    std::vector<std::string> ids;
    ids.reserve(count);
    for (unsigned long i = 0; i < count; ++i) {
        ids.push_back(core::Uuid::generateV4().toString());
    }

    if (count == 1) {
        out.print_string(ids.front());
    } else {
        out.print_array(ids);
    }
    return 0;
}

} // namespace uuidcore::cli::commands
