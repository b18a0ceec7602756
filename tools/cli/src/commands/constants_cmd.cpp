/**
 * @file constants_cmd.cpp
 * @brief NIL, MAX and NAMESPACE commands
 */

#include "../commands.hpp"
#include "../utils/string_utils.hpp"

#include <uuidcore/core/uuid.hpp>

namespace uuidcore::cli::commands {

int nil_cmd(OutputFormatter& out, const std::vector<std::string>&) {
    out.print_string(core::Uuid::nil().toString());
    return 0;
}

int max_cmd(OutputFormatter& out, const std::vector<std::string>&) {
    out.print_string(core::Uuid::max().toString());
    return 0;
}

int namespace_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    std::string name = utils::to_lower(args[0]);

    if (name == "dns") {
        out.print_string(core::NAMESPACE_DNS.toString());
    } else if (name == "url") {
        out.print_string(core::NAMESPACE_URL.toString());
    } else if (name == "oid") {
        out.print_string(core::NAMESPACE_OID.toString());
    } else if (name == "x500") {
        out.print_string(core::NAMESPACE_X500.toString());
    } else {
        out.print_error("unknown namespace '" + args[0] + "', expected dns, url, oid or x500");
        return EXIT_INPUT_ERROR;
    }
    return 0;
}

} // namespace uuidcore::cli::commands
