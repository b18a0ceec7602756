/**
 * @file commands.cpp
 * @brief Command table
 */

#include "commands.hpp"

namespace uuidcore::cli {

void register_commands(CommandParser& parser) {
    parser.register_command("GENERATE", {"", "Generate random (v4) UUIDs",
                                         "generate [count]", 0, 1, commands::generate_cmd});
    parser.register_command("PARSE", {"", "Print the canonical form of a UUID",
                                      "parse <text>", 1, 1, commands::parse_cmd});
    parser.register_command("INSPECT", {"", "Show variant, version and raw fields",
                                        "inspect <text>", 1, 1, commands::inspect_cmd});
    parser.register_command("VALIDATE", {"", "Check whether text is a UUID",
                                         "validate <text>", 1, 1, commands::validate_cmd});
    parser.register_command("NIL", {"", "Print the nil UUID", "nil", 0, 0, commands::nil_cmd});
    parser.register_command("MAX", {"", "Print the max UUID", "max", 0, 0, commands::max_cmd});
    parser.register_command("NAMESPACE", {"", "Print a namespace UUID",
                                          "namespace <dns|url|oid|x500>", 1, 1,
                                          commands::namespace_cmd});
    parser.register_command("ENCODE", {"", "Print the protobuf encoding as hex",
                                       "encode <text>", 1, 1, commands::encode_cmd});
    parser.register_command("DECODE", {"", "Decode a protobuf encoding",
                                       "decode <hex>", 1, 1, commands::decode_cmd});
}

} // namespace uuidcore::cli
