/**
 * @file codec_cmd.cpp
 * @brief ENCODE and DECODE commands - protobuf wire form
 */

#include "../commands.hpp"
#include "../utils/string_utils.hpp"

#include <uuidcore/proto/uuid_codec.hpp>

namespace uuidcore::cli::commands {

int encode_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    try {
        auto uuid = core::Uuid::parse(args[0]);
        out.print_string(utils::to_hex(codec::encode(uuid)));
        return 0;
    } catch (const core::InvalidUuid& e) {
        out.print_error(e.what());
        return EXIT_INPUT_ERROR;
    }
}

int decode_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    auto wire = utils::from_hex(args[0]);
    if (!wire) {
        out.print_error("input is not a hex string");
        return EXIT_INPUT_ERROR;
    }

    try {
        out.print_string(codec::decode(*wire).toString());
        return 0;
    } catch (const core::InvalidUuid& e) {
        out.print_error(e.what());
        return EXIT_INPUT_ERROR;
    }
}

} // namespace uuidcore::cli::commands
