/**
 * @file parse_cmd.cpp
 * @brief PARSE, INSPECT and VALIDATE commands
 */

#include "../commands.hpp"

#include <uuidcore/core/uuid.hpp>

#include <cstdio>

namespace uuidcore::cli::commands {

namespace {

std::string hex64(uint64_t value) {
    char buf[19];
    std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(value));
    return buf;
}

std::string hexBytes(const core::Uuid::Bytes& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) out += ' ';
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0f];
    }
    return out;
}

} // anonymous namespace

int parse_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    try {
        out.print_string(core::Uuid::parse(args[0]).toString());
        return 0;
    } catch (const core::InvalidUuid& e) {
        out.print_error(e.what());
        return EXIT_INPUT_ERROR;
    }
}

int inspect_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    core::Uuid uuid;
    try {
        uuid = core::Uuid::parse(args[0]);
    } catch (const core::InvalidUuid& e) {
        out.print_error(e.what());
        return EXIT_INPUT_ERROR;
    }

    auto [high, low] = uuid.toU64Pair();
    auto version = uuid.version();

    std::map<std::string, JsonObject> fields;
    fields["uuid"] = uuid.toString();
    fields["debug"] = uuid.toDebugString();
    fields["variant"] = core::variantToString(uuid.variant());
    fields["version"] = version ? JsonObject(static_cast<int>(*version)) : JsonObject(nullptr);
    fields["high"] = hex64(high);
    fields["low"] = hex64(low);
    fields["bytes"] = hexBytes(uuid.bytes());
    fields["is_nil"] = uuid.isNil();
    fields["is_max"] = uuid.isMax();
    out.print_json(fields);
    return 0;
}

int validate_cmd(OutputFormatter& out, const std::vector<std::string>& args) {
    bool valid = core::Uuid::isValid(args[0]);
    if (out.is_json_mode()) {
        out.print_json({{"input", args[0]}, {"valid", valid}});
    } else {
        out.print_string(valid ? "valid" : "invalid");
    }
    return valid ? 0 : EXIT_INPUT_ERROR;
}

} // namespace uuidcore::cli::commands
