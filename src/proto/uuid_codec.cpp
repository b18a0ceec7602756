/**
 * @file uuid_codec.cpp
 * @brief core::Uuid <-> uuidcore.proto.Uuid.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#include "uuidcore/proto/uuid_codec.hpp"
#include "uuidcore/utils/logger.hpp"

namespace uuidcore {
namespace codec {

proto::Uuid toProto(const core::Uuid& uuid) {
    proto::Uuid message;
    const auto& bytes = uuid.bytes();
    message.set_binary(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return message;
}

proto::Uuid toProtoText(const core::Uuid& uuid) {
    proto::Uuid message;
    message.set_text(uuid.toString());
    return message;
}

core::Uuid fromProto(const proto::Uuid& message) {
    switch (message.value_case()) {
        case proto::Uuid::kBinary: {
            const std::string& binary = message.binary();
            return core::Uuid::fromBytes(
                reinterpret_cast<const uint8_t*>(binary.data()), binary.size());
        }
        case proto::Uuid::kText:
            return core::Uuid::parse(message.text());
        case proto::Uuid::VALUE_NOT_SET:
        default:
            throw core::InvalidUuid(core::ErrorKind::MALFORMED_BYTES,
                                    "invalid length: expected 16 bytes, found 0 (value not set)", 0);
    }
}

std::string encode(const core::Uuid& uuid) {
    return toProto(uuid).SerializeAsString();
}

core::Uuid decode(const std::string& wire) {
    proto::Uuid message;
    if (!message.ParseFromString(wire)) {
        LOG_WARN("Codec", "Failed to parse {} byte Uuid message", wire.size());
        throw core::InvalidUuid(core::ErrorKind::MALFORMED_BYTES,
                                "invalid encoding: not a uuidcore.proto.Uuid message", wire.size());
    }
    return fromProto(message);
}

}  // namespace codec
}  // namespace uuidcore
