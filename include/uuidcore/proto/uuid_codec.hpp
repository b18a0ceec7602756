/**
 * @file uuid_codec.hpp
 * @brief Conversion between core::Uuid and the uuidcore.proto.Uuid message.
 *
 * Decoding reuses the core validation, so every failure surfaces as
 * core::InvalidUuid.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#include "uuidcore/proto/export.hpp"
#include "uuidcore/core/uuid.hpp"
#include "uuidcore/proto/uuid.pb.h"

#include <string>

namespace uuidcore {
namespace codec {

/**
 * @brief Message carrying the 16 raw bytes.
 */
UUIDCORE_PROTO_API proto::Uuid toProto(const core::Uuid& uuid);

/**
 * @brief Message carrying the canonical text form.
 */
UUIDCORE_PROTO_API proto::Uuid toProtoText(const core::Uuid& uuid);

/**
 * @brief Build a Uuid from either message representation.
 * @throws core::InvalidUuid if the value is unset, the binary field is not
 *         16 bytes, or the text field does not parse.
 */
UUIDCORE_PROTO_API core::Uuid fromProto(const proto::Uuid& message);

/**
 * @brief Serialize toProto(uuid) to protobuf wire bytes.
 */
UUIDCORE_PROTO_API std::string encode(const core::Uuid& uuid);

/**
 * @brief Parse protobuf wire bytes and decode the message.
 * @throws core::InvalidUuid (MALFORMED_BYTES) if @p wire is not a valid
 *         message, or whatever fromProto() throws.
 */
UUIDCORE_PROTO_API core::Uuid decode(const std::string& wire);

}  // namespace codec
}  // namespace uuidcore
