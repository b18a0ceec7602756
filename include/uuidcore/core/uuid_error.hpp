/**
 * @file uuid_error.hpp
 * @brief Error raised when a UUID cannot be built from caller input.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#include "uuidcore/core/export.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace uuidcore {
namespace core {

/**
 * @enum ErrorKind
 * @brief Which construction path rejected its input.
 */
enum class ErrorKind {
    MALFORMED_TEXT,   ///< Text does not match the accepted UUID grammar
    MALFORMED_BYTES   ///< Binary input is not exactly 16 bytes
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_TEXT: return "malformed text";
        case ErrorKind::MALFORMED_BYTES: return "malformed bytes";
        default: return "unknown";
    }
}

/**
 * @class InvalidUuid
 * @brief Thrown by Uuid::parse and Uuid::fromBytes.
 *
 * what() is the human-readable description. For MALFORMED_BYTES,
 * actualLength() is the number of bytes received; for MALFORMED_TEXT it is
 * the length of the rejected string.
 */
class UUIDCORE_CORE_API InvalidUuid : public std::invalid_argument {
public:
    InvalidUuid(ErrorKind kind, const std::string& description, size_t actualLength)
        : std::invalid_argument(description)
        , kind_(kind)
        , actualLength_(actualLength)
    {}

    ErrorKind kind() const noexcept { return kind_; }
    size_t actualLength() const noexcept { return actualLength_; }

private:
    ErrorKind kind_;
    size_t actualLength_;
};

}  // namespace core
}  // namespace uuidcore
