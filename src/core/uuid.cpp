/**
 * @file uuid.cpp
 * @brief Uuid parsing, formatting and bit-field inspection.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#include "uuidcore/core/uuid.hpp"
#include "uuidcore/core/random_source.hpp"
#include "uuidcore/utils/logger.hpp"

#include <cstring>
#include <ostream>

namespace uuidcore {
namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";
constexpr char URN_PREFIX[] = "urn:uuid:";
constexpr size_t URN_PREFIX_LENGTH = sizeof(URN_PREFIX) - 1;

constexpr size_t SIMPLE_LENGTH = 32;
constexpr size_t HYPHENATED_LENGTH = 36;
constexpr size_t GROUP_COUNT = 5;
constexpr size_t GROUP_LENGTHS[GROUP_COUNT] = {8, 4, 4, 4, 12};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * @brief Decode @p text into @p out.
 *
 * On failure returns false and, when @p error is non-null, stores a
 * description of the first problem found. Character positions in the
 * description are indices into the original text.
 */
bool decodeText(const std::string& text, Uuid::Bytes& out, std::string* error) {
    // Strip an optional urn:uuid: prefix or surrounding braces.
    size_t begin = 0;
    size_t end = text.size();
    if (text.compare(0, URN_PREFIX_LENGTH, URN_PREFIX) == 0) {
        begin = URN_PREFIX_LENGTH;
    } else if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        begin = 1;
        end = text.size() - 1;
    }
    const size_t length = end - begin;

    size_t hyphens = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '-') {
            ++hyphens;
        } else if (hexValue(c) < 0) {
            if (error) {
                *error = "invalid character '" + std::string(1, c) +
                         "' at index " + std::to_string(i);
            }
            return false;
        }
    }

    if (hyphens == 0) {
        if (length != SIMPLE_LENGTH) {
            if (error) {
                *error = "invalid length: expected 32 or 36 characters, found " +
                         std::to_string(length);
            }
            return false;
        }
    } else {
        if (hyphens + 1 != GROUP_COUNT) {
            if (error) {
                *error = "invalid group count: expected 5, found " +
                         std::to_string(hyphens + 1);
            }
            return false;
        }
        size_t groupStart = begin;
        for (size_t group = 0; group < GROUP_COUNT; ++group) {
            size_t groupEnd = text.find('-', groupStart);
            if (groupEnd == std::string::npos || groupEnd > end) {
                groupEnd = end;
            }
            size_t groupLength = groupEnd - groupStart;
            if (groupLength != GROUP_LENGTHS[group]) {
                if (error) {
                    *error = "invalid group length in group " + std::to_string(group + 1) +
                             ": expected " + std::to_string(GROUP_LENGTHS[group]) +
                             ", found " + std::to_string(groupLength);
                }
                return false;
            }
            groupStart = groupEnd + 1;
        }
        // Correct groups imply the canonical 36 character layout.
    }

    size_t byte = 0;
    for (size_t i = begin; i < end; ++i) {
        if (text[i] == '-') {
            continue;
        }
        int high = hexValue(text[i]);
        int low = hexValue(text[++i]);
        out[byte++] = static_cast<uint8_t>((high << 4) | low);
    }
    return true;
}

void writeBigEndian(uint64_t value, uint8_t* out) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(value & 0xff);
        value >>= 8;
    }
}

uint64_t readBigEndian(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

Uuid Uuid::parse(const std::string& text) {
    Bytes bytes{};
    std::string error;
    if (!decodeText(text, bytes, &error)) {
        LOG_DEBUG("Uuid", "Rejected text \"{}\": {}", text, error);
        throw InvalidUuid(ErrorKind::MALFORMED_TEXT, error, text.size());
    }
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::tryParse(const std::string& text) noexcept {
    Bytes bytes{};
    if (!decodeText(text, bytes, nullptr)) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

bool Uuid::isValid(const std::string& text) noexcept {
    Bytes bytes{};
    return decodeText(text, bytes, nullptr);
}

Uuid Uuid::fromBytes(const uint8_t* data, size_t length) {
    if (length != SIZE) {
        std::string error = "invalid length: expected 16 bytes, found " + std::to_string(length);
        LOG_DEBUG("Uuid", "Rejected binary input: {}", error);
        throw InvalidUuid(ErrorKind::MALFORMED_BYTES, error, length);
    }
    Bytes bytes;
    std::memcpy(bytes.data(), data, SIZE);
    return Uuid(bytes);
}

Uuid Uuid::fromBytes(const std::vector<uint8_t>& bytes) {
    return fromBytes(bytes.data(), bytes.size());
}

#ifdef UUIDCORE_HAS_INT128
Uuid Uuid::fromU128(uint128_t value) noexcept {
    return fromU64Pair(static_cast<uint64_t>(value >> 64), static_cast<uint64_t>(value));
}
#endif

Uuid Uuid::fromU64Pair(uint64_t high, uint64_t low) noexcept {
    Bytes bytes;
    writeBigEndian(high, bytes.data());
    writeBigEndian(low, bytes.data() + 8);
    return Uuid(bytes);
}

Uuid Uuid::generateV4() {
    return generateV4(defaultRandomSource());
}

Uuid Uuid::generateV4(RandomSource& source) {
    Bytes bytes{};
    source.fill(bytes.data(), SIZE);

    // Version 4: high nibble of time_hi_and_version = 0100
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    // Variant: top bits of clock_seq_hi_and_reserved = 10
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    return Uuid(bytes);
}

// =============================================================================
// Inspection
// =============================================================================

std::string Uuid::toString() const {
    std::string out;
    out.reserve(HYPHENATED_LENGTH);
    for (size_t i = 0; i < SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX_DIGITS[bytes_[i] >> 4]);
        out.push_back(HEX_DIGITS[bytes_[i] & 0x0f]);
    }
    return out;
}

std::string Uuid::toDebugString() const {
    return "UUID('" + toString() + "')";
}

std::vector<uint8_t> Uuid::toVector() const {
    return std::vector<uint8_t>(bytes_.begin(), bytes_.end());
}

#ifdef UUIDCORE_HAS_INT128
uint128_t Uuid::toU128() const noexcept {
    auto words = toU64Pair();
    return (static_cast<uint128_t>(words.first) << 64) | words.second;
}
#endif

std::pair<uint64_t, uint64_t> Uuid::toU64Pair() const noexcept {
    return {readBigEndian(bytes_.data()), readBigEndian(bytes_.data() + 8)};
}

Variant Uuid::variant() const noexcept {
    const uint8_t b = bytes_[8];
    if ((b & 0x80) == 0x00) {
        return Variant::NCS;
    }
    if ((b & 0xc0) == 0x80) {
        return Variant::RFC4122;
    }
    if ((b & 0xe0) == 0xc0) {
        return Variant::MICROSOFT;
    }
    return Variant::FUTURE;
}

std::optional<uint8_t> Uuid::version() const noexcept {
    const uint8_t nibble = static_cast<uint8_t>((bytes_[6] >> 4) & 0x0f);
    if (nibble >= 1 && nibble <= 8) {
        return nibble;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.toString();
}

}  // namespace core
}  // namespace uuidcore
