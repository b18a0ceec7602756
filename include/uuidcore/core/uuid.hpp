/**
 * @file uuid.hpp
 * @brief RFC 4122 UUID value type.
 *
 * A Uuid is 16 bytes in network (big-endian) order. It is immutable:
 * every accessor derives a new view of the stored bytes. Equality,
 * ordering and hashing all operate on those bytes, which matches the
 * order of the value read as an unsigned 128-bit big-endian integer.
 *
 * Usage:
 * @code
 * auto id = Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
 * assert(id == NAMESPACE_DNS);
 *
 * auto fresh = Uuid::generateV4();
 * std::cout << fresh << " version " << int(*fresh.version()) << "\n";
 * @endcode
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#include "uuidcore/core/export.hpp"
#include "uuidcore/core/uuid_error.hpp"
#include "uuidcore/utils/crc64.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uuidcore {
namespace core {

class RandomSource;

#if defined(__SIZEOF_INT128__)
#define UUIDCORE_HAS_INT128 1
__extension__ typedef unsigned __int128 uint128_t;
#endif

/**
 * @enum Variant
 * @brief Layout family, from the most significant bits of byte 8.
 */
enum class Variant {
    NCS,        ///< 0xx - reserved, NCS backward compatibility
    RFC4122,    ///< 10x - the RFC 4122 layout
    MICROSOFT,  ///< 110 - reserved, Microsoft backward compatibility
    FUTURE      ///< 111 - reserved for future definition
};

inline const char* variantToString(Variant variant) {
    switch (variant) {
        case Variant::NCS: return "NCS";
        case Variant::RFC4122: return "RFC4122";
        case Variant::MICROSOFT: return "Microsoft";
        case Variant::FUTURE: return "Future";
        default: return "Unknown";
    }
}

/**
 * @class Uuid
 * @brief Immutable 128-bit identifier.
 */
class UUIDCORE_CORE_API Uuid {
public:
    static constexpr size_t SIZE = 16;
    using Bytes = std::array<uint8_t, SIZE>;

    /// The nil UUID.
    constexpr Uuid() : bytes_{} {}

    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    // =========================================================================
    // Construction
    // =========================================================================

    /**
     * @brief Parse hyphenated, simple (32 hex digits), braced or
     *        `urn:uuid:` text. Hex digits may be upper or lower case.
     * @throws InvalidUuid (MALFORMED_TEXT) describing the first problem found.
     */
    static Uuid parse(const std::string& text);

    /**
     * @brief Like parse() but reports failure as std::nullopt.
     */
    static std::optional<Uuid> tryParse(const std::string& text) noexcept;

    /**
     * @brief True if parse() would succeed.
     */
    static bool isValid(const std::string& text) noexcept;

    /**
     * @brief Copy exactly 16 bytes.
     * @throws InvalidUuid (MALFORMED_BYTES) carrying @p length otherwise.
     */
    static Uuid fromBytes(const uint8_t* data, size_t length);
    static Uuid fromBytes(const std::vector<uint8_t>& bytes);

#ifdef UUIDCORE_HAS_INT128
    static Uuid fromU128(uint128_t value) noexcept;
#endif

    static Uuid fromU64Pair(uint64_t high, uint64_t low) noexcept;

    /**
     * @brief Random (version 4) UUID from defaultRandomSource().
     * @throws std::system_error if the system random source fails.
     */
    static Uuid generateV4();

    /**
     * @brief Random (version 4) UUID drawing 16 bytes from @p source,
     *        then forcing the version nibble to 4 and the variant to RFC4122.
     */
    static Uuid generateV4(RandomSource& source);

    static constexpr Uuid nil() { return Uuid(); }

    static constexpr Uuid max() {
        return Uuid(Bytes{0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
                          0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    /**
     * @brief Canonical form: 36 lowercase characters, 8-4-4-4-12.
     */
    std::string toString() const;

    /**
     * @brief Diagnostic form, e.g. `UUID('6ba7b810-9dad-11d1-80b4-00c04fd430c8')`.
     */
    std::string toDebugString() const;

    constexpr const Bytes& bytes() const { return bytes_; }

    std::vector<uint8_t> toVector() const;

#ifdef UUIDCORE_HAS_INT128
    uint128_t toU128() const noexcept;
#endif

    /**
     * @brief {high, low}: bytes 0-7 and 8-15, each big-endian.
     */
    std::pair<uint64_t, uint64_t> toU64Pair() const noexcept;

    Variant variant() const noexcept;

    /**
     * @brief Version number 1-8 from the high nibble of byte 6.
     * @return std::nullopt for any other nibble (0 for nil, 15 for max, ...).
     */
    std::optional<uint8_t> version() const noexcept;

    constexpr bool isNil() const { return *this == nil(); }
    constexpr bool isMax() const { return *this == max(); }

    /**
     * @brief CRC64 of the stored bytes.
     */
    size_t hash() const noexcept {
        return static_cast<size_t>(utils::CRC64::compute(bytes_));
    }

    // =========================================================================
    // Comparison
    // =========================================================================

    friend constexpr bool operator==(const Uuid& lhs, const Uuid& rhs) {
        return compare(lhs, rhs) == 0;
    }
    friend constexpr bool operator!=(const Uuid& lhs, const Uuid& rhs) {
        return compare(lhs, rhs) != 0;
    }
    friend constexpr bool operator<(const Uuid& lhs, const Uuid& rhs) {
        return compare(lhs, rhs) < 0;
    }
    friend constexpr bool operator<=(const Uuid& lhs, const Uuid& rhs) {
        return compare(lhs, rhs) <= 0;
    }
    friend constexpr bool operator>(const Uuid& lhs, const Uuid& rhs) {
        return compare(lhs, rhs) > 0;
    }
    friend constexpr bool operator>=(const Uuid& lhs, const Uuid& rhs) {
        return compare(lhs, rhs) >= 0;
    }

private:
    static constexpr int compare(const Uuid& lhs, const Uuid& rhs) {
        for (size_t i = 0; i < SIZE; ++i) {
            if (lhs.bytes_[i] != rhs.bytes_[i]) {
                return lhs.bytes_[i] < rhs.bytes_[i] ? -1 : 1;
            }
        }
        return 0;
    }

    Bytes bytes_;
};

/// Writes toString().
UUIDCORE_CORE_API std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

// RFC 4122, Appendix C

/// Name string is a fully-qualified domain name.
inline constexpr Uuid NAMESPACE_DNS{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

/// Name string is a URL.
inline constexpr Uuid NAMESPACE_URL{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

/// Name string is an ISO OID.
inline constexpr Uuid NAMESPACE_OID{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

/// Name string is an X.500 DN, in DER or a text output format.
inline constexpr Uuid NAMESPACE_X500{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

}  // namespace core
}  // namespace uuidcore

namespace std {

template<>
struct hash<uuidcore::core::Uuid> {
    size_t operator()(const uuidcore::core::Uuid& uuid) const noexcept {
        return uuid.hash();
    }
};

}  // namespace std
