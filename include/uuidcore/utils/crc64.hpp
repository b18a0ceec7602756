/**
 * @file crc64.hpp
 * @brief CRC64 (ECMA-182) over byte buffers, used as the UUID hash.
 *
 * The lookup table is built at compile time.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace uuidcore {
namespace utils {

namespace detail {

constexpr std::array<uint64_t, 256> crc64Table(uint64_t polynomial) {
    std::array<uint64_t, 256> t{};
    for (uint64_t i = 0; i < 256; ++i) {
        uint64_t crc = i << 56;
        for (int j = 0; j < 8; ++j) {
            if (crc & 0x8000000000000000ULL) {
                crc = (crc << 1) ^ polynomial;
            } else {
                crc <<= 1;
            }
        }
        t[i] = crc;
    }
    return t;
}

}  // namespace detail

/**
 * @class CRC64
 * @brief Incremental CRC64 calculator using the ECMA-182 polynomial.
 *
 * Usage:
 * @code
 * uint64_t h = CRC64::compute(uuid.bytes().data(), 16);
 *
 * CRC64 crc;
 * crc.update(first, 8);
 * crc.update(second, 8);
 * uint64_t same = crc.finalize();
 * @endcode
 */
class CRC64 {
public:
    static constexpr uint64_t POLYNOMIAL = 0x42F0E1EBA9EA3693ULL;

    static constexpr uint64_t compute(const uint8_t* data, size_t length) {
        CRC64 crc;
        crc.update(data, length);
        return crc.finalize();
    }

    template<size_t N>
    static constexpr uint64_t compute(const std::array<uint8_t, N>& data) {
        return compute(data.data(), N);
    }

    constexpr CRC64() : crc_(INITIAL) {}

    constexpr void update(const uint8_t* data, size_t length) {
        for (size_t i = 0; i < length; ++i) {
            uint8_t index = static_cast<uint8_t>(crc_ >> 56) ^ data[i];
            crc_ = TABLE[index] ^ (crc_ << 8);
        }
    }

    constexpr uint64_t finalize() const {
        return crc_ ^ INITIAL;
    }

    constexpr void reset() {
        crc_ = INITIAL;
    }

private:
    static constexpr uint64_t INITIAL = 0xFFFFFFFFFFFFFFFFULL;

    static constexpr std::array<uint64_t, 256> TABLE = detail::crc64Table(POLYNOMIAL);

    uint64_t crc_;
};

}  // namespace utils
}  // namespace uuidcore
