/**
 * @file random_source.hpp
 * @brief Source of cryptographically strong random bytes for v4 generation.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#include "uuidcore/core/export.hpp"

#include <cstddef>
#include <cstdint>

namespace uuidcore {
namespace core {

/**
 * @class RandomSource
 * @brief Fills buffers with random bytes.
 *
 * Implementations used through defaultRandomSource() must be safe to call
 * from several threads at once.
 */
class UUIDCORE_CORE_API RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Overwrite @p length bytes at @p out with random data.
     * @throws std::system_error if the underlying source fails.
     */
    virtual void fill(uint8_t* out, size_t length) = 0;
};

/**
 * @class SystemRandomSource
 * @brief Kernel CSPRNG via getrandom(2). Stateless, so thread-safe.
 */
class UUIDCORE_CORE_API SystemRandomSource : public RandomSource {
public:
    void fill(uint8_t* out, size_t length) override;
};

/**
 * @brief Process-wide SystemRandomSource used by Uuid::generateV4().
 */
UUIDCORE_CORE_API RandomSource& defaultRandomSource();

}  // namespace core
}  // namespace uuidcore
