/**
 * @file random_source.cpp
 * @brief getrandom(2) backed RandomSource.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#include "uuidcore/core/random_source.hpp"
#include "uuidcore/utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <sys/random.h>

namespace uuidcore {
namespace core {

void SystemRandomSource::fill(uint8_t* out, size_t length) {
    size_t filled = 0;
    while (filled < length) {
        ssize_t n = ::getrandom(out + filled, length - filled, 0);
        if (n < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            LOG_ERROR("RandomSource", "getrandom failed after {} of {} bytes: {}",
                      filled, length, std::strerror(err));
            throw std::system_error(err, std::generic_category(), "getrandom");
        }
        filled += static_cast<size_t>(n);
    }
}

RandomSource& defaultRandomSource() {
    static SystemRandomSource source;
    return source;
}

}  // namespace core
}  // namespace uuidcore
