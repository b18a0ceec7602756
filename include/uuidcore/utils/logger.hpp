/**
 * @file logger.hpp
 * @brief Thread-safe leveled logging for uuidcore.
 *
 * Lines have the form `[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Component] message`.
 * Messages use `{}` placeholders which are replaced, in order, by the
 * streamed representation of the extra arguments.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#include "uuidcore/utils/export.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace uuidcore {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name (case-insensitive, e.g. "debug", "WARN").
 * @return The level, or std::nullopt if the name is not recognised.
 */
UUIDCORE_UTILS_API std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * @class Logger
 * @brief Process-wide logger writing to a configurable stream.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_DEBUG("Cli", "Dispatching command {}", name);
 * LOG_ERROR("RandomSource", "getrandom failed: {}", message);
 * @endcode
 */
class UUIDCORE_UTILS_API Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colors around the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every subsequent log call.
     */
    void setSink(std::ostream* sink);

    /**
     * @brief Name of a level without padding ("TRACE", "INFO", ...).
     */
    static std::string levelName(LogLevel level);

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream message;
        formatMessage(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& component, const std::string& message);

    static void formatMessage(std::ostringstream& out, const char* format) {
        out << format;
    }

    template<typename T, typename... Args>
    static void formatMessage(std::ostringstream& out, const char* format, T&& value, Args&&... args) {
        while (*format) {
            if (format[0] == '{' && format[1] == '}') {
                out << value;
                formatMessage(out, format + 2, std::forward<Args>(args)...);
                return;
            }
            out << *format++;
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* sink_;
};

}  // namespace utils
}  // namespace uuidcore

#define LOG_TRACE(component, ...) \
    ::uuidcore::utils::Logger::instance().log(::uuidcore::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::uuidcore::utils::Logger::instance().log(::uuidcore::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::uuidcore::utils::Logger::instance().log(::uuidcore::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::uuidcore::utils::Logger::instance().log(::uuidcore::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::uuidcore::utils::Logger::instance().log(::uuidcore::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::uuidcore::utils::Logger::instance().log(::uuidcore::utils::LogLevel::FATAL, component, __VA_ARGS__)
