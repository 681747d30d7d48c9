#ifndef BOOTSCAN_UTILS_LOGGING_HPP
#define BOOTSCAN_UTILS_LOGGING_HPP

#include <sstream>
#include <string>

namespace bootscan {
namespace utils {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Critical = 4,
    Off = 5
};

/**
 * @brief Sets the process-wide minimum level. Messages below it are dropped.
 */
void setLogLevel(LogLevel level);

/**
 * @brief Returns the current process-wide minimum level (Info by default).
 */
LogLevel getLogLevel();

bool isLogEnabled(LogLevel level);

/**
 * @brief Writes one formatted line to std::clog.
 *
 * Format: "[bootscan] [LEVEL] message". Lines from concurrent threads are not
 * interleaved.
 */
void logMessage(LogLevel level, const std::string& message);

const char* toString(LogLevel level);

/**
 * @brief Parses "debug", "info", "warn", "error", "critical" or "off"
 * (case-insensitive).
 *
 * @throws std::invalid_argument for any other name
 */
LogLevel parseLogLevel(const std::string& name);

} // namespace utils
} // namespace bootscan

// Stream-style logging macros; the message expression is only evaluated when
// the level is enabled.
#define BSLOG(level, message) \
    do { \
        if (::bootscan::utils::isLogEnabled(level)) { \
            std::ostringstream bslog_stream_; \
            bslog_stream_ << message; \
            ::bootscan::utils::logMessage(level, bslog_stream_.str()); \
        } \
    } while (false)

#define BSLOG_DEBUG(message)    BSLOG(::bootscan::utils::LogLevel::Debug, message)
#define BSLOG_INFO(message)     BSLOG(::bootscan::utils::LogLevel::Info, message)
#define BSLOG_WARN(message)     BSLOG(::bootscan::utils::LogLevel::Warn, message)
#define BSLOG_ERROR(message)    BSLOG(::bootscan::utils::LogLevel::Error, message)
#define BSLOG_CRITICAL(message) BSLOG(::bootscan::utils::LogLevel::Critical, message)

#endif // BOOTSCAN_UTILS_LOGGING_HPP
