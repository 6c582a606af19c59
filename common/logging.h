#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

#include "common/macros.h"

namespace Shield::Common {

/// Log severity, ordered so that a threshold comparison filters lower levels
enum class LogLevel : uint16_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

struct LogStats {
    uint64_t messages_written = 0;
    uint64_t messages_dropped = 0;
    uint64_t bytes_written = 0;
};

/// Start the global async logger writing to log_file. Re-initialising closes
/// the previous file first. Must not race with threads that are logging.
void initLogging(const char* log_file, LogLevel min_level = LogLevel::INFO);

/// Flush pending records and stop the writer thread
void shutdownLogging();

[[nodiscard]] auto isLoggingEnabled(LogLevel level) noexcept -> bool;
[[nodiscard]] auto getLogStats() noexcept -> LogStats;
[[nodiscard]] auto parseLogLevel(const char* name, LogLevel* level) noexcept -> bool;
[[nodiscard]] auto logLevelName(LogLevel level) noexcept -> const char*;

// Enqueues an already formatted message
void logMessageToGlobal(LogLevel level, const char* msg, size_t len) noexcept;

template <typename... Args>
inline void logFormatted(LogLevel level, const char* format, Args&&... args) noexcept {
    constexpr size_t MAX_MSG_SIZE = 240;
    char buffer[MAX_MSG_SIZE];

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
    int len = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
    if (SHIELD_UNLIKELY(len <= 0)) {
        return;
    }
    // Truncated messages are still logged
    size_t n = static_cast<size_t>(len);
    if (n >= sizeof(buffer)) {
        n = sizeof(buffer) - 1;
    }
    logMessageToGlobal(level, buffer, n);
}

} // namespace Shield::Common

#define SHIELD_LOG(level, ...)                                                  \
    do {                                                                        \
        if (::Shield::Common::isLoggingEnabled(level)) {                        \
            ::Shield::Common::logFormatted(level, __VA_ARGS__);                 \
        }                                                                       \
    } while (0)

#define LOG_DEBUG(...) SHIELD_LOG(::Shield::Common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  SHIELD_LOG(::Shield::Common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  SHIELD_LOG(::Shield::Common::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) SHIELD_LOG(::Shield::Common::LogLevel::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) SHIELD_LOG(::Shield::Common::LogLevel::FATAL, __VA_ARGS__)
