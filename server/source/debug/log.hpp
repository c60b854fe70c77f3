/**
 * @file log.hpp
 * @brief Logging System for natrelay
 *
 * Provides configurable logging for the relay daemon and its worker threads.
 * Supports multiple log levels, console output, and optional file logging.
 *
 * ## Design Principles
 *
 * 1. **Cheap When Filtered**: Logging macros check the level before any
 *    formatting happens, so verbose per-packet logging costs a branch when
 *    disabled.
 *
 * 2. **Fixed-Size Buffers**: Each message is formatted into a stack buffer
 *    of MAX_LOG_MESSAGE_LENGTH bytes and truncated if longer.
 *
 * 3. **Thread-Safe**: Every relay runs two threads that may log, so output
 *    is serialized by an internal mutex.
 *
 * 4. **Configurable at Runtime**: Log level and file output come from the
 *    [debug] section of natrelay.ini.
 *
 * ## Log Levels
 *
 * - **Error (0)**: Critical issues that prevent normal operation
 * - **Warning (1)**: Potential problems that don't prevent operation
 * - **Info (2)**: Normal operational messages (joins, leaves, game ends)
 * - **Verbose (3)**: Detailed debugging information
 *
 * ## Usage Example
 *
 * @code
 * #include "debug/log.hpp"
 *
 * natrelay::debug::g_logger.init(config.debug);
 *
 * LOG_ERROR("bind failed on port %u: %s", port, reason);
 * LOG_INFO("Player joined: %s", addr_str);
 * LOG_VERBOSE("Packet received: %zu bytes", size);
 * @endcode
 *
 * @see config/config.hpp for DebugConfig structure
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdarg>
#include <atomic>
#include <cstdio>
#include <mutex>

// Forward declaration to avoid circular include
namespace natrelay::config {
    struct DebugConfig;
}

namespace natrelay::debug {

// =============================================================================
// Constants
// =============================================================================

/** @brief Maximum length of a single log message */
constexpr size_t MAX_LOG_MESSAGE_LENGTH = 512;

/** @brief Maximum length of the log file path */
constexpr size_t MAX_LOG_PATH_LENGTH = 256;

/** @brief Default log file path, relative to the working directory */
constexpr const char* DEFAULT_LOG_PATH = "natrelay.log";

// =============================================================================
// Log Levels
// =============================================================================

/**
 * @brief Log severity levels
 *
 * Lower values indicate higher severity. Only messages at or below the
 * configured level are output.
 */
enum class LogLevel : uint32_t {
    Error = 0,      ///< Critical errors (always logged when enabled)
    Warning = 1,    ///< Warnings (potential issues)
    Info = 2,       ///< Informational messages
    Verbose = 3     ///< Detailed debug output
};

/**
 * @brief Convert LogLevel to human-readable string
 *
 * @param level The log level
 * @return Static string representation (e.g., "ERROR", "WARN")
 */
inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Verbose: return "VERBOSE";
        default:                return "UNKNOWN";
    }
}

// =============================================================================
// Log Message Formatting
// =============================================================================

/**
 * @brief Format a log message with timestamp and level prefix
 *
 * Output format: `[YYYY-MM-DD HH:MM:SS] [LEVEL] message`
 *
 * @param buffer Output buffer for formatted message
 * @param buffer_size Size of output buffer
 * @param level Log level for prefix
 * @param format printf-style format string
 * @param ... Format arguments
 */
void format_log_message(char* buffer, size_t buffer_size, LogLevel level,
                        const char* format, ...);

/**
 * @brief Format a log message with va_list
 */
void format_log_message_v(char* buffer, size_t buffer_size, LogLevel level,
                          const char* format, va_list args);

// =============================================================================
// Logger Class
// =============================================================================

/**
 * @brief Main logger class
 *
 * Handles log message formatting, filtering by level, and output to
 * console and/or file. Thread-safe for concurrent logging.
 */
class Logger {
public:
    Logger() = default;
    ~Logger();

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Initialize logger with configuration
     *
     * @param config Debug configuration from natrelay.ini
     */
    void init(const config::DebugConfig& config);

    /**
     * @brief Check if logging is enabled
     */
    bool is_enabled() const { return m_enabled.load(std::memory_order_relaxed); }

    /**
     * @brief Get current log level
     */
    LogLevel get_level() const { return m_level.load(std::memory_order_relaxed); }

    /**
     * @brief Check if a message at given level should be logged
     *
     * @param level Log level to check
     * @return true if message should be logged
     */
    bool should_log(LogLevel level) const;

    /**
     * @brief Log a message
     *
     * @param level Log level
     * @param format printf-style format string
     * @param ... Format arguments
     */
    void log(LogLevel level, const char* format, ...)
        __attribute__((format(printf, 3, 4)));

    /**
     * @brief Log a message with va_list
     */
    void log_v(LogLevel level, const char* format, va_list args);

    /**
     * @brief Log multi-line text, one log record per line
     *
     * Each line gets its own timestamp and level prefix, so text longer than
     * MAX_LOG_MESSAGE_LENGTH is only cut if a single line is. Empty lines
     * are skipped.
     *
     * @param level Log level
     * @param text Newline-separated text
     * @return Number of lines logged
     */
    size_t log_lines(LogLevel level, const char* text);

    /**
     * @brief Flush any buffered output to file
     */
    void flush();

    /**
     * @brief Close the log file, if open
     *
     * The next file write reopens it in append mode.
     */
    void close();

    /**
     * @brief Get the log file path in use
     */
    const char* get_path() const { return m_log_path; }

private:
    void output_message(const char* message);
    void open_file();
    void close_file();

    mutable std::mutex m_mutex;
    // Read without the mutex by should_log()
    std::atomic<bool> m_enabled{false};
    std::atomic<LogLevel> m_level{LogLevel::Warning};
    bool m_log_to_file = false;
    char m_log_path[MAX_LOG_PATH_LENGTH] = {0};
    FILE* m_file = nullptr;
    bool m_header_written = false;   // Track if header was written this session
};

// =============================================================================
// Global Logger Instance
// =============================================================================

/**
 * @brief Global logger instance
 *
 * Use this for all logging throughout the daemon. Initialize once
 * at startup with g_logger.init(config.debug).
 */
extern Logger g_logger;

// =============================================================================
// Logging Macros
// =============================================================================

/**
 * @brief Log an error message
 *
 * @note Uses GNU extension ##__VA_ARGS__ to handle zero variadic arguments.
 */
#define LOG_ERROR(fmt, ...) \
    do { \
        if (natrelay::debug::g_logger.should_log(natrelay::debug::LogLevel::Error)) { \
            natrelay::debug::g_logger.log(natrelay::debug::LogLevel::Error, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

/**
 * @brief Log a warning message
 */
#define LOG_WARN(fmt, ...) \
    do { \
        if (natrelay::debug::g_logger.should_log(natrelay::debug::LogLevel::Warning)) { \
            natrelay::debug::g_logger.log(natrelay::debug::LogLevel::Warning, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

/**
 * @brief Log an info message
 */
#define LOG_INFO(fmt, ...) \
    do { \
        if (natrelay::debug::g_logger.should_log(natrelay::debug::LogLevel::Info)) { \
            natrelay::debug::g_logger.log(natrelay::debug::LogLevel::Info, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

/**
 * @brief Log a verbose debug message
 */
#define LOG_VERBOSE(fmt, ...) \
    do { \
        if (natrelay::debug::g_logger.should_log(natrelay::debug::LogLevel::Verbose)) { \
            natrelay::debug::g_logger.log(natrelay::debug::LogLevel::Verbose, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

} // namespace natrelay::debug
