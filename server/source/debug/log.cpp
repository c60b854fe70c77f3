/**
 * @file log.cpp
 * @brief Logging System Implementation
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "log.hpp"
#include "../config/config.hpp"
#include <cstring>
#include <ctime>
#include <cerrno>

namespace natrelay::debug {

// =============================================================================
// Global Logger Instance
// =============================================================================

Logger g_logger;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * @brief Copy string with length limit
 */
void safe_strcpy(char* dest, const char* src, size_t max_len) {
    size_t i = 0;
    while (i < max_len && src[i] != '\0') {
        dest[i] = src[i];
        i++;
    }
    dest[i] = '\0';
}

/**
 * @brief Format the local wall-clock time
 */
void get_timestamp(char* buffer, size_t buffer_size) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    if (std::strftime(buffer, buffer_size, "%Y-%m-%d %H:%M:%S", &local) == 0) {
        buffer[0] = '\0';
    }
}

} // anonymous namespace

// =============================================================================
// Message Formatting
// =============================================================================

void format_log_message(char* buffer, size_t buffer_size, LogLevel level,
                        const char* format, ...) {
    va_list args;
    va_start(args, format);
    format_log_message_v(buffer, buffer_size, level, format, args);
    va_end(args);
}

void format_log_message_v(char* buffer, size_t buffer_size, LogLevel level,
                          const char* format, va_list args) {
    if (buffer_size == 0) return;

    // Format: [TIMESTAMP] [LEVEL] message
    char timestamp[32];
    get_timestamp(timestamp, sizeof(timestamp));

    int prefix_len = snprintf(buffer, buffer_size, "[%s] [%s] ",
                               timestamp, log_level_to_string(level));

    if (prefix_len < 0 || static_cast<size_t>(prefix_len) >= buffer_size) {
        buffer[buffer_size - 1] = '\0';
        return;
    }

    // Append the actual message
    vsnprintf(buffer + prefix_len, buffer_size - prefix_len, format, args);
    buffer[buffer_size - 1] = '\0';
}

// =============================================================================
// Logger Implementation
// =============================================================================

Logger::~Logger() {
    close_file();
}

void Logger::init(const config::DebugConfig& config) {
    {
        std::scoped_lock lock(m_mutex);

        m_enabled = config.enabled;
        m_level = static_cast<LogLevel>(config.level > 3 ? 3 : config.level);
        m_log_to_file = config.log_to_file;

        if (config.log_path[0] != '\0') {
            safe_strcpy(m_log_path, config.log_path, sizeof(m_log_path) - 1);
        } else {
            safe_strcpy(m_log_path, DEFAULT_LOG_PATH, sizeof(m_log_path) - 1);
        }

        // File will be reopened on demand with the new path
        close_file();

        // New session needs new header
        m_header_written = false;
    }

    if (is_enabled()) {
        log(LogLevel::Info, "Logger initialized (level=%u, file=%s)",
            static_cast<uint32_t>(get_level()),
            m_log_to_file ? m_log_path : "disabled");
    }
}

bool Logger::should_log(LogLevel level) const {
    if (!is_enabled()) return false;
    return static_cast<uint32_t>(level) <= static_cast<uint32_t>(get_level());
}

void Logger::log(LogLevel level, const char* format, ...) {
    if (!should_log(level)) return;

    va_list args;
    va_start(args, format);
    log_v(level, format, args);
    va_end(args);
}

void Logger::log_v(LogLevel level, const char* format, va_list args) {
    if (!should_log(level)) return;

    char message[MAX_LOG_MESSAGE_LENGTH];
    format_log_message_v(message, sizeof(message), level, format, args);

    std::scoped_lock lock(m_mutex);
    output_message(message);
}

size_t Logger::log_lines(LogLevel level, const char* text) {
    if (text == nullptr || !should_log(level)) return 0;

    size_t count = 0;
    const char* line = text;
    while (*line != '\0') {
        const char* end = std::strchr(line, '\n');
        size_t length = end != nullptr ? static_cast<size_t>(end - line) : std::strlen(line);

        if (length > 0) {
            log(level, "%.*s", static_cast<int>(length), line);
            count++;
        }

        if (end == nullptr) break;
        line = end + 1;
    }
    return count;
}

void Logger::flush() {
    std::scoped_lock lock(m_mutex);
    std::fflush(stdout);
    if (m_file != nullptr) {
        std::fflush(m_file);
    }
}

void Logger::close() {
    std::scoped_lock lock(m_mutex);
    close_file();
}

void Logger::output_message(const char* message) {
    std::printf("%s\n", message);

    if (!m_log_to_file) {
        return;
    }

    // Open file on-demand if not already open
    if (m_file == nullptr) {
        open_file();
    }

    if (m_file != nullptr) {
        std::fprintf(m_file, "%s\n", message);
        std::fflush(m_file);
    }
}

void Logger::open_file() {
    if (m_file != nullptr) return;

    m_file = std::fopen(m_log_path, "a");
    if (m_file == nullptr) {
        // Give up on the file for this session, console output continues
        std::fprintf(stderr, "natrelay: cannot open log file %s: %s\n",
                     m_log_path, std::strerror(errno));
        m_log_to_file = false;
        return;
    }

    // Write header only once per session
    if (!m_header_written) {
        std::fprintf(m_file, "\n=== natrelay Log Started ===\n");
        m_header_written = true;
    }
    std::fflush(m_file);
}

void Logger::close_file() {
    if (m_file != nullptr) {
        std::fflush(m_file);
        std::fclose(m_file);
        m_file = nullptr;
    }
}

} // namespace natrelay::debug
