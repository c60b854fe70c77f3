/**
 * @file config.cpp
 * @brief Configuration Manager Implementation
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "config.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <sys/stat.h>

namespace natrelay::config {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

/**
 * @brief Trim leading whitespace from string
 */
const char* trim_start(const char* str) {
    while (*str == ' ' || *str == '\t') {
        str++;
    }
    return str;
}

/**
 * @brief Trim trailing whitespace from string (modifies in place)
 */
void trim_end(char* str) {
    size_t len = std::strlen(str);
    while (len > 0 && (str[len - 1] == ' ' || str[len - 1] == '\t' ||
                       str[len - 1] == '\n' || str[len - 1] == '\r')) {
        str[--len] = '\0';
    }
}

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
 * @brief Parse boolean value (0/1, true/false, yes/no)
 */
bool parse_bool(const char* value) {
    if (value[0] == '0' || value[0] == 'f' || value[0] == 'F' ||
        value[0] == 'n' || value[0] == 'N') {
        return false;
    }
    return true;  // Default to true for any non-false value
}

/**
 * @brief Parse unsigned integer, rejecting trailing garbage
 */
bool parse_uint32(const char* value, uint32_t& out) {
    char* end = nullptr;
    unsigned long parsed = std::strtoul(value, &end, 10);
    if (end == value || *trim_start(end) != '\0' || parsed > 0xFFFFFFFFul) {
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

/**
 * @brief Parse a non-zero port number
 */
bool parse_port(const char* value, uint16_t& out) {
    uint32_t parsed = 0;
    if (!parse_uint32(value, parsed) || parsed == 0 || parsed > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(parsed);
    return true;
}

// Section identifiers
enum class Section {
    None,
    Server,
    Relay,
    Debug,
    Unknown
};

/**
 * @brief Identify section from header line
 */
Section parse_section(const char* line) {
    if (std::strcmp(line, "[server]") == 0) return Section::Server;
    if (std::strcmp(line, "[relay]") == 0) return Section::Relay;
    if (std::strcmp(line, "[debug]") == 0) return Section::Debug;
    if (line[0] == '[') return Section::Unknown;
    return Section::None;
}

/**
 * @brief Process a key=value line for server section
 * @return false if the value was rejected
 */
bool process_server_key(const char* key, const char* value, ServerConfig& config) {
    if (std::strcmp(key, "host") == 0) {
        safe_strcpy(config.host, value, MAX_HOST_LENGTH);
    } else if (std::strcmp(key, "port") == 0) {
        return parse_port(value, config.port);
    }
    return true;
}

/**
 * @brief Process a key=value line for relay section
 * @return false if the value was rejected
 */
bool process_relay_key(const char* key, const char* value, RelayConfig& config) {
    if (std::strcmp(key, "first_port") == 0) {
        return parse_port(value, config.first_port);
    } else if (std::strcmp(key, "buffer_size") == 0) {
        uint32_t size = 0;
        if (!parse_uint32(value, size) || size == 0 || size > MAX_BUFFER_SIZE) {
            return false;
        }
        config.buffer_size = size;
    } else if (std::strcmp(key, "status_interval") == 0) {
        return parse_uint32(value, config.status_interval_s);
    }
    return true;
}

/**
 * @brief Process a key=value line for debug section
 * @return false if the value was rejected
 */
bool process_debug_key(const char* key, const char* value, DebugConfig& config) {
    if (std::strcmp(key, "enabled") == 0) {
        config.enabled = parse_bool(value);
    } else if (std::strcmp(key, "level") == 0) {
        uint32_t level = 0;
        if (!parse_uint32(value, level) || level > 3) {
            return false;
        }
        config.level = level;
    } else if (std::strcmp(key, "log_to_file") == 0) {
        config.log_to_file = parse_bool(value);
    } else if (std::strcmp(key, "log_path") == 0) {
        safe_strcpy(config.log_path, value, MAX_PATH_LENGTH);
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Public Functions
// ============================================================================

Config get_default_config() {
    Config config{};

    // Server defaults
    safe_strcpy(config.server.host, DEFAULT_HOST, MAX_HOST_LENGTH);
    config.server.port = DEFAULT_PORT;

    // Relay defaults
    config.relay.first_port = DEFAULT_FIRST_PROXY_PORT;
    config.relay.buffer_size = DEFAULT_BUFFER_SIZE;
    config.relay.status_interval_s = DEFAULT_STATUS_INTERVAL_S;

    // Debug defaults
    config.debug.enabled = DEFAULT_DEBUG_ENABLED;
    config.debug.level = DEFAULT_DEBUG_LEVEL;
    config.debug.log_to_file = DEFAULT_LOG_TO_FILE;
    safe_strcpy(config.debug.log_path, DEFAULT_LOG_PATH, MAX_PATH_LENGTH);

    return config;
}

ConfigResult load_config(const char* path, Config& config) {
    FILE* file = std::fopen(path, "r");
    if (!file) {
        return ConfigResult::FileNotFound;
    }

    char line[512];
    Section current_section = Section::None;
    bool rejected_value = false;

    while (std::fgets(line, sizeof(line), file)) {
        // Remove trailing whitespace/newlines
        trim_end(line);

        // Skip empty lines
        const char* trimmed = trim_start(line);
        if (trimmed[0] == '\0') {
            continue;
        }

        // Skip comments
        if (trimmed[0] == ';' || trimmed[0] == '#') {
            continue;
        }

        // Check for section header
        Section new_section = parse_section(trimmed);
        if (new_section != Section::None) {
            current_section = new_section;
            continue;
        }

        // Skip if in unknown section
        if (current_section == Section::None || current_section == Section::Unknown) {
            continue;
        }

        // Parse key=value
        char* eq_pos = std::strchr(line, '=');
        if (!eq_pos) {
            continue;  // No '=' found, skip line
        }

        // Split into key and value
        *eq_pos = '\0';
        char* key = line;
        char* value = eq_pos + 1;

        const char* trimmed_key = trim_start(key);
        trim_end(key);

        const char* trimmed_value = trim_start(value);
        trim_end(value);

        char key_buf[64];
        safe_strcpy(key_buf, trimmed_key, sizeof(key_buf) - 1);
        trim_end(key_buf);

        bool accepted = true;
        switch (current_section) {
            case Section::Server:
                accepted = process_server_key(key_buf, trimmed_value, config.server);
                break;
            case Section::Relay:
                accepted = process_relay_key(key_buf, trimmed_value, config.relay);
                break;
            case Section::Debug:
                accepted = process_debug_key(key_buf, trimmed_value, config.debug);
                break;
            default:
                break;
        }

        if (!accepted) {
            rejected_value = true;
        }
    }

    bool read_error = std::ferror(file) != 0;
    std::fclose(file);

    if (read_error) {
        return ConfigResult::IoError;
    }
    return rejected_value ? ConfigResult::ParseError : ConfigResult::Success;
}

ConfigResult save_config(const char* path, const Config& config) {
    FILE* file = std::fopen(path, "w");
    if (!file) {
        return ConfigResult::IoError;
    }

    std::fprintf(file, "; natrelay Configuration\n");
    std::fprintf(file, "; Auto-generated with default values\n\n");

    std::fprintf(file, "[server]\n");
    std::fprintf(file, "; Gateway bind address\n");
    std::fprintf(file, "host = %s\n", config.server.host);
    std::fprintf(file, "; Gateway UDP port (first contact for new players)\n");
    std::fprintf(file, "port = %u\n\n", config.server.port);

    std::fprintf(file, "[relay]\n");
    std::fprintf(file, "; First proxy port handed to a player\n");
    std::fprintf(file, "first_port = %u\n", config.relay.first_port);
    std::fprintf(file, "; Datagram buffer size in bytes\n");
    std::fprintf(file, "buffer_size = %u\n", config.relay.buffer_size);
    std::fprintf(file, "; Seconds between server state dumps (0 = off)\n");
    std::fprintf(file, "status_interval = %u\n\n", config.relay.status_interval_s);

    std::fprintf(file, "[debug]\n");
    std::fprintf(file, "; Enable logging (0/1)\n");
    std::fprintf(file, "enabled = %d\n", config.debug.enabled ? 1 : 0);
    std::fprintf(file, "; Log level (0=errors, 1=warnings, 2=info, 3=verbose)\n");
    std::fprintf(file, "level = %u\n", config.debug.level);
    std::fprintf(file, "; Log to file (0/1)\n");
    std::fprintf(file, "log_to_file = %d\n", config.debug.log_to_file ? 1 : 0);
    std::fprintf(file, "log_path = %s\n", config.debug.log_path);

    bool write_error = std::ferror(file) != 0;
    if (std::fclose(file) != 0 || write_error) {
        return ConfigResult::IoError;
    }

    return ConfigResult::Success;
}

ConfigResult ensure_config_exists(const char* path) {
    struct stat st;
    if (stat(path, &st) == 0) {
        return ConfigResult::Success;  // File exists
    }

    Config default_config = get_default_config();
    return save_config(path, default_config);
}

} // namespace natrelay::config
