/**
 * @file config.hpp
 * @brief Configuration Manager for natrelay
 *
 * This module handles loading and parsing of INI configuration files.
 * It provides all runtime settings for the relay daemon: where the gateway
 * socket listens, where proxy port allocation starts, and logging options.
 *
 * ## Design Principles
 *
 * 1. **Fixed-Size Buffers**: All strings use fixed-size buffers so a Config
 *    can be copied around by value.
 *
 * 2. **Safe Defaults**: If the config file is missing or malformed, sensible
 *    defaults are used so the relay can still start.
 *
 * 3. **Simple INI Format**: Standard INI syntax with [sections] and key=value
 *    pairs. Comments start with ; or #.
 *
 * ## INI File Format
 *
 * ```ini
 * ; Comment line
 * [section]
 * key = value
 * ```
 *
 * ## Supported Sections
 *
 * - `[server]`: Gateway bind address and port
 * - `[relay]`: Proxy port base, datagram buffer size, status dump interval
 * - `[debug]`: Logging configuration
 *
 * ## Usage Example
 *
 * @code
 * using namespace natrelay::config;
 *
 * Config config = get_default_config();
 * ConfigResult result = load_config("natrelay.ini", config);
 * if (result == ConfigResult::FileNotFound) {
 *     // keep defaults
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace natrelay::config {

// =============================================================================
// Constants
// =============================================================================

/**
 * @brief Maximum length of the gateway bind address (excluding null terminator)
 */
constexpr size_t MAX_HOST_LENGTH = 64;

/**
 * @brief Maximum length of the log file path (excluding null terminator)
 */
constexpr size_t MAX_PATH_LENGTH = 255;

/**
 * @brief Default configuration file path, relative to the working directory
 */
constexpr const char* CONFIG_PATH = "natrelay.ini";

// -----------------------------------------------------------------------------
// Default Values - Server
// -----------------------------------------------------------------------------

/** @brief Default gateway bind address (all interfaces) */
constexpr const char* DEFAULT_HOST = "0.0.0.0";

/** @brief Default gateway port where unknown players make first contact */
constexpr uint16_t DEFAULT_PORT = 50000;

// -----------------------------------------------------------------------------
// Default Values - Relay
// -----------------------------------------------------------------------------

/** @brief First proxy port handed to a player */
constexpr uint16_t DEFAULT_FIRST_PROXY_PORT = 40001;

/**
 * @brief Default datagram buffer size
 *
 * The largest safe UDP payload is 576 bytes for IPv4 and 1280 for IPv6;
 * game traffic stays well below 1024.
 */
constexpr uint32_t DEFAULT_BUFFER_SIZE = 1024;

/** @brief Largest accepted buffer_size value (max UDP payload) */
constexpr uint32_t MAX_BUFFER_SIZE = 65507;

/** @brief Default interval between server state dumps (seconds, 0 = off) */
constexpr uint32_t DEFAULT_STATUS_INTERVAL_S = 60;

// -----------------------------------------------------------------------------
// Default Values - Debug
// -----------------------------------------------------------------------------

/** @brief Default logging state */
constexpr bool DEFAULT_DEBUG_ENABLED = true;

/** @brief Default log level (2 = info) */
constexpr uint32_t DEFAULT_DEBUG_LEVEL = 2;

/** @brief Default file logging state */
constexpr bool DEFAULT_LOG_TO_FILE = false;

/** @brief Default log file path */
constexpr const char* DEFAULT_LOG_PATH = "natrelay.log";

// =============================================================================
// Result Codes
// =============================================================================

/**
 * @brief Result codes for configuration operations
 */
enum class ConfigResult {
    Success = 0,       ///< Configuration loaded successfully
    FileNotFound,      ///< Configuration file does not exist
    ParseError,        ///< File exists but contains invalid values
    IoError            ///< File I/O error (permissions, disk full, etc.)
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Gateway socket settings
 *
 * Corresponds to the [server] section in natrelay.ini.
 *
 * ## INI Keys
 * - `host`: IPv4 address the gateway socket binds to
 * - `port`: Gateway UDP port
 */
struct ServerConfig {
    char host[MAX_HOST_LENGTH + 1];  ///< Bind address (null-terminated)
    uint16_t port;                    ///< Gateway port
};

/**
 * @brief Relay engine settings
 *
 * Corresponds to the [relay] section in natrelay.ini.
 *
 * ## INI Keys
 * - `first_port`: Lowest proxy port handed out
 * - `buffer_size`: Receive buffer per relay (max datagram size)
 * - `status_interval`: Seconds between server state dumps (0 = off)
 */
struct RelayConfig {
    uint16_t first_port;          ///< Proxy port allocation base
    uint32_t buffer_size;         ///< Datagram buffer size in bytes
    uint32_t status_interval_s;   ///< State dump interval
};

/**
 * @brief Debug and logging settings
 *
 * Corresponds to the [debug] section in natrelay.ini.
 *
 * ## INI Keys
 * - `enabled`: Enable logging (0/1)
 * - `level`: Log verbosity (0=errors, 1=warnings, 2=info, 3=verbose)
 * - `log_to_file`: Also write logs to file (0/1)
 * - `log_path`: Log file path
 */
struct DebugConfig {
    bool enabled;                         ///< Enable logging
    uint32_t level;                       ///< Log level (0-3)
    bool log_to_file;                     ///< Write logs to file
    char log_path[MAX_PATH_LENGTH + 1];   ///< Log file path (null-terminated)
};

/**
 * @brief Complete configuration
 */
struct Config {
    ServerConfig server;    ///< Gateway settings
    RelayConfig relay;      ///< Relay engine settings
    DebugConfig debug;      ///< Debug/logging settings
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Get configuration with all default values
 *
 * ## Default Values
 * - server.host: "0.0.0.0"
 * - server.port: 50000
 * - relay.first_port: 40001
 * - relay.buffer_size: 1024
 * - relay.status_interval_s: 60
 * - debug.enabled: true
 * - debug.level: 2 (info)
 * - debug.log_to_file: false
 * - debug.log_path: "natrelay.log"
 */
Config get_default_config();

/**
 * @brief Load configuration from INI file
 *
 * Unknown sections and keys are silently ignored. Values that are out of
 * range (port 0, buffer_size 0 or above MAX_BUFFER_SIZE) keep the previous
 * value and make the result ParseError; the rest of the file still applies.
 *
 * @param path Path to configuration file
 * @param[in,out] config Configuration to populate (should be initialized first)
 * @return ConfigResult indicating success or failure type
 */
ConfigResult load_config(const char* path, Config& config);

/**
 * @brief Save configuration to INI file
 *
 * @param path Path to configuration file
 * @param config Configuration to save
 * @return ConfigResult indicating success or failure type
 */
ConfigResult save_config(const char* path, const Config& config);

/**
 * @brief Ensure configuration file exists, create with defaults if not
 *
 * @param path Path to configuration file
 * @return ConfigResult indicating success or failure type
 */
ConfigResult ensure_config_exists(const char* path);

/**
 * @brief Convert ConfigResult to human-readable string
 */
inline const char* config_result_to_string(ConfigResult result) {
    switch (result) {
        case ConfigResult::Success:      return "Success";
        case ConfigResult::FileNotFound: return "FileNotFound";
        case ConfigResult::ParseError:   return "ParseError";
        case ConfigResult::IoError:      return "IoError";
        default:                         return "Unknown";
    }
}

} // namespace natrelay::config
