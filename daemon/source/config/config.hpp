/**
 * @file config.hpp
 * @brief Configuration Manager for sumo_mitm
 *
 * This module handles loading and parsing of INI configuration files.
 * It provides all runtime settings for the daemon: discovery and
 * announcement parameters, handshake timeouts and port policy, relay
 * sizing and observers, restart pacing, and debug options.
 *
 * ## Design Principles
 *
 * 1. **No Dynamic Allocation**: All strings and lists use fixed-size
 *    buffers; a Config is a plain value that can be copied freely.
 *
 * 2. **Safe Defaults**: If the config file is missing or malformed,
 *    sensible defaults are used so the daemon can still function.
 *
 * 3. **Simple INI Format**: Standard INI syntax with [sections] and key=value
 *    pairs. Comments start with ; or #.
 *
 * ## Configuration File Location
 *
 * Default: `/etc/sumo_mitm/config.ini` (overridable on the command line)
 *
 * ## Supported Sections
 *
 * - `[discovery]`: mDNS service type, announced name, locate timeout,
 *   announce addresses
 * - `[handshake]`: Accept/IO timeouts, port policy
 * - `[relay]`: Datagram size, watchdog timing, observer sinks
 * - `[supervisor]`: Restart delay and backoff cap
 * - `[debug]`: Logging configuration
 *
 * ## Usage Example
 *
 * @code
 * #include "config/config.hpp"
 *
 * using namespace sumo_mitm::config;
 *
 * Config config = get_default_config();
 * ConfigResult result = load_config("/etc/sumo_mitm/config.ini", config);
 *
 * if (result == ConfigResult::FileNotFound) {
 *     printf("Using default config\n");
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include "../network/address.hpp"

namespace sumo_mitm::config {

// =============================================================================
// Constants
// =============================================================================

/**
 * @brief Maximum length of an mDNS service type (excluding null terminator)
 *
 * e.g. "_arsdk-0902._udp.local."
 */
constexpr size_t MAX_SERVICE_TYPE_LENGTH = 64;

/**
 * @brief Maximum length of the announced instance name prefix
 *
 * The full instance name is "<prefix>-a-b-c-d", which must fit a single
 * 63-byte DNS label.
 */
constexpr size_t MAX_SERVICE_NAME_LENGTH = 32;

/** @brief Maximum number of explicitly configured announce addresses */
constexpr size_t MAX_ANNOUNCE_ADDRESSES = 8;

/** @brief Maximum number of observer sinks */
constexpr size_t MAX_OBSERVER_SINKS = 8;

/** @brief Maximum length of the log file path (excluding null terminator) */
constexpr size_t MAX_LOG_PATH_LENGTH = 255;

/** @brief Default configuration file path */
constexpr const char* CONFIG_PATH = "/etc/sumo_mitm/config.ini";

// -----------------------------------------------------------------------------
// Default Values - Discovery
// -----------------------------------------------------------------------------

/** @brief Service type advertised by ARSDK 0x0902 devices (Jumping Sumo) */
constexpr const char* DEFAULT_SERVICE_TYPE = "_arsdk-0902._udp.local.";

/** @brief Prefix of the announced proxy instance name */
constexpr const char* DEFAULT_SERVICE_NAME = "Sumo";

/** @brief Default device locate timeout (30 seconds) */
constexpr uint32_t DEFAULT_DISCOVERY_TIMEOUT_MS = 30000;

// -----------------------------------------------------------------------------
// Default Values - Handshake
// -----------------------------------------------------------------------------

/** @brief Default wait for the client's handshake connection (30 seconds) */
constexpr uint32_t DEFAULT_HANDSHAKE_TIMEOUT_MS = 30000;

/** @brief Default connect/read timeout on the handshake TCP legs */
constexpr uint32_t DEFAULT_HANDSHAKE_IO_TIMEOUT_MS = 5000;

/** @brief Default offset applied to the client's d2c_port */
constexpr int32_t DEFAULT_CLIENT_PORT_OFFSET = 1;

/** @brief Default offset applied to the device's c2d_port */
constexpr int32_t DEFAULT_DEVICE_PORT_OFFSET = -1;

// -----------------------------------------------------------------------------
// Default Values - Relay
// -----------------------------------------------------------------------------

/** @brief Default receive buffer size per datagram */
constexpr uint32_t DEFAULT_MAX_DATAGRAM_SIZE = 65000;

/** @brief Largest datagram a UDP/IPv4 socket can deliver */
constexpr uint32_t MAX_DATAGRAM_SIZE_LIMIT = 65535;

/** @brief Default watchdog check interval */
constexpr uint32_t DEFAULT_CHECK_INTERVAL_MS = 1000;

/** @brief Default allowed silence before a session is declared dead */
constexpr uint32_t DEFAULT_MAX_SILENCE_MS = 1000;

// -----------------------------------------------------------------------------
// Default Values - Supervisor
// -----------------------------------------------------------------------------

/** @brief Default delay before restarting a failed session */
constexpr uint32_t DEFAULT_RESTART_DELAY_MS = 1000;

/** @brief Default cap on the restart delay after repeated failures */
constexpr uint32_t DEFAULT_MAX_RESTART_DELAY_MS = 10000;

// -----------------------------------------------------------------------------
// Default Values - Debug
// -----------------------------------------------------------------------------

/** @brief Default debug logging state */
constexpr bool DEFAULT_DEBUG_ENABLED = true;

/** @brief Default debug log level (2 = info) */
constexpr uint32_t DEFAULT_DEBUG_LEVEL = 2;

/** @brief Default file logging state */
constexpr bool DEFAULT_LOG_TO_FILE = false;

// =============================================================================
// Result Codes
// =============================================================================

/**
 * @brief Result codes for configuration operations
 */
enum class ConfigResult {
    Success = 0,       ///< Configuration loaded successfully
    FileNotFound,      ///< Configuration file does not exist
    ParseError,        ///< File loaded but some values were rejected
    IoError            ///< File I/O error (permissions, disk full, etc.)
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief How proxy ports are derived from the negotiated ports
 */
enum class PortPolicyMode : uint8_t {
    Offset,         ///< Shift each negotiated port by a configured offset
    Passthrough     ///< Reuse negotiated ports unchanged (proxy on its own host)
};

/**
 * @brief Discovery and announcement settings
 *
 * Corresponds to the [discovery] section in config.ini.
 *
 * ## INI Keys
 * - `service_type`: mDNS service type to browse and announce
 * - `service_name`: Prefix of the announced instance name
 * - `timeout`: Locate timeout in milliseconds
 * - `announce_addresses`: Comma list of IPv4 addresses (empty = all local)
 */
struct DiscoveryConfig {
    char service_type[MAX_SERVICE_TYPE_LENGTH + 1];   ///< e.g. "_arsdk-0902._udp.local."
    char service_name[MAX_SERVICE_NAME_LENGTH + 1];   ///< e.g. "Sumo"
    uint32_t timeout_ms;                              ///< Locate timeout
    uint32_t announce_addresses[MAX_ANNOUNCE_ADDRESSES]; ///< Host order
    size_t announce_address_count;                    ///< 0 = enumerate interfaces
};

/**
 * @brief Handshake interception settings
 *
 * Corresponds to the [handshake] section in config.ini.
 *
 * ## INI Keys
 * - `listen_address`: Local address for the handshake and relay listeners
 * - `timeout`: Wait for the client connection, in milliseconds
 * - `io_timeout`: Connect/read timeout on each TCP leg
 * - `port_policy`: `offset` or `passthrough`
 * - `client_port_offset`: Added to d2c_port (offset policy)
 * - `device_port_offset`: Added to c2d_port (offset policy)
 */
struct HandshakeConfig {
    uint32_t listen_address;        ///< Host order, 0 = all interfaces
    uint32_t timeout_ms;            ///< Accept timeout
    uint32_t io_timeout_ms;         ///< Per-operation TCP timeout
    PortPolicyMode port_policy;     ///< Proxy port derivation
    int32_t client_port_offset;     ///< Default +1
    int32_t device_port_offset;     ///< Default -1
};

/**
 * @brief Relay and watchdog settings
 *
 * Corresponds to the [relay] section in config.ini.
 *
 * ## INI Keys
 * - `max_datagram_size`: Receive buffer size (1..65535)
 * - `check_interval`: Watchdog check period in milliseconds
 * - `max_silence`: Allowed gap between datagrams in milliseconds
 * - `observers`: Comma list of `ip:port` mirror sinks
 */
struct RelayConfig {
    uint32_t max_datagram_size;                         ///< Bytes
    uint32_t check_interval_ms;                         ///< Watchdog period
    uint32_t max_silence_ms;                            ///< Expiry threshold
    network::Endpoint observers[MAX_OBSERVER_SINKS];    ///< Mirror sinks
    size_t observer_count;                              ///< Valid entries
};

/**
 * @brief Restart loop settings
 *
 * Corresponds to the [supervisor] section in config.ini.
 *
 * ## INI Keys
 * - `restart_delay`: Initial delay between sessions in milliseconds
 * - `max_restart_delay`: Backoff cap in milliseconds
 */
struct SupervisorConfig {
    uint32_t restart_delay_ms;      ///< Initial restart delay
    uint32_t max_restart_delay_ms;  ///< Backoff cap
};

/**
 * @brief Debug and logging settings
 *
 * Corresponds to the [debug] section in config.ini.
 *
 * ## INI Keys
 * - `enabled`: Enable logging (0/1)
 * - `level`: Log verbosity (0=errors, 1=warnings, 2=info, 3=verbose)
 * - `log_to_file`: Also write logs to file (0/1)
 * - `log_path`: Log file path (empty = /var/log/sumo_mitm.log)
 */
struct DebugConfig {
    bool enabled;                               ///< Enable logging
    uint32_t level;                             ///< Log level (0-3)
    bool log_to_file;                           ///< Write logs to file
    char log_path[MAX_LOG_PATH_LENGTH + 1];     ///< Log file path
};

/**
 * @brief Complete configuration
 *
 * Use get_default_config() to initialize with defaults, then
 * load_config() to override with file settings.
 */
struct Config {
    DiscoveryConfig discovery;      ///< Discovery/announcement settings
    HandshakeConfig handshake;      ///< Handshake interception settings
    RelayConfig relay;              ///< Relay/watchdog settings
    SupervisorConfig supervisor;    ///< Restart loop settings
    DebugConfig debug;              ///< Debug/logging settings
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Get configuration with all default values
 *
 * ## Default Values
 * - discovery.service_type: "_arsdk-0902._udp.local."
 * - discovery.service_name: "Sumo"
 * - discovery.timeout_ms: 30000
 * - discovery.announce_address_count: 0 (all local addresses)
 * - handshake.listen_address: 0.0.0.0
 * - handshake.timeout_ms: 30000
 * - handshake.io_timeout_ms: 5000
 * - handshake.port_policy: Offset (+1 / -1)
 * - relay.max_datagram_size: 65000
 * - relay.check_interval_ms / max_silence_ms: 1000
 * - relay.observer_count: 0
 * - supervisor.restart_delay_ms: 1000, max_restart_delay_ms: 10000
 * - debug.enabled: true, level: 2, log_to_file: false
 */
Config get_default_config();

/**
 * @brief Load configuration from INI file
 *
 * Parses an INI file and populates the config structure.
 * Unknown sections and keys are silently ignored. Values that fail
 * validation (a malformed observer endpoint, an out-of-range datagram
 * size, an unknown port policy) keep their previous value and make the
 * call return ParseError; every other key is still applied.
 *
 * @param path Path to configuration file
 * @param[in,out] config Configuration to populate (should be initialized first)
 * @return ConfigResult indicating success or failure type
 */
ConfigResult load_config(const char* path, Config& config);

/**
 * @brief Save configuration to INI file
 *
 * Creates the parent directory if it doesn't exist.
 */
ConfigResult save_config(const char* path, const Config& config);

/**
 * @brief Ensure configuration file exists, create with defaults if not
 */
ConfigResult ensure_config_exists(const char* path);

/**
 * @brief Convert PortPolicyMode to its INI spelling
 */
inline const char* port_policy_to_string(PortPolicyMode mode) {
    switch (mode) {
        case PortPolicyMode::Offset:      return "offset";
        case PortPolicyMode::Passthrough: return "passthrough";
        default:                          return "unknown";
    }
}

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

} // namespace sumo_mitm::config
