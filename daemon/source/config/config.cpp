/**
 * @file config.cpp
 * @brief Configuration Manager Implementation
 *
 * Plain C file I/O: the daemon reads its configuration once at startup,
 * before any session thread exists.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "config.hpp"
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstdio>

#include <sys/stat.h>

namespace sumo_mitm::config {

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
 * @brief Parse unsigned integer
 */
uint32_t parse_uint32(const char* value) {
    return static_cast<uint32_t>(std::strtoul(value, nullptr, 10));
}

/**
 * @brief Parse signed integer (port offsets may be negative)
 */
int32_t parse_int32(const char* value) {
    return static_cast<int32_t>(std::strtol(value, nullptr, 10));
}

/**
 * @brief Split a comma list and hand each trimmed, non-empty item to fn
 *
 * @return false if any item was rejected by fn
 */
template <typename Fn>
bool for_each_list_item(const char* value, Fn fn) {
    bool all_ok = true;
    char item[64];

    const char* cursor = value;
    while (*cursor != '\0') {
        const char* comma = std::strchr(cursor, ',');
        size_t len = comma ? static_cast<size_t>(comma - cursor) : std::strlen(cursor);

        if (len >= sizeof(item)) {
            all_ok = false;
        } else {
            std::memcpy(item, cursor, len);
            item[len] = '\0';
            trim_end(item);
            const char* trimmed = trim_start(item);
            if (trimmed[0] != '\0' && !fn(trimmed)) {
                all_ok = false;
            }
        }

        if (!comma) {
            break;
        }
        cursor = comma + 1;
    }

    return all_ok;
}

// Section identifiers
enum class Section {
    None,
    Discovery,
    Handshake,
    Relay,
    Supervisor,
    Debug,
    Unknown
};

/**
 * @brief Identify section from header line
 */
Section parse_section(const char* line) {
    if (std::strcmp(line, "[discovery]") == 0) return Section::Discovery;
    if (std::strcmp(line, "[handshake]") == 0) return Section::Handshake;
    if (std::strcmp(line, "[relay]") == 0) return Section::Relay;
    if (std::strcmp(line, "[supervisor]") == 0) return Section::Supervisor;
    if (std::strcmp(line, "[debug]") == 0) return Section::Debug;
    if (line[0] == '[') return Section::Unknown;
    return Section::None;
}

/**
 * @brief Process a key=value line for discovery section
 * @return false if the value was rejected
 */
bool process_discovery_key(const char* key, const char* value, DiscoveryConfig& config) {
    if (std::strcmp(key, "service_type") == 0) {
        if (value[0] == '\0') {
            return false;
        }
        safe_strcpy(config.service_type, value, MAX_SERVICE_TYPE_LENGTH);
    } else if (std::strcmp(key, "service_name") == 0) {
        if (value[0] == '\0') {
            return false;
        }
        safe_strcpy(config.service_name, value, MAX_SERVICE_NAME_LENGTH);
    } else if (std::strcmp(key, "timeout") == 0) {
        config.timeout_ms = parse_uint32(value);
    } else if (std::strcmp(key, "announce_addresses") == 0) {
        config.announce_address_count = 0;
        return for_each_list_item(value, [&config](const char* item) {
            uint32_t address = 0;
            if (config.announce_address_count >= MAX_ANNOUNCE_ADDRESSES ||
                !network::parse_ipv4(item, address)) {
                return false;
            }
            config.announce_addresses[config.announce_address_count++] = address;
            return true;
        });
    }
    return true;
}

/**
 * @brief Process a key=value line for handshake section
 */
bool process_handshake_key(const char* key, const char* value, HandshakeConfig& config) {
    if (std::strcmp(key, "listen_address") == 0) {
        uint32_t address = network::ANY_ADDRESS;
        if (value[0] != '\0' && !network::parse_ipv4(value, address)) {
            return false;
        }
        config.listen_address = address;
    } else if (std::strcmp(key, "timeout") == 0) {
        config.timeout_ms = parse_uint32(value);
    } else if (std::strcmp(key, "io_timeout") == 0) {
        config.io_timeout_ms = parse_uint32(value);
    } else if (std::strcmp(key, "port_policy") == 0) {
        if (std::strcmp(value, "offset") == 0) {
            config.port_policy = PortPolicyMode::Offset;
        } else if (std::strcmp(value, "passthrough") == 0) {
            config.port_policy = PortPolicyMode::Passthrough;
        } else {
            return false;
        }
    } else if (std::strcmp(key, "client_port_offset") == 0) {
        config.client_port_offset = parse_int32(value);
    } else if (std::strcmp(key, "device_port_offset") == 0) {
        config.device_port_offset = parse_int32(value);
    }
    return true;
}

/**
 * @brief Process a key=value line for relay section
 */
bool process_relay_key(const char* key, const char* value, RelayConfig& config) {
    if (std::strcmp(key, "max_datagram_size") == 0) {
        uint32_t size = parse_uint32(value);
        if (size == 0 || size > MAX_DATAGRAM_SIZE_LIMIT) {
            return false;
        }
        config.max_datagram_size = size;
    } else if (std::strcmp(key, "check_interval") == 0) {
        uint32_t interval = parse_uint32(value);
        if (interval == 0) {
            return false;
        }
        config.check_interval_ms = interval;
    } else if (std::strcmp(key, "max_silence") == 0) {
        config.max_silence_ms = parse_uint32(value);
    } else if (std::strcmp(key, "observers") == 0) {
        config.observer_count = 0;
        return for_each_list_item(value, [&config](const char* item) {
            network::Endpoint endpoint{};
            if (config.observer_count >= MAX_OBSERVER_SINKS ||
                !network::parse_endpoint(item, endpoint)) {
                return false;
            }
            config.observers[config.observer_count++] = endpoint;
            return true;
        });
    }
    return true;
}

/**
 * @brief Process a key=value line for supervisor section
 */
bool process_supervisor_key(const char* key, const char* value, SupervisorConfig& config) {
    if (std::strcmp(key, "restart_delay") == 0) {
        config.restart_delay_ms = parse_uint32(value);
    } else if (std::strcmp(key, "max_restart_delay") == 0) {
        config.max_restart_delay_ms = parse_uint32(value);
    }
    return true;
}

/**
 * @brief Process a key=value line for debug section
 */
bool process_debug_key(const char* key, const char* value, DebugConfig& config) {
    if (std::strcmp(key, "enabled") == 0) {
        config.enabled = parse_bool(value);
    } else if (std::strcmp(key, "level") == 0) {
        config.level = parse_uint32(value);
    } else if (std::strcmp(key, "log_to_file") == 0) {
        config.log_to_file = parse_bool(value);
    } else if (std::strcmp(key, "log_path") == 0) {
        safe_strcpy(config.log_path, value, MAX_LOG_PATH_LENGTH);
    }
    return true;
}

/**
 * @brief Write a comma list of addresses or endpoints
 */
void write_address_list(FILE* file, const uint32_t* addresses, size_t count) {
    char ip[network::IPV4_STRING_LENGTH];
    for (size_t i = 0; i < count; i++) {
        std::fprintf(file, "%s%s", i > 0 ? ", " : "",
                     network::format_ipv4(addresses[i], ip, sizeof(ip)));
    }
}

void write_endpoint_list(FILE* file, const network::Endpoint* endpoints, size_t count) {
    char ip[network::IPV4_STRING_LENGTH];
    for (size_t i = 0; i < count; i++) {
        std::fprintf(file, "%s%s:%u", i > 0 ? ", " : "",
                     network::format_ipv4(endpoints[i].address, ip, sizeof(ip)),
                     endpoints[i].port);
    }
}

/**
 * @brief mkdir -p for the parent directory of path
 */
bool ensure_parent_directory(const char* path) {
    char dir_path[MAX_LOG_PATH_LENGTH + 1];
    safe_strcpy(dir_path, path, sizeof(dir_path) - 1);

    char* last_slash = std::strrchr(dir_path, '/');
    if (!last_slash || last_slash == dir_path) {
        return true;
    }
    *last_slash = '\0';

    for (char* p = dir_path + 1; *p != '\0'; p++) {
        if (*p == '/') {
            *p = '\0';
            if (mkdir(dir_path, 0755) != 0 && errno != EEXIST) {
                return false;
            }
            *p = '/';
        }
    }

    return mkdir(dir_path, 0755) == 0 || errno == EEXIST;
}

} // anonymous namespace

// ============================================================================
// Public Functions
// ============================================================================

Config get_default_config() {
    Config config{};

    // Discovery defaults
    safe_strcpy(config.discovery.service_type, DEFAULT_SERVICE_TYPE, MAX_SERVICE_TYPE_LENGTH);
    safe_strcpy(config.discovery.service_name, DEFAULT_SERVICE_NAME, MAX_SERVICE_NAME_LENGTH);
    config.discovery.timeout_ms = DEFAULT_DISCOVERY_TIMEOUT_MS;
    config.discovery.announce_address_count = 0;

    // Handshake defaults
    config.handshake.listen_address = network::ANY_ADDRESS;
    config.handshake.timeout_ms = DEFAULT_HANDSHAKE_TIMEOUT_MS;
    config.handshake.io_timeout_ms = DEFAULT_HANDSHAKE_IO_TIMEOUT_MS;
    config.handshake.port_policy = PortPolicyMode::Offset;
    config.handshake.client_port_offset = DEFAULT_CLIENT_PORT_OFFSET;
    config.handshake.device_port_offset = DEFAULT_DEVICE_PORT_OFFSET;

    // Relay defaults
    config.relay.max_datagram_size = DEFAULT_MAX_DATAGRAM_SIZE;
    config.relay.check_interval_ms = DEFAULT_CHECK_INTERVAL_MS;
    config.relay.max_silence_ms = DEFAULT_MAX_SILENCE_MS;
    config.relay.observer_count = 0;

    // Supervisor defaults
    config.supervisor.restart_delay_ms = DEFAULT_RESTART_DELAY_MS;
    config.supervisor.max_restart_delay_ms = DEFAULT_MAX_RESTART_DELAY_MS;

    // Debug defaults
    config.debug.enabled = DEFAULT_DEBUG_ENABLED;
    config.debug.level = DEFAULT_DEBUG_LEVEL;
    config.debug.log_to_file = DEFAULT_LOG_TO_FILE;
    config.debug.log_path[0] = '\0';

    return config;
}

ConfigResult load_config(const char* path, Config& config) {
    FILE* file = std::fopen(path, "r");
    if (!file) {
        return errno == ENOENT ? ConfigResult::FileNotFound : ConfigResult::IoError;
    }

    char line[512];
    Section current_section = Section::None;
    bool rejected = false;

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
            rejected = true;
            continue;
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
            case Section::Discovery:
                accepted = process_discovery_key(key_buf, trimmed_value, config.discovery);
                break;
            case Section::Handshake:
                accepted = process_handshake_key(key_buf, trimmed_value, config.handshake);
                break;
            case Section::Relay:
                accepted = process_relay_key(key_buf, trimmed_value, config.relay);
                break;
            case Section::Supervisor:
                accepted = process_supervisor_key(key_buf, trimmed_value, config.supervisor);
                break;
            case Section::Debug:
                accepted = process_debug_key(key_buf, trimmed_value, config.debug);
                break;
            default:
                break;
        }

        if (!accepted) {
            rejected = true;
        }
    }

    bool read_error = std::ferror(file) != 0;
    std::fclose(file);

    if (read_error) {
        return ConfigResult::IoError;
    }
    return rejected ? ConfigResult::ParseError : ConfigResult::Success;
}

ConfigResult save_config(const char* path, const Config& config) {
    if (!ensure_parent_directory(path)) {
        return ConfigResult::IoError;
    }

    char ip[network::IPV4_STRING_LENGTH];

    FILE* file = std::fopen(path, "w");
    if (!file) {
        return ConfigResult::IoError;
    }

    std::fprintf(file, "; sumo_mitm Configuration\n");
    std::fprintf(file, "; Auto-generated on first start\n");
    std::fprintf(file, "; Edit this file to customize settings\n\n");

    std::fprintf(file, "[discovery]\n");
    std::fprintf(file, "; mDNS service type of the device\n");
    std::fprintf(file, "service_type = %s\n", config.discovery.service_type);
    std::fprintf(file, "; Prefix of the announced proxy name\n");
    std::fprintf(file, "service_name = %s\n", config.discovery.service_name);
    std::fprintf(file, "; Device locate timeout in milliseconds\n");
    std::fprintf(file, "timeout = %u\n", config.discovery.timeout_ms);
    std::fprintf(file, "; Addresses to announce on (empty = all local IPv4)\n");
    std::fprintf(file, "announce_addresses = ");
    write_address_list(file, config.discovery.announce_addresses,
                       config.discovery.announce_address_count);
    std::fprintf(file, "\n\n");

    std::fprintf(file, "[handshake]\n");
    std::fprintf(file, "; Local address to listen on (0.0.0.0 = all)\n");
    std::fprintf(file, "listen_address = %s\n",
                 network::format_ipv4(config.handshake.listen_address, ip, sizeof(ip)));
    std::fprintf(file, "; Wait for the client connection in milliseconds\n");
    std::fprintf(file, "timeout = %u\n", config.handshake.timeout_ms);
    std::fprintf(file, "; Connect/read timeout per TCP leg in milliseconds\n");
    std::fprintf(file, "io_timeout = %u\n", config.handshake.io_timeout_ms);
    std::fprintf(file, "; offset or passthrough\n");
    std::fprintf(file, "port_policy = %s\n", port_policy_to_string(config.handshake.port_policy));
    std::fprintf(file, "client_port_offset = %d\n", config.handshake.client_port_offset);
    std::fprintf(file, "device_port_offset = %d\n\n", config.handshake.device_port_offset);

    std::fprintf(file, "[relay]\n");
    std::fprintf(file, "; Receive buffer size in bytes\n");
    std::fprintf(file, "max_datagram_size = %u\n", config.relay.max_datagram_size);
    std::fprintf(file, "; Watchdog check interval in milliseconds\n");
    std::fprintf(file, "check_interval = %u\n", config.relay.check_interval_ms);
    std::fprintf(file, "; Allowed silence before the session restarts\n");
    std::fprintf(file, "max_silence = %u\n", config.relay.max_silence_ms);
    std::fprintf(file, "; Mirror sinks, comma separated ip:port\n");
    std::fprintf(file, "observers = ");
    write_endpoint_list(file, config.relay.observers, config.relay.observer_count);
    std::fprintf(file, "\n\n");

    std::fprintf(file, "[supervisor]\n");
    std::fprintf(file, "; Delay before restarting a session in milliseconds\n");
    std::fprintf(file, "restart_delay = %u\n", config.supervisor.restart_delay_ms);
    std::fprintf(file, "; Backoff cap in milliseconds\n");
    std::fprintf(file, "max_restart_delay = %u\n\n", config.supervisor.max_restart_delay_ms);

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
    if (stat(path, &st) == 0 && S_ISREG(st.st_mode)) {
        return ConfigResult::Success;  // File already exists
    }

    // File doesn't exist, create with defaults
    Config default_config = get_default_config();
    return save_config(path, default_config);
}

} // namespace sumo_mitm::config
