/**
 * @file log.hpp
 * @brief Debug Logging System for sumo_mitm
 *
 * Provides configurable logging for the interception daemon. Supports
 * multiple log levels, console output, and optional file logging.
 *
 * ## Design Principles
 *
 * 1. **Cheap When Filtered**: The logging macros test the level before
 *    formatting, so filtered messages cost one comparison.
 *
 * 2. **No Dynamic Allocation**: Messages are formatted into fixed-size
 *    stack buffers.
 *
 * 3. **Thread-Safe**: Relay listeners, the watchdog and the mDNS receive
 *    thread log concurrently. Output is serialized by a mutex so lines
 *    never interleave.
 *
 * 4. **Configurable at Runtime**: Log level and file output come from the
 *    [debug] section of config.ini.
 *
 * ## Log Levels
 *
 * - **Error (0)**: Session failures, socket errors
 * - **Warning (1)**: Recoverable problems (dropped sends, bad config lines)
 * - **Info (2)**: Session lifecycle (device found, handshake, relay start)
 * - **Verbose (3)**: Per-datagram and per-packet detail
 *
 * ## Usage Example
 *
 * @code
 * #include "debug/log.hpp"
 *
 * sumo_mitm::debug::g_logger.init(config.debug);
 *
 * LOG_ERROR("Bind failed on port %u: %s", port, reason);
 * LOG_INFO("Device found at %s:%u", ip, port);
 * LOG_VERBOSE("c2d datagram: %zu bytes", size);
 * @endcode
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdarg>
#include <cstdio>
#include <mutex>

// Forward declaration to avoid circular include
namespace sumo_mitm::config {
    struct DebugConfig;
}

namespace sumo_mitm::debug {

// =============================================================================
// Constants
// =============================================================================

/** @brief Maximum length of a single log message */
constexpr size_t MAX_LOG_MESSAGE_LENGTH = 512;

/** @brief Maximum length of the log file path */
constexpr size_t MAX_LOG_PATH_LENGTH = 256;

/** @brief Default log file path */
constexpr const char* DEFAULT_LOG_PATH = "/var/log/sumo_mitm.log";

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
    Error = 0,      ///< Critical errors
    Warning = 1,    ///< Warnings (potential issues)
    Info = 2,       ///< Informational messages
    Verbose = 3     ///< Detailed debug output
};

/**
 * @brief Convert LogLevel to human-readable string
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
 * Output format: `[HH:MM:SS.mmm] [LEVEL] message`
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
 * Handles formatting, level filtering, and output to console and/or file.
 * Until init() is called the logger is enabled at Warning level so early
 * startup problems are still reported.
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
     * @param config Debug configuration from config.ini
     */
    void init(const config::DebugConfig& config);

    /**
     * @brief Check if logging is enabled
     */
    bool is_enabled() const { return m_enabled; }

    /**
     * @brief Get current log level
     */
    LogLevel get_level() const { return m_level; }

    /**
     * @brief Check if a message at given level should be logged
     */
    bool should_log(LogLevel level) const;

    /**
     * @brief Log a message
     */
    void log(LogLevel level, const char* format, ...)
        __attribute__((format(printf, 3, 4)));

    /**
     * @brief Log a message with va_list
     */
    void log_v(LogLevel level, const char* format, va_list args);

    /**
     * @brief Flush any buffered output to file
     */
    void flush();

    /**
     * @brief Redirect console output (tests capture into a memory stream)
     *
     * @param stream Destination stream, or nullptr to silence console output
     */
    void set_console(FILE* stream);

private:
    void output_message(const char* message);
    void open_file();
    void close_file();

    bool m_enabled = true;
    LogLevel m_level = LogLevel::Warning;
    bool m_log_to_file = false;
    char m_log_path[MAX_LOG_PATH_LENGTH] = {0};
    FILE* m_console = stdout;
    FILE* m_file = nullptr;
    bool m_header_written = false;
    std::mutex m_mutex;
};

// =============================================================================
// Global Logger Instance
// =============================================================================

/**
 * @brief Global logger instance
 *
 * Initialize once at startup with g_logger.init(config.debug).
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
        if (sumo_mitm::debug::g_logger.should_log(sumo_mitm::debug::LogLevel::Error)) { \
            sumo_mitm::debug::g_logger.log(sumo_mitm::debug::LogLevel::Error, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

/**
 * @brief Log a warning message
 */
#define LOG_WARN(fmt, ...) \
    do { \
        if (sumo_mitm::debug::g_logger.should_log(sumo_mitm::debug::LogLevel::Warning)) { \
            sumo_mitm::debug::g_logger.log(sumo_mitm::debug::LogLevel::Warning, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

/**
 * @brief Log an info message
 */
#define LOG_INFO(fmt, ...) \
    do { \
        if (sumo_mitm::debug::g_logger.should_log(sumo_mitm::debug::LogLevel::Info)) { \
            sumo_mitm::debug::g_logger.log(sumo_mitm::debug::LogLevel::Info, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

/**
 * @brief Log a verbose debug message
 */
#define LOG_VERBOSE(fmt, ...) \
    do { \
        if (sumo_mitm::debug::g_logger.should_log(sumo_mitm::debug::LogLevel::Verbose)) { \
            sumo_mitm::debug::g_logger.log(sumo_mitm::debug::LogLevel::Verbose, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

} // namespace sumo_mitm::debug
