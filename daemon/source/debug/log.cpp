/**
 * @file log.cpp
 * @brief Debug Logging System Implementation
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "log.hpp"
#include "../config/config.hpp"
#include <cerrno>
#include <cstring>
#include <cstdarg>
#include <ctime>
#include <sys/time.h>

namespace sumo_mitm::debug {

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
 * @brief Wall-clock timestamp, millisecond resolution
 */
void get_timestamp(char* buffer, size_t buffer_size) {
    struct timeval tv;
    gettimeofday(&tv, nullptr);

    struct tm local;
    time_t seconds = tv.tv_sec;
    localtime_r(&seconds, &local);

    snprintf(buffer, buffer_size, "%02d:%02d:%02d.%03ld",
             local.tm_hour, local.tm_min, local.tm_sec,
             static_cast<long>(tv.tv_usec / 1000));
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
    char timestamp[16];
    get_timestamp(timestamp, sizeof(timestamp));

    int prefix_len = snprintf(buffer, buffer_size, "[%s] [%s] ",
                               timestamp, log_level_to_string(level));

    if (prefix_len < 0 || static_cast<size_t>(prefix_len) >= buffer_size) {
        buffer[buffer_size - 1] = '\0';
        return;
    }

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
        std::lock_guard<std::mutex> lock(m_mutex);

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
        m_header_written = false;
    }

    if (m_enabled) {
        log(LogLevel::Info, "Logger initialized (level=%u, file=%s)",
            static_cast<uint32_t>(m_level),
            m_log_to_file ? m_log_path : "disabled");
    }
}

bool Logger::should_log(LogLevel level) const {
    if (!m_enabled) return false;
    return static_cast<uint32_t>(level) <= static_cast<uint32_t>(m_level);
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

    std::lock_guard<std::mutex> lock(m_mutex);
    output_message(message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_console != nullptr) {
        std::fflush(m_console);
    }
    if (m_file != nullptr) {
        std::fflush(m_file);
    }
}

void Logger::set_console(FILE* stream) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console = stream;
}

void Logger::output_message(const char* message) {
    if (m_console != nullptr) {
        std::fprintf(m_console, "%s\n", message);
    }

    if (!m_log_to_file) {
        return;
    }

    // Open file on-demand
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
        // Keep console logging alive, stop retrying the file
        m_log_to_file = false;
        if (m_console != nullptr) {
            std::fprintf(m_console, "Cannot open log file %s: %s\n",
                         m_log_path, std::strerror(errno));
        }
        return;
    }

    // Header once per logger init
    if (!m_header_written) {
        std::fprintf(m_file, "\n=== sumo_mitm Log Started ===\n");
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

} // namespace sumo_mitm::debug
