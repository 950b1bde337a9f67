/**
 * @file log_tests.cpp
 * @brief Unit tests for the logging system
 *
 * Tests for log levels, message formatting, console capture and file
 * output driven by the [debug] configuration section.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "test_framework.hpp"
#include "debug/log.hpp"
#include "config/config.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace sumo_mitm::debug;
using namespace sumo_mitm::config;

namespace {

std::string read_stream(FILE* stream) {
    std::fflush(stream);
    std::rewind(stream);

    std::string content;
    char buffer[512];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        content.append(buffer, n);
    }
    return content;
}

std::string read_file(const char* path) {
    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

size_t count_lines(const std::string& text) {
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') {
            lines++;
        }
    }
    return lines;
}

DebugConfig console_config(uint32_t level) {
    DebugConfig config{};
    config.enabled = true;
    config.level = level;
    config.log_to_file = false;
    return config;
}

} // anonymous namespace

// ============================================================================
// Log Level Tests
// ============================================================================

TEST(log_level_to_string) {
    ASSERT_STREQ(log_level_to_string(LogLevel::Error), "ERROR");
    ASSERT_STREQ(log_level_to_string(LogLevel::Warning), "WARN");
    ASSERT_STREQ(log_level_to_string(LogLevel::Info), "INFO");
    ASSERT_STREQ(log_level_to_string(LogLevel::Verbose), "VERBOSE");
}

TEST(log_level_values_match_config) {
    ASSERT_EQ(static_cast<uint32_t>(LogLevel::Error), 0u);
    ASSERT_EQ(static_cast<uint32_t>(LogLevel::Warning), 1u);
    ASSERT_EQ(static_cast<uint32_t>(LogLevel::Info), 2u);
    ASSERT_EQ(static_cast<uint32_t>(LogLevel::Verbose), 3u);
}

// ============================================================================
// Formatting Tests
// ============================================================================

TEST(format_has_timestamp_and_level) {
    char buffer[256];
    format_log_message(buffer, sizeof(buffer), LogLevel::Warning, "port %u", 54321u);

    std::string line(buffer);
    ASSERT_EQ(line[0], '[');
    ASSERT_TRUE(line.find("] [WARN] port 54321") != std::string::npos);
}

TEST(format_truncates_to_buffer) {
    char buffer[24];
    format_log_message(buffer, sizeof(buffer), LogLevel::Info, "%s",
                       "a message much longer than the buffer");
    ASSERT_TRUE(std::strlen(buffer) < sizeof(buffer));
}

// ============================================================================
// Logger Tests
// ============================================================================

TEST(logger_init_disabled) {
    DebugConfig config = console_config(3);
    config.enabled = false;

    Logger logger;
    logger.init(config);

    ASSERT_FALSE(logger.is_enabled());
    ASSERT_FALSE(logger.should_log(LogLevel::Error));
}

TEST(logger_level_clamped) {
    FILE* capture = std::tmpfile();
    ASSERT_TRUE(capture != nullptr);

    Logger logger;
    logger.set_console(capture);
    logger.init(console_config(9));
    std::fclose(capture);

    ASSERT_EQ(logger.get_level(), LogLevel::Verbose);
}

TEST(logger_filters_by_level) {
    FILE* capture = std::tmpfile();
    ASSERT_TRUE(capture != nullptr);

    Logger logger;
    logger.set_console(capture);
    logger.init(console_config(1));

    logger.log(LogLevel::Error, "first");
    logger.log(LogLevel::Warning, "second");
    logger.log(LogLevel::Info, "hidden info");
    logger.log(LogLevel::Verbose, "hidden verbose");

    std::string output = read_stream(capture);
    std::fclose(capture);

    ASSERT_TRUE(output.find("[ERROR] first") != std::string::npos);
    ASSERT_TRUE(output.find("[WARN] second") != std::string::npos);
    ASSERT_TRUE(output.find("hidden") == std::string::npos);
}

TEST(logger_concurrent_lines_not_interleaved) {
    FILE* capture = std::tmpfile();
    ASSERT_TRUE(capture != nullptr);

    Logger logger;
    logger.set_console(capture);
    logger.init(console_config(0));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < 50; i++) {
                logger.log(LogLevel::Error, "thread %d line %d", t, i);
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    std::string output = read_stream(capture);
    std::fclose(capture);

    ASSERT_EQ(count_lines(output), 200u);
}

TEST(logger_writes_file) {
    char path[128];
    snprintf(path, sizeof(path), "/tmp/sumo_mitm_log_%d.log", static_cast<int>(getpid()));
    std::remove(path);

    DebugConfig config = console_config(2);
    config.log_to_file = true;
    snprintf(config.log_path, sizeof(config.log_path), "%s", path);

    {
        Logger logger;
        logger.set_console(nullptr);
        logger.init(config);
        logger.log(LogLevel::Info, "Session #%u failed at stage %s: %s", 3u, "Relay", "SessionInactive");
        logger.flush();
    }

    std::string content = read_file(path);
    std::remove(path);

    ASSERT_TRUE(content.find("=== sumo_mitm Log Started ===") != std::string::npos);
    ASSERT_TRUE(content.find("Session #3 failed at stage Relay: SessionInactive") != std::string::npos);
}

TEST(logger_unwritable_file_keeps_console) {
    FILE* capture = std::tmpfile();
    ASSERT_TRUE(capture != nullptr);

    DebugConfig config = console_config(2);
    config.log_to_file = true;
    snprintf(config.log_path, sizeof(config.log_path), "%s", "/nonexistent_dir/sumo.log");

    Logger logger;
    logger.set_console(capture);
    logger.init(config);
    logger.log(LogLevel::Info, "still here");

    std::string output = read_stream(capture);
    std::fclose(capture);

    ASSERT_TRUE(output.find("Cannot open log file") != std::string::npos);
    ASSERT_TRUE(output.find("still here") != std::string::npos);
}

int main() {
    return run_all_tests("Logging");
}
