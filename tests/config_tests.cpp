/**
 * @file config_tests.cpp
 * @brief Unit tests for the INI configuration loader
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "test_framework.hpp"
#include "config/config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace sumo_mitm::config;

namespace {

// Helper to create temp config file
class TempConfigFile {
public:
    explicit TempConfigFile(const char* content) {
        snprintf(m_path, sizeof(m_path), "/tmp/sumo_mitm_config_%d_%d.ini",
                 static_cast<int>(getpid()), rand());
        std::ofstream f(m_path);
        if (f.is_open()) {
            f << content;
            f.close();
        }
    }

    ~TempConfigFile() {
        std::remove(m_path);
    }

    const char* path() const { return m_path; }

private:
    char m_path[256];
};

} // anonymous namespace

// ============================================================================
// Default Values Tests
// ============================================================================

TEST(default_values) {
    Config config = get_default_config();

    ASSERT_STREQ(config.discovery.service_type, "_arsdk-0902._udp.local.");
    ASSERT_STREQ(config.discovery.service_name, "Sumo");
    ASSERT_EQ(config.discovery.timeout_ms, 30000u);
    ASSERT_EQ(config.discovery.announce_address_count, 0u);

    ASSERT_EQ(config.handshake.listen_address, 0u);
    ASSERT_EQ(config.handshake.timeout_ms, 30000u);
    ASSERT_EQ(config.handshake.io_timeout_ms, 5000u);
    ASSERT_EQ(config.handshake.port_policy, PortPolicyMode::Offset);
    ASSERT_EQ(config.handshake.client_port_offset, 1);
    ASSERT_EQ(config.handshake.device_port_offset, -1);

    ASSERT_EQ(config.relay.max_datagram_size, 65000u);
    ASSERT_EQ(config.relay.check_interval_ms, 1000u);
    ASSERT_EQ(config.relay.max_silence_ms, 1000u);
    ASSERT_EQ(config.relay.observer_count, 0u);

    ASSERT_EQ(config.supervisor.restart_delay_ms, 1000u);
    ASSERT_EQ(config.supervisor.max_restart_delay_ms, 10000u);

    ASSERT_EQ(config.debug.enabled, true);
    ASSERT_EQ(config.debug.level, 2u);
    ASSERT_EQ(config.debug.log_to_file, false);
}

// ============================================================================
// Parse Tests
// ============================================================================

TEST(parse_empty_file) {
    TempConfigFile file("");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_STREQ(config.discovery.service_type, "_arsdk-0902._udp.local.");
}

TEST(parse_discovery_section) {
    TempConfigFile file(
        "[discovery]\n"
        "service_type = _arsdk-0905._udp.local.\n"
        "service_name = Proxy\n"
        "timeout = 5000\n"
        "announce_addresses = 192.168.2.10, 10.0.0.1\n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_STREQ(config.discovery.service_type, "_arsdk-0905._udp.local.");
    ASSERT_STREQ(config.discovery.service_name, "Proxy");
    ASSERT_EQ(config.discovery.timeout_ms, 5000u);
    ASSERT_EQ(config.discovery.announce_address_count, 2u);
    ASSERT_EQ(config.discovery.announce_addresses[0], 0xC0A8020Au);
    ASSERT_EQ(config.discovery.announce_addresses[1], 0x0A000001u);
}

TEST(parse_handshake_section) {
    TempConfigFile file(
        "[handshake]\n"
        "listen_address = 127.0.0.1\n"
        "timeout = 1500\n"
        "io_timeout = 250\n"
        "port_policy = passthrough\n"
        "client_port_offset = 10\n"
        "device_port_offset = -10\n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.handshake.listen_address, 0x7F000001u);
    ASSERT_EQ(config.handshake.timeout_ms, 1500u);
    ASSERT_EQ(config.handshake.io_timeout_ms, 250u);
    ASSERT_EQ(config.handshake.port_policy, PortPolicyMode::Passthrough);
    ASSERT_EQ(config.handshake.client_port_offset, 10);
    ASSERT_EQ(config.handshake.device_port_offset, -10);
}

TEST(parse_relay_section) {
    TempConfigFile file(
        "[relay]\n"
        "max_datagram_size = 2048\n"
        "check_interval = 200\n"
        "max_silence = 3000\n"
        "observers = 127.0.0.1:65432,192.168.1.5:9000\n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.relay.max_datagram_size, 2048u);
    ASSERT_EQ(config.relay.check_interval_ms, 200u);
    ASSERT_EQ(config.relay.max_silence_ms, 3000u);
    ASSERT_EQ(config.relay.observer_count, 2u);
    ASSERT_EQ(config.relay.observers[0].address, 0x7F000001u);
    ASSERT_EQ(config.relay.observers[0].port, 65432);
    ASSERT_EQ(config.relay.observers[1].address, 0xC0A80105u);
    ASSERT_EQ(config.relay.observers[1].port, 9000);
}

TEST(parse_supervisor_and_debug_sections) {
    TempConfigFile file(
        "[supervisor]\n"
        "restart_delay = 50\n"
        "max_restart_delay = 400\n"
        "\n"
        "[debug]\n"
        "enabled = 0\n"
        "level = 3\n"
        "log_to_file = yes\n"
        "log_path = /tmp/sumo.log\n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.supervisor.restart_delay_ms, 50u);
    ASSERT_EQ(config.supervisor.max_restart_delay_ms, 400u);
    ASSERT_EQ(config.debug.enabled, false);
    ASSERT_EQ(config.debug.level, 3u);
    ASSERT_EQ(config.debug.log_to_file, true);
    ASSERT_STREQ(config.debug.log_path, "/tmp/sumo.log");
}

TEST(parse_comments_and_unknown_ignored) {
    TempConfigFile file(
        "; comment\n"
        "# another\n"
        "[mystery]\n"
        "timeout = 1\n"
        "[relay]\n"
        "unknown_key = 5\n"
        "  max_silence   =   2500  \n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.relay.max_silence_ms, 2500u);
    ASSERT_EQ(config.discovery.timeout_ms, 30000u);
}

TEST(invalid_observer_skipped_rest_loaded) {
    TempConfigFile file(
        "[relay]\n"
        "observers = 127.0.0.1:65432, not-an-endpoint, 127.0.0.1:70000\n"
        "max_silence = 1200\n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_EQ(config.relay.observer_count, 1u);
    ASSERT_EQ(config.relay.observers[0].port, 65432);
    ASSERT_EQ(config.relay.max_silence_ms, 1200u);
}

TEST(invalid_values_rejected) {
    TempConfigFile file(
        "[handshake]\n"
        "port_policy = sideways\n"
        "listen_address = 300.1.1.1\n"
        "[relay]\n"
        "max_datagram_size = 70000\n"
        "check_interval = 0\n");
    Config config = get_default_config();

    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_EQ(config.handshake.port_policy, PortPolicyMode::Offset);
    ASSERT_EQ(config.handshake.listen_address, 0u);
    ASSERT_EQ(config.relay.max_datagram_size, 65000u);
    ASSERT_EQ(config.relay.check_interval_ms, 1000u);
}

TEST(file_not_found) {
    Config config = get_default_config();
    ASSERT_EQ(load_config("/tmp/sumo_mitm_does_not_exist.ini", config), ConfigResult::FileNotFound);
}

// ============================================================================
// Save Tests
// ============================================================================

TEST(save_then_load_preserves_values) {
    char path[256];
    snprintf(path, sizeof(path), "/tmp/sumo_mitm_save_%d/config.ini", static_cast<int>(getpid()));

    Config saved = get_default_config();
    saved.handshake.port_policy = PortPolicyMode::Passthrough;
    saved.handshake.listen_address = 0x7F000001;
    saved.relay.max_silence_ms = 4321;
    saved.relay.observers[0] = sumo_mitm::network::Endpoint{0x7F000001, 65432};
    saved.relay.observer_count = 1;
    saved.discovery.announce_addresses[0] = 0xC0A8020A;
    saved.discovery.announce_address_count = 1;

    ASSERT_EQ(save_config(path, saved), ConfigResult::Success);

    Config loaded = get_default_config();
    ConfigResult result = load_config(path, loaded);
    std::remove(path);
    rmdir(std::string(path, std::strrchr(path, '/')).c_str());

    ASSERT_EQ(result, ConfigResult::Success);
    ASSERT_EQ(loaded.handshake.port_policy, PortPolicyMode::Passthrough);
    ASSERT_EQ(loaded.handshake.listen_address, 0x7F000001u);
    ASSERT_EQ(loaded.relay.max_silence_ms, 4321u);
    ASSERT_EQ(loaded.relay.observer_count, 1u);
    ASSERT_EQ(loaded.relay.observers[0].port, 65432);
    ASSERT_EQ(loaded.discovery.announce_address_count, 1u);
    ASSERT_EQ(loaded.discovery.announce_addresses[0], 0xC0A8020Au);
}

TEST(ensure_config_exists_creates_defaults) {
    char path[256];
    snprintf(path, sizeof(path), "/tmp/sumo_mitm_ensure_%d.ini", static_cast<int>(getpid()));
    std::remove(path);

    ASSERT_EQ(ensure_config_exists(path), ConfigResult::Success);

    Config loaded = get_default_config();
    loaded.relay.max_silence_ms = 1;
    ConfigResult result = load_config(path, loaded);
    std::remove(path);

    ASSERT_EQ(result, ConfigResult::Success);
    ASSERT_EQ(loaded.relay.max_silence_ms, 1000u);
}

TEST(result_strings) {
    ASSERT_STREQ(config_result_to_string(ConfigResult::Success), "Success");
    ASSERT_STREQ(config_result_to_string(ConfigResult::FileNotFound), "FileNotFound");
    ASSERT_STREQ(config_result_to_string(ConfigResult::ParseError), "ParseError");
}

int main() {
    return run_all_tests("Config");
}
