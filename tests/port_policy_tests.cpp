/**
 * @file port_policy_tests.cpp
 * @brief Unit tests for proxy port derivation
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "test_framework.hpp"
#include "session/port_policy.hpp"

using namespace sumo_mitm;
using namespace sumo_mitm::session;

TEST(default_offsets_from_config) {
    config::Config config = config::get_default_config();
    PortPolicy policy = PortPolicy::from_config(config.handshake);

    ASSERT_EQ(policy.mode, config::PortPolicyMode::Offset);
    ASSERT_EQ(policy.client_port_offset, 1);
    ASSERT_EQ(policy.device_port_offset, -1);
}

TEST(offset_mode_shifts_ports) {
    PortPolicy policy{config::PortPolicyMode::Offset, 1, -1};
    uint16_t port = 0;

    ASSERT_TRUE(policy.client_facing_port(54321, port));
    ASSERT_EQ(port, 54322);

    ASSERT_TRUE(policy.device_facing_port(54320, port));
    ASSERT_EQ(port, 54319);
}

TEST(passthrough_keeps_ports) {
    PortPolicy policy{config::PortPolicyMode::Passthrough, 1, -1};
    uint16_t port = 0;

    ASSERT_TRUE(policy.client_facing_port(54321, port));
    ASSERT_EQ(port, 54321);

    ASSERT_TRUE(policy.device_facing_port(54320, port));
    ASSERT_EQ(port, 54320);
}

TEST(offset_past_top_rejected) {
    PortPolicy policy{config::PortPolicyMode::Offset, 1, -1};
    uint16_t port = 7;
    ASSERT_FALSE(policy.client_facing_port(65535, port));
    ASSERT_EQ(port, 7);
}

TEST(offset_to_zero_rejected) {
    PortPolicy policy{config::PortPolicyMode::Offset, 1, -1};
    uint16_t port = 0;
    ASSERT_FALSE(policy.device_facing_port(1, port));
}

TEST(passthrough_zero_rejected) {
    PortPolicy policy{config::PortPolicyMode::Passthrough, 0, 0};
    uint16_t port = 0;
    ASSERT_FALSE(policy.client_facing_port(0, port));
}

TEST(policy_names) {
    ASSERT_STREQ(config::port_policy_to_string(config::PortPolicyMode::Offset), "offset");
    ASSERT_STREQ(config::port_policy_to_string(config::PortPolicyMode::Passthrough), "passthrough");
}

int main() {
    return run_all_tests("Port Policy");
}
