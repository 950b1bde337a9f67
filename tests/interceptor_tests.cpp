/**
 * @file interceptor_tests.cpp
 * @brief Handshake interceptor tests against a scripted device
 *
 * The proxy listens on 127.0.0.1 and the fake device on 127.0.0.2. Handshake
 * listeners use TCP ports 47300-47309, relay listeners UDP 47310-47399.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "test_framework.hpp"
#include "loopback_peers.hpp"
#include "network/address.hpp"
#include "network/tcp_listener.hpp"
#include "network/udp_socket.hpp"
#include "protocol/handshake.hpp"
#include "session/activity_clock.hpp"
#include "session/handshake_interceptor.hpp"

#include <string>

using namespace sumo_mitm;
using namespace sumo_mitm::session;

namespace {

using testing::DEVICE_ADDRESS;
using testing::FakeClient;
using testing::FakeDevice;
using testing::PROXY_ADDRESS;
using testing::with_terminator;

config::HandshakeConfig make_config(uint32_t timeout_ms = 3000) {
    config::HandshakeConfig config = config::get_default_config().handshake;
    config.listen_address = PROXY_ADDRESS;
    config.timeout_ms = timeout_ms;
    config.io_timeout_ms = 2000;
    return config;
}

DeviceEndpoint device_at(uint16_t port) {
    DeviceEndpoint device;
    device.instance_name = "JumpingSumo-test";
    device.address = DEVICE_ADDRESS;
    device.handshake_port = port;
    return device;
}

} // anonymous namespace

// ============================================================================
// Exchange
// ============================================================================

TEST(rewrites_both_directions) {
    FakeDevice device(with_terminator(
        "{\"status\":0,\"c2d_port\":47320,\"arstream_fragment_size\":1000}"));
    FakeClient client(47300, with_terminator(
        "{\"controller_type\":\"computer\",\"controller_name\":\"pc\",\"d2c_port\":47310}"));

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    device.start();
    client.start();
    SessionError error = interceptor.intercept(device_at(device.port()), 47300, listeners, out);
    client.join();
    device.join();

    ASSERT_EQ(error, SessionError::None);
    ASSERT_EQ(out.client_address, PROXY_ADDRESS);
    ASSERT_EQ(out.ports.client_inbound_port, 47310);
    ASSERT_EQ(out.ports.proxy_client_facing_port, 47311);
    ASSERT_EQ(out.ports.device_inbound_port, 47320);
    ASSERT_EQ(out.ports.proxy_device_facing_port, 47319);

    ASSERT_TRUE(device.request() == with_terminator(
        "{\"controller_type\":\"computer\",\"controller_name\":\"pc\",\"d2c_port\":47311}"));
    ASSERT_TRUE(client.response() == with_terminator(
        "{\"status\":0,\"c2d_port\":47319,\"arstream_fragment_size\":1000}"));

    ASSERT_EQ(listeners.count(), 2u);
    ASSERT_TRUE(listeners.find(47311) != nullptr);
    ASSERT_TRUE(listeners.find(47319) != nullptr);
}

TEST(passthrough_shares_one_listener) {
    FakeDevice device(with_terminator("{\"status\":0,\"c2d_port\":47330}"));
    FakeClient client(47301, with_terminator("{\"d2c_port\":47330}"));

    config::HandshakeConfig config = make_config();
    config.port_policy = config::PortPolicyMode::Passthrough;

    util::StopSignal stop;
    HandshakeInterceptor interceptor(config, stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    device.start();
    client.start();
    SessionError error = interceptor.intercept(device_at(device.port()), 47301, listeners, out);
    client.join();
    device.join();

    ASSERT_EQ(error, SessionError::None);
    ASSERT_EQ(out.ports.proxy_client_facing_port, 47330);
    ASSERT_EQ(out.ports.proxy_device_facing_port, 47330);
    ASSERT_EQ(listeners.count(), 1u);
    ASSERT_TRUE(device.request() == with_terminator("{\"d2c_port\":47330}"));
}

TEST(busy_device_response_passed_through) {
    const std::string busy = with_terminator("{\"status\":-1,\"c2d_port\":0}");
    FakeDevice device(busy);
    FakeClient client(47302, with_terminator("{\"d2c_port\":47340}"));

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    device.start();
    client.start();
    SessionError error = interceptor.intercept(device_at(device.port()), 47302, listeners, out);
    client.join();
    device.join();

    ASSERT_EQ(error, SessionError::None);
    ASSERT_EQ(out.ports.device_inbound_port, protocol::DEVICE_BUSY_PORT);
    ASSERT_TRUE(client.response() == busy);
    ASSERT_EQ(listeners.count(), 1u);
}

TEST(trailing_bytes_after_terminator_dropped) {
    FakeDevice device(with_terminator("{\"c2d_port\":47350}"));
    FakeClient client(47303, with_terminator("{\"d2c_port\":47360}") + "junk");

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    device.start();
    client.start();
    SessionError error = interceptor.intercept(device_at(device.port()), 47303, listeners, out);
    client.join();
    device.join();

    ASSERT_EQ(error, SessionError::None);
    ASSERT_TRUE(device.request() == with_terminator("{\"d2c_port\":47361}"));
}

// ============================================================================
// Failures
// ============================================================================

TEST(no_client_times_out) {
    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(200), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    uint64_t started = monotonic_ms();
    ASSERT_EQ(interceptor.intercept(device_at(1), 47304, listeners, out),
              SessionError::HandshakeTimeout);
    ASSERT_TRUE(monotonic_ms() - started >= 200);
    ASSERT_EQ(listeners.count(), 0u);

    // Listener released on return
    network::TcpListener again;
    ASSERT_EQ(again.listen(PROXY_ADDRESS, 47304), network::SocketResult::Success);
}

TEST(missing_port_field_is_malformed) {
    FakeDevice device(with_terminator("{\"c2d_port\":47370}"));
    FakeClient client(47305, with_terminator("{\"controller_type\":\"computer\"}"));

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    client.start();
    SessionError error = interceptor.intercept(device_at(device.port()), 47305, listeners, out);
    client.join();

    ASSERT_EQ(error, SessionError::HandshakeMalformed);
    ASSERT_FALSE(device.connected());
    ASSERT_EQ(listeners.count(), 0u);
}

TEST(occupied_relay_port_fails_bind) {
    network::UdpSocket squatter;
    ASSERT_EQ(squatter.bind(PROXY_ADDRESS, 47381), network::SocketResult::Success);

    FakeClient client(47306, with_terminator("{\"d2c_port\":47380}"));

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    client.start();
    SessionError error = interceptor.intercept(device_at(1), 47306, listeners, out);
    client.join();

    ASSERT_EQ(error, SessionError::ListenerBindFailure);
    ASSERT_TRUE(listeners.bind_failed());
}

TEST(unreachable_device_is_transport_failure) {
    // Grab a free port and release it so nothing listens there
    uint16_t dead_port = 0;
    {
        network::TcpListener probe;
        ASSERT_EQ(probe.listen(DEVICE_ADDRESS, 0), network::SocketResult::Success);
        dead_port = probe.get_port();
    }

    FakeClient client(47307, with_terminator("{\"d2c_port\":47390}"));

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    client.start();
    SessionError error = interceptor.intercept(device_at(dead_port), 47307, listeners, out);
    client.join();

    ASSERT_EQ(error, SessionError::HandshakeTransportFailure);
}

TEST(stop_before_client_cancels) {
    util::StopSignal stop;
    stop.request_stop();

    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    ASSERT_EQ(interceptor.intercept(device_at(1), 47308, listeners, out), SessionError::Cancelled);
}

TEST(occupied_handshake_port_fails_bind) {
    network::TcpListener squatter;
    ASSERT_EQ(squatter.listen(PROXY_ADDRESS, 47309), network::SocketResult::Success);

    util::StopSignal stop;
    HandshakeInterceptor interceptor(make_config(), stop);
    RelayListeners listeners(PROXY_ADDRESS);
    InterceptResult out{};

    ASSERT_EQ(interceptor.intercept(device_at(1), 47309, listeners, out),
              SessionError::ListenerBindFailure);
}

int main() {
    network::socket_init();
    int result = run_all_tests("Handshake Interceptor");
    network::socket_exit();
    return result;
}
