/**
 * @file session_relay.cpp
 * @brief Bidirectional UDP relay between client and device
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "session_relay.hpp"
#include "../debug/log.hpp"

namespace sumo_mitm::session {

SessionRelay::SessionRelay(const RelaySession& session, RelayListeners& listeners,
                           ActivityClock& clock, const util::StopSignal& parent)
    : m_session(session)
    , m_listeners(listeners)
    , m_clock(clock)
    , m_stop(&parent)
    , m_failure(SessionError::None)
    , m_c2d_datagrams(0)
    , m_d2c_datagrams(0)
    , m_c2d_bytes(0)
    , m_d2c_bytes(0)
    , m_send_failures(0)
    , m_truncated(0)
{
}

SessionRelay::~SessionRelay() {
    stop();
}

SessionError SessionRelay::start() {
    const NegotiatedPorts& ports = m_session.ports;

    network::UdpSocket* device_facing = m_listeners.find(ports.proxy_device_facing_port);
    network::UdpSocket* client_facing = m_listeners.find(ports.proxy_client_facing_port);
    if (device_facing == nullptr || client_facing == nullptr) {
        LOG_ERROR("Relay listeners missing for ports %u/%u",
                  ports.proxy_device_facing_port, ports.proxy_client_facing_port);
        return SessionError::ListenerBindFailure;
    }

    network::SocketResult result = m_send_socket.open();
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Cannot open relay send socket: %s", network::socket_result_to_string(result));
        return SessionError::ListenerBindFailure;
    }

    char client_ip[network::IPV4_STRING_LENGTH];
    char device_ip[network::IPV4_STRING_LENGTH];
    network::format_ipv4(m_session.client_address, client_ip, sizeof(client_ip));
    network::format_ipv4(m_session.device_address, device_ip, sizeof(device_ip));

    if (is_shared_port()) {
        LOG_INFO("Relay (shared port %u): client %s:%u <-> device %s:%u",
                 ports.proxy_device_facing_port, client_ip, ports.client_inbound_port,
                 device_ip, ports.device_inbound_port);
        m_threads.emplace_back(&SessionRelay::listener_loop, this, device_facing, ListenerRole::Shared);
    } else {
        LOG_INFO("Relay: client %s:%u <- :%u | :%u -> device %s:%u",
                 client_ip, ports.client_inbound_port, ports.proxy_client_facing_port,
                 ports.proxy_device_facing_port, device_ip, ports.device_inbound_port);
        m_threads.emplace_back(&SessionRelay::listener_loop, this, device_facing,
                               ListenerRole::ClientToDevice);
        m_threads.emplace_back(&SessionRelay::listener_loop, this, client_facing,
                               ListenerRole::DeviceToClient);
    }

    if (!m_session.observers.empty()) {
        LOG_INFO("Mirroring to %zu observer sink(s)", m_session.observers.size());
    }

    return SessionError::None;
}

SessionError SessionRelay::run() {
    while (!m_stop.wait_for(RELAY_POLL_SLICE_MS)) {
    }

    SessionError failure = get_failure();
    return failure != SessionError::None ? failure : SessionError::Cancelled;
}

void SessionRelay::stop() {
    m_stop.request_stop();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    if (!m_threads.empty()) {
        RelayCounters counters = get_counters();
        LOG_INFO("Relay stopped: c2d %llu datagrams/%llu bytes, d2c %llu datagrams/%llu bytes, "
                 "%llu send failures, %llu truncated",
                 static_cast<unsigned long long>(counters.c2d_datagrams),
                 static_cast<unsigned long long>(counters.c2d_bytes),
                 static_cast<unsigned long long>(counters.d2c_datagrams),
                 static_cast<unsigned long long>(counters.d2c_bytes),
                 static_cast<unsigned long long>(counters.send_failures),
                 static_cast<unsigned long long>(counters.truncated));
        m_threads.clear();
    }

    m_send_socket.close();
}

SessionError SessionRelay::get_failure() const {
    std::lock_guard<std::mutex> lock(m_failure_mutex);
    return m_failure;
}

RelayCounters SessionRelay::get_counters() const {
    RelayCounters counters;
    counters.c2d_datagrams = m_c2d_datagrams.load();
    counters.d2c_datagrams = m_d2c_datagrams.load();
    counters.c2d_bytes = m_c2d_bytes.load();
    counters.d2c_bytes = m_d2c_bytes.load();
    counters.send_failures = m_send_failures.load();
    counters.truncated = m_truncated.load();
    return counters;
}

void SessionRelay::fail(SessionError error) {
    {
        std::lock_guard<std::mutex> lock(m_failure_mutex);
        if (m_failure == SessionError::None) {
            m_failure = error;
        }
    }
    m_stop.request_stop();
}

/**
 * @brief Receive loop of one listener
 *
 * The frame buffer keeps one spare byte in front of the payload so the
 * mirror copy (marker + payload) needs no second buffer.
 */
void SessionRelay::listener_loop(network::UdpSocket* socket, ListenerRole role) {
    std::vector<uint8_t> frame(m_session.max_datagram_size + 1);
    uint8_t* payload = frame.data() + 1;

    while (!m_stop.stop_requested()) {
        size_t received = 0;
        uint32_t src_address = 0;
        uint16_t src_port = 0;
        bool truncated = false;

        network::SocketResult result = socket->recv_from(payload, m_session.max_datagram_size,
                                                         received, src_address, src_port,
                                                         RELAY_POLL_SLICE_MS, &truncated);
        if (result == network::SocketResult::Timeout) {
            continue;
        }
        if (result != network::SocketResult::Success) {
            if (!m_stop.stop_requested()) {
                LOG_ERROR("Relay listener on UDP port %u failed: %s",
                          socket->get_port(), network::socket_result_to_string(result));
                fail(SessionError::ListenerFailure);
            }
            return;
        }

        m_clock.touch();

        if (truncated) {
            // Forwarded anyway, cut to the buffer size
            m_truncated++;
            LOG_WARN("Datagram from port %u exceeds %zu bytes, forwarding it truncated",
                     src_port, m_session.max_datagram_size);
        }

        RelayDirection direction;
        switch (role) {
            case ListenerRole::ClientToDevice:
                direction = RelayDirection::ClientToDevice;
                break;
            case ListenerRole::DeviceToClient:
                direction = RelayDirection::DeviceToClient;
                break;
            default:
                direction = classify_shared(src_address, m_session.client_address);
                break;
        }

        relay_datagram(direction, frame.data(), received);
    }
}

void SessionRelay::relay_datagram(RelayDirection direction, uint8_t* frame, size_t payload_size) {
    const uint8_t* payload = frame + 1;
    uint32_t dest_address;
    uint16_t dest_port;

    if (direction == RelayDirection::ClientToDevice) {
        dest_address = m_session.device_address;
        dest_port = m_session.ports.device_inbound_port;
        frame[0] = C2D_MARKER;
        m_c2d_datagrams++;
        m_c2d_bytes += payload_size;
    } else {
        dest_address = m_session.client_address;
        dest_port = m_session.ports.client_inbound_port;
        frame[0] = D2C_MARKER;
        m_d2c_datagrams++;
        m_d2c_bytes += payload_size;
    }

    network::SocketResult result = m_send_socket.send_to(dest_address, dest_port, payload, payload_size);
    if (result != network::SocketResult::Success) {
        m_send_failures++;
        LOG_VERBOSE("Forward %s failed: %s",
                    direction == RelayDirection::ClientToDevice ? "c2d" : "d2c",
                    network::socket_result_to_string(result));
    }

    for (const network::Endpoint& sink : m_session.observers) {
        result = m_send_socket.send_to(sink.address, sink.port, frame, payload_size + 1);
        if (result != network::SocketResult::Success) {
            m_send_failures++;
            LOG_VERBOSE("Mirror to port %u failed: %s",
                        sink.port, network::socket_result_to_string(result));
        }
    }
}

} // namespace sumo_mitm::session
