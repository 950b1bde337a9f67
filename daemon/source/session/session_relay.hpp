/**
 * @file session_relay.hpp
 * @brief Bidirectional UDP relay between client and device
 *
 * After the handshake both peers send their datagrams to the proxy. The
 * relay forwards each datagram to the other peer and, when observer sinks
 * are configured, mirrors a copy to every sink with a one-byte direction
 * marker in front:
 *
 * @code
 * '>' (0x3E)  client -> device (c2d)
 * '<' (0x3C)  device -> client (d2c)
 * @endcode
 *
 * ## Listener layout
 *
 * - Distinct ports: the listener on proxy_device_facing_port only ever sees
 *   c2d traffic, the one on proxy_client_facing_port only d2c traffic.
 * - Shared port: a single listener; a datagram whose source address is the
 *   client's is c2d, anything else is d2c.
 *
 * ## Threading
 *
 * One std::thread per listener. Each received datagram touches the shared
 * ActivityClock that the watchdog reads. A receive error stops the relay
 * with ListenerFailure; send errors are counted and never stop it.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "session_types.hpp"
#include "activity_clock.hpp"
#include "relay_listeners.hpp"
#include "../network/address.hpp"
#include "../network/udp_socket.hpp"
#include "../util/stop_signal.hpp"

namespace sumo_mitm::session {

/** @brief Receive slice; bounds how late a stop request is noticed */
constexpr uint32_t RELAY_POLL_SLICE_MS = 100;

/** @brief Mirror marker for client -> device datagrams */
constexpr uint8_t C2D_MARKER = '>';

/** @brief Mirror marker for device -> client datagrams */
constexpr uint8_t D2C_MARKER = '<';

enum class RelayDirection {
    ClientToDevice,
    DeviceToClient
};

/**
 * @brief Everything one relay needs to know about its session
 */
struct RelaySession {
    uint32_t client_address;                    ///< Host order
    uint32_t device_address;                    ///< Host order
    NegotiatedPorts ports;
    std::vector<network::Endpoint> observers;   ///< Mirror sinks
    size_t max_datagram_size;                   ///< Receive buffer size
};

/**
 * @brief Snapshot of relay traffic counters
 */
struct RelayCounters {
    uint64_t c2d_datagrams;
    uint64_t d2c_datagrams;
    uint64_t c2d_bytes;
    uint64_t d2c_bytes;
    uint64_t send_failures;     ///< Forward and mirror sends that failed
    uint64_t truncated;         ///< Datagrams larger than max_datagram_size
};

class SessionRelay {
public:
    /**
     * @param session Addresses, ports, sinks
     * @param listeners Bound listeners for both proxy ports
     * @param clock Activity clock shared with the watchdog
     * @param parent Session stop signal
     */
    SessionRelay(const RelaySession& session, RelayListeners& listeners,
                 ActivityClock& clock, const util::StopSignal& parent);

    /**
     * @brief Stops and joins listener threads
     */
    ~SessionRelay();

    SessionRelay(const SessionRelay&) = delete;
    SessionRelay& operator=(const SessionRelay&) = delete;

    /**
     * @brief Open the send socket and start one thread per listener
     *
     * @return None, or ListenerBindFailure if a proxy port has no listener
     */
    SessionError start();

    /**
     * @brief Block until the relay fails or is stopped
     *
     * @return ListenerFailure, or Cancelled when stopped from outside
     */
    SessionError run();

    /**
     * @brief Stop and join listener threads (idempotent)
     */
    void stop();

    /**
     * @brief Signal that fires when the relay fails or is stopped
     *
     * The watchdog waits on it so a relay failure also ends the watch.
     */
    const util::StopSignal& stop_signal() const { return m_stop; }

    /**
     * @brief First failure seen by a listener thread, None if none
     */
    SessionError get_failure() const;

    RelayCounters get_counters() const;

    bool is_shared_port() const {
        return m_session.ports.proxy_device_facing_port == m_session.ports.proxy_client_facing_port;
    }

    /**
     * @brief Direction of a datagram that arrived on the shared listener
     */
    static RelayDirection classify_shared(uint32_t source_address, uint32_t client_address) {
        return source_address == client_address
            ? RelayDirection::ClientToDevice
            : RelayDirection::DeviceToClient;
    }

private:
    enum class ListenerRole {
        ClientToDevice,     // proxy_device_facing_port
        DeviceToClient,     // proxy_client_facing_port
        Shared
    };

    void listener_loop(network::UdpSocket* socket, ListenerRole role);
    void relay_datagram(RelayDirection direction, uint8_t* frame, size_t payload_size);
    void fail(SessionError error);

    RelaySession m_session;
    RelayListeners& m_listeners;
    ActivityClock& m_clock;
    util::StopSignal m_stop;

    network::UdpSocket m_send_socket;
    std::vector<std::thread> m_threads;

    mutable std::mutex m_failure_mutex;
    SessionError m_failure;

    std::atomic<uint64_t> m_c2d_datagrams;
    std::atomic<uint64_t> m_d2c_datagrams;
    std::atomic<uint64_t> m_c2d_bytes;
    std::atomic<uint64_t> m_d2c_bytes;
    std::atomic<uint64_t> m_send_failures;
    std::atomic<uint64_t> m_truncated;
};

} // namespace sumo_mitm::session
