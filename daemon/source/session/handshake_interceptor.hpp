/**
 * @file handshake_interceptor.hpp
 * @brief Man-in-the-middle for the ARSDK TCP handshake
 *
 * The client believes the proxy is the device. The interceptor accepts the
 * client's handshake connection, swaps the client's receive port for a proxy
 * port, forwards the request to the real device, then swaps the device's
 * receive port in the response for another proxy port before returning it.
 * After that both peers send their UDP traffic to the proxy.
 *
 * @code
 *  client                  proxy                      device
 *    | -- {d2c_port:P} ----> |                            |
 *    |                       | reserve UDP P'             |
 *    |                       | -- {d2c_port:P'} --------> |
 *    |                       | <------- {c2d_port:Q} ---- |
 *    |                       | reserve UDP Q'             |
 *    | <---- {c2d_port:Q'} - |                            |
 * @endcode
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <vector>

#include "session_types.hpp"
#include "port_policy.hpp"
#include "relay_listeners.hpp"
#include "../config/config.hpp"
#include "../network/socket.hpp"
#include "../util/stop_signal.hpp"

namespace sumo_mitm::session {

/** @brief Accept/receive slice; bounds how late a stop request is noticed */
constexpr uint32_t HANDSHAKE_POLL_SLICE_MS = 100;

class HandshakeInterceptor {
public:
    /**
     * @param config Timeouts and port policy
     * @param stop Session stop signal, must outlive the interceptor
     */
    HandshakeInterceptor(const config::HandshakeConfig& config, const util::StopSignal& stop);

    /**
     * @brief Run one handshake exchange
     *
     * The TCP listener on listen_port exists only for the duration of the
     * call and accepts exactly one connection.
     *
     * On success with out.ports.device_inbound_port == 0 the device is busy:
     * its response was returned to the client unmodified and no
     * device-facing listener was reserved.
     *
     * @param device Real device endpoint
     * @param listen_port TCP port to accept the client on
     * @param listeners Receives the relay listeners for both proxy ports
     * @param[out] out Client address and negotiated ports
     */
    SessionError intercept(const DeviceEndpoint& device, uint16_t listen_port,
                           RelayListeners& listeners, InterceptResult& out);

    /**
     * @brief Actual port of the last TCP listener (tests bind port 0)
     */
    uint16_t get_last_listen_port() const { return m_last_listen_port; }

private:
    SessionError read_message(network::Socket& sock, std::vector<uint8_t>& message,
                              const char* peer);
    SessionError forward_request(const DeviceEndpoint& device, network::Socket& device_sock,
                                 std::vector<uint8_t>& request, RelayListeners& listeners,
                                 InterceptResult& out);
    SessionError forward_response(network::Socket& client, std::vector<uint8_t>& response,
                                  RelayListeners& listeners, InterceptResult& out);

    config::HandshakeConfig m_config;
    PortPolicy m_policy;
    const util::StopSignal& m_stop;
    uint16_t m_last_listen_port;
};

} // namespace sumo_mitm::session
