/**
 * @file relay_listeners.hpp
 * @brief UDP listeners bound on the proxy ports of one session
 *
 * The handshake interceptor reserves each proxy port here *before* writing
 * it into the payload, so a port is never promised to a peer unless the
 * proxy already listens on it. The relay later takes over the bound
 * sockets. The set belongs to the session and closes everything when it is
 * destroyed.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include "../network/udp_socket.hpp"

namespace sumo_mitm::session {

/** @brief At most one listener per proxy port, two proxy ports per session */
constexpr size_t MAX_RELAY_LISTENERS = 2;

class RelayListeners {
public:
    /**
     * @param bind_address Local address for every listener (host order)
     */
    explicit RelayListeners(uint32_t bind_address = network::ANY_ADDRESS);

    RelayListeners(const RelayListeners&) = delete;
    RelayListeners& operator=(const RelayListeners&) = delete;

    /**
     * @brief Bind a listener on port, or reuse the one already bound there
     *
     * @return Success or the bind error. A failed bind is remembered,
     *         see bind_failed().
     */
    network::SocketResult reserve(uint16_t port);

    /**
     * @brief Listener bound on port, nullptr if none
     */
    network::UdpSocket* find(uint16_t port);

    size_t count() const { return m_count; }

    /**
     * @brief true once any reserve() has failed to bind
     */
    bool bind_failed() const { return m_bind_failed; }

    /**
     * @brief Close every listener
     */
    void close_all();

private:
    struct Entry {
        uint16_t port = 0;
        network::UdpSocket socket;
    };

    uint32_t m_bind_address;
    Entry m_entries[MAX_RELAY_LISTENERS];
    size_t m_count;
    bool m_bind_failed;
};

} // namespace sumo_mitm::session
