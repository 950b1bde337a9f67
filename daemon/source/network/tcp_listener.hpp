/**
 * @file tcp_listener.hpp
 * @brief Listening TCP socket for sumo_mitm
 *
 * The handshake interceptor binds one listener per session on the device's
 * handshake port, accepts exactly one client and then drops the listener.
 * Accept is bounded by a timeout so callers can slice their wait and check
 * for cancellation between slices.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include "socket.hpp"

namespace sumo_mitm::network {

/**
 * @brief RAII listening TCP socket
 *
 * Non-copyable, move-only. The descriptor is closed on destruction, so a
 * port bound by a failed session is free again as soon as the session
 * object goes out of scope.
 */
class TcpListener {
public:
    TcpListener();
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    TcpListener(TcpListener&& other) noexcept;
    TcpListener& operator=(TcpListener&& other) noexcept;

    /**
     * @brief Bind and listen
     *
     * SO_REUSEADDR is set so a port left in TIME_WAIT by the previous
     * session can be bound again immediately.
     *
     * @param address Local address (host order), ANY_ADDRESS for all
     * @param port Local port, 0 for an ephemeral port
     * @param backlog listen() backlog
     * @return Success, AddressInUse, or error
     */
    SocketResult listen(uint32_t address, uint16_t port, int backlog = 1);

    /**
     * @brief Accept one connection
     *
     * @param[out] client Connected socket (valid on Success)
     * @param[out] peer_address Remote IPv4 address (host order)
     * @param timeout_ms Maximum wait
     * @return Success, Timeout, or error
     */
    SocketResult accept(Socket& client, uint32_t& peer_address, uint32_t timeout_ms);

    /**
     * @brief Close the listening socket
     */
    void close();

    bool is_listening() const { return m_fd >= 0; }

    /**
     * @brief Actually bound port (resolves port 0)
     */
    uint16_t get_port() const { return m_port; }

private:
    int m_fd;
    uint16_t m_port;
};

} // namespace sumo_mitm::network
