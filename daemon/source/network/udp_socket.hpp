/**
 * @file udp_socket.hpp
 * @brief UDP socket wrapper for sumo_mitm
 *
 * Used for three jobs:
 * - relay listeners bound on the proxy ports (exclusive bind, so a port
 *   already owned by someone else is reported instead of silently shared);
 * - the unbound send socket that forwards and mirrors datagrams;
 * - the mDNS socket on 5353 (shared bind plus multicast membership).
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include "address.hpp"
#include "socket.hpp"

namespace sumo_mitm::network {

/**
 * @brief RAII UDP socket
 *
 * Non-copyable, move-only. send_to() may be called from several threads at
 * once (sendto() on one descriptor is atomic per datagram); recv_from() is
 * meant to be called from a single thread.
 */
class UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Create an unbound socket (send only)
     */
    SocketResult open();

    /**
     * @brief Create and bind
     *
     * @param address Local address (host order), ANY_ADDRESS for all
     * @param port Local port, 0 for an ephemeral port
     * @param shared Set SO_REUSEADDR/SO_REUSEPORT (mDNS only)
     * @return Success, AddressInUse, or error
     */
    SocketResult bind(uint32_t address, uint16_t port, bool shared = false);

    /**
     * @brief Send one datagram
     *
     * @param address Destination address (host order)
     * @param port Destination port
     */
    SocketResult send_to(uint32_t address, uint16_t port, const uint8_t* data, size_t size);

    /**
     * @brief Receive one datagram
     *
     * A zero-length datagram is a valid Success with received == 0.
     * Datagrams larger than buffer_size are cut to buffer_size; the excess
     * is lost and reported through truncated.
     *
     * @param[out] received Bytes stored in buffer
     * @param[out] src_address Sender address (host order)
     * @param[out] src_port Sender port
     * @param timeout_ms Maximum wait
     * @param[out] truncated Set when the datagram did not fit (optional)
     * @return Success, Timeout, or error
     */
    SocketResult recv_from(uint8_t* buffer, size_t buffer_size, size_t& received,
                           uint32_t& src_address, uint16_t& src_port, uint32_t timeout_ms,
                           bool* truncated = nullptr);

    /**
     * @brief Join an IPv4 multicast group
     *
     * @param group Group address (host order), e.g. 224.0.0.251
     * @param interface_address Interface to join on, ANY_ADDRESS for default
     */
    SocketResult join_multicast(uint32_t group, uint32_t interface_address = ANY_ADDRESS);

    /**
     * @brief Leave an IPv4 multicast group
     */
    SocketResult leave_multicast(uint32_t group, uint32_t interface_address = ANY_ADDRESS);

    SocketResult set_multicast_ttl(uint8_t ttl);
    SocketResult set_multicast_loop(bool enabled);

    void close();

    bool is_valid() const { return m_fd >= 0; }
    int get_fd() const { return m_fd; }

    /**
     * @brief Bound port (0 if unbound)
     */
    uint16_t get_port() const { return m_port; }

private:
    int m_fd;
    uint16_t m_port;

    SocketResult set_membership(int option, uint32_t group, uint32_t interface_address);
};

} // namespace sumo_mitm::network
