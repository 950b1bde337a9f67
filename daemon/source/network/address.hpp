/**
 * @file address.hpp
 * @brief IPv4 address helpers for sumo_mitm
 *
 * All addresses inside the daemon are IPv4 addresses held as uint32_t in
 * host byte order. Conversion to network order happens only at the socket
 * boundary (udp_socket.cpp, tcp_listener.cpp, socket.cpp).
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace sumo_mitm::network {

/** @brief Buffer size large enough for a dotted-quad string */
constexpr size_t IPV4_STRING_LENGTH = 16;

/** @brief 0.0.0.0 */
constexpr uint32_t ANY_ADDRESS = 0;

/** @brief 127.0.0.1 */
constexpr uint32_t LOOPBACK_ADDRESS = 0x7F000001;

/**
 * @brief An IPv4 address and port
 */
struct Endpoint {
    uint32_t address;   ///< IPv4 address (host order)
    uint16_t port;      ///< UDP/TCP port
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.address == b.address && a.port == b.port;
}

/**
 * @brief Parse a dotted-quad IPv4 string
 *
 * @param text Null-terminated string (e.g. "192.168.2.1")
 * @param[out] address Parsed address in host order
 * @return true on success
 */
bool parse_ipv4(const char* text, uint32_t& address);

/**
 * @brief Format an IPv4 address as dotted-quad
 *
 * @param address Address in host order
 * @param buffer Output buffer (at least IPV4_STRING_LENGTH bytes)
 * @param buffer_size Size of output buffer
 * @return buffer, for use directly in log arguments
 */
const char* format_ipv4(uint32_t address, char* buffer, size_t buffer_size);

/**
 * @brief Parse an "ip:port" endpoint
 *
 * Surrounding spaces are ignored. The port must be 1..65535.
 *
 * @param text Null-terminated string (e.g. "127.0.0.1:65432")
 * @param[out] endpoint Parsed endpoint
 * @return true on success
 */
bool parse_endpoint(const char* text, Endpoint& endpoint);

/**
 * @brief Enumerate the local IPv4 addresses of all interfaces that are up
 *
 * Loopback is included only when include_loopback is set. The result is
 * sorted ascending so announcement order is stable between sessions.
 *
 * @param[out] addresses Enumerated addresses (host order)
 * @param include_loopback Also report 127.0.0.0/8 addresses
 * @return true if getifaddrs() succeeded
 */
bool enumerate_local_ipv4(std::vector<uint32_t>& addresses, bool include_loopback = false);

} // namespace sumo_mitm::network
