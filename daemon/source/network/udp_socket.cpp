/**
 * @file udp_socket.cpp
 * @brief UDP socket wrapper implementation
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "udp_socket.hpp"
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

namespace sumo_mitm::network {

namespace {

void fill_address(struct sockaddr_in& addr, uint32_t address, uint16_t port) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(address);
    addr.sin_port = htons(port);
}

} // anonymous namespace

UdpSocket::UdpSocket()
    : m_fd(-1)
    , m_port(0)
{
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : m_fd(other.m_fd)
    , m_port(other.m_port)
{
    other.m_fd = -1;
    other.m_port = 0;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();

        m_fd = other.m_fd;
        m_port = other.m_port;

        other.m_fd = -1;
        other.m_port = 0;
    }
    return *this;
}

SocketResult UdpSocket::open() {
    if (m_fd >= 0) {
        return SocketResult::Success;
    }

    m_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (m_fd < 0) {
        return errno_to_result(errno);
    }

    return SocketResult::Success;
}

SocketResult UdpSocket::bind(uint32_t address, uint16_t port, bool shared) {
    if (m_port != 0) {
        return SocketResult::AlreadyConnected;
    }

    SocketResult result = open();
    if (result != SocketResult::Success) {
        return result;
    }

    if (shared) {
        int reuse = 1;
        if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            result = errno_to_result(errno);
            close();
            return result;
        }
#ifdef SO_REUSEPORT
        // Other mDNS responders (avahi) usually hold 5353 already
        if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
            result = errno_to_result(errno);
            close();
            return result;
        }
#endif
    }

    struct sockaddr_in addr;
    fill_address(addr, address, port);

    if (::bind(m_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        result = errno_to_result(errno);
        close();
        return result;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(m_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        m_port = ntohs(addr.sin_port);
    } else {
        m_port = port;
    }

    return SocketResult::Success;
}

SocketResult UdpSocket::send_to(uint32_t address, uint16_t port, const uint8_t* data, size_t size) {
    if (m_fd < 0) {
        return SocketResult::NotInitialized;
    }

    struct sockaddr_in addr;
    fill_address(addr, address, port);

    ssize_t ret = ::sendto(m_fd, data, size, MSG_NOSIGNAL,
                           reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0) {
        return errno_to_result(errno);
    }

    return SocketResult::Success;
}

SocketResult UdpSocket::recv_from(uint8_t* buffer, size_t buffer_size, size_t& received,
                                  uint32_t& src_address, uint16_t& src_port, uint32_t timeout_ms,
                                  bool* truncated) {
    received = 0;
    if (truncated != nullptr) {
        *truncated = false;
    }

    if (m_fd < 0) {
        return SocketResult::NotInitialized;
    }

    SocketResult result = poll_fd(m_fd, timeout_ms, false);
    if (result != SocketResult::Success) {
        return result;
    }

    struct sockaddr_in src;
    socklen_t len = sizeof(src);
    // MSG_TRUNC makes recvfrom() return the real datagram length
    ssize_t ret = ::recvfrom(m_fd, buffer, buffer_size, MSG_DONTWAIT | MSG_TRUNC,
                             reinterpret_cast<struct sockaddr*>(&src), &len);
    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return SocketResult::Timeout;
        }
        // An ICMP port unreachable from an earlier send is reported on the
        // next receive; it says nothing about this socket.
        if (errno == ECONNREFUSED) {
            return SocketResult::Timeout;
        }
        return errno_to_result(errno);
    }

    received = static_cast<size_t>(ret);
    if (received > buffer_size) {
        received = buffer_size;
        if (truncated != nullptr) {
            *truncated = true;
        }
    }
    src_address = ntohl(src.sin_addr.s_addr);
    src_port = ntohs(src.sin_port);
    return SocketResult::Success;
}

SocketResult UdpSocket::set_membership(int option, uint32_t group, uint32_t interface_address) {
    if (m_fd < 0) {
        return SocketResult::NotInitialized;
    }

    struct ip_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    mreq.imr_multiaddr.s_addr = htonl(group);
    mreq.imr_interface.s_addr = htonl(interface_address);

    if (setsockopt(m_fd, IPPROTO_IP, option, &mreq, sizeof(mreq)) < 0) {
        return errno_to_result(errno);
    }

    return SocketResult::Success;
}

SocketResult UdpSocket::join_multicast(uint32_t group, uint32_t interface_address) {
    return set_membership(IP_ADD_MEMBERSHIP, group, interface_address);
}

SocketResult UdpSocket::leave_multicast(uint32_t group, uint32_t interface_address) {
    return set_membership(IP_DROP_MEMBERSHIP, group, interface_address);
}

SocketResult UdpSocket::set_multicast_ttl(uint8_t ttl) {
    if (m_fd < 0) {
        return SocketResult::NotInitialized;
    }

    unsigned char value = ttl;
    if (setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_TTL, &value, sizeof(value)) < 0) {
        return errno_to_result(errno);
    }
    return SocketResult::Success;
}

SocketResult UdpSocket::set_multicast_loop(bool enabled) {
    if (m_fd < 0) {
        return SocketResult::NotInitialized;
    }

    unsigned char value = enabled ? 1 : 0;
    if (setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_LOOP, &value, sizeof(value)) < 0) {
        return errno_to_result(errno);
    }
    return SocketResult::Success;
}

void UdpSocket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_port = 0;
}

} // namespace sumo_mitm::network
