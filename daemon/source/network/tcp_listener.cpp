/**
 * @file tcp_listener.cpp
 * @brief Listening TCP socket implementation
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "tcp_listener.hpp"
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

namespace sumo_mitm::network {

TcpListener::TcpListener()
    : m_fd(-1)
    , m_port(0)
{
}

TcpListener::~TcpListener() {
    close();
}

TcpListener::TcpListener(TcpListener&& other) noexcept
    : m_fd(other.m_fd)
    , m_port(other.m_port)
{
    other.m_fd = -1;
    other.m_port = 0;
}

TcpListener& TcpListener::operator=(TcpListener&& other) noexcept {
    if (this != &other) {
        close();

        m_fd = other.m_fd;
        m_port = other.m_port;

        other.m_fd = -1;
        other.m_port = 0;
    }
    return *this;
}

SocketResult TcpListener::listen(uint32_t address, uint16_t port, int backlog) {
    if (m_fd >= 0) {
        return SocketResult::AlreadyConnected;
    }

    m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (m_fd < 0) {
        return errno_to_result(errno);
    }

    int reuse = 1;
    if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        SocketResult result = errno_to_result(errno);
        close();
        return result;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(address);
    addr.sin_port = htons(port);

    if (::bind(m_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        SocketResult result = errno_to_result(errno);
        close();
        return result;
    }

    if (::listen(m_fd, backlog) < 0) {
        SocketResult result = errno_to_result(errno);
        close();
        return result;
    }

    // Resolve the real port when binding to 0
    socklen_t len = sizeof(addr);
    if (getsockname(m_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        m_port = ntohs(addr.sin_port);
    } else {
        m_port = port;
    }

    return SocketResult::Success;
}

SocketResult TcpListener::accept(Socket& client, uint32_t& peer_address, uint32_t timeout_ms) {
    if (m_fd < 0) {
        return SocketResult::NotConnected;
    }

    SocketResult result = poll_fd(m_fd, timeout_ms, false);
    if (result != SocketResult::Success) {
        return result;
    }

    struct sockaddr_in peer;
    socklen_t len = sizeof(peer);
    int fd = ::accept(m_fd, reinterpret_cast<struct sockaddr*>(&peer), &len);
    if (fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR) {
            // Client vanished between poll and accept; caller keeps waiting
            return SocketResult::Timeout;
        }
        return errno_to_result(errno);
    }

    client = Socket(fd);
    peer_address = ntohl(peer.sin_addr.s_addr);
    return SocketResult::Success;
}

void TcpListener::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_port = 0;
}

} // namespace sumo_mitm::network
