/**
 * @file socket.cpp
 * @brief TCP Socket Implementation for sumo_mitm
 *
 * ## Architecture
 *
 * The socket implementation uses standard BSD socket APIs. Key features:
 *
 * - Non-blocking connect with poll() for timeout support
 * - Dotted-quad IPv4 targets only; device addresses come from discovery
 * - MSG_NOSIGNAL to prevent SIGPIPE on broken connections
 * - Proper cleanup on move/destruction
 *
 * ## Error Handling
 *
 * All operations return SocketResult enum values. errno_to_result() maps
 * POSIX errno codes to the enum; the listener and UDP wrappers reuse it.
 *
 * ## Thread Safety
 *
 * Individual Socket instances are NOT thread-safe. The handshake
 * interceptor owns both of its sockets on a single thread.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "socket.hpp"
#include "address.hpp"

#include <cstring>
#include <cerrno>
#include <csignal>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

namespace sumo_mitm::network {

// =============================================================================
// Static State
// =============================================================================

static bool s_initialized = false;

// =============================================================================
// Socket Subsystem Functions
// =============================================================================

SocketResult socket_init() {
    // Idempotent - safe to call multiple times
    if (s_initialized) {
        return SocketResult::Success;
    }

    // A client or device closing mid-handshake must not kill the daemon
    std::signal(SIGPIPE, SIG_IGN);

    s_initialized = true;
    return SocketResult::Success;
}

void socket_exit() {
    s_initialized = false;
}

bool socket_is_initialized() {
    return s_initialized;
}

// =============================================================================
// Shared Helpers
// =============================================================================

/**
 * @brief Map POSIX errno to SocketResult
 *
 * Common mappings:
 * - EAGAIN/EWOULDBLOCK -> WouldBlock (non-blocking operation)
 * - ECONNREFUSED -> ConnectionRefused (nobody listening)
 * - ECONNRESET -> ConnectionReset (connection dropped by peer)
 * - EHOSTUNREACH -> HostUnreachable (routing failure)
 * - EADDRINUSE -> AddressInUse (bind conflict)
 * - ETIMEDOUT -> Timeout
 */
SocketResult errno_to_result(int err) {
    switch (err) {
        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
            return SocketResult::WouldBlock;

        case ECONNREFUSED:
            return SocketResult::ConnectionRefused;
        case ECONNRESET:
        case EPIPE:
            return SocketResult::ConnectionReset;

        case EHOSTUNREACH:
        case ENETUNREACH:
            return SocketResult::HostUnreachable;
        case ENETDOWN:
            return SocketResult::NetworkDown;

        case ENOTCONN:
            return SocketResult::NotConnected;
        case EISCONN:
            return SocketResult::AlreadyConnected;

        case EADDRINUSE:
            return SocketResult::AddressInUse;
        case EADDRNOTAVAIL:
        case EAFNOSUPPORT:
            return SocketResult::InvalidAddress;

        case ETIMEDOUT:
            return SocketResult::Timeout;

        default:
            return SocketResult::SocketError;
    }
}

/**
 * @brief Wait for a descriptor to be ready for I/O
 *
 * @return SocketResult::Success if ready
 * @return SocketResult::Timeout if timeout expired
 * @return SocketResult::SocketError if poll reports an error condition
 */
SocketResult poll_fd(int fd, uint32_t timeout_ms, bool for_write) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = for_write ? POLLOUT : POLLIN;
    pfd.revents = 0;

    int ret = poll(&pfd, 1, static_cast<int>(timeout_ms));

    if (ret < 0) {
        if (errno == EINTR) {
            // Treated as a spurious wakeup, callers loop on Timeout
            return SocketResult::Timeout;
        }
        return errno_to_result(errno);
    }

    if (ret == 0) {
        return SocketResult::Timeout;
    }

    // POLLHUP with pending data still lets recv() drain the buffer
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        return SocketResult::SocketError;
    }

    return SocketResult::Success;
}

namespace {

/// Writable wait per chunk in send_all()
constexpr uint32_t SEND_READY_TIMEOUT_MS = 5000;

bool make_address(const char* host, uint16_t port, struct sockaddr_in& addr) {
    uint32_t address = 0;
    if (!parse_ipv4(host, address)) {
        return false;
    }

    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(address);
    addr.sin_port = htons(port);
    return true;
}

} // anonymous namespace

// =============================================================================
// Socket Class Implementation
// =============================================================================

Socket::Socket()
    : m_fd(-1)
    , m_connected(false)
{
}

Socket::Socket(int fd)
    : m_fd(fd)
    , m_connected(fd >= 0)
{
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : m_fd(other.m_fd)
    , m_connected(other.m_connected)
{
    other.m_fd = -1;
    other.m_connected = false;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();

        m_fd = other.m_fd;
        m_connected = other.m_connected;

        other.m_fd = -1;
        other.m_connected = false;
    }
    return *this;
}

SocketResult Socket::create() {
    if (m_fd >= 0) {
        return SocketResult::Success;
    }

    m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (m_fd < 0) {
        return errno_to_result(errno);
    }

    return SocketResult::Success;
}

/**
 * @brief Connect to a remote host
 *
 * ## Connection Process
 * 1. Parse the IPv4 address
 * 2. Create socket if needed
 * 3. Set non-blocking mode (if timeout specified)
 * 4. Initiate connection
 * 5. Wait for connection with poll() (if timeout specified)
 * 6. Verify connection succeeded
 * 7. Restore blocking mode
 *
 * @note If connection fails, the socket is automatically closed
 */
SocketResult Socket::connect(const char* host, uint16_t port, uint32_t timeout_ms) {
    if (!s_initialized) {
        return SocketResult::NotInitialized;
    }

    if (host == nullptr || host[0] == '\0') {
        return SocketResult::InvalidAddress;
    }

    if (m_connected) {
        return SocketResult::AlreadyConnected;
    }

    SocketResult result = create();
    if (result != SocketResult::Success) {
        return result;
    }

    struct sockaddr_in addr;
    if (!make_address(host, port, addr)) {
        close();
        return SocketResult::InvalidAddress;
    }

    bool use_timeout = (timeout_ms > 0);

    if (use_timeout) {
        result = set_non_blocking(true);
        if (result != SocketResult::Success) {
            close();
            return result;
        }
    }

    int ret = ::connect(m_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));

    if (ret < 0) {
        if (use_timeout && (errno == EINPROGRESS || errno == EWOULDBLOCK)) {
            result = wait_ready(timeout_ms, true);
            // POLLERR still means the attempt finished, SO_ERROR says how
            if (result != SocketResult::Success && result != SocketResult::SocketError) {
                close();
                return result;
            }

            // Connection attempt finished - check if it succeeded
            int error = 0;
            socklen_t len = sizeof(error);
            if (getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
                close();
                return errno_to_result(errno);
            }

            if (error != 0) {
                close();
                return errno_to_result(error);
            }

            if (result != SocketResult::Success) {
                close();
                return result;
            }
        } else {
            close();
            return errno_to_result(errno);
        }
    }

    if (use_timeout) {
        result = set_non_blocking(false);
        if (result != SocketResult::Success) {
            close();
            return result;
        }
    }

    m_connected = true;
    return SocketResult::Success;
}

/**
 * @brief Send data over the socket
 *
 * May not send all data in one call - check the 'sent' parameter.
 * Uses MSG_NOSIGNAL to prevent SIGPIPE on broken connections.
 */
SocketResult Socket::send(const uint8_t* data, size_t size, size_t& sent) {
    sent = 0;

    if (!m_connected) {
        return SocketResult::NotConnected;
    }

    ssize_t ret = ::send(m_fd, data, size, MSG_NOSIGNAL);

    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return SocketResult::WouldBlock;
        }
        m_connected = false;
        return errno_to_result(errno);
    }

    if (ret == 0 && size > 0) {
        m_connected = false;
        return SocketResult::Closed;
    }

    sent = static_cast<size_t>(ret);
    return SocketResult::Success;
}

/**
 * @brief Send all data reliably
 *
 * Loops until all data is sent or an error occurs, waiting up to
 * SEND_READY_TIMEOUT_MS for the socket to become writable between chunks.
 */
SocketResult Socket::send_all(const uint8_t* data, size_t size) {
    size_t total_sent = 0;

    while (total_sent < size) {
        size_t sent = 0;
        SocketResult result = send(data + total_sent, size - total_sent, sent);

        if (result == SocketResult::WouldBlock) {
            result = wait_ready(SEND_READY_TIMEOUT_MS, true);
            if (result != SocketResult::Success) {
                return result;
            }
            continue;
        }

        if (result != SocketResult::Success) {
            return result;
        }

        total_sent += sent;
    }

    return SocketResult::Success;
}

/**
 * @brief Receive data from the socket
 *
 * - timeout_ms > 0: Wait up to timeout_ms for data
 * - timeout_ms == 0: Non-blocking, return immediately
 * - timeout_ms < 0: Blocking, wait indefinitely
 *
 * @note received may be less than buffer_size (TCP is a stream)
 */
SocketResult Socket::recv(uint8_t* buffer, size_t buffer_size, size_t& received, int32_t timeout_ms) {
    received = 0;

    if (!m_connected) {
        return SocketResult::NotConnected;
    }

    int flags = 0;
    if (timeout_ms > 0) {
        SocketResult result = wait_ready(static_cast<uint32_t>(timeout_ms), false);
        if (result != SocketResult::Success) {
            return result;
        }
    } else if (timeout_ms == 0) {
        flags = MSG_DONTWAIT;
    }

    ssize_t ret = ::recv(m_fd, buffer, buffer_size, flags);

    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return SocketResult::WouldBlock;
        }
        m_connected = false;
        return errno_to_result(errno);
    }

    if (ret == 0) {
        // Zero bytes = connection closed gracefully
        m_connected = false;
        return SocketResult::Closed;
    }

    received = static_cast<size_t>(ret);
    return SocketResult::Success;
}

void Socket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_connected = false;
}

bool Socket::is_connected() const {
    return m_connected;
}

bool Socket::is_valid() const {
    return m_fd >= 0;
}

SocketResult Socket::set_non_blocking(bool non_blocking) {
    if (m_fd < 0) {
        return SocketResult::SocketError;
    }

    int flags = fcntl(m_fd, F_GETFL, 0);
    if (flags < 0) {
        return errno_to_result(errno);
    }

    if (non_blocking) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }

    if (fcntl(m_fd, F_SETFL, flags) < 0) {
        return errno_to_result(errno);
    }

    return SocketResult::Success;
}

/**
 * @brief Set TCP_NODELAY option
 */
SocketResult Socket::set_nodelay(bool nodelay) {
    if (m_fd < 0) {
        return SocketResult::SocketError;
    }

    int flag = nodelay ? 1 : 0;
    if (setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        return errno_to_result(errno);
    }

    return SocketResult::Success;
}

SocketResult Socket::wait_ready(uint32_t timeout_ms, bool for_write) {
    return poll_fd(m_fd, timeout_ms, for_write);
}

} // namespace sumo_mitm::network
