/**
 * @file socket.hpp
 * @brief TCP Socket Wrapper for sumo_mitm
 *
 * Provides a thin RAII wrapper over POSIX TCP sockets with timeout support.
 * Used by the handshake interceptor for both legs of the exchange: the
 * connection accepted from the controller client and the fresh connection
 * opened to the real device.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace sumo_mitm::network {

// ============================================================================
// Result Codes
// ============================================================================

enum class SocketResult {
    Success = 0,
    WouldBlock,        // Non-blocking operation would block
    Timeout,           // Operation timed out
    ConnectionRefused, // Server refused connection
    ConnectionReset,   // Connection reset by peer
    HostUnreachable,   // Cannot reach host
    NetworkDown,       // Network is down
    NotConnected,      // Socket not connected
    AlreadyConnected,  // Socket already connected
    InvalidAddress,    // Invalid address format
    AddressInUse,      // Bind target already taken
    SocketError,       // Generic socket error
    NotInitialized,    // Socket subsystem not initialized
    Closed             // Socket was closed
};

// ============================================================================
// Socket Class
// ============================================================================

/**
 * @brief TCP Socket wrapper
 *
 * Provides connect/send/recv operations with timeout support.
 * Non-copyable, move-only.
 *
 * Usage:
 * @code
 * Socket sock;
 * if (sock.connect("192.168.2.1", 44444, 5000) == SocketResult::Success) {
 *     sock.send_all(request.data(), request.size());
 *
 *     uint8_t buf[256];
 *     size_t received;
 *     sock.recv(buf, sizeof(buf), received, 1000);
 * }
 * @endcode
 */
class Socket {
public:
    /**
     * @brief Default constructor - creates invalid socket
     */
    Socket();

    /**
     * @brief Adopt an already connected descriptor (from accept())
     * @param fd Connected socket descriptor; ownership is transferred
     */
    explicit Socket(int fd);

    /**
     * @brief Destructor - closes socket if open
     */
    ~Socket();

    // Non-copyable
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // Moveable
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    /**
     * @brief Connect to a remote host
     * @param host Dotted-quad IPv4 address
     * @param port Port number
     * @param timeout_ms Connection timeout in milliseconds (0 = blocking)
     * @return SocketResult::Success or error
     */
    SocketResult connect(const char* host, uint16_t port, uint32_t timeout_ms = 0);

    /**
     * @brief Send data (blocking)
     * @param data Data to send
     * @param size Size of data
     * @param[out] sent Number of bytes actually sent
     * @return SocketResult::Success or error
     */
    SocketResult send(const uint8_t* data, size_t size, size_t& sent);

    /**
     * @brief Send all data (loops until complete or error)
     * @param data Data to send
     * @param size Size of data
     * @return SocketResult::Success or error
     */
    SocketResult send_all(const uint8_t* data, size_t size);

    /**
     * @brief Receive data (non-blocking or with timeout)
     * @param buffer Buffer to receive into
     * @param buffer_size Size of buffer
     * @param[out] received Number of bytes received
     * @param timeout_ms Receive timeout (0 = non-blocking, -1 = blocking)
     * @return SocketResult::Success, WouldBlock, Timeout, Closed or error
     */
    SocketResult recv(uint8_t* buffer, size_t buffer_size, size_t& received, int32_t timeout_ms = 0);

    /**
     * @brief Close the socket
     */
    void close();

    /**
     * @brief Check if socket is connected
     */
    bool is_connected() const;

    /**
     * @brief Check if socket is valid (has file descriptor)
     */
    bool is_valid() const;

    /**
     * @brief Get the native socket file descriptor
     * @return File descriptor or -1 if invalid
     */
    int get_fd() const { return m_fd; }

    /**
     * @brief Set socket to non-blocking mode
     */
    SocketResult set_non_blocking(bool non_blocking);

    /**
     * @brief Set TCP_NODELAY option (disable Nagle's algorithm)
     */
    SocketResult set_nodelay(bool nodelay);

private:
    int m_fd;
    bool m_connected;

    SocketResult create();

    /**
     * @brief Wait for socket to be ready (using poll)
     * @param timeout_ms Timeout in milliseconds
     * @param for_write true to wait for write, false for read
     * @return SocketResult::Success, Timeout, or error
     */
    SocketResult wait_ready(uint32_t timeout_ms, bool for_write);
};

// ============================================================================
// Socket Subsystem
// ============================================================================

/**
 * @brief Initialize socket subsystem
 *
 * Must be called before connecting. Ignores SIGPIPE process-wide so a peer
 * dropping a connection surfaces as an error code instead of a signal.
 */
SocketResult socket_init();

/**
 * @brief Shutdown socket subsystem
 */
void socket_exit();

/**
 * @brief Check if socket subsystem is initialized
 */
bool socket_is_initialized();

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Map POSIX errno to SocketResult
 *
 * Shared by the TCP, listener and UDP wrappers so every socket error is
 * reported through the same enum.
 */
SocketResult errno_to_result(int err);

/**
 * @brief Wait until a descriptor is readable or writable
 *
 * @return Success, Timeout, or error
 */
SocketResult poll_fd(int fd, uint32_t timeout_ms, bool for_write);

/**
 * @brief Convert SocketResult to string for debugging
 */
inline const char* socket_result_to_string(SocketResult result) {
    switch (result) {
        case SocketResult::Success:           return "Success";
        case SocketResult::WouldBlock:        return "WouldBlock";
        case SocketResult::Timeout:           return "Timeout";
        case SocketResult::ConnectionRefused: return "ConnectionRefused";
        case SocketResult::ConnectionReset:   return "ConnectionReset";
        case SocketResult::HostUnreachable:   return "HostUnreachable";
        case SocketResult::NetworkDown:       return "NetworkDown";
        case SocketResult::NotConnected:      return "NotConnected";
        case SocketResult::AlreadyConnected:  return "AlreadyConnected";
        case SocketResult::InvalidAddress:    return "InvalidAddress";
        case SocketResult::AddressInUse:      return "AddressInUse";
        case SocketResult::SocketError:       return "SocketError";
        case SocketResult::NotInitialized:    return "NotInitialized";
        case SocketResult::Closed:            return "Closed";
        default:                              return "Unknown";
    }
}

} // namespace sumo_mitm::network
