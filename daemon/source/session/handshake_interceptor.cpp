/**
 * @file handshake_interceptor.cpp
 * @brief Man-in-the-middle for the ARSDK TCP handshake
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "handshake_interceptor.hpp"
#include "activity_clock.hpp"
#include "../debug/log.hpp"
#include "../network/address.hpp"
#include "../network/tcp_listener.hpp"
#include "../protocol/handshake.hpp"

#include <algorithm>

namespace sumo_mitm::session {

namespace {

/**
 * @brief Map a codec failure to the session error
 */
SessionError field_error(protocol::HandshakeResult result, const char* key, const char* peer) {
    LOG_ERROR("Handshake from %s: cannot use %s (%s)",
              peer, key, protocol::handshake_result_to_string(result));
    return SessionError::HandshakeMalformed;
}

/**
 * @brief Each leg carries one small message; do not let Nagle hold it back
 */
void disable_nagle(network::Socket& sock, const char* peer) {
    network::SocketResult result = sock.set_nodelay(true);
    if (result != network::SocketResult::Success) {
        LOG_VERBOSE("TCP_NODELAY on %s leg failed: %s",
                    peer, network::socket_result_to_string(result));
    }
}

} // anonymous namespace

HandshakeInterceptor::HandshakeInterceptor(const config::HandshakeConfig& config,
                                           const util::StopSignal& stop)
    : m_config(config)
    , m_policy(PortPolicy::from_config(config))
    , m_stop(stop)
    , m_last_listen_port(0)
{
}

SessionError HandshakeInterceptor::intercept(const DeviceEndpoint& device, uint16_t listen_port,
                                             RelayListeners& listeners, InterceptResult& out) {
    out = InterceptResult{};

    // Step 1: listener lives only for this call
    network::TcpListener listener;
    network::SocketResult result = listener.listen(m_config.listen_address, listen_port);
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Cannot listen for handshake on TCP port %u: %s",
                  listen_port, network::socket_result_to_string(result));
        return SessionError::ListenerBindFailure;
    }
    m_last_listen_port = listener.get_port();
    LOG_INFO("Waiting for client handshake on TCP port %u", m_last_listen_port);

    // Step 2: exactly one client
    network::Socket client;
    uint32_t client_address = 0;
    const uint64_t deadline = monotonic_ms() + m_config.timeout_ms;
    for (;;) {
        if (m_stop.stop_requested()) {
            return SessionError::Cancelled;
        }

        uint64_t now = monotonic_ms();
        if (now >= deadline) {
            LOG_WARN("No client handshake within %u ms", m_config.timeout_ms);
            return SessionError::HandshakeTimeout;
        }

        uint32_t slice = static_cast<uint32_t>(
            std::min<uint64_t>(deadline - now, HANDSHAKE_POLL_SLICE_MS));
        result = listener.accept(client, client_address, slice);
        if (result == network::SocketResult::Success) {
            break;
        }
        if (result != network::SocketResult::Timeout) {
            LOG_ERROR("Handshake accept failed: %s", network::socket_result_to_string(result));
            return SessionError::HandshakeTransportFailure;
        }
    }
    listener.close();
    disable_nagle(client, "client");

    char client_ip[network::IPV4_STRING_LENGTH];
    network::format_ipv4(client_address, client_ip, sizeof(client_ip));
    LOG_INFO("Client connected from %s", client_ip);
    out.client_address = client_address;

    // Step 3: request, client -> device
    std::vector<uint8_t> request;
    SessionError error = read_message(client, request, "client");
    if (error != SessionError::None) {
        return error;
    }

    network::Socket device_sock;
    error = forward_request(device, device_sock, request, listeners, out);
    if (error != SessionError::None) {
        return error;
    }

    // Step 4: response, device -> client
    std::vector<uint8_t> response;
    error = read_message(device_sock, response, "device");
    if (error != SessionError::None) {
        return error;
    }

    return forward_response(client, response, listeners, out);
}

SessionError HandshakeInterceptor::forward_request(const DeviceEndpoint& device,
                                                   network::Socket& device_sock,
                                                   std::vector<uint8_t>& request,
                                                   RelayListeners& listeners,
                                                   InterceptResult& out) {
    uint16_t d2c_port = 0;
    protocol::HandshakeResult codec = protocol::read_port(request, protocol::D2C_PORT_KEY, d2c_port);
    if (codec != protocol::HandshakeResult::Success) {
        return field_error(codec, protocol::D2C_PORT_KEY, "client");
    }

    uint16_t proxy_port = 0;
    if (!m_policy.client_facing_port(d2c_port, proxy_port)) {
        LOG_ERROR("Client d2c_port %u leaves no usable proxy port", d2c_port);
        return SessionError::HandshakeMalformed;
    }

    // Listen before promising the port to the device
    if (listeners.reserve(proxy_port) != network::SocketResult::Success) {
        return SessionError::ListenerBindFailure;
    }

    if (proxy_port != d2c_port) {
        codec = protocol::rewrite_port(request, protocol::D2C_PORT_KEY, proxy_port);
        if (codec != protocol::HandshakeResult::Success) {
            return field_error(codec, protocol::D2C_PORT_KEY, "client");
        }
    }

    out.ports.client_inbound_port = d2c_port;
    out.ports.proxy_client_facing_port = proxy_port;
    LOG_INFO("d2c_port %u -> %u", d2c_port, proxy_port);

    char device_ip[network::IPV4_STRING_LENGTH];
    network::format_ipv4(device.address, device_ip, sizeof(device_ip));

    network::SocketResult result = device_sock.connect(device_ip, device.handshake_port,
                                                       m_config.io_timeout_ms);
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Cannot connect to device %s:%u: %s",
                  device_ip, device.handshake_port, network::socket_result_to_string(result));
        return SessionError::HandshakeTransportFailure;
    }
    disable_nagle(device_sock, "device");

    result = device_sock.send_all(request.data(), request.size());
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Cannot forward handshake to device: %s", network::socket_result_to_string(result));
        return SessionError::HandshakeTransportFailure;
    }

    return SessionError::None;
}

SessionError HandshakeInterceptor::forward_response(network::Socket& client,
                                                    std::vector<uint8_t>& response,
                                                    RelayListeners& listeners,
                                                    InterceptResult& out) {
    uint16_t c2d_port = 0;
    protocol::HandshakeResult codec = protocol::read_port(response, protocol::C2D_PORT_KEY, c2d_port);
    if (codec != protocol::HandshakeResult::Success) {
        return field_error(codec, protocol::C2D_PORT_KEY, "device");
    }

    out.ports.device_inbound_port = c2d_port;

    if (c2d_port != protocol::DEVICE_BUSY_PORT) {
        uint16_t proxy_port = 0;
        if (!m_policy.device_facing_port(c2d_port, proxy_port)) {
            LOG_ERROR("Device c2d_port %u leaves no usable proxy port", c2d_port);
            return SessionError::HandshakeMalformed;
        }

        // Reuses the client-facing listener when both proxy ports coincide
        if (listeners.reserve(proxy_port) != network::SocketResult::Success) {
            return SessionError::ListenerBindFailure;
        }

        if (proxy_port != c2d_port) {
            codec = protocol::rewrite_port(response, protocol::C2D_PORT_KEY, proxy_port);
            if (codec != protocol::HandshakeResult::Success) {
                return field_error(codec, protocol::C2D_PORT_KEY, "device");
            }
        }

        out.ports.proxy_device_facing_port = proxy_port;
        LOG_INFO("c2d_port %u -> %u", c2d_port, proxy_port);
    } else {
        LOG_WARN("Device reports c2d_port 0, already paired with another controller");
    }

    network::SocketResult result = client.send_all(response.data(), response.size());
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Cannot return handshake to client: %s", network::socket_result_to_string(result));
        return SessionError::HandshakeTransportFailure;
    }

    return SessionError::None;
}

/**
 * @brief Read one NUL-terminated message
 *
 * Bytes after the terminator are not part of the handshake and are dropped.
 * The whole read is bounded by io_timeout.
 */
SessionError HandshakeInterceptor::read_message(network::Socket& sock,
                                                std::vector<uint8_t>& message,
                                                const char* peer) {
    message.clear();

    uint8_t chunk[4096];
    const uint64_t deadline = monotonic_ms() + m_config.io_timeout_ms;

    for (;;) {
        if (m_stop.stop_requested()) {
            return SessionError::Cancelled;
        }

        uint64_t now = monotonic_ms();
        if (now >= deadline) {
            LOG_ERROR("Handshake from %s incomplete after %u ms", peer, m_config.io_timeout_ms);
            return SessionError::HandshakeTransportFailure;
        }

        uint32_t slice = static_cast<uint32_t>(
            std::min<uint64_t>(deadline - now, HANDSHAKE_POLL_SLICE_MS));

        size_t received = 0;
        network::SocketResult result = sock.recv(chunk, sizeof(chunk), received,
                                                 static_cast<int32_t>(slice));
        if (result == network::SocketResult::Timeout ||
            result == network::SocketResult::WouldBlock) {
            continue;
        }
        if (result == network::SocketResult::Closed) {
            if (message.empty()) {
                LOG_ERROR("Handshake: %s closed the connection", peer);
                return SessionError::HandshakeTransportFailure;
            }
            LOG_ERROR("Handshake from %s ended without terminator (%zu bytes)",
                      peer, message.size());
            return SessionError::HandshakeMalformed;
        }
        if (result != network::SocketResult::Success) {
            LOG_ERROR("Handshake read from %s failed: %s",
                      peer, network::socket_result_to_string(result));
            return SessionError::HandshakeTransportFailure;
        }

        size_t length = 0;
        if (protocol::find_terminator(chunk, received, length)) {
            message.insert(message.end(), chunk, chunk + length);
            if (length < received) {
                LOG_VERBOSE("Dropping %zu bytes after %s handshake", received - length, peer);
            }
            break;
        }

        message.insert(message.end(), chunk, chunk + received);
        if (message.size() >= protocol::MAX_HANDSHAKE_SIZE) {
            LOG_ERROR("Handshake from %s exceeds %zu bytes", peer, protocol::MAX_HANDSHAKE_SIZE);
            return SessionError::HandshakeMalformed;
        }
    }

    if (message.size() > protocol::MAX_HANDSHAKE_SIZE) {
        LOG_ERROR("Handshake from %s exceeds %zu bytes", peer, protocol::MAX_HANDSHAKE_SIZE);
        return SessionError::HandshakeMalformed;
    }

    LOG_VERBOSE("Handshake from %s: %zu bytes", peer, message.size());
    return SessionError::None;
}

} // namespace sumo_mitm::session
