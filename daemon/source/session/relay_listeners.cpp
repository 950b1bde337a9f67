/**
 * @file relay_listeners.cpp
 * @brief UDP listeners bound on the proxy ports of one session
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "relay_listeners.hpp"
#include "../debug/log.hpp"

namespace sumo_mitm::session {

RelayListeners::RelayListeners(uint32_t bind_address)
    : m_bind_address(bind_address)
    , m_count(0)
    , m_bind_failed(false)
{
}

network::SocketResult RelayListeners::reserve(uint16_t port) {
    if (find(port) != nullptr) {
        // Shared-port mode: both directions use one listener
        return network::SocketResult::Success;
    }

    if (m_count >= MAX_RELAY_LISTENERS) {
        LOG_ERROR("Relay listener table full, cannot reserve UDP port %u", port);
        m_bind_failed = true;
        return network::SocketResult::SocketError;
    }

    Entry& entry = m_entries[m_count];
    network::SocketResult result = entry.socket.bind(m_bind_address, port);
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Cannot bind relay listener on UDP port %u: %s",
                  port, network::socket_result_to_string(result));
        m_bind_failed = true;
        return result;
    }

    entry.port = port;
    m_count++;
    LOG_VERBOSE("Relay listener bound on UDP port %u", port);
    return network::SocketResult::Success;
}

network::UdpSocket* RelayListeners::find(uint16_t port) {
    for (size_t i = 0; i < m_count; i++) {
        if (m_entries[i].port == port) {
            return &m_entries[i].socket;
        }
    }
    return nullptr;
}

void RelayListeners::close_all() {
    for (size_t i = 0; i < m_count; i++) {
        m_entries[i].socket.close();
        m_entries[i].port = 0;
    }
    m_count = 0;
}

} // namespace sumo_mitm::session
