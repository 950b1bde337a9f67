/**
 * @file port_policy.hpp
 * @brief Derivation of the proxy's UDP ports from the negotiated ones
 *
 * When the proxy runs on the same host as a peer it cannot listen on the
 * very port that peer listens on, so each negotiated port is shifted by a
 * small offset (client +1, device -1 by default). When the proxy has a host
 * of its own the ports can be kept unchanged.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>

#include "../config/config.hpp"

namespace sumo_mitm::session {

struct PortPolicy {
    config::PortPolicyMode mode;
    int32_t client_port_offset;
    int32_t device_port_offset;

    static PortPolicy from_config(const config::HandshakeConfig& config) {
        return PortPolicy{config.port_policy, config.client_port_offset, config.device_port_offset};
    }

    /**
     * @brief Port the proxy promises to the device in place of d2c_port
     * @return false if the result is not a usable port (1..65535)
     */
    bool client_facing_port(uint16_t d2c_port, uint16_t& proxy_port) const {
        return derive(d2c_port, client_port_offset, proxy_port);
    }

    /**
     * @brief Port the proxy promises to the client in place of c2d_port
     * @return false if the result is not a usable port (1..65535)
     */
    bool device_facing_port(uint16_t c2d_port, uint16_t& proxy_port) const {
        return derive(c2d_port, device_port_offset, proxy_port);
    }

private:
    bool derive(uint16_t port, int32_t offset, uint16_t& proxy_port) const {
        int32_t value = port;
        if (mode == config::PortPolicyMode::Offset) {
            value += offset;
        }
        if (value < 1 || value > 65535) {
            return false;
        }
        proxy_port = static_cast<uint16_t>(value);
        return true;
    }
};

} // namespace sumo_mitm::session
