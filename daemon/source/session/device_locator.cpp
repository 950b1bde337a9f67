/**
 * @file device_locator.cpp
 * @brief Finds the real device on the local network
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "device_locator.hpp"
#include "activity_clock.hpp"
#include "../debug/log.hpp"
#include "../network/address.hpp"

#include <algorithm>
#include <vector>

namespace sumo_mitm::session {

SessionError DeviceLocator::locate(const char* service_type, uint32_t timeout_ms,
                                   DeviceEndpoint& device) {
    LOG_INFO("Looking for %s (timeout %u ms)", service_type, timeout_ms);

    const uint64_t deadline = monotonic_ms() + timeout_ms;
    std::vector<discovery::ServiceInstance> instances;

    for (;;) {
        if (m_stop.stop_requested()) {
            return SessionError::Cancelled;
        }

        uint64_t round_start = monotonic_ms();
        if (round_start >= deadline) {
            LOG_WARN("No %s device within %u ms", service_type, timeout_ms);
            return SessionError::DiscoveryTimeout;
        }

        uint32_t round = static_cast<uint32_t>(
            std::min<uint64_t>(deadline - round_start, LOCATE_ROUND_MS));

        instances.clear();
        discovery::DiscoveryResult result = m_browser.browse(service_type, round, instances);
        if (result != discovery::DiscoveryResult::Success) {
            LOG_ERROR("Browse for %s failed: %s",
                      service_type, discovery::discovery_result_to_string(result));
            return SessionError::DiscoveryTransportFailure;
        }

        if (!instances.empty()) {
            const discovery::ServiceInstance& first = instances.front();
            device.instance_name = first.name;
            device.address = first.address;
            device.handshake_port = first.port;

            char ip[network::IPV4_STRING_LENGTH];
            LOG_INFO("Device '%s' at %s:%u%s", first.name.c_str(),
                     network::format_ipv4(first.address, ip, sizeof(ip)), first.port,
                     instances.size() > 1 ? " (first of several)" : "");
            return SessionError::None;
        }

        // Browsers may return early; keep rounds at their nominal length
        uint64_t elapsed = monotonic_ms() - round_start;
        if (elapsed < round && m_stop.wait_for(static_cast<uint32_t>(round - elapsed))) {
            return SessionError::Cancelled;
        }
    }
}

} // namespace sumo_mitm::session
