/**
 * @file device_locator.hpp
 * @brief Finds the real device on the local network
 *
 * ARSDK devices advertise themselves over mDNS (service type
 * "_arsdk-0902._udp.local." for the Jumping Sumo). The locator browses in
 * rounds until the first instance shows up or the timeout runs out.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>

#include "session_types.hpp"
#include "../discovery/interfaces/iservice_browser.hpp"
#include "../util/stop_signal.hpp"

namespace sumo_mitm::session {

/** @brief Duration of one browse round */
constexpr uint32_t LOCATE_ROUND_MS = 1000;

class DeviceLocator {
public:
    DeviceLocator(discovery::IServiceBrowser& browser, const util::StopSignal& stop)
        : m_browser(browser)
        , m_stop(stop)
    {
    }

    /**
     * @brief Wait for the first device of service_type
     *
     * When several devices answer, the first one reported is used.
     *
     * @param service_type mDNS service type to browse
     * @param timeout_ms Overall timeout
     * @param[out] device Found device (valid on None)
     * @return None, DiscoveryTimeout, DiscoveryTransportFailure or Cancelled
     */
    SessionError locate(const char* service_type, uint32_t timeout_ms, DeviceEndpoint& device);

private:
    discovery::IServiceBrowser& m_browser;
    const util::StopSignal& m_stop;
};

} // namespace sumo_mitm::session
