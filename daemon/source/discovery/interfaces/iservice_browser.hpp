/**
 * @file iservice_browser.hpp
 * @brief Browse capability consumed by the device locator
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <vector>

#include "../discovery_types.hpp"

namespace sumo_mitm::discovery {

class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;

    /**
     * @brief Run one browse round
     *
     * Sends a query for service_type and collects the instances resolved
     * within wait_ms. An empty result with Success means nothing answered
     * yet; the caller decides whether to try again.
     *
     * @param service_type e.g. "_arsdk-0902._udp.local."
     * @param wait_ms Round duration
     * @param[out] instances Resolved instances, in order of discovery
     */
    virtual DiscoveryResult browse(const char* service_type, uint32_t wait_ms,
                                   std::vector<ServiceInstance>& instances) = 0;
};

} // namespace sumo_mitm::discovery
