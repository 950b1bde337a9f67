/**
 * @file iservice_publisher.hpp
 * @brief Publish capability consumed by the proxy announcer
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <string>

#include "../discovery_types.hpp"

namespace sumo_mitm::discovery {

class IServicePublisher {
public:
    virtual ~IServicePublisher() = default;

    /**
     * @brief Advertise a record until it is withdrawn
     */
    virtual DiscoveryResult publish(const ServiceRecord& record) = 0;

    /**
     * @brief Stop advertising the record with this instance name
     */
    virtual DiscoveryResult withdraw(const std::string& name) = 0;
};

} // namespace sumo_mitm::discovery
