/**
 * @file proxy_announcer.hpp
 * @brief Advertises the proxy as if it were the device
 *
 * The client discovers devices by mDNS. For each local address the proxy
 * publishes an instance "<service_name>-a-b-c-d" of the device's service
 * type, carrying the device's handshake port, so the client connects to the
 * proxy instead of the device.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "session_types.hpp"
#include "../config/config.hpp"
#include "../discovery/interfaces/iservice_publisher.hpp"

namespace sumo_mitm::session {

/**
 * @brief Published records of one session
 *
 * Withdraws every record it owns when destroyed or reset, so a failing
 * session never leaves a stale advertisement behind. Move-only.
 */
class Announcement {
public:
    Announcement() : m_publisher(nullptr) {}
    ~Announcement();

    Announcement(const Announcement&) = delete;
    Announcement& operator=(const Announcement&) = delete;

    Announcement(Announcement&& other) noexcept;
    Announcement& operator=(Announcement&& other) noexcept;

    /**
     * @brief Withdraw all records now
     */
    void reset();

    const std::vector<std::string>& names() const { return m_names; }
    bool empty() const { return m_names.empty(); }

private:
    friend class ProxyAnnouncer;

    discovery::IServicePublisher* m_publisher;
    std::vector<std::string> m_names;
};

class ProxyAnnouncer {
public:
    ProxyAnnouncer(discovery::IServicePublisher& publisher, const config::DiscoveryConfig& config)
        : m_publisher(publisher)
        , m_config(config)
    {
    }

    /**
     * @brief Publish one record per local address
     *
     * @param device Device being impersonated
     * @param handshake_port Port the interceptor will accept on
     * @param addresses Local IPv4 addresses (host order)
     * @param[out] announcement Owner of the published records
     * @return None or AnnouncePublishFailure (nothing stays published)
     */
    SessionError announce(const DeviceEndpoint& device, uint16_t handshake_port,
                          const std::vector<uint32_t>& addresses, Announcement& announcement);

    /**
     * @brief Instance name for a local address, e.g. "Sumo-192-168-2-10"
     */
    static std::string instance_name(const char* prefix, uint32_t address);

private:
    discovery::IServicePublisher& m_publisher;
    config::DiscoveryConfig m_config;
};

} // namespace sumo_mitm::session
