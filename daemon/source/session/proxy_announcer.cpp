/**
 * @file proxy_announcer.cpp
 * @brief Advertises the proxy as if it were the device
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "proxy_announcer.hpp"
#include "../debug/log.hpp"
#include "../network/address.hpp"

#include <cstdio>
#include <utility>

namespace sumo_mitm::session {

// =============================================================================
// Announcement
// =============================================================================

Announcement::~Announcement() {
    reset();
}

Announcement::Announcement(Announcement&& other) noexcept
    : m_publisher(other.m_publisher)
    , m_names(std::move(other.m_names))
{
    other.m_publisher = nullptr;
    other.m_names.clear();
}

Announcement& Announcement::operator=(Announcement&& other) noexcept {
    if (this != &other) {
        reset();

        m_publisher = other.m_publisher;
        m_names = std::move(other.m_names);

        other.m_publisher = nullptr;
        other.m_names.clear();
    }
    return *this;
}

void Announcement::reset() {
    if (m_publisher != nullptr) {
        for (const std::string& name : m_names) {
            discovery::DiscoveryResult result = m_publisher->withdraw(name);
            if (result != discovery::DiscoveryResult::Success) {
                LOG_WARN("Cannot withdraw '%s': %s",
                         name.c_str(), discovery::discovery_result_to_string(result));
            } else {
                LOG_VERBOSE("Withdrew '%s'", name.c_str());
            }
        }
    }
    m_names.clear();
    m_publisher = nullptr;
}

// =============================================================================
// ProxyAnnouncer
// =============================================================================

std::string ProxyAnnouncer::instance_name(const char* prefix, uint32_t address) {
    char name[96];
    std::snprintf(name, sizeof(name), "%s-%u-%u-%u-%u", prefix,
                  (address >> 24) & 0xFF, (address >> 16) & 0xFF,
                  (address >> 8) & 0xFF, address & 0xFF);
    return name;
}

SessionError ProxyAnnouncer::announce(const DeviceEndpoint& device, uint16_t handshake_port,
                                      const std::vector<uint32_t>& addresses,
                                      Announcement& announcement) {
    announcement.reset();

    if (addresses.empty()) {
        LOG_ERROR("No local IPv4 address to announce on");
        return SessionError::AnnouncePublishFailure;
    }

    Announcement published;
    published.m_publisher = &m_publisher;

    for (uint32_t address : addresses) {
        discovery::ServiceRecord record;
        record.service_type = m_config.service_type;
        record.name = instance_name(m_config.service_name, address);
        record.address = address;
        record.port = handshake_port;

        discovery::DiscoveryResult result = m_publisher.publish(record);
        if (result != discovery::DiscoveryResult::Success) {
            LOG_ERROR("Cannot publish '%s': %s",
                      record.name.c_str(), discovery::discovery_result_to_string(result));
            return SessionError::AnnouncePublishFailure;  // published records withdrawn here
        }

        char ip[network::IPV4_STRING_LENGTH];
        LOG_INFO("Announced '%s' at %s:%u for device '%s'", record.name.c_str(),
                 network::format_ipv4(address, ip, sizeof(ip)), handshake_port,
                 device.instance_name.c_str());
        published.m_names.push_back(record.name);
    }

    announcement = std::move(published);
    return SessionError::None;
}

} // namespace sumo_mitm::session
