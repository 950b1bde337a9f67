/**
 * @file discovery_types.hpp
 * @brief Types shared by service browsing and publishing
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <string>

namespace sumo_mitm::discovery {

enum class DiscoveryResult {
    Success = 0,
    NotStarted,         ///< Transport not running
    TransportFailure,   ///< Socket error while sending or receiving
    InvalidRecord,      ///< Record cannot be encoded (name too long, etc.)
    NotFound            ///< withdraw() of a record that was never published
};

inline const char* discovery_result_to_string(DiscoveryResult result) {
    switch (result) {
        case DiscoveryResult::Success:          return "Success";
        case DiscoveryResult::NotStarted:       return "NotStarted";
        case DiscoveryResult::TransportFailure: return "TransportFailure";
        case DiscoveryResult::InvalidRecord:    return "InvalidRecord";
        case DiscoveryResult::NotFound:         return "NotFound";
        default:                                return "Unknown";
    }
}

/**
 * @brief One resolved service instance seen on the network
 */
struct ServiceInstance {
    std::string name;   ///< Instance label, e.g. "JS_123456"
    uint32_t address;   ///< IPv4 (host order)
    uint16_t port;      ///< SRV port
};

/**
 * @brief One instance we advertise
 */
struct ServiceRecord {
    std::string service_type;   ///< e.g. "_arsdk-0902._udp.local."
    std::string name;           ///< Instance label, e.g. "Sumo-192-168-2-10"
    uint32_t address;           ///< Address carried in the A record (host order)
    uint16_t port;              ///< SRV port
};

} // namespace sumo_mitm::discovery
