/**
 * @file session_types.hpp
 * @brief Shared types of the interception session
 *
 * One session walks four stages in order:
 *
 * @code
 * Locate -> Announce -> Handshake -> Relay (+ Watchdog)
 * @endcode
 *
 * Any failure ends the session with a SessionError and the stage it
 * happened in; the supervisor logs the pair and starts a fresh session.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <string>

namespace sumo_mitm::session {

// ============================================================================
// Errors and Stages
// ============================================================================

/**
 * @brief Why a session ended
 *
 * Every value except None is fatal to the current session only.
 */
enum class SessionError {
    None = 0,
    DiscoveryTimeout,           ///< No device found within the locate timeout
    DiscoveryTransportFailure,  ///< Browse capability failed
    AnnouncePublishFailure,     ///< A proxy record could not be published
    HandshakeTimeout,           ///< No client connected within the timeout
    HandshakeMalformed,         ///< Missing/invalid port field or bad framing
    HandshakeTransportFailure,  ///< TCP I/O failed on either leg
    DeviceBusy,                 ///< Device answered c2d_port = 0
    SessionInactive,            ///< Watchdog saw no traffic for too long
    ListenerBindFailure,        ///< A TCP or UDP listener could not be bound
    ListenerFailure,            ///< A relay listener failed while receiving
    Cancelled                   ///< Stop was requested
};

enum class SessionStage {
    Locate,
    Announce,
    Handshake,
    Relay
};

inline const char* session_error_to_string(SessionError error) {
    switch (error) {
        case SessionError::None:                      return "None";
        case SessionError::DiscoveryTimeout:          return "DiscoveryTimeout";
        case SessionError::DiscoveryTransportFailure: return "DiscoveryTransportFailure";
        case SessionError::AnnouncePublishFailure:    return "AnnouncePublishFailure";
        case SessionError::HandshakeTimeout:          return "HandshakeTimeout";
        case SessionError::HandshakeMalformed:        return "HandshakeMalformed";
        case SessionError::HandshakeTransportFailure: return "HandshakeTransportFailure";
        case SessionError::DeviceBusy:                return "DeviceBusy";
        case SessionError::SessionInactive:           return "SessionInactive";
        case SessionError::ListenerBindFailure:       return "ListenerBindFailure";
        case SessionError::ListenerFailure:           return "ListenerFailure";
        case SessionError::Cancelled:                 return "Cancelled";
        default:                                      return "Unknown";
    }
}

inline const char* session_stage_to_string(SessionStage stage) {
    switch (stage) {
        case SessionStage::Locate:    return "Locate";
        case SessionStage::Announce:  return "Announce";
        case SessionStage::Handshake: return "Handshake";
        case SessionStage::Relay:     return "Relay";
        default:                      return "Unknown";
    }
}

// ============================================================================
// Session Data
// ============================================================================

/**
 * @brief The real device, as found by the locator
 */
struct DeviceEndpoint {
    std::string instance_name;  ///< mDNS instance name
    uint32_t address;           ///< IPv4 (host order)
    uint16_t handshake_port;    ///< TCP port of the JSON handshake
};

/**
 * @brief Ports agreed during the handshake
 *
 * The "proxy" ports are where the proxy listens; the "inbound" ports are
 * where the real peers listen.
 */
struct NegotiatedPorts {
    uint16_t device_inbound_port;       ///< Device's real c2d_port (0 = busy)
    uint16_t client_inbound_port;       ///< Client's real d2c_port
    uint16_t proxy_device_facing_port;  ///< Promised to the client as c2d_port
    uint16_t proxy_client_facing_port;  ///< Promised to the device as d2c_port
};

/**
 * @brief Everything the relay needs, produced by the handshake interceptor
 */
struct InterceptResult {
    uint32_t client_address;    ///< Peer address of the accepted connection
    NegotiatedPorts ports;
};

/**
 * @brief Outcome of one supervised session
 */
struct SessionReport {
    SessionStage stage;     ///< Last stage entered
    SessionError error;     ///< Why it ended
};

} // namespace sumo_mitm::session
