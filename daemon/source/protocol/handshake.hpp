/**
 * @file handshake.hpp
 * @brief ARSDK TCP handshake payload codec
 *
 * The controller client and the device exchange one JSON object each over
 * TCP, terminated by a single NUL byte:
 *
 * @code
 * client -> device: {"controller_type":"...","controller_name":"...","d2c_port":54321}\0
 * device -> client: {"status":0,"c2d_port":54320,"arstream_fragment_size":65000,...}\0
 * @endcode
 *
 * Only two integer fields matter to the proxy:
 * - `d2c_port` (request): where the client listens for device->client UDP
 * - `c2d_port` (response): where the device listens for client->device UDP;
 *   0 means the device is already paired with another controller
 *
 * This codec locates those fields without building a document. A rewrite
 * replaces the digits of the number token and nothing else, so every other
 * byte of the payload (key order, whitespace, unknown fields, the trailing
 * NUL) reaches the peer exactly as sent.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace sumo_mitm::protocol {

// ============================================================================
// Constants
// ============================================================================

/** @brief Request key carrying the client's receive port */
constexpr const char* D2C_PORT_KEY = "d2c_port";

/** @brief Response key carrying the device's receive port */
constexpr const char* C2D_PORT_KEY = "c2d_port";

/** @brief Upper bound on one handshake message, terminator included */
constexpr size_t MAX_HANDSHAKE_SIZE = 102400;

/** @brief Message terminator */
constexpr uint8_t HANDSHAKE_TERMINATOR = 0x00;

/** @brief c2d_port value announcing a device that is already paired */
constexpr uint16_t DEVICE_BUSY_PORT = 0;

// ============================================================================
// Result Codes
// ============================================================================

enum class HandshakeResult {
    Success = 0,
    Unterminated,       ///< No NUL byte in the payload
    KeyNotFound,        ///< Key absent at the top level of the object
    InvalidValue,       ///< Value is not a plain non-negative integer
    ValueOutOfRange     ///< Integer does not fit a UDP port (0..65535)
};

inline const char* handshake_result_to_string(HandshakeResult result) {
    switch (result) {
        case HandshakeResult::Success:         return "Success";
        case HandshakeResult::Unterminated:    return "Unterminated";
        case HandshakeResult::KeyNotFound:     return "KeyNotFound";
        case HandshakeResult::InvalidValue:    return "InvalidValue";
        case HandshakeResult::ValueOutOfRange: return "ValueOutOfRange";
        default:                               return "Unknown";
    }
}

// ============================================================================
// Field Location
// ============================================================================

/**
 * @brief Position of an integer field's number token inside a payload
 */
struct PortField {
    size_t offset;      ///< First digit
    size_t length;      ///< Digit count
    uint16_t value;     ///< Parsed value
};

/**
 * @brief Find the end of a handshake message
 *
 * @param data Received bytes
 * @param size Number of bytes
 * @param[out] length Message length including the terminator
 * @return true if a terminator was found
 */
bool find_terminator(const uint8_t* data, size_t size, size_t& length);

/**
 * @brief Locate a top-level integer field
 *
 * Scans up to the first NUL. Keys inside nested objects or arrays and
 * key-like text inside string values are ignored. When the key repeats,
 * the last top-level occurrence wins.
 *
 * @param data Payload bytes (must contain the terminator)
 * @param size Payload size
 * @param key Field name, e.g. D2C_PORT_KEY
 * @param[out] field Location and value (valid on Success)
 */
HandshakeResult find_port_field(const uint8_t* data, size_t size, const char* key, PortField& field);

/**
 * @brief Read a port field
 */
HandshakeResult read_port(const std::vector<uint8_t>& payload, const char* key, uint16_t& port);

/**
 * @brief Replace a port field's value in place
 *
 * Only the digits of the number token change; the payload grows or shrinks
 * by the difference in digit count.
 *
 * @param[in,out] payload Terminated handshake message
 * @param key Field name
 * @param port New value
 */
HandshakeResult rewrite_port(std::vector<uint8_t>& payload, const char* key, uint16_t port);

} // namespace sumo_mitm::protocol
