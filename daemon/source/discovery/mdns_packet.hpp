/**
 * @file mdns_packet.hpp
 * @brief Multicast DNS message encoding and decoding
 *
 * Covers the subset of RFC 1035 / RFC 6762 needed for DNS-SD browsing and
 * advertising: questions plus PTR, SRV, TXT and A records. Names are handled
 * in canonical form (lowercase is only applied for comparison, no trailing
 * dot). Decoding follows compression pointers; encoding never compresses.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sumo_mitm::discovery {

// ============================================================================
// Constants
// ============================================================================

constexpr uint16_t MDNS_PORT = 5353;
constexpr uint32_t MDNS_GROUP = 0xE00000FB;        ///< 224.0.0.251

constexpr size_t DNS_HEADER_SIZE = 12;
constexpr size_t DNS_MAX_NAME_LENGTH = 255;
constexpr size_t DNS_MAX_LABEL_LENGTH = 63;
constexpr size_t MDNS_MAX_PACKET_SIZE = 9000;

constexpr uint16_t DNS_FLAG_RESPONSE = 0x8000;
constexpr uint16_t DNS_FLAG_AUTHORITATIVE = 0x0400;

constexpr uint16_t DNS_CLASS_IN = 0x0001;
constexpr uint16_t DNS_CLASS_MASK = 0x7FFF;
constexpr uint16_t MDNS_CACHE_FLUSH = 0x8000;      ///< Record class high bit
constexpr uint16_t MDNS_UNICAST_RESPONSE = 0x8000; ///< Question class high bit

constexpr uint32_t MDNS_DEFAULT_TTL = 120;
constexpr uint32_t MDNS_GOODBYE_TTL = 0;

/// DNS-SD service type enumeration name
constexpr const char* DNS_SD_SERVICES_NAME = "_services._dns-sd._udp.local";

enum class DnsType : uint16_t {
    A   = 1,
    PTR = 12,
    TXT = 16,
    SRV = 33,
    ANY = 255
};

// ============================================================================
// Message model
// ============================================================================

struct DnsQuestion {
    std::string name;
    uint16_t type;
    uint16_t klass;     ///< Including the unicast-response bit
};

/**
 * @brief One resource record
 *
 * Only the fields of the record's type are meaningful. Records of other
 * types decode with their rdata skipped.
 */
struct DnsRecord {
    std::string name;
    uint16_t type;
    uint16_t klass;     ///< Including the cache-flush bit
    uint32_t ttl;

    std::string target;             ///< PTR target or SRV target host
    uint16_t priority;              ///< SRV
    uint16_t weight;                ///< SRV
    uint16_t port;                  ///< SRV
    uint32_t address;               ///< A (host order)
    std::vector<std::string> txt;   ///< TXT strings

    DnsRecord()
        : type(0), klass(DNS_CLASS_IN), ttl(0)
        , priority(0), weight(0), port(0), address(0)
    {
    }
};

struct DnsMessage {
    uint16_t id;
    uint16_t flags;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    DnsMessage() : id(0), flags(0) {}

    bool is_response() const { return (flags & DNS_FLAG_RESPONSE) != 0; }
};

// ============================================================================
// Record builders
// ============================================================================

DnsRecord make_ptr_record(const std::string& name, const std::string& target, uint32_t ttl);
DnsRecord make_srv_record(const std::string& name, const std::string& target,
                          uint16_t port, uint32_t ttl);
DnsRecord make_txt_record(const std::string& name, uint32_t ttl);
DnsRecord make_a_record(const std::string& name, uint32_t address, uint32_t ttl);

// ============================================================================
// Names
// ============================================================================

/**
 * @brief Lowercase copy without trailing dot
 *
 * DNS names compare case-insensitively; "_Foo._udp.local." and
 * "_foo._udp.local" are the same name.
 */
std::string canonical_name(const std::string& name);

/**
 * @brief Append a name in wire format (no compression)
 *
 * @return false if a label is empty or longer than 63 bytes, or the whole
 *         name is longer than 255 bytes
 */
bool encode_name(const std::string& name, std::vector<uint8_t>& out);

/**
 * @brief Read a possibly compressed name
 *
 * @param offset In: start of the name. Out: first byte after the name in
 *               the original position (not after a pointer target).
 * @return false on truncation, pointer loops or oversize names
 */
bool read_name(const uint8_t* data, size_t size, size_t& offset, std::string& name);

// ============================================================================
// Messages
// ============================================================================

/**
 * @brief Serialize a message
 *
 * @return false if any name or record cannot be represented
 */
bool encode_message(const DnsMessage& message, std::vector<uint8_t>& out);

/**
 * @brief Parse a message
 *
 * @return false if the packet is truncated or malformed
 */
bool decode_message(const uint8_t* data, size_t size, DnsMessage& message);

const char* dns_type_to_string(uint16_t type);

} // namespace sumo_mitm::discovery
