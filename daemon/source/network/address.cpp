/**
 * @file address.cpp
 * @brief IPv4 address helpers implementation
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "address.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace sumo_mitm::network {

bool parse_ipv4(const char* text, uint32_t& address) {
    if (text == nullptr || text[0] == '\0') {
        return false;
    }

    struct in_addr addr;
    if (inet_pton(AF_INET, text, &addr) != 1) {
        return false;
    }

    address = ntohl(addr.s_addr);
    return true;
}

const char* format_ipv4(uint32_t address, char* buffer, size_t buffer_size) {
    if (buffer == nullptr || buffer_size == 0) {
        return "";
    }

    std::snprintf(buffer, buffer_size, "%u.%u.%u.%u",
                  (address >> 24) & 0xFF,
                  (address >> 16) & 0xFF,
                  (address >> 8) & 0xFF,
                  address & 0xFF);
    return buffer;
}

bool parse_endpoint(const char* text, Endpoint& endpoint) {
    if (text == nullptr) {
        return false;
    }

    while (*text == ' ' || *text == '\t') {
        text++;
    }

    const char* colon = std::strrchr(text, ':');
    if (colon == nullptr || colon == text) {
        return false;
    }

    size_t host_len = static_cast<size_t>(colon - text);
    if (host_len >= IPV4_STRING_LENGTH) {
        return false;
    }

    char host[IPV4_STRING_LENGTH];
    std::memcpy(host, text, host_len);
    host[host_len] = '\0';

    char* end = nullptr;
    unsigned long port = std::strtoul(colon + 1, &end, 10);
    if (end == colon + 1) {
        return false;
    }
    while (*end == ' ' || *end == '\t') {
        end++;
    }
    if (*end != '\0' || port == 0 || port > 65535) {
        return false;
    }

    uint32_t address = 0;
    if (!parse_ipv4(host, address)) {
        return false;
    }

    endpoint.address = address;
    endpoint.port = static_cast<uint16_t>(port);
    return true;
}

bool enumerate_local_ipv4(std::vector<uint32_t>& addresses, bool include_loopback) {
    addresses.clear();

    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        return false;
    }

    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0) {
            continue;
        }
        if (!include_loopback && (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        const auto* sin = reinterpret_cast<const struct sockaddr_in*>(it->ifa_addr);
        uint32_t address = ntohl(sin->sin_addr.s_addr);
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(address);
        }
    }

    freeifaddrs(interfaces);

    std::sort(addresses.begin(), addresses.end());
    return true;
}

} // namespace sumo_mitm::network
