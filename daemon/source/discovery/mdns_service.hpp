/**
 * @file mdns_service.hpp
 * @brief DNS-SD over multicast DNS: browsing and advertising
 *
 * One UDP socket on port 5353, joined to 224.0.0.251, shared by both roles:
 *
 * - Browsing sends a PTR query for a service type and resolves the
 *   answers (PTR -> SRV -> A) from a TTL-bounded cache filled by every
 *   response seen on the link, solicited or not.
 * - Advertising answers PTR/SRV/TXT/A queries for published records,
 *   announces each record when published and again before its TTL runs
 *   out, and sends a goodbye (TTL 0) when it is withdrawn.
 *
 * A background thread owns the receive side. browse(), publish() and
 * withdraw() may be called from any thread.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "discovery_types.hpp"
#include "mdns_packet.hpp"
#include "interfaces/iservice_browser.hpp"
#include "interfaces/iservice_publisher.hpp"
#include "../network/udp_socket.hpp"

namespace sumo_mitm::discovery {

constexpr uint32_t MDNS_POLL_SLICE_MS = 100;
constexpr uint32_t MDNS_SECOND_ANNOUNCE_MS = 1000;   ///< RFC 6762 8.3 repeat
constexpr uint8_t MDNS_MULTICAST_TTL = 255;

/**
 * @brief Where the service listens and sends
 *
 * A non-multicast destination skips group membership; queries and
 * announcements then go to that unicast address only.
 */
struct MdnsOptions {
    uint32_t destination = MDNS_GROUP;
    uint16_t port = MDNS_PORT;
    uint32_t interface_address = network::ANY_ADDRESS;
};

class MdnsService : public IServiceBrowser, public IServicePublisher {
public:
    explicit MdnsService(const MdnsOptions& options = MdnsOptions());
    ~MdnsService() override;

    MdnsService(const MdnsService&) = delete;
    MdnsService& operator=(const MdnsService&) = delete;

    /**
     * @brief Bind, join the group and start the receive thread
     */
    DiscoveryResult start();

    /**
     * @brief Send goodbyes for everything still published, then shut down
     */
    void stop();

    bool is_running() const { return m_running.load(); }

    // IServiceBrowser
    DiscoveryResult browse(const char* service_type, uint32_t wait_ms,
                           std::vector<ServiceInstance>& instances) override;

    // IServicePublisher
    DiscoveryResult publish(const ServiceRecord& record) override;
    DiscoveryResult withdraw(const std::string& name) override;

    /**
     * @brief Feed one received datagram
     *
     * Responses update the cache, queries are answered. Called by the
     * receive thread for every datagram.
     */
    void process_packet(const uint8_t* data, size_t size,
                        uint32_t src_address, uint16_t src_port);

    /**
     * @brief Resolved instances of a type currently in the cache
     *
     * Own published instances are excluded. Instances with a PTR but no SRV
     * yet are listed in unresolved (full instance names).
     */
    void get_cached_instances(const std::string& service_type,
                              std::vector<ServiceInstance>& instances,
                              std::vector<std::string>* unresolved = nullptr) const;

    /**
     * @brief Answers for a query from our published records
     *
     * @return false if nothing matched
     */
    bool build_answer(const DnsMessage& query, DnsMessage& response) const;

    size_t get_published_count() const;

    /**
     * @brief Bound port (useful when options.port is 0)
     */
    uint16_t get_port() const { return m_socket.get_port(); }

private:
    struct PublishedService {
        ServiceRecord record;
        std::string type_name;       ///< canonical service type
        std::string instance_name;   ///< "<label>.<type>"
        std::string host_name;       ///< "<label>.local"
        uint64_t next_announce_ms;
    };

    struct PointerEntry {
        std::string type_name;       ///< canonical
        std::string instance_name;   ///< as received
        uint64_t expires_ms;
    };

    struct ServiceEntry {
        std::string target;          ///< canonical host name
        uint16_t port;
        uint32_t source_address;
        uint64_t expires_ms;
    };

    struct HostEntry {
        uint32_t address;
        uint64_t expires_ms;
    };

    void receive_loop();
    void handle_response(const DnsMessage& message, uint32_t src_address);
    void handle_query(const DnsMessage& message, uint32_t src_address, uint16_t src_port);
    void announce_due();

    DiscoveryResult send_query(const std::string& name, DnsType type);
    DiscoveryResult send_announcement(const PublishedService& service, uint32_t ttl);
    DiscoveryResult send_message(const DnsMessage& message, uint32_t address, uint16_t port);

    void append_service_records(const PublishedService& service, uint32_t ttl,
                                DnsMessage& message, bool with_pointer) const;

    const PublishedService* find_published(const std::string& canonical_instance) const;
    void expire_cache(uint64_t now);

    MdnsOptions m_options;
    network::UdpSocket m_socket;
    std::thread m_thread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_transport_failed;

    mutable std::mutex m_mutex;
    std::condition_variable m_cache_changed;
    std::vector<PublishedService> m_published;
    std::vector<PointerEntry> m_pointers;
    std::map<std::string, ServiceEntry> m_services;   ///< canonical instance name
    std::map<std::string, HostEntry> m_hosts;         ///< canonical host name
};

} // namespace sumo_mitm::discovery
