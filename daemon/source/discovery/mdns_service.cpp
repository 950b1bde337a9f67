/**
 * @file mdns_service.cpp
 * @brief DNS-SD over multicast DNS: browsing and advertising
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "mdns_service.hpp"
#include "../debug/log.hpp"
#include "../network/address.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace sumo_mitm::discovery {

namespace {

uint64_t now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

bool is_multicast(uint32_t address) {
    return (address & 0xF0000000) == 0xE0000000;
}

/// Re-announce once three quarters of the TTL have elapsed
uint64_t reannounce_delay_ms() {
    return static_cast<uint64_t>(MDNS_DEFAULT_TTL) * 1000 * 3 / 4;
}

bool has_suffix(const std::string& name, const std::string& suffix) {
    return name.size() > suffix.size() + 1 &&
           name[name.size() - suffix.size() - 1] == '.' &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains_record(const std::vector<DnsRecord>& records, const DnsRecord& record) {
    for (const DnsRecord& existing : records) {
        if (existing.type == record.type && existing.name == record.name &&
            existing.target == record.target) {
            return true;
        }
    }
    return false;
}

void add_record(std::vector<DnsRecord>& records, DnsRecord record) {
    if (!contains_record(records, record)) {
        records.push_back(std::move(record));
    }
}

bool type_matches(uint16_t question_type, DnsType wanted) {
    return question_type == static_cast<uint16_t>(wanted) ||
           question_type == static_cast<uint16_t>(DnsType::ANY);
}

} // anonymous namespace

MdnsService::MdnsService(const MdnsOptions& options)
    : m_options(options)
    , m_running(false)
    , m_transport_failed(false)
{
}

MdnsService::~MdnsService() {
    stop();
}

DiscoveryResult MdnsService::start() {
    if (m_running.load()) {
        return DiscoveryResult::Success;
    }

    network::SocketResult result = m_socket.bind(network::ANY_ADDRESS, m_options.port, true);
    if (result != network::SocketResult::Success) {
        LOG_ERROR("mDNS: cannot bind UDP port %u: %s",
                  m_options.port, network::socket_result_to_string(result));
        return DiscoveryResult::TransportFailure;
    }

    if (is_multicast(m_options.destination)) {
        result = m_socket.join_multicast(m_options.destination, m_options.interface_address);
        if (result == network::SocketResult::Success) {
            result = m_socket.set_multicast_ttl(MDNS_MULTICAST_TTL);
        }
        if (result == network::SocketResult::Success) {
            // Responders on this host must see our queries too
            result = m_socket.set_multicast_loop(true);
        }
        if (result != network::SocketResult::Success) {
            LOG_ERROR("mDNS: cannot join multicast group: %s",
                      network::socket_result_to_string(result));
            m_socket.close();
            return DiscoveryResult::TransportFailure;
        }
    }

    m_transport_failed = false;
    m_running = true;
    m_thread = std::thread(&MdnsService::receive_loop, this);

    char ip[network::IPV4_STRING_LENGTH];
    LOG_INFO("mDNS: listening on port %u, sending to %s",
             m_socket.get_port(), network::format_ipv4(m_options.destination, ip, sizeof(ip)));
    return DiscoveryResult::Success;
}

void MdnsService::stop() {
    if (!m_running.load()) {
        return;
    }

    std::vector<PublishedService> published;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        published.swap(m_published);
    }
    for (const PublishedService& service : published) {
        DiscoveryResult result = send_announcement(service, MDNS_GOODBYE_TTL);
        if (result != DiscoveryResult::Success) {
            LOG_WARN("mDNS: goodbye for '%s' failed: %s",
                     service.record.name.c_str(), discovery_result_to_string(result));
        }
    }

    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }

    if (is_multicast(m_options.destination)) {
        m_socket.leave_multicast(m_options.destination, m_options.interface_address);
    }
    m_socket.close();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pointers.clear();
    m_services.clear();
    m_hosts.clear();
    m_cache_changed.notify_all();

    LOG_INFO("mDNS: stopped");
}

// ============================================================================
// Browsing
// ============================================================================

DiscoveryResult MdnsService::browse(const char* service_type, uint32_t wait_ms,
                                    std::vector<ServiceInstance>& instances) {
    instances.clear();
    if (!m_running.load()) {
        return DiscoveryResult::NotStarted;
    }

    const std::string type_name = canonical_name(service_type);
    DiscoveryResult result = send_query(type_name, DnsType::PTR);
    if (result != DiscoveryResult::Success) {
        return result;
    }

    const uint64_t deadline = now_ms() + wait_ms;
    bool resolve_sent = false;
    std::vector<std::string> unresolved;

    std::unique_lock<std::mutex> lock(m_mutex);
    for (;;) {
        if (m_transport_failed.load()) {
            return DiscoveryResult::TransportFailure;
        }

        lock.unlock();
        unresolved.clear();
        get_cached_instances(type_name, instances, &unresolved);
        if (!instances.empty()) {
            return DiscoveryResult::Success;
        }

        // Some responders answer the PTR query with the pointer only
        if (!unresolved.empty() && !resolve_sent) {
            for (const std::string& instance : unresolved) {
                result = send_query(instance, DnsType::SRV);
                if (result != DiscoveryResult::Success) {
                    return result;
                }
            }
            resolve_sent = true;
        }
        lock.lock();

        uint64_t now = now_ms();
        if (now >= deadline || !m_running.load()) {
            break;
        }
        m_cache_changed.wait_for(lock, std::chrono::milliseconds(
            std::min<uint64_t>(deadline - now, MDNS_POLL_SLICE_MS)));
    }
    lock.unlock();

    get_cached_instances(type_name, instances);
    return DiscoveryResult::Success;
}

void MdnsService::get_cached_instances(const std::string& service_type,
                                       std::vector<ServiceInstance>& instances,
                                       std::vector<std::string>* unresolved) const {
    instances.clear();
    const std::string type_name = canonical_name(service_type);

    std::lock_guard<std::mutex> lock(m_mutex);
    const uint64_t now = now_ms();

    for (const PointerEntry& pointer : m_pointers) {
        if (pointer.type_name != type_name || pointer.expires_ms <= now) {
            continue;
        }

        const std::string instance_key = canonical_name(pointer.instance_name);
        if (find_published(instance_key) != nullptr) {
            continue;
        }

        auto service = m_services.find(instance_key);
        if (service == m_services.end() || service->second.expires_ms <= now) {
            if (unresolved != nullptr) {
                unresolved->push_back(pointer.instance_name);
            }
            continue;
        }

        ServiceInstance instance;
        instance.port = service->second.port;
        instance.address = service->second.source_address;

        auto host = m_hosts.find(service->second.target);
        if (host != m_hosts.end() && host->second.expires_ms > now) {
            instance.address = host->second.address;
        }

        // Label is the instance name without the service type
        if (has_suffix(instance_key, type_name)) {
            instance.name = pointer.instance_name.substr(
                0, pointer.instance_name.size() - type_name.size() - 1);
        } else {
            instance.name = pointer.instance_name;
        }

        instances.push_back(instance);
    }
}

// ============================================================================
// Advertising
// ============================================================================

DiscoveryResult MdnsService::publish(const ServiceRecord& record) {
    if (!m_running.load()) {
        return DiscoveryResult::NotStarted;
    }

    PublishedService service;
    service.record = record;
    service.type_name = canonical_name(record.service_type);
    service.instance_name = record.name + "." + service.type_name;
    service.host_name = record.name + ".local";
    service.next_announce_ms = now_ms() + MDNS_SECOND_ANNOUNCE_MS;

    std::vector<uint8_t> probe;
    if (record.name.empty() || service.type_name.empty() ||
        !encode_name(service.instance_name, probe) || !encode_name(service.host_name, probe)) {
        LOG_ERROR("mDNS: cannot publish '%s': invalid name", record.name.c_str());
        return DiscoveryResult::InvalidRecord;
    }

    const std::string key = canonical_name(service.instance_name);
    auto same_instance = [&key](const PublishedService& existing) {
        return canonical_name(existing.instance_name) == key;
    };

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_published.erase(std::remove_if(m_published.begin(), m_published.end(), same_instance),
                          m_published.end());
        m_published.push_back(service);
    }

    DiscoveryResult result = send_announcement(service, MDNS_DEFAULT_TTL);
    if (result != DiscoveryResult::Success) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_published.erase(std::remove_if(m_published.begin(), m_published.end(), same_instance),
                          m_published.end());
        return result;
    }

    char ip[network::IPV4_STRING_LENGTH];
    LOG_INFO("mDNS: published '%s' at %s:%u", service.instance_name.c_str(),
             network::format_ipv4(record.address, ip, sizeof(ip)), record.port);
    return DiscoveryResult::Success;
}

DiscoveryResult MdnsService::withdraw(const std::string& name) {
    PublishedService removed;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_published.begin(); it != m_published.end(); ++it) {
            if (canonical_name(it->record.name) == canonical_name(name)) {
                removed = *it;
                m_published.erase(it);
                found = true;
                break;
            }
        }
    }

    if (!found) {
        return DiscoveryResult::NotFound;
    }
    if (!m_running.load()) {
        return DiscoveryResult::NotStarted;
    }

    LOG_INFO("mDNS: withdrawing '%s'", removed.instance_name.c_str());
    return send_announcement(removed, MDNS_GOODBYE_TTL);
}

size_t MdnsService::get_published_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_published.size();
}

bool MdnsService::build_answer(const DnsMessage& query, DnsMessage& response) const {
    response = DnsMessage{};
    response.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const DnsQuestion& question : query.questions) {
        if ((question.klass & DNS_CLASS_MASK) != DNS_CLASS_IN &&
            (question.klass & DNS_CLASS_MASK) != static_cast<uint16_t>(DnsType::ANY)) {
            continue;
        }
        const std::string name = canonical_name(question.name);

        for (const PublishedService& service : m_published) {
            if (type_matches(question.type, DnsType::PTR)) {
                if (name == service.type_name) {
                    DnsMessage records;
                    append_service_records(service, MDNS_DEFAULT_TTL, records, true);
                    for (DnsRecord& record : records.answers) {
                        if (record.type == static_cast<uint16_t>(DnsType::PTR)) {
                            add_record(response.answers, record);
                        } else {
                            add_record(response.additionals, record);
                        }
                    }
                } else if (name == DNS_SD_SERVICES_NAME) {
                    add_record(response.answers, make_ptr_record(
                        DNS_SD_SERVICES_NAME, service.type_name, MDNS_DEFAULT_TTL));
                }
            }

            if (name == canonical_name(service.instance_name) &&
                (type_matches(question.type, DnsType::SRV) ||
                 type_matches(question.type, DnsType::TXT))) {
                add_record(response.answers, make_srv_record(
                    service.instance_name, service.host_name, service.record.port, MDNS_DEFAULT_TTL));
                add_record(response.answers, make_txt_record(service.instance_name, MDNS_DEFAULT_TTL));
                add_record(response.additionals, make_a_record(
                    service.host_name, service.record.address, MDNS_DEFAULT_TTL));
            }

            if (name == canonical_name(service.host_name) &&
                type_matches(question.type, DnsType::A)) {
                add_record(response.answers, make_a_record(
                    service.host_name, service.record.address, MDNS_DEFAULT_TTL));
            }
        }
    }

    // An additional already present as an answer is redundant
    response.additionals.erase(
        std::remove_if(response.additionals.begin(), response.additionals.end(),
                       [&response](const DnsRecord& record) {
                           return contains_record(response.answers, record);
                       }),
        response.additionals.end());

    return !response.answers.empty();
}

void MdnsService::append_service_records(const PublishedService& service, uint32_t ttl,
                                         DnsMessage& message, bool with_pointer) const {
    if (with_pointer) {
        message.answers.push_back(make_ptr_record(service.type_name, service.instance_name, ttl));
    }
    message.answers.push_back(make_srv_record(
        service.instance_name, service.host_name, service.record.port, ttl));
    message.answers.push_back(make_txt_record(service.instance_name, ttl));
    message.answers.push_back(make_a_record(service.host_name, service.record.address, ttl));
}

const MdnsService::PublishedService* MdnsService::find_published(
        const std::string& canonical_instance) const {
    for (const PublishedService& service : m_published) {
        if (canonical_name(service.instance_name) == canonical_instance) {
            return &service;
        }
    }
    return nullptr;
}

// ============================================================================
// Receive side
// ============================================================================

void MdnsService::receive_loop() {
    std::vector<uint8_t> buffer(MDNS_MAX_PACKET_SIZE);

    while (m_running.load()) {
        size_t received = 0;
        uint32_t src_address = 0;
        uint16_t src_port = 0;

        network::SocketResult result = m_socket.recv_from(buffer.data(), buffer.size(), received,
                                                          src_address, src_port,
                                                          MDNS_POLL_SLICE_MS);
        if (result == network::SocketResult::Success) {
            process_packet(buffer.data(), received, src_address, src_port);
        } else if (result != network::SocketResult::Timeout) {
            LOG_ERROR("mDNS: receive failed: %s", network::socket_result_to_string(result));
            m_transport_failed = true;
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cache_changed.notify_all();
            break;
        }

        announce_due();
    }
}

void MdnsService::process_packet(const uint8_t* data, size_t size,
                                 uint32_t src_address, uint16_t src_port) {
    DnsMessage message;
    if (!decode_message(data, size, message)) {
        LOG_VERBOSE("mDNS: dropping malformed packet (%zu bytes)", size);
        return;
    }

    if (message.is_response()) {
        handle_response(message, src_address);
    } else {
        handle_query(message, src_address, src_port);
    }
}

void MdnsService::handle_response(const DnsMessage& message, uint32_t src_address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const uint64_t now = now_ms();
    expire_cache(now);

    bool changed = false;
    for (const std::vector<DnsRecord>* section : {&message.answers, &message.additionals}) {
        for (const DnsRecord& record : *section) {
            if ((record.klass & DNS_CLASS_MASK) != DNS_CLASS_IN) {
                continue;
            }

            const std::string name = canonical_name(record.name);
            const uint64_t expires = now + static_cast<uint64_t>(record.ttl) * 1000;

            switch (static_cast<DnsType>(record.type)) {
                case DnsType::PTR: {
                    const std::string instance_key = canonical_name(record.target);
                    auto it = std::find_if(m_pointers.begin(), m_pointers.end(),
                        [&](const PointerEntry& entry) {
                            return entry.type_name == name &&
                                   canonical_name(entry.instance_name) == instance_key;
                        });
                    if (record.ttl == MDNS_GOODBYE_TTL) {
                        if (it != m_pointers.end()) {
                            LOG_VERBOSE("mDNS: goodbye from '%s'", record.target.c_str());
                            m_pointers.erase(it);
                            m_services.erase(instance_key);
                        }
                    } else if (it != m_pointers.end()) {
                        it->expires_ms = expires;
                    } else {
                        m_pointers.push_back(PointerEntry{name, record.target, expires});
                    }
                    changed = true;
                    break;
                }

                case DnsType::SRV:
                    if (record.ttl == MDNS_GOODBYE_TTL) {
                        m_services.erase(name);
                    } else {
                        m_services[name] = ServiceEntry{canonical_name(record.target), record.port,
                                                        src_address, expires};
                    }
                    changed = true;
                    break;

                case DnsType::A:
                    if (record.ttl == MDNS_GOODBYE_TTL) {
                        m_hosts.erase(name);
                    } else {
                        m_hosts[name] = HostEntry{record.address, expires};
                    }
                    changed = true;
                    break;

                default:
                    break;
            }
        }
    }

    if (changed) {
        m_cache_changed.notify_all();
    }
}

void MdnsService::handle_query(const DnsMessage& message, uint32_t src_address, uint16_t src_port) {
    DnsMessage response;
    if (!build_answer(message, response)) {
        return;
    }

    bool unicast = !message.questions.empty();
    for (const DnsQuestion& question : message.questions) {
        if ((question.klass & MDNS_UNICAST_RESPONSE) == 0) {
            unicast = false;
        }
    }

    uint32_t address = m_options.destination;
    uint16_t port = m_options.port != 0 ? m_options.port : m_socket.get_port();

    if (src_port != port) {
        // Legacy unicast resolver: reply directly, echoing id and questions
        response.id = message.id;
        response.questions = message.questions;
        address = src_address;
        port = src_port;
    } else if (unicast) {
        address = src_address;
    }

    DiscoveryResult result = send_message(response, address, port);
    if (result != DiscoveryResult::Success) {
        LOG_WARN("mDNS: cannot answer query: %s", discovery_result_to_string(result));
    }
}

void MdnsService::announce_due() {
    std::vector<PublishedService> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const uint64_t now = now_ms();
        for (PublishedService& service : m_published) {
            if (now < service.next_announce_ms) {
                continue;
            }
            due.push_back(service);
            service.next_announce_ms = now + reannounce_delay_ms();
        }
    }

    for (const PublishedService& service : due) {
        DiscoveryResult result = send_announcement(service, MDNS_DEFAULT_TTL);
        if (result != DiscoveryResult::Success) {
            LOG_WARN("mDNS: re-announce of '%s' failed: %s",
                     service.record.name.c_str(), discovery_result_to_string(result));
        }
    }
}

void MdnsService::expire_cache(uint64_t now) {
    m_pointers.erase(std::remove_if(m_pointers.begin(), m_pointers.end(),
                                    [now](const PointerEntry& entry) {
                                        return entry.expires_ms <= now;
                                    }),
                     m_pointers.end());

    for (auto it = m_services.begin(); it != m_services.end();) {
        it = it->second.expires_ms <= now ? m_services.erase(it) : std::next(it);
    }
    for (auto it = m_hosts.begin(); it != m_hosts.end();) {
        it = it->second.expires_ms <= now ? m_hosts.erase(it) : std::next(it);
    }
}

// ============================================================================
// Send side
// ============================================================================

DiscoveryResult MdnsService::send_query(const std::string& name, DnsType type) {
    DnsMessage query;
    DnsQuestion question;
    question.name = name;
    question.type = static_cast<uint16_t>(type);
    question.klass = DNS_CLASS_IN;
    query.questions.push_back(question);

    LOG_VERBOSE("mDNS: query %s %s", dns_type_to_string(question.type), name.c_str());
    return send_message(query, m_options.destination,
                        m_options.port != 0 ? m_options.port : m_socket.get_port());
}

DiscoveryResult MdnsService::send_announcement(const PublishedService& service, uint32_t ttl) {
    DnsMessage message;
    message.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;
    append_service_records(service, ttl, message, true);

    return send_message(message, m_options.destination,
                        m_options.port != 0 ? m_options.port : m_socket.get_port());
}

DiscoveryResult MdnsService::send_message(const DnsMessage& message, uint32_t address, uint16_t port) {
    std::vector<uint8_t> packet;
    if (!encode_message(message, packet)) {
        return DiscoveryResult::InvalidRecord;
    }

    network::SocketResult result = m_socket.send_to(address, port, packet.data(), packet.size());
    if (result != network::SocketResult::Success) {
        char ip[network::IPV4_STRING_LENGTH];
        LOG_ERROR("mDNS: send to %s:%u failed: %s",
                  network::format_ipv4(address, ip, sizeof(ip)), port,
                  network::socket_result_to_string(result));
        return DiscoveryResult::TransportFailure;
    }

    return DiscoveryResult::Success;
}

} // namespace sumo_mitm::discovery
