/**
 * @file fake_discovery.hpp
 * @brief In-memory service browser and publisher for session tests
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "discovery/interfaces/iservice_browser.hpp"
#include "discovery/interfaces/iservice_publisher.hpp"

namespace sumo_mitm::testing {

/**
 * @brief Returns a scripted set of instances on every round
 */
class FakeBrowser : public discovery::IServiceBrowser {
public:
    discovery::DiscoveryResult browse(const char* service_type, uint32_t wait_ms,
                                      std::vector<discovery::ServiceInstance>& instances) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rounds++;
        m_last_type = service_type;
        m_last_wait_ms = wait_ms;

        instances.clear();
        if (m_result != discovery::DiscoveryResult::Success) {
            return m_result;
        }
        if (m_rounds > m_empty_rounds) {
            instances = m_instances;
        }
        return discovery::DiscoveryResult::Success;
    }

    void add_instance(const std::string& name, uint32_t address, uint16_t port) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_instances.push_back(discovery::ServiceInstance{name, address, port});
    }

    /// Rounds answered with nothing before the instances show up
    void set_empty_rounds(uint32_t rounds) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_empty_rounds = rounds;
    }
    void set_result(discovery::DiscoveryResult result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_result = result;
    }

    uint32_t get_rounds() const { return m_rounds.load(); }
    uint32_t get_last_wait_ms() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_wait_ms;
    }
    std::string get_last_type() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_type;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<discovery::ServiceInstance> m_instances;
    discovery::DiscoveryResult m_result = discovery::DiscoveryResult::Success;
    uint32_t m_empty_rounds = 0;
    std::atomic<uint32_t> m_rounds{0};
    uint32_t m_last_wait_ms = 0;
    std::string m_last_type;
};

/**
 * @brief Records published names; can be told to fail the Nth publish
 */
class FakePublisher : public discovery::IServicePublisher {
public:
    discovery::DiscoveryResult publish(const discovery::ServiceRecord& record) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_publish_calls++;
        if (m_fail_on_publish != 0 && m_publish_calls == m_fail_on_publish) {
            return discovery::DiscoveryResult::TransportFailure;
        }
        m_active.push_back(record);
        m_history.push_back(record);
        return discovery::DiscoveryResult::Success;
    }

    discovery::DiscoveryResult withdraw(const std::string& name) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_withdraw_calls++;
        auto it = std::find_if(m_active.begin(), m_active.end(),
                               [&name](const discovery::ServiceRecord& record) {
                                   return record.name == name;
                               });
        if (it == m_active.end()) {
            return discovery::DiscoveryResult::NotFound;
        }
        m_active.erase(it);
        return discovery::DiscoveryResult::Success;
    }

    /// 1-based publish call that fails, 0 = never
    void set_fail_on_publish(uint32_t call) { m_fail_on_publish = call; }

    size_t get_active_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_active.size();
    }

    std::vector<discovery::ServiceRecord> get_history() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history;
    }

    uint32_t get_withdraw_calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_withdraw_calls;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<discovery::ServiceRecord> m_active;
    std::vector<discovery::ServiceRecord> m_history;
    uint32_t m_publish_calls = 0;
    uint32_t m_withdraw_calls = 0;
    uint32_t m_fail_on_publish = 0;
};

} // namespace sumo_mitm::testing
