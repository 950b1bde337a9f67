/**
 * @file pipeline_supervisor.hpp
 * @brief Crash-only session loop
 *
 * The supervisor never repairs a session. Any failure, at any stage, drops
 * every resource of that session (announcement, TCP listener, relay
 * listeners, threads) and a fresh session starts from device discovery:
 *
 * ```
 *   +--------------------------------------------------------------+
 *   |                                                              |
 *   v                                                              |
 * Locate --> Announce --> Handshake --> Relay + Watchdog --> (failure)
 *   |           |             |                                    ^
 *   +-----------+-------------+------------ (failure) -------------+
 * ```
 *
 * All session resources are locals of run_once(), so leaving the function
 * releases them on every path.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "session_types.hpp"
#include "../config/config.hpp"
#include "../discovery/interfaces/iservice_browser.hpp"
#include "../discovery/interfaces/iservice_publisher.hpp"
#include "../util/stop_signal.hpp"

namespace sumo_mitm::session {

class RelayListeners;

class PipelineSupervisor {
public:
    PipelineSupervisor(const config::Config& config,
                       discovery::IServiceBrowser& browser,
                       discovery::IServicePublisher& publisher);

    PipelineSupervisor(const PipelineSupervisor&) = delete;
    PipelineSupervisor& operator=(const PipelineSupervisor&) = delete;

    /**
     * @brief Run one complete session
     *
     * Returns when the session fails or stop is requested. A busy device
     * is reported as DeviceBusy at stage Handshake without starting the
     * relay. A relay listener that cannot be bound is reported at stage
     * Relay.
     */
    SessionReport run_once();

    /**
     * @brief Run sessions back to back until request_stop()
     */
    void run_forever();

    /**
     * @brief Stop the current session and the restart loop (thread-safe)
     */
    void request_stop();

    bool stop_requested() const { return m_stop.stop_requested(); }

    /**
     * @brief Number of sessions started so far
     */
    uint32_t get_session_count() const { return m_session_count.load(); }

private:
    bool collect_announce_addresses(std::vector<uint32_t>& addresses) const;
    SessionError relay_stage(const DeviceEndpoint& device, const InterceptResult& intercepted,
                             RelayListeners& listeners, const util::StopSignal& session_stop);

    config::Config m_config;
    discovery::IServiceBrowser& m_browser;
    discovery::IServicePublisher& m_publisher;
    util::StopSignal m_stop;
    std::atomic<uint32_t> m_session_count;
};

} // namespace sumo_mitm::session
