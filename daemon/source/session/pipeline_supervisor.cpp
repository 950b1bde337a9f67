/**
 * @file pipeline_supervisor.cpp
 * @brief Crash-only session loop
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "pipeline_supervisor.hpp"
#include "activity_clock.hpp"
#include "device_locator.hpp"
#include "handshake_interceptor.hpp"
#include "proxy_announcer.hpp"
#include "relay_listeners.hpp"
#include "restart_backoff.hpp"
#include "session_relay.hpp"
#include "session_watchdog.hpp"
#include "../debug/log.hpp"
#include "../network/address.hpp"

namespace sumo_mitm::session {

PipelineSupervisor::PipelineSupervisor(const config::Config& config,
                                       discovery::IServiceBrowser& browser,
                                       discovery::IServicePublisher& publisher)
    : m_config(config)
    , m_browser(browser)
    , m_publisher(publisher)
    , m_stop(nullptr)
    , m_session_count(0)
{
}

void PipelineSupervisor::request_stop() {
    LOG_INFO("Stop requested");
    m_stop.request_stop();
}

bool PipelineSupervisor::collect_announce_addresses(std::vector<uint32_t>& addresses) const {
    const config::DiscoveryConfig& discovery = m_config.discovery;

    if (discovery.announce_address_count > 0) {
        addresses.assign(discovery.announce_addresses,
                         discovery.announce_addresses + discovery.announce_address_count);
        return true;
    }

    if (!network::enumerate_local_ipv4(addresses)) {
        LOG_ERROR("Cannot enumerate local IPv4 addresses");
        return false;
    }
    return true;
}

SessionReport PipelineSupervisor::run_once() {
    util::StopSignal session_stop(&m_stop);
    SessionReport report{SessionStage::Locate, SessionError::None};

    // Stage 1: find the real device
    DeviceEndpoint device{};
    DeviceLocator locator(m_browser, session_stop);
    report.error = locator.locate(m_config.discovery.service_type,
                                  m_config.discovery.timeout_ms, device);
    if (report.error != SessionError::None) {
        return report;
    }

    // Stage 2: impersonate it
    report.stage = SessionStage::Announce;
    std::vector<uint32_t> addresses;
    if (!collect_announce_addresses(addresses)) {
        report.error = SessionError::AnnouncePublishFailure;
        return report;
    }

    Announcement announcement;
    ProxyAnnouncer announcer(m_publisher, m_config.discovery);
    report.error = announcer.announce(device, device.handshake_port, addresses, announcement);
    if (report.error != SessionError::None) {
        return report;
    }

    // Stage 3: handshake, reserving the relay listeners on the way
    report.stage = SessionStage::Handshake;
    RelayListeners listeners(m_config.handshake.listen_address);
    InterceptResult intercepted{};
    HandshakeInterceptor interceptor(m_config.handshake, session_stop);
    report.error = interceptor.intercept(device, device.handshake_port, listeners, intercepted);
    if (report.error != SessionError::None) {
        if (report.error == SessionError::ListenerBindFailure && listeners.bind_failed()) {
            report.stage = SessionStage::Relay;
        }
        return report;
    }

    if (intercepted.ports.device_inbound_port == 0) {
        report.error = SessionError::DeviceBusy;
        return report;
    }

    // Stage 4: relay until something breaks
    report.stage = SessionStage::Relay;
    report.error = relay_stage(device, intercepted, listeners, session_stop);
    return report;
}

SessionError PipelineSupervisor::relay_stage(const DeviceEndpoint& device,
                                             const InterceptResult& intercepted,
                                             RelayListeners& listeners,
                                             const util::StopSignal& session_stop) {
    RelaySession session;
    session.client_address = intercepted.client_address;
    session.device_address = device.address;
    session.ports = intercepted.ports;
    session.observers.assign(m_config.relay.observers,
                             m_config.relay.observers + m_config.relay.observer_count);
    session.max_datagram_size = m_config.relay.max_datagram_size;

    // Silence is measured from the end of the handshake
    ActivityClock clock(monotonic_ms());
    SessionRelay relay(session, listeners, clock, session_stop);

    SessionError error = relay.start();
    if (error != SessionError::None) {
        return error;
    }

    SessionWatchdog watchdog(m_config.relay);
    SessionError watch_result = watchdog.watch(clock, relay.stop_signal());

    relay.stop();

    SessionError relay_failure = relay.get_failure();
    if (relay_failure != SessionError::None) {
        return relay_failure;
    }
    return watch_result;
}

void PipelineSupervisor::run_forever() {
    RestartBackoff backoff(RestartBackoffConfig::from_config(m_config.supervisor));

    LOG_INFO("Supervisor started (service %s)", m_config.discovery.service_type);

    while (!m_stop.stop_requested()) {
        uint32_t session_id = ++m_session_count;
        LOG_INFO("Session #%u starting", session_id);

        SessionReport report = run_once();

        if (m_stop.stop_requested()) {
            break;
        }

        LOG_WARN("Session #%u failed at stage %s: %s", session_id,
                 session_stage_to_string(report.stage), session_error_to_string(report.error));

        // A session that relayed traffic starts the backoff over
        bool relayed = report.stage == SessionStage::Relay &&
                       report.error != SessionError::ListenerBindFailure;
        if (relayed) {
            backoff.reset();
        }

        uint32_t delay = backoff.get_next_delay_ms_with_jitter(static_cast<uint32_t>(monotonic_ms()));
        if (!relayed) {
            backoff.record_failure();
        }
        LOG_INFO("Restarting in %u ms", delay);
        if (m_stop.wait_for(delay)) {
            break;
        }
    }

    LOG_INFO("Supervisor stopped after %u session(s)", m_session_count.load());
}

} // namespace sumo_mitm::session
