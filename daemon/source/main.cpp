/**
 * @file main.cpp
 * @brief sumo_mitm - transparent proxy for Parrot Jumping Sumo sessions
 *
 * Sits between an ARSDK controller and a Jumping Sumo on the same network:
 * advertises itself as the device, rewrites the UDP ports negotiated in the
 * TCP handshake so both sides talk to the proxy, then relays (and optionally
 * mirrors) every datagram. Sessions are restarted from scratch on any
 * failure.
 *
 * Usage: sumo_mitm [config.ini]
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include <csignal>
#include <cstdio>
#include <thread>

#include <pthread.h>

#include "config/config.hpp"
#include "debug/log.hpp"
#include "discovery/mdns_service.hpp"
#include "network/socket.hpp"
#include "session/pipeline_supervisor.hpp"

namespace {

// ============================================================================
// Signal handling
// ============================================================================

/**
 * @brief Block SIGINT/SIGTERM in every thread spawned after this call
 *
 * The signals are then only delivered through sigwait() on the signal
 * thread.
 */
bool block_termination_signals(sigset_t& signals) {
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return pthread_sigmask(SIG_BLOCK, &signals, nullptr) == 0;
}

void signal_thread_main(sigset_t signals, sumo_mitm::session::PipelineSupervisor* supervisor) {
    int signal_number = 0;
    if (sigwait(&signals, &signal_number) != 0) {
        LOG_ERROR("sigwait failed");
        return;
    }

    LOG_INFO("Received %s, stopping", signal_number == SIGINT ? "SIGINT" : "SIGTERM");
    supervisor->request_stop();
}

// ============================================================================
// Initialization
// ============================================================================

sumo_mitm::config::Config load_configuration(const char* path) {
    using namespace sumo_mitm::config;

    Config config = get_default_config();

    ConfigResult result = ensure_config_exists(path);
    if (result != ConfigResult::Success) {
        fprintf(stderr, "Cannot create %s (%s), using defaults\n",
                path, config_result_to_string(result));
        return config;
    }

    result = load_config(path, config);
    if (result != ConfigResult::Success) {
        // Keys that parsed are kept, the others stay at their defaults
        fprintf(stderr, "Config %s: %s\n", path, config_result_to_string(result));
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace sumo_mitm;

    const char* config_path = argc > 1 ? argv[1] : config::CONFIG_PATH;
    config::Config config = load_configuration(config_path);

    debug::g_logger.init(config.debug);
    LOG_INFO("sumo_mitm starting");
    LOG_INFO("Config loaded from %s", config_path);
    LOG_VERBOSE("Service: %s, port policy: %s, observers: %zu",
                config.discovery.service_type,
                config::port_policy_to_string(config.handshake.port_policy),
                config.relay.observer_count);

    sigset_t signals;
    if (!block_termination_signals(signals)) {
        LOG_ERROR("Cannot block termination signals");
        return 1;
    }

    network::SocketResult socket_result = network::socket_init();
    if (socket_result != network::SocketResult::Success) {
        LOG_ERROR("Socket initialization failed: %s",
                  network::socket_result_to_string(socket_result));
        return 1;
    }

    discovery::MdnsService mdns;
    discovery::DiscoveryResult mdns_result = mdns.start();
    if (mdns_result != discovery::DiscoveryResult::Success) {
        LOG_ERROR("mDNS startup failed: %s", discovery::discovery_result_to_string(mdns_result));
        network::socket_exit();
        return 1;
    }

    session::PipelineSupervisor supervisor(config, mdns, mdns);

    std::thread signal_thread(signal_thread_main, signals, &supervisor);

    supervisor.run_forever();

    // run_forever() only returns after request_stop(), which the signal
    // thread issues right before it exits
    signal_thread.join();

    LOG_INFO("sumo_mitm shutting down after %u sessions", supervisor.get_session_count());
    mdns.stop();
    network::socket_exit();
    debug::g_logger.flush();

    return 0;
}
