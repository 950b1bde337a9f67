/**
 * @file session_watchdog.hpp
 * @brief Inactivity detection for a running relay
 *
 * The Jumping Sumo and its controller exchange datagrams continuously
 * (pings, piloting commands, video). A gap longer than max_silence means one
 * side went away; the session is then torn down and restarted.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>

#include "session_types.hpp"
#include "activity_clock.hpp"
#include "../config/config.hpp"
#include "../util/stop_signal.hpp"

namespace sumo_mitm::session {

class SessionWatchdog {
public:
    SessionWatchdog(uint32_t check_interval_ms, uint32_t max_silence_ms)
        : m_check_interval_ms(check_interval_ms)
        , m_max_silence_ms(max_silence_ms)
    {
    }

    explicit SessionWatchdog(const config::RelayConfig& config)
        : SessionWatchdog(config.check_interval_ms, config.max_silence_ms)
    {
    }

    /**
     * @brief Pure expiry rule
     *
     * A gap of exactly max_silence is still alive.
     */
    bool is_expired(uint64_t last_activity_ms, uint64_t now_ms) const {
        return now_ms > last_activity_ms && now_ms - last_activity_ms > m_max_silence_ms;
    }

    /**
     * @brief Check the clock every check_interval until it expires
     *
     * @return SessionInactive on expiry, Cancelled when stop fires
     */
    SessionError watch(const ActivityClock& clock, const util::StopSignal& stop) const;

    uint32_t get_check_interval() const { return m_check_interval_ms; }
    uint32_t get_max_silence() const { return m_max_silence_ms; }

private:
    uint32_t m_check_interval_ms;
    uint32_t m_max_silence_ms;
};

} // namespace sumo_mitm::session
