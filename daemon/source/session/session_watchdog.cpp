/**
 * @file session_watchdog.cpp
 * @brief Inactivity detection for a running relay
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "session_watchdog.hpp"
#include "../debug/log.hpp"

namespace sumo_mitm::session {

SessionError SessionWatchdog::watch(const ActivityClock& clock, const util::StopSignal& stop) const {
    for (;;) {
        if (stop.wait_for(m_check_interval_ms)) {
            return SessionError::Cancelled;
        }

        uint64_t now = monotonic_ms();
        uint64_t last = clock.last();
        if (is_expired(last, now)) {
            LOG_WARN("No relay traffic for %llu ms (limit %u ms)",
                     static_cast<unsigned long long>(now - last), m_max_silence_ms);
            return SessionError::SessionInactive;
        }
    }
}

} // namespace sumo_mitm::session
