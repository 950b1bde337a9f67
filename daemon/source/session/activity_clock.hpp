/**
 * @file activity_clock.hpp
 * @brief Last-activity timestamp shared by relay listeners and the watchdog
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace sumo_mitm::session {

/**
 * @brief Monotonic milliseconds since an arbitrary epoch
 */
inline uint64_t monotonic_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

/**
 * @brief Atomic timestamp that only moves forward
 *
 * Several listener threads touch it concurrently; a stale touch from a
 * slower thread can never move the timestamp backwards.
 */
class ActivityClock {
public:
    explicit ActivityClock(uint64_t start_ms = 0) : m_last(start_ms) {}

    void touch(uint64_t now_ms) {
        uint64_t current = m_last.load();
        while (now_ms > current && !m_last.compare_exchange_weak(current, now_ms)) {
        }
    }

    void touch() { touch(monotonic_ms()); }

    uint64_t last() const { return m_last.load(); }

private:
    std::atomic<uint64_t> m_last;
};

} // namespace sumo_mitm::session
