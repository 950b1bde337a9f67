/**
 * @file restart_backoff.cpp
 * @brief Delay between supervised sessions
 *
 * Integer arithmetic throughout; the multiplier is a percentage.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "restart_backoff.hpp"

namespace sumo_mitm::session {

RestartBackoff::RestartBackoff()
    : RestartBackoff(RestartBackoffConfig())
{
}

RestartBackoff::RestartBackoff(const RestartBackoffConfig& config)
    : m_config(config)
    , m_failure_count(0)
    , m_current_delay_ms(config.initial_delay_ms)
{
}

void RestartBackoff::record_failure() {
    m_failure_count++;

    if (m_current_delay_ms >= m_config.max_delay_ms) {
        m_current_delay_ms = m_config.max_delay_ms;
        return;
    }

    // 64-bit product so a large cap cannot overflow
    uint64_t grown = static_cast<uint64_t>(m_current_delay_ms) * m_config.multiplier_percent / 100;
    m_current_delay_ms = grown > m_config.max_delay_ms
        ? m_config.max_delay_ms
        : static_cast<uint32_t>(grown);
}

void RestartBackoff::reset() {
    m_failure_count = 0;
    m_current_delay_ms = m_config.initial_delay_ms;
}

uint32_t RestartBackoff::get_next_delay_ms_with_jitter(uint32_t seed) const {
    if (m_config.jitter_percent == 0 || m_current_delay_ms == 0) {
        return m_current_delay_ms;
    }

    // xorshift32 scramble of the seed
    uint32_t x = seed;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;

    // Offset in [-jitter, +jitter] percent
    int32_t span = 2 * static_cast<int32_t>(m_config.jitter_percent) + 1;
    int32_t offset = static_cast<int32_t>(x % static_cast<uint32_t>(span)) - m_config.jitter_percent;

    int64_t delay = static_cast<int64_t>(m_current_delay_ms) * (100 + offset) / 100;
    if (delay < 1) {
        delay = 1;
    }
    if (delay > m_config.max_delay_ms) {
        delay = m_config.max_delay_ms;
    }
    return static_cast<uint32_t>(delay);
}

} // namespace sumo_mitm::session
