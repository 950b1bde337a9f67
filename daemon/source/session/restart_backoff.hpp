/**
 * @file restart_backoff.hpp
 * @brief Delay between supervised sessions
 *
 * A session that fails early (no device, no client, busy device) would
 * otherwise be retried in a tight loop. The delay doubles after every
 * failed session and drops back to the initial value once a session gets
 * as far as relaying traffic:
 *
 * ```
 * delay(n) = min(initial_delay * multiplier^n, max_delay)   n = failures since reset
 * ```
 *
 * Each actual wait is spread by +/- jitter_percent so several proxies on
 * one network do not restart in lock step.
 *
 * Not thread-safe; owned by the supervisor thread.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>

#include "../config/config.hpp"

namespace sumo_mitm::session {

struct RestartBackoffConfig {
    uint32_t initial_delay_ms;      ///< Delay after the first failure
    uint32_t max_delay_ms;          ///< Cap
    uint16_t multiplier_percent;    ///< 200 = x2
    uint8_t jitter_percent;         ///< 10 = +/-10%, 0 = off

    RestartBackoffConfig()
        : initial_delay_ms(config::DEFAULT_RESTART_DELAY_MS)
        , max_delay_ms(config::DEFAULT_MAX_RESTART_DELAY_MS)
        , multiplier_percent(200)
        , jitter_percent(10)
    {}

    static RestartBackoffConfig from_config(const config::SupervisorConfig& config) {
        RestartBackoffConfig backoff;
        backoff.initial_delay_ms = config.restart_delay_ms;
        backoff.max_delay_ms = config.max_restart_delay_ms < config.restart_delay_ms
            ? config.restart_delay_ms
            : config.max_restart_delay_ms;
        return backoff;
    }
};

class RestartBackoff {
public:
    RestartBackoff();
    explicit RestartBackoff(const RestartBackoffConfig& config);

    /**
     * @brief Delay before the next session, without jitter
     */
    uint32_t get_next_delay_ms() const { return m_current_delay_ms; }

    /**
     * @brief Delay before the next session, with jitter
     *
     * @param seed Any varying value (e.g. a timestamp); equal seeds give
     *             equal results
     */
    uint32_t get_next_delay_ms_with_jitter(uint32_t seed) const;

    /**
     * @brief A session ended before reaching the relay stage
     */
    void record_failure();

    /**
     * @brief A session reached the relay stage
     */
    void reset();

    uint32_t get_failure_count() const { return m_failure_count; }
    const RestartBackoffConfig& get_config() const { return m_config; }

private:
    RestartBackoffConfig m_config;
    uint32_t m_failure_count;
    uint32_t m_current_delay_ms;
};

} // namespace sumo_mitm::session
