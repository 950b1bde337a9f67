/**
 * @file stop_signal.hpp
 * @brief Cancellation flag with interruptible waits
 *
 * Every blocking step of a session (browse rounds, accept, relay receive,
 * watchdog checks, the restart delay) waits through a StopSignal, so a
 * session can be torn down promptly from another thread.
 *
 * A signal may have a parent: the supervisor owns the process-level signal,
 * each session owns a child. Stopping the parent stops every child; stopping
 * a child leaves the parent (and later sessions) untouched.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace sumo_mitm::util {

/** @brief Longest single wait slice; bounds how late a parent stop is seen */
constexpr uint32_t STOP_POLL_SLICE_MS = 50;

class StopSignal {
public:
    /**
     * @param parent Optional parent signal; must outlive this one
     */
    explicit StopSignal(const StopSignal* parent = nullptr);

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    /**
     * @brief Request stop and wake all waiters on this signal
     */
    void request_stop();

    /**
     * @brief true if this signal or any ancestor was stopped
     */
    bool stop_requested() const;

    /**
     * @brief Sleep up to timeout_ms, returning early on stop
     *
     * @return true if stopped (before or during the wait)
     */
    bool wait_for(uint32_t timeout_ms) const;

private:
    const StopSignal* m_parent;
    std::atomic<bool> m_stopped;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

} // namespace sumo_mitm::util
