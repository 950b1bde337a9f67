/**
 * @file stop_signal.cpp
 * @brief Cancellation flag implementation
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "stop_signal.hpp"
#include <algorithm>
#include <chrono>

namespace sumo_mitm::util {

StopSignal::StopSignal(const StopSignal* parent)
    : m_parent(parent)
    , m_stopped(false)
{
}

void StopSignal::request_stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped.store(true);
    }
    m_cv.notify_all();
}

bool StopSignal::stop_requested() const {
    if (m_stopped.load()) {
        return true;
    }
    return m_parent != nullptr && m_parent->stop_requested();
}

bool StopSignal::wait_for(uint32_t timeout_ms) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    std::unique_lock<std::mutex> lock(m_mutex);
    while (!stop_requested()) {
        auto now = clock::now();
        if (now >= deadline) {
            return false;
        }

        // The parent notifies its own waiters only, so wake up regularly
        auto slice = std::min<clock::duration>(deadline - now,
                                               std::chrono::milliseconds(STOP_POLL_SLICE_MS));
        m_cv.wait_for(lock, slice);
    }
    return true;
}

} // namespace sumo_mitm::util
