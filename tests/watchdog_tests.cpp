/**
 * @file watchdog_tests.cpp
 * @brief Tests for the session watchdog, activity clock and stop signal
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "test_framework.hpp"
#include "session/activity_clock.hpp"
#include "session/session_watchdog.hpp"
#include "util/stop_signal.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace sumo_mitm;
using namespace sumo_mitm::session;

// ============================================================================
// Expiry Rule
// ============================================================================

TEST(silence_equal_to_limit_is_alive) {
    SessionWatchdog watchdog(1000, 1000);
    ASSERT_FALSE(watchdog.is_expired(5000, 6000));
}

TEST(silence_past_limit_expires) {
    SessionWatchdog watchdog(1000, 1000);
    ASSERT_TRUE(watchdog.is_expired(5000, 6001));
}

TEST(clock_ahead_of_now_is_alive) {
    SessionWatchdog watchdog(1000, 1000);
    ASSERT_FALSE(watchdog.is_expired(7000, 6000));
}

TEST(built_from_relay_config) {
    config::Config config = config::get_default_config();
    config.relay.check_interval_ms = 250;
    config.relay.max_silence_ms = 750;

    SessionWatchdog watchdog(config.relay);
    ASSERT_EQ(watchdog.get_check_interval(), 250u);
    ASSERT_EQ(watchdog.get_max_silence(), 750u);
}

// ============================================================================
// Watch Loop
// ============================================================================

TEST(watch_reports_inactive_session) {
    ActivityClock clock(monotonic_ms());
    util::StopSignal stop;
    SessionWatchdog watchdog(20, 100);

    uint64_t started = monotonic_ms();
    ASSERT_EQ(watchdog.watch(clock, stop), SessionError::SessionInactive);
    ASSERT_TRUE(monotonic_ms() - started >= 100);
}

TEST(watch_survives_steady_traffic) {
    ActivityClock clock(monotonic_ms());
    util::StopSignal stop;
    SessionWatchdog watchdog(20, 150);

    std::atomic<bool> done(false);
    std::thread traffic([&]() {
        for (int i = 0; i < 20; i++) {
            clock.touch();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        done = true;
        stop.request_stop();
    });

    SessionError result = watchdog.watch(clock, stop);
    traffic.join();

    ASSERT_TRUE(done.load());
    ASSERT_EQ(result, SessionError::Cancelled);
}

TEST(watch_cancelled_by_stop) {
    ActivityClock clock(monotonic_ms());
    util::StopSignal stop;
    stop.request_stop();

    SessionWatchdog watchdog(1000, 60000);
    ASSERT_EQ(watchdog.watch(clock, stop), SessionError::Cancelled);
}

// ============================================================================
// Activity Clock
// ============================================================================

TEST(clock_never_moves_backwards) {
    ActivityClock clock(100);
    clock.touch(300);
    clock.touch(200);
    ASSERT_EQ(clock.last(), 300u);
}

TEST(clock_concurrent_touches_keep_maximum) {
    ActivityClock clock;
    std::thread a([&clock]() {
        for (uint64_t t = 0; t < 10000; t += 2) clock.touch(t);
    });
    std::thread b([&clock]() {
        for (uint64_t t = 1; t < 10000; t += 2) clock.touch(t);
    });
    a.join();
    b.join();
    ASSERT_EQ(clock.last(), 9999u);
}

// ============================================================================
// Stop Signal
// ============================================================================

TEST(stop_wait_times_out) {
    util::StopSignal stop;
    uint64_t started = monotonic_ms();
    ASSERT_FALSE(stop.wait_for(60));
    ASSERT_TRUE(monotonic_ms() - started >= 60);
}

TEST(stop_wakes_waiter) {
    util::StopSignal stop;
    std::thread stopper([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        stop.request_stop();
    });

    uint64_t started = monotonic_ms();
    bool stopped = stop.wait_for(5000);
    stopper.join();

    ASSERT_TRUE(stopped);
    ASSERT_TRUE(monotonic_ms() - started < 2000);
}

TEST(parent_stop_reaches_child) {
    util::StopSignal parent;
    util::StopSignal child(&parent);
    util::StopSignal grandchild(&child);

    ASSERT_FALSE(grandchild.stop_requested());
    parent.request_stop();
    ASSERT_TRUE(child.stop_requested());
    ASSERT_TRUE(grandchild.wait_for(1000));
}

TEST(child_stop_leaves_parent) {
    util::StopSignal parent;
    util::StopSignal child(&parent);

    child.request_stop();
    ASSERT_TRUE(child.stop_requested());
    ASSERT_FALSE(parent.stop_requested());
}

int main() {
    return run_all_tests("Watchdog");
}
