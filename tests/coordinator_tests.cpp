#include <recording/recording_coordinator.hpp>

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using mrec_test::check;
using mrec_test::wait_until;

namespace {
    mrec::RecordingCoordinator::Options fast_poll(const mrec_test::ManualClock& clock) {
        mrec::RecordingCoordinator::Options opt;
        opt.watchdog_poll = 5ms;
        opt.clock = clock.fn();
        return opt;
    }

    void test_below_threshold_is_noop() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

        coord.on_motion(500.0, clock.at(0ms));
        coord.on_motion(120.0, clock.at(1s));

        check(nvr.start_calls == 0, "score <= threshold must not issue StartTrack");
        check(!coord.last_motion_at().has_value(), "score <= threshold must not touch last_motion_at");
        check(!coord.is_recording(), "score <= threshold must not start recording");
    }

    void test_episode_scenario_start_once_stop_once() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera("front", 500.0, 30s, 10s, 3),
                                         nvr, running, fast_poll(clock));

        coord.on_motion(800.0, clock.at(0s));
        check(nvr.start_calls == 1, "first motion should issue exactly one StartTrack");
        check(nvr.last_start_id == 301, "track id should be channel*100+1");
        check(coord.is_recording(), "successful start should set is_recording");
        check(coord.watchdog_active(), "successful start should spawn the watchdog");

        clock.set(2s);
        coord.on_motion(800.0, clock.at(2s));
        clock.set(5s);
        coord.on_motion(800.0, clock.at(5s));

        check(nvr.start_calls == 1, "motion while recording must not issue another StartTrack");
        check(coord.last_motion_at() == clock.at(5s), "last_motion_at should follow every motion event");
        check(coord.stats().suppressed_recording == 2, "both follow-up events should be suppressed as recording");

        clock.set(15s);
        std::this_thread::sleep_for(60ms);
        check(nvr.stop_calls == 0, "no StopTrack before the no-motion timeout is exceeded");
        check(coord.is_recording(), "still recording at exactly the timeout");

        clock.set(16s);
        check(wait_until([&] { return !coord.is_recording(); }), "watchdog should stop the recording after the timeout");
        check(wait_until([&] { return !coord.watchdog_active(); }), "watchdog should terminate after stopping");
        std::this_thread::sleep_for(30ms);
        check(nvr.stop_calls == 1, "exactly one StopTrack per episode");
        check(nvr.last_stop_id == 301, "StopTrack should target the same track");
    }

    void test_cooldown_requires_quiet_gap() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera("yard", 500.0, 30s, 10s),
                                         nvr, running, fast_poll(clock));

        coord.on_motion(900.0, clock.at(0s));
        clock.set(11s);
        check(wait_until([&] { return !coord.is_recording(); }), "episode should end after the timeout");
        check(nvr.stop_calls == 1, "one stop after the first episode");

        clock.set(20s);
        coord.on_motion(900.0, clock.at(20s));
        check(nvr.start_calls == 1, "motion within the cooldown of the previous event must be suppressed");
        check(coord.stats().suppressed_cooldown == 1, "suppression should be counted as cooldown");
        check(coord.last_motion_at() == clock.at(20s), "suppressed event should still refresh last_motion_at");

        clock.set(51s);
        coord.on_motion(900.0, clock.at(51s));
        check(nvr.start_calls == 2, "motion after a full quiet cooldown should start a new episode");
        check(coord.stats().watchdogs_spawned == 2, "a new episode gets a new watchdog");
        check(coord.is_recording(), "second episode should be recording");

        coord.shutdown();
    }

    void test_failed_start_leaves_idle_and_retries() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

        nvr.fail_start = true;
        coord.on_motion(800.0, clock.at(0s));
        check(nvr.start_calls == 1, "start should have been attempted");
        check(!coord.is_recording(), "failed start must leave is_recording false");
        check(!coord.watchdog_active(), "failed start must not spawn a watchdog");
        check(coord.stats().start_failures == 1, "failure should be counted");

        nvr.fail_start = false;
        clock.set(1s);
        coord.on_motion(800.0, clock.at(1s));
        check(nvr.start_calls == 2, "next qualifying motion should retry StartTrack");
        check(coord.is_recording(), "retry should succeed and set is_recording");
        check(coord.watchdog_active(), "successful retry should spawn the watchdog");

        coord.shutdown();
    }

    void test_client_exception_is_a_failure() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

        nvr.throw_on_start = true;
        coord.on_motion(800.0, clock.at(0s));
        check(!coord.is_recording(), "exception from the client must not set is_recording");
        check(coord.stats().start_failures == 1, "exception should be counted as a start failure");
    }

    void test_concurrent_events_issue_single_start() {
        for (int round = 0; round < 20; ++round) {
            mrec_test::ManualClock clock;
            mrec_test::FakeNvr nvr;
            nvr.start_delay = (round % 2 == 0) ? 20ms : 0ms;
            std::atomic<bool> running{true};
            mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

            std::atomic<bool> go{false};
            std::vector<std::thread> threads;
            for (int i = 0; i < 8; ++i) {
                threads.emplace_back([&, i] {
                    while (!go.load()) std::this_thread::yield();
                    coord.on_motion(800.0, clock.at(std::chrono::milliseconds(i)));
                });
            }
            go = true;
            for (auto& t : threads) t.join();

            check(nvr.start_calls == 1, "concurrent events on an idle camera must issue exactly one StartTrack");
            check(nvr.max_starts_in_flight <= 1, "never more than one StartTrack in flight per camera");
            check(coord.is_recording(), "one of the concurrent events should have started recording");
            check(coord.stats().watchdogs_spawned == 1, "exactly one watchdog for the episode");
            check(coord.last_motion_at() == clock.at(7ms), "last_motion_at should hold the latest event time");
            coord.shutdown();
        }
    }

    void test_last_motion_at_never_moves_backwards() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

        coord.on_motion(800.0, clock.at(10s));
        coord.on_motion(800.0, clock.at(4s));
        check(coord.last_motion_at() == clock.at(10s), "a late-delivered event must not move last_motion_at backwards");
        coord.shutdown();
    }

    void test_failed_stop_still_clears_state() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

        nvr.fail_stop = true;
        coord.on_motion(800.0, clock.at(0s));
        clock.set(11s);
        check(wait_until([&] { return !coord.is_recording(); }),
              "failed StopTrack still clears is_recording (recorder may remain recording)");
        check(wait_until([&] { return !coord.watchdog_active(); }), "watchdog exits after a failed stop");
        check(nvr.stop_calls == 1, "failed stop is not retried");
        check(coord.stats().stop_failures == 1, "failed stop should be counted");
    }

    void test_running_flag_ends_watchdog_without_stop() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        mrec::RecordingCoordinator coord(mrec_test::make_camera(), nvr, running, fast_poll(clock));

        coord.on_motion(800.0, clock.at(0s));
        check(coord.watchdog_active(), "watchdog should be running");

        running = false;
        check(wait_until([&] { return !coord.watchdog_active(); }), "watchdog should observe the running flag");
        check(nvr.stop_calls == 0, "shutdown must not issue StopTrack");
        check(coord.is_recording(), "shutdown leaves the recording state untouched");

        coord.on_motion(800.0, clock.at(40s));
        check(nvr.start_calls == 1, "no new start once the running flag is cleared");
        coord.shutdown();
    }

    void test_shutdown_joins_active_watchdog() {
        mrec_test::ManualClock clock;
        mrec_test::FakeNvr nvr;
        std::atomic<bool> running{true};
        auto coord = std::make_unique<mrec::RecordingCoordinator>(
            mrec_test::make_camera(), nvr, running, fast_poll(clock));

        coord->on_motion(800.0, clock.at(0s));
        coord->shutdown();
        check(!coord->watchdog_active(), "shutdown should join the watchdog");
        coord.reset();
        check(nvr.stop_calls == 0, "destroying the coordinator must not issue StopTrack");
    }
}

int main() {
    test_below_threshold_is_noop();
    test_episode_scenario_start_once_stop_once();
    test_cooldown_requires_quiet_gap();
    test_failed_start_leaves_idle_and_retries();
    test_client_exception_is_a_failure();
    test_concurrent_events_issue_single_start();
    test_last_motion_at_never_moves_backwards();
    test_failed_stop_still_clears_state();
    test_running_flag_ends_watchdog_without_stop();
    test_shutdown_joins_active_watchdog();

    return mrec_test::finish("coordinator");
}
