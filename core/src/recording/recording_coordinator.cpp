#include <recording/recording_coordinator.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace mrec {
    RecordingCoordinator::RecordingCoordinator(CameraConfig cam,
                                               INvrClient& nvr,
                                               const std::atomic<bool>& running,
                                               Options opt)
        : cam_(std::move(cam)),
          track_id_(track_id_for_channel(cam_.nvr_channel)),
          nvr_(nvr),
          running_(running),
          poll_(opt.watchdog_poll),
          clock_(std::move(opt.clock)) {
        if (!clock_) clock_ = [] { return SteadyClock::now(); };
        if (poll_.count() <= 0) poll_ = std::chrono::milliseconds(1000);
    }

    RecordingCoordinator::RecordingCoordinator(CameraConfig cam,
                                               INvrClient& nvr,
                                               const std::atomic<bool>& running)
        : RecordingCoordinator(std::move(cam), nvr, running, Options{}) {}

    TrackResult RecordingCoordinator::call_(bool start) {
        try {
            return start ? nvr_.start_track(track_id_) : nvr_.stop_track(track_id_);
        } catch (const std::exception& e) {
            TrackResult r;
            r.error = e.what();
            return r;
        }
    }

    void RecordingCoordinator::on_motion(double score, TimePoint now) {
        if (!(score > cam_.threshold)) return;

        {
            std::lock_guard lk(m_);
            ++stats_.motion_events;

            // the watchdog reads this even when no transition follows
            const std::optional<TimePoint> prev = last_motion_at_;
            if (!prev || now > *prev) last_motion_at_ = now;

            if (is_recording_ || start_in_flight_) {
                ++stats_.suppressed_recording;
                return;
            }
            if (!retry_pending_ && prev && now - *prev < cam_.cooldown) {
                ++stats_.suppressed_cooldown;
                return;
            }
            if (stopping_ || !running_.load()) return;

            start_in_flight_ = true;
        }

        const TrackResult res = call_(true);

        std::thread previous;
        {
            std::lock_guard lk(m_);
            start_in_flight_ = false;

            if (!res.ok) {
                ++stats_.start_failures;
                retry_pending_ = true;
                std::cerr << cam_.name << ": Record failed (start track " << track_id_ << "): "
                          << res.error << "\n";
                return;
            }

            is_recording_ = true;
            retry_pending_ = false;
            ++stats_.starts;
            std::cout << cam_.name << ": Recording STARTED Ch" << cam_.nvr_channel
                      << " [" << res.status << "]\n";

            if (stopping_) {
                std::cerr << "[Recorder](on_motion) " << cam_.name
                          << ": started during shutdown, no watchdog will stop it.\n";
            } else if (!watchdog_active_) {
                spawn_watchdog_locked_(previous);
            }
        }

        // finished watchdog of an earlier episode; it no longer touches the state
        if (previous.joinable()) previous.join();
    }

    void RecordingCoordinator::spawn_watchdog_locked_(std::thread& previous) {
        watchdog_active_ = true;
        ++stats_.watchdogs_spawned;
        previous = std::move(watchdog_thr_);
        watchdog_thr_ = std::thread([this] { watchdog_loop_(); });
    }

    void RecordingCoordinator::watchdog_loop_() {
        std::unique_lock lk(m_);
        while (running_.load() && !stopping_ && is_recording_) {
            const TimePoint now = clock_();
            if (last_motion_at_ && now - *last_motion_at_ > cam_.no_motion_timeout) {
                lk.unlock();
                const TrackResult res = call_(false);
                lk.lock();

                // cleared on failure too: a later motion event may start a fresh episode
                is_recording_ = false;
                if (res.ok) {
                    ++stats_.stops;
                    std::cout << cam_.name << ": Recording STOPPED [" << res.status << "]\n";
                } else {
                    ++stats_.stop_failures;
                    std::cerr << cam_.name << ": Stop record failed (stop track " << track_id_ << "): "
                              << res.error << "; local state cleared, recorder may still be recording\n";
                }
                break;
            }
            cv_.wait_for(lk, poll_);
        }
        watchdog_active_ = false;
    }

    void RecordingCoordinator::shutdown() {
        std::thread thr;
        {
            std::lock_guard lk(m_);
            stopping_ = true;
            thr = std::move(watchdog_thr_);
        }
        cv_.notify_all();
        if (thr.joinable()) thr.join();
    }

    bool RecordingCoordinator::is_recording() const {
        std::lock_guard lk(m_);
        return is_recording_;
    }

    std::optional<TimePoint> RecordingCoordinator::last_motion_at() const {
        std::lock_guard lk(m_);
        return last_motion_at_;
    }

    bool RecordingCoordinator::watchdog_active() const {
        std::lock_guard lk(m_);
        return watchdog_active_;
    }

    CoordinatorStats RecordingCoordinator::stats() const {
        std::lock_guard lk(m_);
        return stats_;
    }
}
