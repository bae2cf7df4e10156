#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include <common/config.hpp>
#include <nvr/nvr_client.hpp>

namespace mrec {
    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = SteadyClock::time_point;
    using ClockFn = std::function<TimePoint()>;

    struct CoordinatorStats {
        uint64_t motion_events = 0;
        uint64_t starts = 0;
        uint64_t start_failures = 0;
        uint64_t stops = 0;
        uint64_t stop_failures = 0;
        uint64_t suppressed_recording = 0; // already recording or start in flight
        uint64_t suppressed_cooldown = 0;
        uint64_t watchdogs_spawned = 0;
    };

    /*
     * Owns the recording state of one camera.
     *
     * on_motion() may be called concurrently from any number of dispatch threads.
     * All reads and writes of the state happen under one mutex; the StartTrack call
     * itself runs outside the lock behind the start_in_flight_ gate, so at most one
     * start is in progress and late events still refresh last_motion_at_.
     *
     * The cooldown compares an event with the previous motion event, so a new
     * episode needs a quiet gap of at least `cooldown`. A failed start is retried
     * by the next event above threshold regardless of the cooldown.
     *
     * While a recording is active a single watchdog thread polls for the no-motion
     * timeout and issues StopTrack. It exits on stop, on shutdown(), or when the
     * shared running flag is cleared.
     */
    class RecordingCoordinator {
    public:
        struct Options {
            std::chrono::milliseconds watchdog_poll{1000};
            ClockFn clock; // steady_clock::now when empty
        };

        RecordingCoordinator(CameraConfig cam,
                             INvrClient& nvr,
                             const std::atomic<bool>& running,
                             Options opt);
        RecordingCoordinator(CameraConfig cam,
                             INvrClient& nvr,
                             const std::atomic<bool>& running);

        RecordingCoordinator(const RecordingCoordinator&) = delete;
        RecordingCoordinator& operator=(const RecordingCoordinator&) = delete;

        ~RecordingCoordinator() { shutdown(); }

        void on_motion(double score, TimePoint now);

        // Joins the watchdog. Does not stop an active recording.
        void shutdown();

        bool is_recording() const;
        std::optional<TimePoint> last_motion_at() const;
        bool watchdog_active() const;
        CoordinatorStats stats() const;

        int track_id() const { return track_id_; }
        const CameraConfig& camera() const { return cam_; }
        TimePoint now() const { return clock_(); }

    private:
        void spawn_watchdog_locked_(std::thread& previous);
        void watchdog_loop_();
        TrackResult call_(bool start);

        const CameraConfig cam_;
        const int track_id_;
        INvrClient& nvr_;
        const std::atomic<bool>& running_;
        std::chrono::milliseconds poll_;
        ClockFn clock_;

        mutable std::mutex m_;
        std::condition_variable cv_;

        // guarded by m_
        bool is_recording_ = false;
        bool start_in_flight_ = false;
        bool retry_pending_ = false; // last start failed; next event skips the cooldown
        bool watchdog_active_ = false;
        bool stopping_ = false;
        std::optional<TimePoint> last_motion_at_;
        CoordinatorStats stats_;
        std::thread watchdog_thr_;
    };
}
