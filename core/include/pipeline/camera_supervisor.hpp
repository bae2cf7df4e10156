#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <common/config.hpp>
#include <detect/motion_detector.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/task_pool.hpp>
#include <recording/recording_coordinator.hpp>

namespace mrec {
    using SourceFactory = std::function<std::unique_ptr<IFrameSource>(const CameraConfig&)>;

    struct SupervisorStats {
        uint64_t frames = 0;       // read attempts, failed ones included
        uint64_t reconnects = 0;   // successful (re)connects
        uint64_t read_failures = 0;
        uint64_t motion_events = 0; // dispatched to the coordinator
        uint64_t dropped_events = 0; // evicted from, or rejected by, this camera's dispatch queue
    };

    class CameraSupervisor {
    public:
        struct Options {
            std::chrono::milliseconds frame_interval{33};
            std::chrono::milliseconds reconnect_backoff{2000};
            int max_read_failures = 50;
            int read_timeout_ms = 5000;
            int quiet_log_every = 30; // frames
        };

        CameraSupervisor(CameraConfig cam,
                         SourceFactory factory,
                         MotionDetector detector,
                         RecordingCoordinator& coordinator,
                         TaskPool& dispatch,   // owned by this camera alone
                         const std::atomic<bool>& running,
                         Options opt);

        CameraSupervisor(const CameraSupervisor&) = delete;
        CameraSupervisor& operator=(const CameraSupervisor&) = delete;

        // detection loop; returns once the running flag is cleared
        void run();

        SupervisorStats stats() const;
        const std::string& name() const { return cam_.name; }

    private:
        bool ensure_source_();
        void release_source_();
        void process_frame_(const cv::Mat& frame);
        void sleep_for_(std::chrono::milliseconds d) const;

        CameraConfig cam_;
        SourceFactory factory_;
        MotionDetector detector_;
        RecordingCoordinator& coordinator_;
        TaskPool& dispatch_;
        const std::atomic<bool>& running_;
        Options opt_;

        std::unique_ptr<IFrameSource> src_;
        int consecutive_failures_ = 0;

        std::atomic<uint64_t> frames_{0};
        std::atomic<uint64_t> reconnects_{0};
        std::atomic<uint64_t> read_failures_{0};
        std::atomic<uint64_t> motion_events_{0};
        std::atomic<uint64_t> dropped_events_{0};
    };
}
