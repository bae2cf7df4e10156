#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <common/config.hpp>
#include <detect/motion_scorer.hpp>
#include <nvr/nvr_client.hpp>
#include <pipeline/camera_supervisor.hpp>
#include <pipeline/task_pool.hpp>
#include <recording/recording_coordinator.hpp>

namespace mrec {
    using ScorerFactory = std::function<std::unique_ptr<IMotionScorer>(const DetectorConfig&)>;

    // One detection thread, coordinator, supervisor and dispatch pool per camera.
    // Nothing on the motion path is shared between cameras.
    class Orchestrator {
    public:
        struct Options {
            CaptureConfig capture;
            DetectorConfig detector;
            RuntimeConfig runtime;

            // defaults: GStreamer source and contour-area scorer
            SourceFactory source_factory;
            ScorerFactory scorer_factory;
            ClockFn clock;
        };

        Orchestrator(std::vector<CameraConfig> cameras,
                     INvrClient& nvr,
                     Options opt);

        ~Orchestrator() { stop(); }

        bool start();
        // clears the running flag; every loop and watchdog exits on its own
        void request_stop();
        // blocks until every camera thread has returned
        void wait();
        void stop();

        bool running() const { return running_.load(); }

        const RecordingCoordinator* coordinator(const std::string& camera) const;
        const CameraSupervisor* supervisor(const std::string& camera) const;
        std::vector<std::string> camera_names() const;

    private:
        struct CameraPipe {
            CameraConfig cfg;
            std::unique_ptr<RecordingCoordinator> coordinator;
            std::unique_ptr<TaskPool> dispatch;
            std::unique_ptr<CameraSupervisor> supervisor;
            std::thread thr;
        };

        void camera_loop_(CameraPipe* pipe);

        std::vector<CameraConfig> cameras_;
        INvrClient& nvr_;
        Options opt_;

        std::atomic<bool> running_{false};
        bool started_ = false;

        std::vector<std::unique_ptr<CameraPipe>> pipes_;
        std::unordered_map<std::string, CameraPipe*> pipes_by_name_;
    };
}
