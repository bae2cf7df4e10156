#include <pipeline/runtime.hpp>

#include <iostream>
#include <utility>

#include <ingest/frame_source_factory.hpp>

namespace mrec {
    Orchestrator::Orchestrator(std::vector<CameraConfig> cameras,
                               INvrClient& nvr,
                               Options opt)
                                   : cameras_(std::move(cameras)),
                                     nvr_(nvr),
                                     opt_(std::move(opt)) {
        if (!opt_.source_factory) {
            const CaptureConfig cap = opt_.capture;
            opt_.source_factory = [cap](const CameraConfig& cam) { return make_frame_source(cam, cap); };
        }
        if (!opt_.scorer_factory) {
            opt_.scorer_factory = [](const DetectorConfig& d) {
                ScorerConfig sc;
                sc.pixel_threshold = d.pixel_threshold;
                sc.blur_kernel = d.blur_kernel;
                sc.dilate_iterations = d.dilate_iterations;
                return create_contour_area_scorer(sc);
            };
        }
    }

    bool Orchestrator::start() {
        if (started_) return true;
        if (cameras_.empty()) {
            std::cerr << "[Orchestrator](start) no cameras configured.\n";
            return false;
        }
        running_ = true;
        started_ = true;

        const RuntimeConfig& rt = opt_.runtime;

        pipes_.clear();
        pipes_by_name_.clear();
        pipes_.reserve(cameras_.size());

        for (const auto& cam : cameras_) {
            auto p = std::make_unique<CameraPipe>();
            p->cfg = cam;

            RecordingCoordinator::Options copt;
            copt.watchdog_poll = rt.watchdog_poll;
            copt.clock = opt_.clock;
            p->coordinator = std::make_unique<RecordingCoordinator>(cam, nvr_, running_, copt);

            p->dispatch = std::make_unique<TaskPool>("dispatch:" + cam.name, rt.dispatch_workers,
                                                     static_cast<size_t>(rt.dispatch_queue));
            p->dispatch->start();

            MotionDetectorConfig dcfg;
            dcfg.threshold = cam.threshold;
            dcfg.refresh_interval = opt_.detector.refresh_interval;
            dcfg.quiet_ratio = opt_.detector.quiet_ratio;

            CameraSupervisor::Options sopt;
            sopt.frame_interval = rt.frame_interval;
            sopt.reconnect_backoff = rt.reconnect_backoff;
            sopt.max_read_failures = rt.max_read_failures;
            sopt.read_timeout_ms = opt_.capture.read_timeout_ms;

            p->supervisor = std::make_unique<CameraSupervisor>(
                cam,
                opt_.source_factory,
                MotionDetector(dcfg, opt_.scorer_factory(opt_.detector)),
                *p->coordinator,
                *p->dispatch,
                running_,
                sopt);

            pipes_by_name_[cam.name] = p.get();
            pipes_.push_back(std::move(p));
        }

        for (auto& p : pipes_) {
            CameraPipe* pipe = p.get();
            pipe->thr = std::thread([this, pipe] { camera_loop_(pipe); });
            std::cout << pipe->cfg.name << ": Thread started\n";
        }
        return true;
    }

    void Orchestrator::camera_loop_(CameraPipe* pipe) {
        if (!pipe || !pipe->supervisor) return;
        try {
            pipe->supervisor->run();
        } catch (const std::exception& e) {
            // isolate the failure to this camera
            std::cerr << "[Orchestrator](camera_loop_) " << pipe->cfg.name << " terminated: " << e.what() << "\n";
        }
    }

    void Orchestrator::request_stop() {
        running_ = false;
    }

    void Orchestrator::wait() {
        for (auto& p : pipes_) {
            if (p->thr.joinable()) p->thr.join();
        }
    }

    void Orchestrator::stop() {
        if (!started_) return;
        request_stop();
        wait();

        // in-flight start calls finish before the coordinators go away
        for (auto& p : pipes_) {
            if (p->dispatch) p->dispatch->stop();
        }
        for (auto& p : pipes_) {
            if (p->coordinator) p->coordinator->shutdown();
        }
        started_ = false;
    }

    const RecordingCoordinator* Orchestrator::coordinator(const std::string& camera) const {
        auto it = pipes_by_name_.find(camera);
        if (it == pipes_by_name_.end() || !it->second) return nullptr;
        return it->second->coordinator.get();
    }

    const CameraSupervisor* Orchestrator::supervisor(const std::string& camera) const {
        auto it = pipes_by_name_.find(camera);
        if (it == pipes_by_name_.end() || !it->second) return nullptr;
        return it->second->supervisor.get();
    }

    std::vector<std::string> Orchestrator::camera_names() const {
        std::vector<std::string> out;
        out.reserve(cameras_.size());
        for (const auto& c : cameras_) out.push_back(c.name);
        return out;
    }
}
