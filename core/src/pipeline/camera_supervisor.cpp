#include <pipeline/camera_supervisor.hpp>

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace mrec {
    namespace {
        std::string wall_clock_now() {
            const std::time_t t = std::time(nullptr);
            std::tm tm{};
            localtime_r(&t, &tm);
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            return oss.str();
        }
    } // namespace

    CameraSupervisor::CameraSupervisor(CameraConfig cam,
                                       SourceFactory factory,
                                       MotionDetector detector,
                                       RecordingCoordinator& coordinator,
                                       TaskPool& dispatch,
                                       const std::atomic<bool>& running,
                                       Options opt)
        : cam_(std::move(cam)),
          factory_(std::move(factory)),
          detector_(std::move(detector)),
          coordinator_(coordinator),
          dispatch_(dispatch),
          running_(running),
          opt_(opt) {
        opt_.max_read_failures = std::max(1, opt_.max_read_failures);
        opt_.quiet_log_every = std::max(1, opt_.quiet_log_every);
    }

    // interruptible so shutdown does not wait out a reconnect backoff
    void CameraSupervisor::sleep_for_(std::chrono::milliseconds d) const {
        const auto step = std::chrono::milliseconds(50);
        const auto deadline = SteadyClock::now() + d;
        while (running_.load(std::memory_order_relaxed)) {
            const auto now = SteadyClock::now();
            if (now >= deadline) return;
            std::this_thread::sleep_for(std::min<SteadyClock::duration>(step, deadline - now));
        }
    }

    void CameraSupervisor::release_source_() {
        if (src_) {
            src_->stop();
            src_.reset();
        }
    }

    bool CameraSupervisor::ensure_source_() {
        if (src_ && src_->is_open()) return true;

        std::cout << cam_.name << ": Reconnecting... (#" << reconnects_.load() << ")\n";
        release_source_();

        try {
            src_ = factory_(cam_);
        } catch (const std::exception& e) {
            std::cerr << "[Supervisor](ensure_source_) " << cam_.name << ": failed to create source: " << e.what() << "\n";
            src_.reset();
        }

        if (src_ && src_->start()) {
            ++reconnects_;
            consecutive_failures_ = 0;
            detector_.reset();
            std::cout << cam_.name << ": Connected\n";
            return true;
        }

        release_source_();
        sleep_for_(opt_.reconnect_backoff);
        return false;
    }

    void CameraSupervisor::process_frame_(const cv::Mat& frame) {
        const MotionSample s = detector_.next_score(frame);
        if (s.reference_set) {
            std::cout << cam_.name << ": Reference set\n";
            return;
        }

        if (s.area > cam_.threshold) {
            if (!coordinator_.is_recording()) {
                std::cout << cam_.name << ": Motion detected " << std::llround(s.area)
                          << "px [" << frames_.load() << "] " << wall_clock_now() << "\n";
            }

            const double area = s.area;
            const TimePoint now = coordinator_.now();
            RecordingCoordinator* coord = &coordinator_;
            ++motion_events_;
            const PushResult r = dispatch_.submit([coord, area, now] { coord->on_motion(area, now); });
            if (r != PushResult::Queued) {
                // rejected, or an older pending event of this camera was evicted
                const uint64_t n = ++dropped_events_;
                if (n == 1 || n % 100 == 0) {
                    std::cerr << "[Supervisor](process_frame_) " << cam_.name << ": dispatch backlog, "
                              << n << " motion events dropped.\n";
                }
            }
        }

        if (s.refreshed && s.quiet && (s.frame_index % opt_.quiet_log_every) == 0) {
            std::cout << cam_.name << ": Background updated (quiet)\n";
        }
    }

    void CameraSupervisor::run() {
        FramePacket fp;
        while (running_.load(std::memory_order_relaxed)) {
            try {
                if (!ensure_source_()) continue;

                const bool ok = src_->read(fp, opt_.read_timeout_ms);
                ++frames_;
                if (!ok || fp.bgr.empty()) {
                    ++read_failures_;
                    if (++consecutive_failures_ >= opt_.max_read_failures) {
                        std::cerr << "[Supervisor](run) " << cam_.name << ": " << consecutive_failures_
                                  << " consecutive read failures, reconnecting.\n";
                        release_source_();
                    }
                    continue;
                }
                consecutive_failures_ = 0;

                process_frame_(fp.bgr);
            } catch (const std::exception& e) {
                std::cerr << "[Supervisor](run) " << cam_.name << ": " << e.what() << "\n";
                release_source_();
                sleep_for_(opt_.reconnect_backoff);
                continue;
            }

            sleep_for_(opt_.frame_interval);
        }

        release_source_();
        std::cerr << "[Supervisor](run) " << cam_.name << ": stopped.\n";
    }

    SupervisorStats CameraSupervisor::stats() const {
        SupervisorStats s;
        s.frames = frames_.load();
        s.reconnects = reconnects_.load();
        s.read_failures = read_failures_.load();
        s.motion_events = motion_events_.load();
        s.dropped_events = dropped_events_.load();
        return s;
    }
}
