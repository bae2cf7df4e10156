#include <detect/motion_detector.hpp>

#include <algorithm>
#include <stdexcept>

namespace mrec {
    MotionDetector::MotionDetector(MotionDetectorConfig cfg, std::unique_ptr<IMotionScorer> scorer)
        : cfg_(cfg), scorer_(std::move(scorer)) {
        if (!scorer_) {
            throw std::invalid_argument("[MotionDetector] scorer is null");
        }
        cfg_.refresh_interval = std::max(1, cfg_.refresh_interval);
        cfg_.quiet_ratio = std::max(0.0, cfg_.quiet_ratio);
    }

    MotionSample MotionDetector::next_score(const cv::Mat& frame) {
        MotionSample s;
        if (frame.empty()) return s;

        s.frame_index = ++frames_;
        cv::Mat prepared = scorer_->prepare(frame);

        // first frame, or the stream came back with another geometry
        if (reference_.empty() ||
            reference_.size() != prepared.size() ||
            reference_.type() != prepared.type()) {
            reference_ = prepared;
            s.reference_set = true;
            return s;
        }

        s.area = std::max(0.0, scorer_->score(reference_, prepared));
        s.quiet = s.area < cfg_.threshold * cfg_.quiet_ratio;

        // two independent triggers: slow drift vs. re-baselining an empty scene
        const bool periodic = (frames_ % cfg_.refresh_interval) == 0;
        if (periodic || s.quiet) {
            reference_ = prepared;
            s.refreshed = true;
        }
        return s;
    }

    void MotionDetector::reset() {
        reference_.release();
    }
}
