#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include <detect/motion_scorer.hpp>

namespace mrec {
    struct MotionDetectorConfig {
        double threshold = 500.0;   // camera motion-area threshold
        int refresh_interval = 300; // unconditional reference refresh, in frames
        double quiet_ratio = 0.1;   // area below threshold * ratio re-baselines immediately
    };

    struct MotionSample {
        double area = 0.0;
        bool reference_set = false; // frame became the reference, no decision made
        bool refreshed = false;     // reference replaced after scoring
        bool quiet = false;         // area under the quiet cutoff
        int64_t frame_index = 0;
    };

    // Scores frames of one camera against an adaptive reference image.
    // Not thread safe: owned and called by a single supervisor loop.
    class MotionDetector {
    public:
        MotionDetector(MotionDetectorConfig cfg, std::unique_ptr<IMotionScorer> scorer);

        MotionSample next_score(const cv::Mat& frame);

        // drop the reference; next frame re-baselines
        void reset();

        bool has_reference() const { return !reference_.empty(); }
        int64_t frames() const { return frames_; }
        const MotionDetectorConfig& config() const { return cfg_; }

    private:
        MotionDetectorConfig cfg_;
        std::unique_ptr<IMotionScorer> scorer_;

        cv::Mat reference_;
        int64_t frames_ = 0;
    };
}
