#pragma once

#include <memory>

#include <opencv2/core.hpp>

namespace mrec {
    struct ScorerConfig {
        int pixel_threshold = 25;  // per-pixel absdiff cutoff
        int blur_kernel = 21;      // forced odd, >= 3
        int dilate_iterations = 2;
    };

    class IMotionScorer {
    public:
        virtual ~IMotionScorer() = default;
        // frame in the form kept as reference (e.g. blurred grey)
        virtual cv::Mat prepare(const cv::Mat& bgr) const = 0;
        // non-negative area of regions differing from the reference
        virtual double score(const cv::Mat& reference, const cv::Mat& prepared) const = 0;
    };

    std::unique_ptr<IMotionScorer> create_contour_area_scorer(const ScorerConfig& cfg = {});
}
