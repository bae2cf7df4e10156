#include <detect/motion_scorer.hpp>

#include <algorithm>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace mrec {
    namespace {
        class ContourAreaScorer final : public IMotionScorer {
        public:
            explicit ContourAreaScorer(const ScorerConfig& cfg)
                : pixel_threshold_(std::clamp(cfg.pixel_threshold, 0, 255)),
                  blur_kernel_(std::max(3, cfg.blur_kernel)),
                  dilate_iterations_(std::max(0, cfg.dilate_iterations)) {
                if ((blur_kernel_ % 2) == 0) blur_kernel_ += 1;
            }

            cv::Mat prepare(const cv::Mat& bgr) const override {
                cv::Mat gray;
                if (bgr.channels() == 3) {
                    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
                } else if (bgr.channels() == 4) {
                    cv::cvtColor(bgr, gray, cv::COLOR_BGRA2GRAY);
                } else {
                    gray = bgr.clone();
                }
                cv::GaussianBlur(gray, gray, cv::Size(blur_kernel_, blur_kernel_), 0);
                return gray;
            }

            double score(const cv::Mat& reference, const cv::Mat& prepared) const override {
                cv::Mat delta, thresh;
                cv::absdiff(reference, prepared, delta);
                cv::threshold(delta, thresh, pixel_threshold_, 255, cv::THRESH_BINARY);
                if (dilate_iterations_ > 0) {
                    cv::dilate(thresh, thresh, cv::Mat(), cv::Point(-1, -1), dilate_iterations_);
                }

                std::vector<std::vector<cv::Point>> contours;
                cv::findContours(thresh, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

                double area = 0.0;
                for (const auto& c : contours) area += cv::contourArea(c);
                return area;
            }

        private:
            int pixel_threshold_;
            int blur_kernel_;
            int dilate_iterations_;
        };
    } // namespace

    std::unique_ptr<IMotionScorer> create_contour_area_scorer(const ScorerConfig& cfg) {
        return std::make_unique<ContourAreaScorer>(cfg);
    }
}
