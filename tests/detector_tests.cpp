#include <detect/motion_detector.hpp>
#include <detect/motion_scorer.hpp>

#include "test_support.hpp"

#include <deque>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

using mrec_test::check;

namespace {
    // frames are tagged by their fill value; the scorer records which reference it saw
    struct ScriptState {
        std::deque<double> scores;
        std::vector<int> references_seen;
    };

    class ScriptedScorer : public mrec::IMotionScorer {
    public:
        explicit ScriptedScorer(ScriptState& st) : st_(st) {}

        cv::Mat prepare(const cv::Mat& bgr) const override { return bgr.clone(); }

        double score(const cv::Mat& reference, const cv::Mat&) const override {
            st_.references_seen.push_back(reference.at<uchar>(0, 0));
            if (st_.scores.empty()) return 0.0;
            const double s = st_.scores.front();
            st_.scores.pop_front();
            return s;
        }

    private:
        ScriptState& st_;
    };

    cv::Mat tagged(int tag, int w = 4, int h = 4) {
        return cv::Mat(h, w, CV_8UC1, cv::Scalar(tag));
    }

    mrec::MotionDetector make_detector(ScriptState& st, int refresh_interval = 300) {
        mrec::MotionDetectorConfig cfg;
        cfg.threshold = 500.0;
        cfg.refresh_interval = refresh_interval;
        cfg.quiet_ratio = 0.1;
        return mrec::MotionDetector(cfg, std::make_unique<ScriptedScorer>(st));
    }

    void test_first_frame_sets_reference() {
        ScriptState st;
        auto det = make_detector(st);

        const auto s = det.next_score(tagged(1));
        check(s.reference_set, "first frame should become the reference");
        check(s.area == 0.0, "first frame should report no motion");
        check(st.references_seen.empty(), "first frame must not be scored");
        check(det.has_reference(), "detector should hold a reference after the first frame");
    }

    void test_quiet_frame_rebaselines_immediately() {
        ScriptState st;
        st.scores = {800.0, 40.0, 800.0};
        auto det = make_detector(st);

        det.next_score(tagged(1));
        const auto motion = det.next_score(tagged(2));
        check(motion.area == 800.0, "score should be passed through");
        check(!motion.refreshed, "motion frame must not replace the reference");

        const auto quiet = det.next_score(tagged(3));
        check(quiet.quiet, "area below 10% of threshold is quiet");
        check(quiet.refreshed, "quiet frame should replace the reference");

        det.next_score(tagged(4));
        check(st.references_seen.size() == 3, "three frames should have been scored");
        check(st.references_seen[0] == 1 && st.references_seen[1] == 1,
              "reference should be kept across a motion frame");
        check(st.references_seen[2] == 3, "quiet frame should be the new reference");
    }

    void test_quiet_cutoff_is_strict() {
        ScriptState st;
        st.scores = {50.0};
        auto det = make_detector(st);

        det.next_score(tagged(1));
        const auto s = det.next_score(tagged(2));
        check(!s.quiet && !s.refreshed, "area equal to 10% of threshold is not quiet");
    }

    void test_periodic_refresh_every_n_frames() {
        ScriptState st;
        st.scores = {800.0, 800.0, 800.0, 800.0, 800.0};
        auto det = make_detector(st, 5);

        for (int i = 1; i <= 4; ++i) {
            const auto s = det.next_score(tagged(i));
            check(!s.refreshed, "no periodic refresh before frame N");
        }
        const auto fifth = det.next_score(tagged(5));
        check(fifth.refreshed && !fifth.quiet, "frame N should refresh the reference even with motion");
        check(fifth.frame_index == 5, "frame index should count every scored frame");

        det.next_score(tagged(6));
        check(st.references_seen.back() == 5, "frame after the periodic refresh is scored against frame N");
    }

    void test_geometry_change_resets_reference() {
        ScriptState st;
        st.scores = {800.0};
        auto det = make_detector(st);

        det.next_score(tagged(1, 4, 4));
        const auto s = det.next_score(tagged(2, 8, 6));
        check(s.reference_set, "frame with a different size should become the new reference");
        check(st.references_seen.empty(), "mismatched frame must not be scored");
    }

    void test_reset_and_empty_frames() {
        ScriptState st;
        st.scores = {-12.0};
        auto det = make_detector(st);

        det.next_score(tagged(1));
        const auto neg = det.next_score(tagged(2));
        check(neg.area == 0.0, "negative scores are clamped to zero");

        const auto empty = det.next_score(cv::Mat());
        check(empty.area == 0.0 && !empty.reference_set, "empty frame yields an empty sample");
        check(det.frames() == 2, "empty frames are not counted");

        det.reset();
        check(!det.has_reference(), "reset drops the reference");
        check(det.next_score(tagged(3)).reference_set, "frame after reset becomes the reference");
    }

    void test_contour_scorer_measures_changed_area() {
        auto scorer = mrec::create_contour_area_scorer(mrec::ScorerConfig{});

        const cv::Mat empty(240, 320, CV_8UC3, cv::Scalar(0, 0, 0));
        cv::Mat object = empty.clone();
        cv::rectangle(object, cv::Rect(100, 80, 60, 60), cv::Scalar(255, 255, 255), cv::FILLED);

        const cv::Mat ref = scorer->prepare(empty);
        check(ref.channels() == 1, "prepared frame should be single channel");
        check(scorer->score(ref, scorer->prepare(empty)) == 0.0, "identical frames have no motion");

        const double area = scorer->score(ref, scorer->prepare(object));
        check(area > 2500.0, "a 60x60 object should score roughly its area");
        check(area < 240.0 * 320.0, "score is bounded by the frame");
    }

    void test_detector_with_contour_scorer() {
        mrec::MotionDetectorConfig cfg;
        cfg.threshold = 500.0;
        mrec::MotionDetector det(cfg, mrec::create_contour_area_scorer());

        const cv::Mat empty(240, 320, CV_8UC3, cv::Scalar(10, 10, 10));
        cv::Mat object = empty.clone();
        cv::rectangle(object, cv::Rect(40, 40, 80, 80), cv::Scalar(250, 250, 250), cv::FILLED);

        det.next_score(empty);
        const auto still = det.next_score(empty);
        check(still.quiet && still.refreshed, "unchanged scene re-baselines as quiet");

        const auto moving = det.next_score(object);
        check(moving.area > cfg.threshold, "object entering the scene exceeds the threshold");
        check(!moving.refreshed, "motion frame keeps the empty-scene reference");

        const auto again = det.next_score(object);
        check(again.area > cfg.threshold, "object stays visible against the kept reference");
    }
}

int main() {
    test_first_frame_sets_reference();
    test_quiet_frame_rebaselines_immediately();
    test_quiet_cutoff_is_strict();
    test_periodic_refresh_every_n_frames();
    test_geometry_change_resets_reference();
    test_reset_and_empty_frames();
    test_contour_scorer_measures_changed_area();
    test_detector_with_contour_scorer();

    return mrec_test::finish("detector");
}
