// ==============================================================================
// Motion analyzer: frame handling, flow metrics, centroid and velocity
// ==============================================================================

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

#include <opencv2/imgproc.hpp>

#include "chaossynth/motion_analyzer.hpp"

using namespace chaossynth;

namespace {

cv::Mat texturedFrame(int w = 320, int h = 240, int seed = 42) {
    cv::Mat noise(h, w, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(noise, cv::RNG::UNIFORM, 0, 256);
    cv::GaussianBlur(noise, noise, cv::Size(0, 0), 2.0);
    cv::normalize(noise, noise, 0, 255, cv::NORM_MINMAX);
    cv::Mat bgr;
    cv::cvtColor(noise, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

cv::Mat shifted(const cv::Mat& src, double dx, double dy) {
    cv::Mat m = (cv::Mat_<double>(2, 3) << 1, 0, dx, 0, 1, dy);
    cv::Mat dst;
    cv::warpAffine(src, dst, m, src.size(), cv::INTER_LINEAR, cv::BORDER_REFLECT);
    return dst;
}

// Flow field that is zero except for a rectangle of horizontal vectors.
cv::Mat blockFlow(cv::Rect block, float magnitude, int w = 320, int h = 240) {
    cv::Mat flow(h, w, CV_32FC2, cv::Scalar(0, 0));
    flow(block).setTo(cv::Scalar(magnitude, 0));
    return flow;
}

}  // namespace

TEST_CASE("First frame primes the history and reads as Still", "[analyzer]") {
    MotionAnalyzer analyzer;
    REQUIRE_FALSE(analyzer.hasHistory());

    MotionReading r = analyzer.analyze(texturedFrame());
    CHECK(r.status == FrameStatus::Ok);
    CHECK(r.metrics.motionType == MotionType::Still);
    CHECK(r.metrics.motionEnergy == 0.0);
    CHECK(r.metrics.globalVelocity == 0.0);
    CHECK(r.metrics.center.x == Approx(0.5));
    CHECK(analyzer.hasHistory());
}

TEST_CASE("Unchanged frames give zero flow and Still", "[analyzer]") {
    MotionAnalyzer analyzer;
    cv::Mat uniform(240, 320, CV_8UC3, cv::Scalar(90, 90, 90));
    analyzer.analyze(uniform);
    MotionReading r = analyzer.analyze(uniform);
    CHECK(r.status == FrameStatus::Ok);
    CHECK(r.metrics.motionEnergy < 0.01);
    CHECK(r.metrics.motionType == MotionType::Still);

    cv::Mat tex = texturedFrame();
    analyzer.analyze(tex);
    r = analyzer.analyze(tex.clone());
    CHECK(r.metrics.motionEnergy < 0.15);
    CHECK(r.metrics.motionType == MotionType::Still);
}

TEST_CASE("A shifted textured frame produces motion energy", "[analyzer][flow]") {
    MotionAnalyzer analyzer;
    cv::Mat a = texturedFrame();
    analyzer.analyze(a);
    MotionReading r = analyzer.analyze(shifted(a, 3.0, 0.0));
    CHECK(r.status == FrameStatus::Ok);
    CHECK(r.metrics.motionEnergy > 0.15);
    CHECK(r.metrics.motionEnergy <= 1.0);
    CHECK(r.metrics.motionType != MotionType::Still);
}

TEST_CASE("Gray and BGRA inputs are accepted", "[analyzer]") {
    cv::Mat bgr = texturedFrame();
    cv::Mat gray, bgra;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);

    MotionAnalyzer a1;
    a1.analyze(gray);
    CHECK(a1.analyze(gray).status == FrameStatus::Ok);

    MotionAnalyzer a2;
    a2.analyze(bgra);
    CHECK(a2.analyze(bgra).status == FrameStatus::Ok);
}

TEST_CASE("Frames larger than the processing size are resized", "[analyzer]") {
    MotionAnalyzer analyzer;
    cv::Mat big = texturedFrame(640, 480);
    analyzer.analyze(big);
    MotionReading r = analyzer.analyze(big);
    CHECK(r.status == FrameStatus::Ok);
    CHECK(analyzer.inputSize() == cv::Size(640, 480));
}

TEST_CASE("Empty frame is FrameUnavailable and keeps history", "[analyzer][errors]") {
    MotionAnalyzer analyzer;
    cv::Mat a = texturedFrame();
    analyzer.analyze(a);
    MotionReading moving = analyzer.analyze(shifted(a, 3.0, 0.0));

    MotionReading r = analyzer.analyze(cv::Mat());
    CHECK(r.status == FrameStatus::FrameUnavailable);
    CHECK(r.metrics.motionEnergy == Approx(moving.metrics.motionEnergy));
    CHECK(analyzer.hasHistory());
}

TEST_CASE("Mismatched frame size is rejected without touching history", "[analyzer][errors]") {
    MotionAnalyzer analyzer;
    cv::Mat a = texturedFrame();
    analyzer.analyze(a);
    MotionReading moving = analyzer.analyze(shifted(a, 3.0, 0.0));

    MotionReading r = analyzer.analyze(texturedFrame(160, 120));
    CHECK(r.status == FrameStatus::InvalidFrameDimensions);
    CHECK(r.metrics.motionEnergy == Approx(moving.metrics.motionEnergy));
    CHECK(r.metrics.motionType == moving.metrics.motionType);
    CHECK(analyzer.hasHistory());

    // history still holds the last good frame, so flow is computed, not re-primed
    MotionReading next = analyzer.analyze(shifted(a, 3.0, 0.0));
    CHECK(next.status == FrameStatus::Ok);
    CHECK(next.metrics.motionEnergy < 0.15);
}

TEST_CASE("Unsupported channel counts and depths are rejected", "[analyzer][errors]") {
    MotionAnalyzer analyzer;
    cv::Mat twoChannel(240, 320, CV_8UC2, cv::Scalar(10, 10));
    CHECK(analyzer.analyze(twoChannel).status == FrameStatus::InvalidFrameDimensions);
    cv::Mat floats(240, 320, CV_32FC3, cv::Scalar(0.5, 0.5, 0.5));
    CHECK(analyzer.analyze(floats).status == FrameStatus::InvalidFrameDimensions);
    CHECK_FALSE(analyzer.hasHistory());
}

TEST_CASE("Configured input size is enforced from the first frame", "[analyzer][errors]") {
    AnalyzerConfig cfg;
    cfg.inputWidth = 640;
    cfg.inputHeight = 480;
    MotionAnalyzer analyzer(cfg);
    CHECK(analyzer.analyze(texturedFrame(320, 240)).status == FrameStatus::InvalidFrameDimensions);
    CHECK(analyzer.analyze(texturedFrame(640, 480)).status == FrameStatus::Ok);
}

TEST_CASE("Energy is the mean flow magnitude over the scale constant", "[analyzer][flow]") {
    MotionAnalyzer analyzer;
    cv::Mat flow(240, 320, CV_32FC2, cv::Scalar(3.0, 4.0));  // |v| = 5 px everywhere
    MotionReading r = analyzer.analyzeFlow(flow);
    CHECK(r.metrics.motionEnergy == Approx(1.0));

    cv::Mat half(240, 320, CV_32FC2, cv::Scalar(1.5, 2.0));  // 2.5 px
    r = analyzer.analyzeFlow(half);
    CHECK(r.metrics.motionEnergy == Approx(0.5));

    cv::Mat huge(240, 320, CV_32FC2, cv::Scalar(100.0, 0.0));
    CHECK(analyzer.analyzeFlow(huge).metrics.motionEnergy == Approx(1.0));
}

TEST_CASE("Centroid follows where the motion is", "[analyzer][flow]") {
    MotionAnalyzer analyzer;
    MotionReading r = analyzer.analyzeFlow(blockFlow(cv::Rect(240, 0, 80, 240), 5.0f));
    CHECK(r.metrics.center.x == Approx((240 + 319) / 2.0 / 320.0));
    CHECK(r.metrics.center.y == Approx(119.5 / 240.0));

    r = analyzer.analyzeFlow(blockFlow(cv::Rect(0, 0, 80, 60), 5.0f));
    CHECK(r.metrics.center.x < 0.15);
    CHECK(r.metrics.center.y < 0.15);
}

TEST_CASE("Zero flow puts the centroid at the frame centre", "[analyzer][flow]") {
    MotionAnalyzer analyzer;
    cv::Mat still(240, 320, CV_32FC2, cv::Scalar(0, 0));
    MotionReading r = analyzer.analyzeFlow(still);
    CHECK(r.metrics.center.x == Approx(0.5));
    CHECK(r.metrics.center.y == Approx(0.5));
    CHECK(r.metrics.motionType == MotionType::Still);
}

TEST_CASE("Velocity is centroid displacement over the frame diagonal", "[analyzer][flow]") {
    MotionAnalyzer analyzer;
    // 320x240 has a 400 px diagonal; centroids 40 px apart give 0.1
    MotionReading first = analyzer.analyzeFlow(blockFlow(cv::Rect(40, 0, 160, 240), 5.0f));
    CHECK(first.metrics.globalVelocity == 0.0);
    MotionReading second = analyzer.analyzeFlow(blockFlow(cv::Rect(80, 0, 160, 240), 5.0f));
    CHECK(second.metrics.globalVelocity == Approx(0.1).margin(1e-6));
    CHECK(second.metrics.motionEnergy == Approx(0.5));
    CHECK(second.metrics.motionType == MotionType::Local);
}

TEST_CASE("Non-finite flow holds the previous metrics", "[analyzer][errors]") {
    MotionAnalyzer analyzer;
    MotionReading good = analyzer.analyzeFlow(blockFlow(cv::Rect(40, 0, 160, 240), 5.0f));
    REQUIRE(good.status == FrameStatus::Ok);

    cv::Mat bad = blockFlow(cv::Rect(40, 0, 160, 240), 5.0f);
    bad.at<cv::Vec2f>(10, 10)[0] = std::numeric_limits<float>::quiet_NaN();
    MotionReading r = analyzer.analyzeFlow(bad);
    CHECK(r.status == FrameStatus::NumericDegenerate);
    CHECK(r.metrics.motionEnergy == Approx(good.metrics.motionEnergy));
    CHECK(r.metrics.center.x == Approx(good.metrics.center.x));
    CHECK(std::isfinite(r.metrics.globalVelocity));

    cv::Mat inf = blockFlow(cv::Rect(40, 0, 160, 240), std::numeric_limits<float>::infinity());
    CHECK(analyzer.analyzeFlow(inf).status == FrameStatus::NumericDegenerate);
}

TEST_CASE("Flow of the wrong type is rejected", "[analyzer][errors]") {
    MotionAnalyzer analyzer;
    cv::Mat wrong(240, 320, CV_64FC2, cv::Scalar(1, 1));
    CHECK(analyzer.analyzeFlow(wrong).status == FrameStatus::InvalidFrameDimensions);
    CHECK(analyzer.analyzeFlow(cv::Mat()).status == FrameStatus::InvalidFrameDimensions);
}

TEST_CASE("Motion statistics track the recent energy history", "[analyzer][stats]") {
    AnalyzerConfig cfg;
    cfg.historySize = 4;
    MotionAnalyzer analyzer(cfg);
    MotionStatistics empty = analyzer.statistics();
    CHECK(empty.mean == 0.0);
    CHECK(empty.max == 0.0);

    for (double px : {0.0, 1.0, 2.0, 3.0, 4.0, 5.0}) {
        cv::Mat flow(240, 320, CV_32FC2, cv::Scalar(px, 0.0));
        analyzer.analyzeFlow(flow);
    }
    // only the last four readings remain: 0.4 0.6 0.8 1.0
    MotionStatistics s = analyzer.statistics();
    CHECK(s.min == Approx(0.4));
    CHECK(s.max == Approx(1.0));
    CHECK(s.mean == Approx(0.7));
    CHECK(s.stddev == Approx(std::sqrt(0.05)));

    analyzer.reset();
    CHECK(analyzer.statistics().max == 0.0);
    CHECK_FALSE(analyzer.hasHistory());
}
