#include "chaossynth/motion_analyzer.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <vector>

#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

#include "chaossynth/motion_classifier.hpp"

namespace chaossynth {

namespace {
bool finite(const MotionMetrics& m) {
    return std::isfinite(m.motionEnergy) && std::isfinite(m.globalVelocity) &&
           std::isfinite(m.center.x) && std::isfinite(m.center.y);
}
}  // namespace

MotionAnalyzer::MotionAnalyzer(const AnalyzerConfig& cfg)
    : cfg_(cfg), inputSize_(cfg.inputWidth, cfg.inputHeight) {}

void MotionAnalyzer::reset() {
    prevGray_.release();
    prevCenter_ = Point2{};
    havePrevCenter_ = false;
    lastMetrics_ = MotionMetrics{};
    energyHistory_.clear();
}

bool MotionAnalyzer::acceptsFrame(const cv::Mat& frame) {
    if (frame.depth() != CV_8U) return false;
    int ch = frame.channels();
    if (ch != 1 && ch != 3 && ch != 4) return false;
    if (inputSize_.area() == 0) inputSize_ = frame.size();  // lock the agreed size
    return frame.size() == inputSize_;
}

cv::Mat MotionAnalyzer::preprocess(const cv::Mat& frame) const {
    cv::Mat small, gray, blurred;
    cv::Size proc(cfg_.procWidth, cfg_.procHeight);
    if (frame.size() != proc) cv::resize(frame, small, proc, 0, 0, cv::INTER_AREA);
    else small = frame;
    if (small.channels() == 3) cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
    else if (small.channels() == 4) cv::cvtColor(small, gray, cv::COLOR_BGRA2GRAY);
    else gray = small.clone();
    cv::GaussianBlur(gray, blurred, cv::Size(cfg_.blurKernel, cfg_.blurKernel), 0);
    return blurred;
}

MotionReading MotionAnalyzer::analyze(const cv::Mat& frame) {
    if (frame.empty()) return {FrameStatus::FrameUnavailable, lastMetrics_};
    if (!acceptsFrame(frame)) return {FrameStatus::InvalidFrameDimensions, lastMetrics_};

    cv::Mat gray = preprocess(frame);
    if (prevGray_.empty()) {
        prevGray_ = gray;
        lastMetrics_ = MotionMetrics{};
        return {FrameStatus::Ok, lastMetrics_};
    }

    cv::Mat flow;
    cv::calcOpticalFlowFarneback(prevGray_, gray, flow,
                                 cfg_.pyrScale, cfg_.levels, cfg_.winsize,
                                 cfg_.iterations, cfg_.polyN, cfg_.polySigma, 0);
    prevGray_ = gray;
    return analyzeFlow(flow);
}

MotionReading MotionAnalyzer::analyzeFlow(const cv::Mat& flow) {
    if (flow.empty() || flow.type() != CV_32FC2)
        return {FrameStatus::InvalidFrameDimensions, lastMetrics_};

    std::vector<cv::Mat> xy;
    cv::split(flow, xy);
    cv::Mat mag;
    cv::magnitude(xy[0], xy[1], mag);

    double meanMag = cv::mean(mag)[0];
    if (!std::isfinite(meanMag)) return {FrameStatus::NumericDegenerate, lastMetrics_};

    const double w = flow.cols, h = flow.rows;
    MotionMetrics m;
    m.motionEnergy = std::clamp(meanMag / cfg_.energyScale, 0.0, 1.0);

    cv::Moments mo = cv::moments(mag, false);
    if (mo.m00 > DBL_EPSILON) {
        m.center.x = std::clamp(mo.m10 / mo.m00 / w, 0.0, 1.0);
        m.center.y = std::clamp(mo.m01 / mo.m00 / h, 0.0, 1.0);
    }

    if (havePrevCenter_) {
        double dx = (m.center.x - prevCenter_.x) * w;
        double dy = (m.center.y - prevCenter_.y) * h;
        m.globalVelocity = std::clamp(std::hypot(dx, dy) / std::hypot(w, h), 0.0, 1.0);
    }
    if (!finite(m)) return {FrameStatus::NumericDegenerate, lastMetrics_};

    m.motionType = classifyMotion(m.motionEnergy, m.globalVelocity);

    prevCenter_ = m.center;
    havePrevCenter_ = true;
    lastMetrics_ = m;
    energyHistory_.push_back(m.motionEnergy);
    while (energyHistory_.size() > cfg_.historySize) energyHistory_.pop_front();
    return {FrameStatus::Ok, m};
}

MotionStatistics MotionAnalyzer::statistics() const {
    MotionStatistics s;
    if (energyHistory_.empty()) return s;
    s.min = s.max = energyHistory_.front();
    double sum = 0.0;
    for (double e : energyHistory_) {
        sum += e;
        s.min = std::min(s.min, e);
        s.max = std::max(s.max, e);
    }
    s.mean = sum / energyHistory_.size();
    double var = 0.0;
    for (double e : energyHistory_) var += (e - s.mean) * (e - s.mean);
    s.stddev = std::sqrt(var / energyHistory_.size());
    return s;
}

}  // namespace chaossynth
