// motion_analyzer.hpp
// dense optical flow -> classified motion reading
#pragma once

#include <deque>

#include <opencv2/core.hpp>

#include "chaossynth/config.hpp"
#include "chaossynth/types.hpp"

namespace chaossynth {

struct MotionStatistics {
    double mean = 0.0;
    double max = 0.0;
    double min = 0.0;
    double stddev = 0.0;
};

class MotionAnalyzer {
public:
    explicit MotionAnalyzer(const AnalyzerConfig& cfg = AnalyzerConfig{});

    // Frame in, reading out. The first frame after construction or reset()
    // only primes the history and reads as Still with zero energy.
    MotionReading analyze(const cv::Mat& frame);

    // Metrics from an already computed CV_32FC2 flow field. The field's
    // size is taken as the frame size for centroid and velocity.
    MotionReading analyzeFlow(const cv::Mat& flow);

    void reset();

    bool hasHistory() const { return !prevGray_.empty(); }
    const MotionMetrics& lastMetrics() const { return lastMetrics_; }
    MotionStatistics statistics() const;
    cv::Size inputSize() const { return inputSize_; }

private:
    bool acceptsFrame(const cv::Mat& frame);
    cv::Mat preprocess(const cv::Mat& frame) const;

    AnalyzerConfig cfg_;
    cv::Size inputSize_;
    cv::Mat prevGray_;
    Point2 prevCenter_;
    bool havePrevCenter_ = false;
    MotionMetrics lastMetrics_;
    std::deque<double> energyHistory_;
};

}  // namespace chaossynth
