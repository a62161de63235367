#include "chaossynth/frame_source.hpp"

#include <string>

#include "chaossynth/log.hpp"

namespace chaossynth {

CameraFrameSource::CameraFrameSource(int index, int width, int height)
    : index_(index), width_(width), height_(height) {}

bool CameraFrameSource::open() {
    if (!cap_.open(index_)) {
        logError("Camera", "cannot open camera " + std::to_string(index_));
        return false;
    }
    if (width_ > 0) cap_.set(cv::CAP_PROP_FRAME_WIDTH, width_);
    if (height_ > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, height_);
    int w = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    int h = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    logInfo("Camera", std::to_string(w) + "x" + std::to_string(h) + " on index " + std::to_string(index_));
    return true;
}

bool CameraFrameSource::read(cv::Mat& frame) {
    if (!cap_.isOpened()) return false;
    if (!cap_.read(frame)) {
        frame.release();
        return false;
    }
    return !frame.empty();
}

}  // namespace chaossynth
