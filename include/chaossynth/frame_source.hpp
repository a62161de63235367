// frame_source.hpp
// where frames come from (camera, files, tests)
#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace chaossynth {

class FrameSource {
public:
    virtual ~FrameSource() = default;
    // False when no frame is available this cycle.
    virtual bool read(cv::Mat& frame) = 0;
};

class CameraFrameSource : public FrameSource {
public:
    explicit CameraFrameSource(int index, int width = 0, int height = 0);

    bool open();
    bool isOpened() const { return cap_.isOpened(); }
    bool read(cv::Mat& frame) override;
    void release() { cap_.release(); }

private:
    int index_;
    int width_;
    int height_;
    cv::VideoCapture cap_;
};

}  // namespace chaossynth
