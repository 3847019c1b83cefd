#include "frame_source.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

bool OpenCvFrameSource::open(int device_index) {
    video_capture_.open(device_index);
    if (!video_capture_.isOpened()) {
        video_capture_.release();
        return false;
    }

    video_capture_.set(cv::CAP_PROP_FRAME_WIDTH, width_);
    video_capture_.set(cv::CAP_PROP_FRAME_HEIGHT, height_);
    video_capture_.set(cv::CAP_PROP_FPS, fps_);
    return true;
}

bool OpenCvFrameSource::read(cv::Mat& frame) {
    if (!video_capture_.isOpened()) return false;
    return video_capture_.read(frame) && !frame.empty();
}

void OpenCvFrameSource::release() {
    if (video_capture_.isOpened()) {
        video_capture_.release();
    }
}

CameraGuard::CameraGuard(FrameSource& source, int device_index)
    : source_(source), device_index_(device_index) {
    if (!source_.open(device_index_)) {
        throw std::runtime_error("failed to open camera " + std::to_string(device_index_));
    }
    std::cout << "[camera] info: camera " << device_index_ << " opened.\n";
}

CameraGuard::~CameraGuard() {
    source_.release();
    std::cout << "[camera] info: camera " << device_index_ << " released.\n";
}
