#ifndef CORE_FRAME_SOURCE_HPP
#define CORE_FRAME_SOURCE_HPP

#include <opencv2/opencv.hpp>

// Camera/video device. read() may fail transiently.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open(int device_index) = 0;
    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
};

class OpenCvFrameSource : public FrameSource {
public:
    OpenCvFrameSource(int width = 640, int height = 480, int fps = 30)
        : width_(width), height_(height), fps_(fps) {}
    ~OpenCvFrameSource() override { release(); }

    bool open(int device_index) override;
    bool read(cv::Mat& frame) override;
    void release() override;

private:
    cv::VideoCapture video_capture_;
    int width_;
    int height_;
    int fps_;
};

// Holds an opened FrameSource for the lifetime of the scope. Throws
// std::runtime_error when the device cannot be opened, in which case
// nothing is held and nothing is released.
class CameraGuard {
public:
    CameraGuard(FrameSource& source, int device_index);
    ~CameraGuard();

    CameraGuard(const CameraGuard&) = delete;
    CameraGuard& operator=(const CameraGuard&) = delete;

    FrameSource& source() { return source_; }

private:
    FrameSource& source_;
    int device_index_;
};

#endif
