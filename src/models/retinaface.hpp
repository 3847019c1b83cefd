#ifndef MODELS_RETINAFACE_HPP
#define MODELS_RETINAFACE_HPP

#include <opencv2/opencv.hpp>
#include <net.h>

#include <array>
#include <string>
#include <vector>

struct FaceObject {
    float prob = 0.0f;
    cv::Rect_<float> rect;
    std::array<cv::Point2f, 5> landmarks;
};

// five-point template for 112x112 MobileFaceNet input
static const std::array<cv::Point2f, 5> g_EMBEDDING_REFERENCE = {
    cv::Point2f(38.2946f, 51.6963f),
    cv::Point2f(73.5318f, 51.5014f),
    cv::Point2f(56.0252f, 71.7366f),
    cv::Point2f(41.5493f, 92.3655f),
    cv::Point2f(70.7299f, 92.2041f)
};

// RetinaFace (mnet.25) face locator.
// https://github.com/Tencent/ncnn/blob/master/examples/retinaface.cpp
class RetinaFaceLocator {
public:
    RetinaFaceLocator(float prob_threshold = 0.8f, float nms_threshold = 0.4f)
        : prob_threshold_(prob_threshold), nms_threshold_(nms_threshold) {}

    bool load(const std::string& param_path, const std::string& bin_path, int num_threads, bool use_vulkan);
    bool ready() const { return ready_; }

    // faces sorted by confidence, clipped to the image
    std::vector<FaceObject> detect(const cv::Mat& bgr);

private:
    ncnn::Net net_;
    float prob_threshold_;
    float nms_threshold_;
    bool ready_ = false;
};

// 112x112 crop aligned to g_EMBEDDING_REFERENCE
cv::Mat align_face(const cv::Mat& bgr, const FaceObject& face);

#endif
