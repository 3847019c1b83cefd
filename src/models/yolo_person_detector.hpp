#ifndef MODELS_YOLO_PERSON_DETECTOR_HPP
#define MODELS_YOLO_PERSON_DETECTOR_HPP

#include <opencv2/opencv.hpp>
#include <net.h>

#include "../config.hpp"
#include "../core/detector.hpp"

#include <string>
#include <vector>

// YOLOv8 exported to ncnn (pnnx): input "in0" 640x640 RGB / 255, output
// "out0" of (4 + classes) x anchors, rows cx, cy, w, h then class scores.
class YoloPersonDetector : public Detector {
public:
    YoloPersonDetector() = default;

    bool load(const PipelineConfig& cfg);
    bool ready() const { return ready_; }

    std::vector<DetectorBox> detect(const cv::Mat& frame) override;

private:
    ncnn::Net net_;
    int target_size_ = 640;
    float conf_threshold_ = 0.25f;
    float nms_threshold_ = 0.45f;
    bool ready_ = false;
};

#endif
