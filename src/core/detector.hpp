#ifndef CORE_DETECTOR_HPP
#define CORE_DETECTOR_HPP

#include <opencv2/core.hpp>

#include "../types.hpp"

#include <vector>

// Stateless per-frame object detection. Throws on inference failure.
class Detector {
public:
    virtual ~Detector() = default;

    virtual std::vector<DetectorBox> detect(const cv::Mat& frame) = 0;
};

#endif
