#ifndef CORE_ANNOTATOR_HPP
#define CORE_ANNOTATOR_HPP

#include <opencv2/opencv.hpp>

#include "../types.hpp"

#include <cstdint>
#include <string>

struct OverlayInfo {
    std::string timestamp;
    size_t gallery_size = 0;
    uint64_t frame_index = 0;
};

// "identified: N", "unknown subjects detected" or "searching..."
std::string status_text(const DetectionSet& detections);

std::string detection_label(const Detection& detection);

class Annotator {
public:
    // BGR
    static const cv::Scalar KNOWN_COLOR;
    static const cv::Scalar UNKNOWN_COLOR;

    // draws onto frame, geometry outside the frame is clipped
    void draw(cv::Mat& frame, const DetectionSet& detections, const OverlayInfo& info) const;

private:
    void draw_detection(cv::Mat& frame, const Detection& detection) const;
    void draw_overlay(cv::Mat& frame, const DetectionSet& detections, const OverlayInfo& info) const;
};

#endif
