#include "annotator.hpp"

#include <algorithm>
#include <cstdio>

namespace {

const int BOX_THICKNESS = 2;
const int CORNER_LENGTH = 15;
const int FONT = cv::FONT_HERSHEY_SIMPLEX;
const double FONT_SCALE = 0.5;
const int FONT_THICKNESS = 1;

int clamp_int(int v, int lo, int hi) {
    return std::max(lo, std::min(v, hi));
}

}

const cv::Scalar Annotator::KNOWN_COLOR(0, 255, 0);
const cv::Scalar Annotator::UNKNOWN_COLOR(0, 99, 255);

std::string status_text(const DetectionSet& detections) {
    int identified = 0;
    for (const Detection& det : detections) {
        if (det.identity.is_known) ++identified;
    }
    if (identified > 0) return "identified: " + std::to_string(identified);
    if (!detections.empty()) return "unknown subjects detected";
    return "searching...";
}

std::string detection_label(const Detection& detection) {
    char buf[128];
    if (detection.identity.is_known) {
        std::snprintf(buf, sizeof(buf), "%s [%d%%]", detection.identity.name.c_str(),
                      static_cast<int>(detection.identity.confidence * 100));
    } else {
        std::snprintf(buf, sizeof(buf), "%s [person %d%%]", detection.identity.name.c_str(),
                      static_cast<int>(detection.detector_confidence * 100));
    }
    return buf;
}

void Annotator::draw(cv::Mat& frame, const DetectionSet& detections, const OverlayInfo& info) const {
    if (frame.empty()) return;
    for (const Detection& det : detections) {
        draw_detection(frame, det);
    }
    draw_overlay(frame, detections, info);
}

void Annotator::draw_detection(cv::Mat& frame, const Detection& detection) const {
    const cv::Rect clipped = detection.bbox & cv::Rect(0, 0, frame.cols, frame.rows);
    if (clipped.width <= 1 || clipped.height <= 1) return;

    const cv::Scalar& color = detection.identity.is_known ? KNOWN_COLOR : UNKNOWN_COLOR;
    const int x1 = clipped.x;
    const int y1 = clipped.y;
    const int x2 = clipped.x + clipped.width - 1;
    const int y2 = clipped.y + clipped.height - 1;

    cv::rectangle(frame, cv::Point(x1, y1), cv::Point(x2, y2), color, BOX_THICKNESS);

    // corner accents
    const int len = std::min(CORNER_LENGTH, std::min(clipped.width, clipped.height) / 2);
    const int thick = BOX_THICKNESS + 1;
    cv::line(frame, cv::Point(x1, y1), cv::Point(x1 + len, y1), color, thick);
    cv::line(frame, cv::Point(x1, y1), cv::Point(x1, y1 + len), color, thick);
    cv::line(frame, cv::Point(x2, y1), cv::Point(x2 - len, y1), color, thick);
    cv::line(frame, cv::Point(x2, y1), cv::Point(x2, y1 + len), color, thick);
    cv::line(frame, cv::Point(x1, y2), cv::Point(x1 + len, y2), color, thick);
    cv::line(frame, cv::Point(x1, y2), cv::Point(x1, y2 - len), color, thick);
    cv::line(frame, cv::Point(x2, y2), cv::Point(x2 - len, y2), color, thick);
    cv::line(frame, cv::Point(x2, y2), cv::Point(x2, y2 - len), color, thick);

    const std::string label = detection_label(detection);
    int baseline = 0;
    const cv::Size text = cv::getTextSize(label, FONT, FONT_SCALE, FONT_THICKNESS, &baseline);

    // above the box, or just inside it when the box touches the top edge
    int bg_top = y1 - text.height - 10;
    if (bg_top < 0) bg_top = y1;
    const int bg_bottom = clamp_int(bg_top + text.height + 8, 0, frame.rows - 1);
    const int bg_right = clamp_int(x1 + text.width + 4, 0, frame.cols - 1);
    cv::rectangle(frame, cv::Point(x1, bg_top), cv::Point(bg_right, bg_bottom), cv::Scalar(0, 0, 0), cv::FILLED);
    cv::putText(frame, label, cv::Point(x1 + 2, bg_bottom - 4), FONT, FONT_SCALE, color, FONT_THICKNESS);
}

void Annotator::draw_overlay(cv::Mat& frame, const DetectionSet& detections, const OverlayInfo& info) const {
    const int height = frame.rows;
    const int width = frame.cols;
    const cv::Scalar hud_color = UNKNOWN_COLOR;

    cv::putText(frame, "[GODS_EYE] " + info.timestamp, cv::Point(10, 25), FONT, 0.5, hud_color, 1);
    cv::putText(frame, "GALLERY: " + std::to_string(info.gallery_size), cv::Point(10, 45), FONT, 0.4, hud_color, 1);

    const std::string status = status_text(detections);
    bool any_known = false;
    for (const Detection& det : detections) {
        any_known = any_known || det.identity.is_known;
    }
    const cv::Scalar& status_color = any_known ? KNOWN_COLOR : UNKNOWN_COLOR;
    cv::putText(frame, "STATUS: " + status, cv::Point(10, std::max(15, height - 15)), FONT, 0.6, status_color, 2);

    cv::putText(frame, "FRAME: " + std::to_string(info.frame_index), cv::Point(std::max(0, width - 120), 25),
                FONT, 0.4, hud_color, 1);
}
