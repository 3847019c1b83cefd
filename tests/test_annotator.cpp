#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/annotator.hpp"
#include "fakes.hpp"

namespace {

Detection make_detection(cv::Rect bbox, const std::string& name, bool known, float conf = 0.9f) {
    Detection det;
    det.bbox = bbox;
    det.detector_confidence = conf;
    det.identity = Identity{ name, known ? 0.8f : 0.0f, known };
    return det;
}

bool frames_equal(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

}

TEST_CASE("status text") {
    DetectionSet none;
    CHECK(status_text(none) == "searching...");

    DetectionSet unknown = { make_detection(cv::Rect(0, 0, 10, 10), IDENTITY_UNKNOWN, false) };
    CHECK(status_text(unknown) == "unknown subjects detected");

    DetectionSet mixed = {
        make_detection(cv::Rect(0, 0, 10, 10), "alice", true),
        make_detection(cv::Rect(20, 0, 10, 10), IDENTITY_SCANNING, false),
        make_detection(cv::Rect(40, 0, 10, 10), "bob", true),
    };
    CHECK(status_text(mixed) == "identified: 2");
}

TEST_CASE("labels") {
    CHECK(detection_label(make_detection(cv::Rect(), "alice", true)) == "alice [80%]");
    CHECK(detection_label(make_detection(cv::Rect(), IDENTITY_SCANNING, false, 0.67f)) == "SCANNING... [person 67%]");
    CHECK(detection_label(make_detection(cv::Rect(), IDENTITY_NOT_ATTEMPTED, false, 0.5f)) == "N/A [person 50%]");
}

TEST_CASE("draw marks the frame and leaves detections untouched") {
    cv::Mat frame = blank_frame();
    const cv::Mat untouched = frame.clone();
    DetectionSet detections = {
        make_detection(cv::Rect(100, 100, 80, 200), "alice", true),
        make_detection(cv::Rect(300, 0, 80, 200), IDENTITY_UNKNOWN, false),
    };
    const DetectionSet before = detections;

    OverlayInfo info;
    info.timestamp = "2024-01-01 00:00:00";
    info.gallery_size = 1;
    info.frame_index = 42;

    Annotator annotator;
    annotator.draw(frame, detections, info);

    CHECK_FALSE(frames_equal(frame, untouched));
    CHECK(frame.size() == untouched.size());
    CHECK(frame.type() == untouched.type());

    REQUIRE(detections.size() == before.size());
    for (size_t i = 0; i < detections.size(); ++i) {
        CHECK(detections[i].bbox == before[i].bbox);
        CHECK(detections[i].identity.name == before[i].identity.name);
        CHECK(detections[i].identity.is_known == before[i].identity.is_known);
    }

    // known box outline is green
    const cv::Vec3b edge = frame.at<cv::Vec3b>(150, 100);
    CHECK(edge[0] == 0);
    CHECK(edge[1] == 255);
    CHECK(edge[2] == 0);
}

TEST_CASE("geometry outside the frame is clipped") {
    cv::Mat frame = blank_frame(320, 240);
    DetectionSet detections = {
        make_detection(cv::Rect(-50, -50, 100, 100), "alice", true),
        make_detection(cv::Rect(300, 200, 500, 500), IDENTITY_UNKNOWN, false),
        make_detection(cv::Rect(1000, 1000, 50, 50), IDENTITY_SCANNING, false),
        make_detection(cv::Rect(-500, 10, 20, 20), IDENTITY_SCANNING, false),
    };

    Annotator annotator;
    CHECK_NOTHROW(annotator.draw(frame, detections, OverlayInfo()));
    CHECK(frame.cols == 320);
    CHECK(frame.rows == 240);
}

TEST_CASE("tiny and empty frames are handled") {
    Annotator annotator;
    DetectionSet detections = { make_detection(cv::Rect(0, 0, 5, 5), "alice", true) };

    cv::Mat empty;
    CHECK_NOTHROW(annotator.draw(empty, detections, OverlayInfo()));
    CHECK(empty.empty());

    cv::Mat tiny = blank_frame(8, 8);
    CHECK_NOTHROW(annotator.draw(tiny, detections, OverlayInfo()));
}
