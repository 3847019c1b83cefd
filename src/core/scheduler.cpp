#include "scheduler.hpp"

#include <cmath>
#include <exception>
#include <iostream>

bool is_malformed(const DetectorBox& box) {
    if (!std::isfinite(box.confidence) || box.confidence < 0.0f || box.confidence > 1.0f) return true;
    if (!std::isfinite(box.bbox.x) || !std::isfinite(box.bbox.y) ||
            !std::isfinite(box.bbox.width) || !std::isfinite(box.bbox.height)) return true;
    return box.bbox.width <= 0.0f || box.bbox.height <= 0.0f;
}

DetectionScheduler::DetectionScheduler(Detector& detector, IdentityResolver& resolver, const ScheduleParams& params)
    : detector_(detector), resolver_(resolver), params_(params) {
    if (params_.detect_interval == 0) params_.detect_interval = 1;
    if (params_.resolve_interval == 0) params_.resolve_interval = 1;
    if (params_.bucket_size <= 0) params_.bucket_size = 1;
}

bool DetectionScheduler::run_detector(const cv::Mat& frame, std::vector<DetectorBox>& persons) {
    std::vector<DetectorBox> boxes;
    try {
        boxes = detector_.detect(frame);
    } catch (const std::exception& e) {
        std::cerr << "[sched] warning: detector failed: " << e.what() << ", clearing detections.\n";
        return false;
    }

    for (const DetectorBox& box : boxes) {
        if (is_malformed(box)) {
            std::cerr << "[sched] warning: detector returned malformed output, clearing detections.\n";
            persons.clear();
            return false;
        }
        if (box.class_id == PERSON_CLASS_ID) persons.push_back(box);
    }
    return true;
}

CycleResult DetectionScheduler::step(const cv::Mat& frame, SchedulerState& state) {
    CycleResult result;
    ++state.frame_index;
    ++state.face_frame_index;

    if (state.frame_index % params_.detect_interval != 0) {
        return result;
    }
    result.ran_inference = true;
    ++state.inference_runs;

    std::vector<DetectorBox> persons;
    if (!run_detector(frame, persons)) {
        result.inference_failed = true;
        state.detections = std::make_shared<const DetectionSet>();
        state.person_present = false;
        return result;
    }

    resolver_.refresh();
    const bool can_resolve = resolver_.available();
    const bool resolve_now = can_resolve && state.face_frame_index % params_.resolve_interval == 0;
    if (resolve_now) {
        result.ran_resolution = true;
        ++state.resolution_runs;
    }

    const cv::Rect frame_rect(0, 0, frame.cols, frame.rows);
    auto detections = std::make_shared<DetectionSet>();
    detections->reserve(persons.size());
    for (const DetectorBox& box : persons) {
        Detection det;
        det.bbox = cv::Rect(cvRound(box.bbox.x), cvRound(box.bbox.y), cvRound(box.bbox.width), cvRound(box.bbox.height));
        det.detector_confidence = box.confidence;

        const BucketKey key = bucket_key_for(det.bbox, params_.bucket_size);
        if (!can_resolve) {
            det.identity = Identity{ IDENTITY_NOT_ATTEMPTED, 0.0f, false };
        } else if (resolve_now) {
            Resolution resolution = resolver_.resolve(frame, det.bbox & frame_rect);
            det.identity = resolution.identity;
            if (resolution.attempted) state.cache.store(key, resolution.identity);
        } else {
            std::optional<Identity> cached = state.cache.lookup(key);
            det.identity = cached ? *cached : Identity{ IDENTITY_SCANNING, 0.0f, false };
        }
        detections->push_back(std::move(det));
    }

    state.person_present = !detections->empty();
    state.detections = std::move(detections);
    return result;
}
