#ifndef CORE_SCHEDULER_HPP
#define CORE_SCHEDULER_HPP

#include <opencv2/core.hpp>

#include "../types.hpp"
#include "detector.hpp"
#include "identity_cache.hpp"
#include "identity_resolver.hpp"

#include <cstdint>
#include <memory>

// All mutable per-stream state, owned by one Pipeline.
struct SchedulerState {
    uint64_t frame_index = 0;      // frames seen, drives the detect cadence
    uint64_t face_frame_index = 0; // frames seen, drives the resolve cadence
    std::shared_ptr<const DetectionSet> detections = std::make_shared<const DetectionSet>();
    IdentityCache cache;
    bool person_present = false;

    uint64_t inference_runs = 0;
    uint64_t resolution_runs = 0;

    explicit SchedulerState(size_t cache_capacity = 0) : cache(cache_capacity) {}
};

struct CycleResult {
    bool ran_inference = false;
    bool ran_resolution = false;
    bool inference_failed = false;
};

struct ScheduleParams {
    uint32_t detect_interval = 5;   // D
    uint32_t resolve_interval = 10; // F
    int bucket_size = 50;           // Q
};

class DetectionScheduler {
public:
    DetectionScheduler(Detector& detector, IdentityResolver& resolver, const ScheduleParams& params);

    // Advances both counters. On a detect frame the detection set is
    // replaced; on every other frame it is left untouched.
    CycleResult step(const cv::Mat& frame, SchedulerState& state);

    const ScheduleParams& params() const { return params_; }

private:
    bool run_detector(const cv::Mat& frame, std::vector<DetectorBox>& persons);

    Detector& detector_;
    IdentityResolver& resolver_;
    ScheduleParams params_;
};

// empty, inverted, non-finite or out-of-range output
bool is_malformed(const DetectorBox& box);

#endif
