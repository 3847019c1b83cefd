#ifndef TYPES_HPP
#define TYPES_HPP

#include <opencv2/opencv.hpp>

#include <cstdint>
#include <string>
#include <vector>

// identity sentinels
static const char* const IDENTITY_SCANNING = "SCANNING...";
static const char* const IDENTITY_UNKNOWN = "UNKNOWN";
static const char* const IDENTITY_NOT_ATTEMPTED = "N/A";

static const int PERSON_CLASS_ID = 0;

// raw detector output
struct DetectorBox {
    int class_id = -1;
    cv::Rect2f bbox;
    float confidence = 0.0f;
};

struct Identity {
    std::string name = IDENTITY_SCANNING;
    float confidence = 0.0f;
    bool is_known = false;
};

struct Detection {
    cv::Rect bbox; // x1,y1 = tl(), x2,y2 = br()
    float detector_confidence = 0.0f;
    Identity identity;
};

using DetectionSet = std::vector<Detection>;

struct DetectionEvent {
    std::string timestamp; // ISO-8601
    int num_persons = 0;
    int identified_count = 0;
    std::vector<std::string> names;
};

enum class PipelineState {
    STOPPED = 0,
    STARTING = 1,
    RUNNING = 2,
    STOPPING = 3
};

struct PipelineStatus {
    bool person_present = false;
    int identified_count = 0;
    uint64_t frame_index = 0;
    int active_detection_count = 0;
    PipelineState state = PipelineState::STOPPED;
};

inline const char* pipeline_state_str(PipelineState state) {
    switch (state) {
        case PipelineState::STARTING: return "STARTING";
        case PipelineState::RUNNING: return "RUNNING";
        case PipelineState::STOPPING: return "STOPPING";
        default: return "STOPPED";
    }
}

#endif
