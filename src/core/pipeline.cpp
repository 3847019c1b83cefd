#include "pipeline.hpp"

#include "../utils.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

Pipeline::Pipeline(const PipelineConfig& cfg, FrameSource& source, Detector& detector,
                   IdentityResolver& resolver, EventLog& event_log)
    : cfg_(cfg),
      source_(source),
      resolver_(resolver),
      event_log_(event_log),
      scheduler_(detector, resolver, ScheduleParams{ cfg.detect_interval, cfg.resolve_interval, cfg.bucket_size }),
      state_data_(cfg.cache_capacity) {}

void Pipeline::set_state(PipelineState next) {
    PipelineState prev = state_.exchange(next);
    event_log_.publish_state(next);
    if (prev != next) {
        std::cout << "[pipeline] info: " << pipeline_state_str(prev) << " -> " << pipeline_state_str(next) << ".\n";
    }
}

void Pipeline::request_stop() {
    stop_requested_.store(true);
}

PipelineStatus Pipeline::make_status() const {
    PipelineStatus status;
    status.person_present = state_data_.person_present;
    status.frame_index = state_data_.frame_index;
    status.state = state_.load();
    status.active_detection_count = static_cast<int>(state_data_.detections->size());
    for (const Detection& det : *state_data_.detections) {
        if (det.identity.is_known) ++status.identified_count;
    }
    return status;
}

void Pipeline::record_cycle(const CycleResult& cycle) {
    const PipelineStatus status = make_status();

    // one event per inference cycle, empty and failed cycles included
    if (!cycle.ran_inference) {
        event_log_.publish_status(status);
        return;
    }

    DetectionEvent event;
    event.timestamp = current_iso_time_str();
    event.num_persons = status.active_detection_count;
    event.identified_count = status.identified_count;
    for (const Detection& det : *state_data_.detections) {
        if (det.identity.is_known) event.names.push_back(det.identity.name);
    }

    // durable failures are reported by the log itself and never stop the stream
    event_log_.append(event, status);
}

CycleResult Pipeline::process_frame(cv::Mat& frame) {
    CycleResult cycle = scheduler_.step(frame, state_data_);
    record_cycle(cycle);

    OverlayInfo info;
    info.timestamp = current_display_time_str();
    info.gallery_size = resolver_.gallery_size();
    info.frame_index = state_data_.frame_index;

    // hold our own reference, the set may be replaced next frame
    std::shared_ptr<const DetectionSet> detections = state_data_.detections;
    annotator_.draw(frame, *detections, info);
    return cycle;
}

void Pipeline::run_loop(FrameSource& source, const FrameSink& sink) {
    std::vector<uchar> buf;
    const std::vector<int> params = { cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality };
    uint64_t read_failures = 0;

    while (!stop_requested_.load()) {
        cv::Mat frame;
        if (!source.read(frame) || frame.empty()) {
            ++read_failures;
            std::cerr << "[pipeline] warning: frame capture failed (" << read_failures << "), retrying.\n";
            continue;
        }
        read_failures = 0;

        process_frame(frame);

        try {
            bool ok = cv::imencode(".jpg", frame, buf, params);
            if (!ok || buf.empty()) {
                std::cerr << "[pipeline] warning: frame encoding failed, skipping frame.\n";
                continue;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "[pipeline] warning: exception during imencode: " << e.what() << "\n";
            continue;
        }
        if (!sink(buf)) {
            std::cout << "[pipeline] info: consumer disconnected.\n";
            break;
        }
    }
}

void Pipeline::stream(const FrameSink& sink) {
    PipelineState expected = PipelineState::STOPPED;
    if (!state_.compare_exchange_strong(expected, PipelineState::STARTING)) {
        throw std::runtime_error("pipeline already streaming");
    }
    event_log_.publish_state(PipelineState::STARTING);
    std::cout << "[pipeline] info: STOPPED -> STARTING.\n";
    stop_requested_.store(false);

    try {
        CameraGuard camera(source_, cfg_.camera_index);
        set_state(PipelineState::RUNNING);
        try {
            run_loop(camera.source(), sink);
        } catch (...) {
            // the camera is released while STOPPING on every path
            set_state(PipelineState::STOPPING);
            throw;
        }
        set_state(PipelineState::STOPPING);
    } catch (const std::exception& e) {
        std::cerr << "[pipeline] error: " << e.what() << "\n";
        set_state(PipelineState::STOPPING);
        set_state(PipelineState::STOPPED);
        throw;
    } catch (...) {
        set_state(PipelineState::STOPPING);
        set_state(PipelineState::STOPPED);
        throw;
    }
    set_state(PipelineState::STOPPED);
}
