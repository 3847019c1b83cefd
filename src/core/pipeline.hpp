#ifndef CORE_PIPELINE_HPP
#define CORE_PIPELINE_HPP

#include <opencv2/opencv.hpp>

#include "../config.hpp"
#include "../types.hpp"
#include "annotator.hpp"
#include "detector.hpp"
#include "event_log.hpp"
#include "frame_source.hpp"
#include "identity_resolver.hpp"
#include "scheduler.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

// Capture -> schedule -> log -> annotate -> encode, one frame at a time on
// the thread that calls stream(). status() and logs() are safe from any
// thread.
class Pipeline {
public:
    // return false to stop the stream (consumer gone)
    using FrameSink = std::function<bool(const std::vector<uchar>& jpeg)>;

    Pipeline(const PipelineConfig& cfg, FrameSource& source, Detector& detector,
             IdentityResolver& resolver, EventLog& event_log);

    // Blocks until stop is requested or the sink refuses a frame. Throws
    // std::runtime_error if the camera cannot be opened or a stream is
    // already running. The camera is released on every exit path.
    void stream(const FrameSink& sink);

    // observed between frames
    void request_stop();

    // schedule, log and annotate one frame in place
    CycleResult process_frame(cv::Mat& frame);

    PipelineState state() const { return state_.load(); }
    PipelineStatus status() const { return event_log_.last_status(); }
    std::vector<DetectionEvent> logs(size_t limit) const { return event_log_.read_tail(limit); }

    // stream thread only
    std::shared_ptr<const DetectionSet> detections() const { return state_data_.detections; }
    const SchedulerState& scheduler_state() const { return state_data_; }

private:
    void set_state(PipelineState next);
    PipelineStatus make_status() const;
    void record_cycle(const CycleResult& cycle);
    void run_loop(FrameSource& source, const FrameSink& sink);

    PipelineConfig cfg_;
    FrameSource& source_;
    IdentityResolver& resolver_;
    EventLog& event_log_;
    DetectionScheduler scheduler_;
    Annotator annotator_;

    SchedulerState state_data_;
    std::atomic<PipelineState> state_{PipelineState::STOPPED};
    std::atomic<bool> stop_requested_{false};
};

#endif
