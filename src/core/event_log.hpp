#ifndef CORE_EVENT_LOG_HPP
#define CORE_EVENT_LOG_HPP

#include "../types.hpp"
#include "event_store.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

// Durable event store plus a bounded in-memory tail. The tail and the last
// published PipelineStatus share one mutex, so readers see both from the
// same cycle.
class EventLog {
public:
    explicit EventLog(std::unique_ptr<EventStore> store, size_t capacity = 1000);

    // creates the durable store if absent
    bool open();

    // Returns false when the durable write failed; the event is kept in
    // memory either way.
    bool append(const DetectionEvent& event);
    bool append(const DetectionEvent& event, const PipelineStatus& status);

    void publish_status(const PipelineStatus& status);
    void publish_state(PipelineState state);

    // last `limit` events, oldest first
    std::vector<DetectionEvent> read_tail(size_t limit) const;
    PipelineStatus last_status() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t durable_failures() const;

private:
    bool write_durable(const DetectionEvent& event);

    std::unique_ptr<EventStore> store_;
    size_t capacity_;
    bool store_ready_ = false;

    mutable std::mutex mutex_;
    std::deque<DetectionEvent> tail_;
    PipelineStatus status_;
    uint64_t durable_failures_ = 0;
};

#endif
