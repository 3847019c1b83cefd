#include "event_log.hpp"

#include <algorithm>
#include <iostream>

EventLog::EventLog(std::unique_ptr<EventStore> store, size_t capacity)
    : store_(std::move(store)), capacity_(std::max<size_t>(1, capacity)) {}

bool EventLog::open() {
    if (!store_) return true;
    store_ready_ = store_->open();
    if (!store_ready_) {
        std::cerr << "[events] warning: event store " << store_->path() << " unavailable, keeping events in memory only.\n";
    }
    return store_ready_;
}

bool EventLog::write_durable(const DetectionEvent& event) {
    if (!store_) return true;
    if (!store_ready_) {
        store_ready_ = store_->open();
        if (!store_ready_) return false;
    }
    return store_->append(event);
}

bool EventLog::append(const DetectionEvent& event) {
    return append(event, last_status());
}

bool EventLog::append(const DetectionEvent& event, const PipelineStatus& status) {
    const bool durable = write_durable(event);
    if (!durable) {
        std::cerr << "[events] warning: failed to write event to "
                  << (store_ ? store_->path() : std::string("<none>")) << ", kept in memory.\n";
    }

    { std::lock_guard<std::mutex> lock(mutex_);
        tail_.push_back(event);
        if (tail_.size() > capacity_) tail_.pop_front();
        status_ = status;
        if (!durable) ++durable_failures_;
    }
    return durable;
}

void EventLog::publish_status(const PipelineStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

void EventLog::publish_state(PipelineState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.state = state;
}

std::vector<DetectionEvent> EventLog::read_tail(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = std::min(limit, tail_.size());
    return std::vector<DetectionEvent>(tail_.end() - static_cast<std::ptrdiff_t>(count), tail_.end());
}

PipelineStatus EventLog::last_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tail_.size();
}

uint64_t EventLog::durable_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durable_failures_;
}
