#ifndef CORE_EVENT_STORE_HPP
#define CORE_EVENT_STORE_HPP

#include "../types.hpp"

#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Durable append-only record of detection events. Columns: timestamp,
// num_persons, identified_count, names (comma-joined or "UNKNOWN").
class EventStore {
public:
    virtual ~EventStore() = default;

    // creates the store with its header/schema when absent
    virtual bool open() = 0;
    virtual bool append(const DetectionEvent& event) = 0;
    virtual const std::string& path() const = 0;
};

class CsvEventStore : public EventStore {
public:
    explicit CsvEventStore(std::string path) : path_(std::move(path)) {}

    bool open() override;
    bool append(const DetectionEvent& event) override;
    const std::string& path() const override { return path_; }

private:
    std::string path_;
};

class SqliteEventStore : public EventStore {
public:
    explicit SqliteEventStore(std::string path) : path_(std::move(path)) {}
    ~SqliteEventStore() override;

    bool open() override;
    bool append(const DetectionEvent& event) override;
    const std::string& path() const override { return path_; }

private:
    void close();

    std::string path_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
};

// "csv" or "sqlite"
std::unique_ptr<EventStore> make_event_store(const std::string& kind, const std::string& path);

std::string csv_escape(const std::string& field);

#endif
