#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/event_log.hpp"
#include "core/event_store.hpp"
#include "fakes.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

DetectionEvent make_event(int n, std::vector<std::string> names = {}) {
    DetectionEvent event;
    event.timestamp = "2024-01-01T00:00:" + std::to_string(n);
    event.num_persons = n;
    event.identified_count = static_cast<int>(names.size());
    event.names = std::move(names);
    return event;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}

TEST_CASE("tail returns the most recent events oldest first") {
    EventLog log(std::make_unique<MemoryEventStore>(), 1000);
    REQUIRE(log.open());
    for (int i = 1; i <= 5; ++i) REQUIRE(log.append(make_event(i)));

    std::vector<DetectionEvent> tail = log.read_tail(3);
    REQUIRE(tail.size() == 3);
    CHECK(tail[0].num_persons == 3);
    CHECK(tail[1].num_persons == 4);
    CHECK(tail[2].num_persons == 5);

    CHECK(log.read_tail(50).size() == 5);
    CHECK(log.read_tail(0).empty());
}

TEST_CASE("tail is bounded and evicts the oldest") {
    EventLog log(std::make_unique<MemoryEventStore>(), 1000);
    REQUIRE(log.open());
    for (int i = 1; i <= 1001; ++i) log.append(make_event(i));

    CHECK(log.size() == 1000);
    std::vector<DetectionEvent> tail = log.read_tail(5000);
    REQUIRE(tail.size() == 1000);
    CHECK(tail.front().num_persons == 2);
    CHECK(tail.back().num_persons == 1001);
}

TEST_CASE("durable write failure keeps the event in memory") {
    auto store = std::make_unique<MemoryEventStore>();
    MemoryEventStore* raw = store.get();
    EventLog log(std::move(store), 10);
    REQUIRE(log.open());

    raw->fail_writes = true;
    CHECK_FALSE(log.append(make_event(1, { "alice" })));
    CHECK(log.durable_failures() == 1);
    CHECK(raw->events.empty());
    REQUIRE(log.read_tail(10).size() == 1);
    CHECK(log.read_tail(10)[0].names[0] == "alice");

    raw->fail_writes = false;
    CHECK(log.append(make_event(2)));
    CHECK(raw->events.size() == 1);
    CHECK(log.size() == 2);
}

TEST_CASE("status is published with the event") {
    EventLog log(std::make_unique<MemoryEventStore>());
    PipelineStatus status;
    status.person_present = true;
    status.identified_count = 1;
    status.frame_index = 15;
    status.active_detection_count = 2;

    log.append(make_event(2, { "alice" }), status);
    PipelineStatus seen = log.last_status();
    CHECK(seen.person_present);
    CHECK(seen.identified_count == 1);
    CHECK(seen.frame_index == 15);
    CHECK(seen.active_detection_count == 2);

    PipelineStatus idle;
    idle.frame_index = 16;
    log.publish_status(idle);
    CHECK_FALSE(log.last_status().person_present);
    CHECK(log.last_status().frame_index == 16);
    CHECK(log.size() == 1);
}

TEST_CASE("lifecycle state travels in the status snapshot") {
    EventLog log(std::make_unique<MemoryEventStore>());
    CHECK(log.last_status().state == PipelineState::STOPPED);

    log.publish_state(PipelineState::RUNNING);
    CHECK(log.last_status().state == PipelineState::RUNNING);

    PipelineStatus status;
    status.state = PipelineState::STOPPING;
    status.frame_index = 7;
    log.append(make_event(1), status);
    CHECK(log.last_status().state == PipelineState::STOPPING);
    CHECK(log.last_status().frame_index == 7);

    // a state change keeps the counters
    log.publish_state(PipelineState::STOPPED);
    CHECK(log.last_status().state == PipelineState::STOPPED);
    CHECK(log.last_status().frame_index == 7);
}

TEST_CASE("csv store writes the header once and appends rows") {
    const std::string path = make_temp_dir("godseye_events") + "/logs/history.csv";
    {
        CsvEventStore store(path);
        REQUIRE(store.open());
        REQUIRE(store.append(make_event(2, { "alice", "bob" })));
        REQUIRE(store.append(make_event(1)));
    }
    {
        // reopening an existing log must not rewrite the header
        CsvEventStore store(path);
        REQUIRE(store.open());
        REQUIRE(store.append(make_event(3, { "carol" })));
    }

    std::vector<std::string> lines = read_lines(path);
    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "timestamp,num_persons,identified_count,names");
    CHECK(lines[1] == "2024-01-01T00:00:2,2,2,\"alice,bob\"");
    CHECK(lines[2] == "2024-01-01T00:00:1,1,0,UNKNOWN");
    CHECK(lines[3] == "2024-01-01T00:00:3,3,1,carol");
}

TEST_CASE("csv store recreates the header when the file disappears") {
    const std::string path = make_temp_dir("godseye_events") + "/history.csv";
    CsvEventStore store(path);
    REQUIRE(store.open());
    REQUIRE(store.append(make_event(1)));

    std::filesystem::remove(path);
    REQUIRE(store.append(make_event(2, { "alice" })));

    std::vector<std::string> lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "timestamp,num_persons,identified_count,names");
    CHECK(lines[1] == "2024-01-01T00:00:2,2,1,alice");
}

TEST_CASE("csv escaping") {
    CHECK(csv_escape("plain") == "plain");
    CHECK(csv_escape("a,b") == "\"a,b\"");
    CHECK(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

TEST_CASE("sqlite store records events") {
    const std::string path = make_temp_dir("godseye_events") + "/history.db";
    {
        SqliteEventStore store(path);
        REQUIRE(store.open());
        REQUIRE(store.append(make_event(2, { "alice", "bob" })));
        REQUIRE(store.append(make_event(1)));
    }

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    REQUIRE(sqlite3_prepare_v2(db, "SELECT num_persons, names FROM detections ORDER BY event_id;", -1, &stmt, nullptr) == SQLITE_OK);

    std::vector<std::string> names;
    std::vector<int> persons;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        persons.push_back(sqlite3_column_int(stmt, 0));
        names.push_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);

    REQUIRE(names.size() == 2);
    CHECK(persons[0] == 2);
    CHECK(names[0] == "alice,bob");
    CHECK(names[1] == "UNKNOWN");
}

TEST_CASE("unknown store kind is rejected") {
    CHECK_THROWS_AS(make_event_store("parquet", "x"), std::runtime_error);
    CHECK(static_cast<bool>(make_event_store("csv", "x.csv")));
    CHECK(static_cast<bool>(make_event_store("sqlite", "x.db")));
}
