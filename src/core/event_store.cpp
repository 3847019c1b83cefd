#include "event_store.hpp"

#include <sqlite3.h>

#include "../utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool ensure_parent_dir(const std::string& path) {
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    fs::create_directories(parent, ec);
    return !ec;
}

bool run_sql(sqlite3* db, const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::cerr << "[events] error: sql error: " << (errmsg ? errmsg : "unknown") << "\n";
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool CsvEventStore::open() {
    std::error_code ec;
    if (fs::exists(path_, ec)) return true;

    if (!ensure_parent_dir(path_)) {
        std::cerr << "[events] error: could not create directory for " << path_ << "\n";
        return false;
    }
    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out) {
        std::cerr << "[events] error: could not create " << path_ << "\n";
        return false;
    }
    out << "timestamp,num_persons,identified_count,names\n";
    out.flush();
    if (!out) return false;

    std::cout << "[events] info: created event log " << path_ << ".\n";
    return true;
}

bool CsvEventStore::append(const DetectionEvent& event) {
    // file removed while running: start over with a header
    std::error_code ec;
    if (!fs::exists(path_, ec) && !open()) return false;

    std::ofstream out(path_, std::ios::app);
    if (!out) return false;

    out << csv_escape(event.timestamp) << ','
        << event.num_persons << ','
        << event.identified_count << ','
        << csv_escape(join_names(event.names, IDENTITY_UNKNOWN)) << '\n';
    out.flush();
    return static_cast<bool>(out);
}

SqliteEventStore::~SqliteEventStore() {
    close();
}

void SqliteEventStore::close() {
    if (insert_stmt_) {
        sqlite3_finalize(insert_stmt_);
        insert_stmt_ = nullptr;
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteEventStore::open() {
    close();
    if (!ensure_parent_dir(path_)) {
        std::cerr << "[events] error: could not create directory for " << path_ << "\n";
        return false;
    }

    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "[events] error: cannot open database: " << sqlite3_errmsg(db_) << "\n";
        close();
        return false;
    }

    if (!run_sql(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS detections (
                event_id INTEGER PRIMARY KEY AUTOINCREMENT,
                timestamp TEXT NOT NULL,
                num_persons INTEGER NOT NULL,
                identified_count INTEGER NOT NULL,
                names TEXT NOT NULL
            );
            )SQL")) {
        close();
        return false;
    }

    rc = sqlite3_prepare_v2(db_, R"SQL(
            INSERT INTO detections (timestamp, num_persons, identified_count, names)
            VALUES (?, ?, ?, ?);
            )SQL", -1, &insert_stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "[events] error: failed to prepare insert: " << sqlite3_errmsg(db_) << "\n";
        close();
        return false;
    }

    std::cout << "[events] info: database " << path_ << " opened.\n";
    return true;
}

bool SqliteEventStore::append(const DetectionEvent& event) {
    if (!insert_stmt_ && !open()) return false;

    const std::string names = join_names(event.names, IDENTITY_UNKNOWN);
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, event.timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert_stmt_, 2, event.num_persons);
    sqlite3_bind_int(insert_stmt_, 3, event.identified_count);
    sqlite3_bind_text(insert_stmt_, 4, names.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::cerr << "[events] error: insert failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

std::unique_ptr<EventStore> make_event_store(const std::string& kind, const std::string& path) {
    if (kind == "csv") return std::make_unique<CsvEventStore>(path);
    if (kind == "sqlite") return std::make_unique<SqliteEventStore>(path);
    throw std::runtime_error("unknown event store kind '" + kind + "'");
}
