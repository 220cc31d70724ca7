#include "record_store.hpp"
#include <stdexcept>

namespace log_collector {

RecordStore::RecordStore(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + err);
    }

    // Tail passes on different files insert concurrently
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");

    init_schema();
}

RecordStore::~RecordStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void RecordStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string error_msg = err ? err : "Unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQL error: " + error_msg);
    }
}

sqlite3_stmt* RecordStore::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void RecordStore::init_schema() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS records (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp REAL NOT NULL,
            timestamp_text TEXT NOT NULL,
            service TEXT NOT NULL,
            message TEXT NOT NULL
        )
    )");

    exec("CREATE INDEX IF NOT EXISTS idx_records_service ON records(service)");
    exec("CREATE INDEX IF NOT EXISTS idx_records_timestamp ON records(timestamp)");
}

void RecordStore::accept(const LogRecord& record) {
    try {
        insert(record);
    } catch (const std::runtime_error& e) {
        throw SinkError(e.what());
    }
}

int64_t RecordStore::insert(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare(R"(
        INSERT INTO records (timestamp, timestamp_text, service, message)
        VALUES (?, ?, ?, ?)
    )");

    std::string timestamp_text = format_timestamp(record.timestamp);
    sqlite3_bind_double(stmt, 1, to_unix_seconds(record.timestamp));
    sqlite3_bind_text(stmt, 2, timestamp_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.service.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.message.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert record: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

int64_t RecordStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM records");

    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

} // namespace log_collector
