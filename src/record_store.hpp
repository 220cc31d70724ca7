#pragma once

#include "log_record.hpp"
#include "record_sink.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace log_collector {

// SQLite-backed sink: every accepted record becomes a row of `records`
// (id, timestamp, timestamp_text, service, message) for other tools to read
class RecordStore : public RecordSink {
public:
    explicit RecordStore(const std::string& db_path);
    ~RecordStore() override;

    // Non-copyable
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    void accept(const LogRecord& record) override;

    // Insert a record, returns the assigned row ID
    int64_t insert(const LogRecord& record);

    int64_t count();

private:
    void init_schema();
    void exec(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace log_collector
