#pragma once

#include "log_record.hpp"
#include "record_sink.hpp"
#include "rotation.hpp"
#include "watch_set.hpp"
#include <cstdint>
#include <string>

namespace log_collector {

struct TailResult {
    bool completed = false;         // False if the path is unknown or the pass aborted
    bool rotated = false;           // Truncated or replaced, read restarted at byte 0
    size_t records = 0;             // Records accepted by the sink
    size_t failed_records = 0;      // Records the parser or sink rejected
    std::uint64_t bytes_consumed = 0;
    std::uint64_t offset = 0;       // Stored offset after the pass

    nlohmann::json to_json() const {
        return {
            {"completed", completed},
            {"rotated", rotated},
            {"records", records},
            {"failed_records", failed_records},
            {"bytes_consumed", bytes_consumed},
            {"offset", offset}
        };
    }
};

// Incremental reader: emits the complete lines appended to a tracked file
// since its stored offset. Passes on the same path are serialized by the
// TrackedFile mutex; passes on different paths run in parallel.
class TailReader {
public:
    TailReader(WatchSet& files, RecordSink& sink, LineParser parser = parse_line,
               size_t read_chunk = 64 * 1024);

    TailResult tail(const std::string& path);

private:
    bool reopen(TrackedFile& file, std::uint64_t inode);
    bool seek(TrackedFile& file, std::uint64_t position);
    std::uint64_t read_lines(TrackedFile& file, std::uint64_t start, TailResult& result,
                             std::string& carry);
    void emit(const std::string& path, std::string line, TailResult& result);

    WatchSet& files_;
    RecordSink& sink_;
    LineParser parser_;
    size_t read_chunk_;
};

} // namespace log_collector
