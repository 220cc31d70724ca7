#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>

namespace log_collector {

using Clock = std::chrono::system_clock;

// RFC 3339 in UTC with nanosecond precision, e.g. 2024-05-01T12:00:00.123456789Z
std::string format_timestamp(Clock::time_point tp);

// Inverse of format_timestamp; throws std::invalid_argument on malformed input
Clock::time_point parse_timestamp(const std::string& text);

inline double to_unix_seconds(Clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

struct LogRecord {
    Clock::time_point timestamp;   // Time of processing, not of the original write
    std::string service;           // Derived from the file name
    std::string message;           // Raw line text without the terminator

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["timestamp"] = format_timestamp(timestamp);
        j["service"] = service;
        j["message"] = message;
        return j;
    }

    static LogRecord from_json(const nlohmann::json& j) {
        LogRecord record;
        record.timestamp = j.contains("timestamp")
            ? parse_timestamp(j["timestamp"].get<std::string>())
            : Clock::now();
        record.service = j.value("service", "");
        record.message = j.value("message", "");
        return record;
    }
};

// Labelling policy: file path -> service label
using ServiceLabeler = std::function<std::string(const std::string& path)>;

// Line parser: (file path, raw line) -> record
using LineParser = std::function<LogRecord(const std::string& path, const std::string& line)>;

// Base name with its last extension stripped: /var/log/app.log -> "app"
std::string service_from_path(const std::string& path);

// Default parser: timestamp = now, service = service_from_path, message = line
LogRecord parse_line(const std::string& path, const std::string& line);

// Builds a parser with the default record layout and a custom labeller
LineParser make_line_parser(ServiceLabeler labeler);

} // namespace log_collector
