#include "collector_log.hpp"
#include <iostream>

namespace log_collector {

CollectorLog::Sink CollectorLog::sink_ = CollectorLog::console_sink;
LogLevel CollectorLog::min_level_ = LogLevel::Info;
std::mutex CollectorLog::mutex_;

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        default: return "unknown";
    }
}

void CollectorLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void CollectorLog::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel CollectorLog::min_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void CollectorLog::debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void CollectorLog::log(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void CollectorLog::warn(const std::string& component, const std::string& message) {
    write(LogLevel::Warning, component, message);
}

void CollectorLog::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void CollectorLog::write(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;
    if (sink_) {
        sink_(level, component, message);
    }
}

void CollectorLog::console_sink(LogLevel level, const std::string& component,
                                const std::string& message) {
    if (level >= LogLevel::Warning) {
        std::cerr << "[" << component << "] " << log_level_to_string(level) << ": "
                  << message << std::endl;
    } else {
        std::cout << "[" << component << "] " << message << std::endl;
    }
}

} // namespace log_collector
