#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace log_collector {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

const char* log_level_to_string(LogLevel level);

// Global diagnostic log - every component reports through here
class CollectorLog {
public:
    using Sink = std::function<void(LogLevel level,
                                     const std::string& component,
                                     const std::string& message)>;

    static void set_sink(Sink sink);
    static void set_min_level(LogLevel level);
    static LogLevel min_level();

    static void debug(const std::string& component, const std::string& message);
    static void log(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Writes info/debug to cout, warnings/errors to cerr
    static void console_sink(LogLevel level, const std::string& component,
                             const std::string& message);

private:
    static void write(LogLevel level, const std::string& component, const std::string& message);

    static Sink sink_;
    static LogLevel min_level_;
    static std::mutex mutex_;
};

} // namespace log_collector
