#pragma once

#include "record_sink.hpp"
#include <httplib.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace log_collector {

struct HttpSinkOptions {
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds io_timeout{5000};
    // After a transport failure records are rejected without a request for this long
    std::chrono::milliseconds retry_after{5000};
};

// POSTs each record as a JSON body. Every request is bounded by the
// configured timeouts, and an unreachable endpoint is only retried every
// `retry_after`, so a tail pass holding its file lock never waits on one
// connect timeout per line.
class HttpSink : public RecordSink {
public:
    // `url` has the form http://host[:port][/path]; throws std::invalid_argument otherwise
    explicit HttpSink(const std::string& url, HttpSinkOptions options = {});

    void accept(const LogRecord& record) override;

    // True while records are rejected after a transport failure
    bool suspended() const;

    const std::string& endpoint() const { return endpoint_; }
    const std::string& path() const { return path_; }

private:
    std::string endpoint_;   // scheme://host:port
    std::string path_;
    std::chrono::milliseconds retry_after_;
    std::unique_ptr<httplib::Client> client_;
    std::chrono::steady_clock::time_point suspended_until_{};
    mutable std::mutex mutex_;
};

} // namespace log_collector
