#include "http_sink.hpp"
#include <stdexcept>

namespace log_collector {

HttpSink::HttpSink(const std::string& url, HttpSinkOptions options)
    : retry_after_(options.retry_after)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || url.compare(0, scheme_end, "http") != 0) {
        throw std::invalid_argument("Unsupported sink URL (expected http://...): " + url);
    }

    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        endpoint_ = url;
        path_ = "/";
    } else {
        endpoint_ = url.substr(0, path_start);
        path_ = url.substr(path_start);
    }
    if (endpoint_.size() <= scheme_end + 3) {
        throw std::invalid_argument("Sink URL has no host: " + url);
    }

    client_ = std::make_unique<httplib::Client>(endpoint_);
    client_->set_connection_timeout(options.connect_timeout);
    client_->set_read_timeout(options.io_timeout);
    client_->set_write_timeout(options.io_timeout);
    client_->set_keep_alive(true);
}

void HttpSink::accept(const LogRecord& record) {
    std::string body = record.to_json().dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (std::chrono::steady_clock::now() < suspended_until_) {
        throw SinkError("POST " + endpoint_ + path_ + " skipped: endpoint unreachable, retrying later");
    }

    auto res = client_->Post(path_, body, "application/json");
    if (!res) {
        suspended_until_ = std::chrono::steady_clock::now() + retry_after_;
        throw SinkError("POST " + endpoint_ + path_ + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw SinkError("POST " + endpoint_ + path_ + " returned HTTP " + std::to_string(res->status));
    }
}

bool HttpSink::suspended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::steady_clock::now() < suspended_until_;
}

} // namespace log_collector
