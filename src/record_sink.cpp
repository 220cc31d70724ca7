#include "record_sink.hpp"
#include "collector_log.hpp"
#include <ostream>

namespace log_collector {

ConsoleSink::ConsoleSink(std::ostream& out)
    : out_(out)
{
}

void ConsoleSink::accept(const LogRecord& record) {
    std::string line = record.to_json().dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw SinkError("Console stream is not writable");
    }
}

void FanoutSink::add(std::shared_ptr<RecordSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void FanoutSink::accept(const LogRecord& record) {
    std::string first_error;
    for (auto& sink : sinks_) {
        try {
            sink->accept(record);
        } catch (const std::exception& e) {
            // The first failure is rethrown to the caller, later ones are logged here
            if (first_error.empty()) {
                first_error = e.what();
            } else {
                CollectorLog::error("Sink", std::string("Delivery failed: ") + e.what());
            }
        }
    }
    if (!first_error.empty()) {
        throw SinkError(first_error);
    }
}

} // namespace log_collector
