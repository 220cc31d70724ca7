#pragma once

#include "log_record.hpp"
#include <iosfwd>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace log_collector {

class SinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Downstream consumer of records. accept() throws on failure; callers log
// the failure and move on.
class RecordSink {
public:
    virtual ~RecordSink() = default;
    virtual void accept(const LogRecord& record) = 0;
};

// One JSON object per line
class ConsoleSink : public RecordSink {
public:
    explicit ConsoleSink(std::ostream& out);
    void accept(const LogRecord& record) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Delivers every record to all children, even if some of them fail
class FanoutSink : public RecordSink {
public:
    void add(std::shared_ptr<RecordSink> sink);
    size_t size() const { return sinks_.size(); }
    void accept(const LogRecord& record) override;

private:
    std::vector<std::shared_ptr<RecordSink>> sinks_;
};

} // namespace log_collector
