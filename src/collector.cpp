#include "collector.hpp"
#include "collector_log.hpp"

namespace log_collector {

Collector::Collector(CollectorOptions options, NotificationSource& notifier, RecordSink& sink,
                     LineParser parser)
    : options_(std::move(options))
    , notifier_(notifier)
    , scanner_(files_, notifier_, options_.directory, options_.pattern,
               [this](const std::string& path) {
                   // The new file may already hold lines no event reported
                   reconciler_.handle({FsEventType::Changed, path, ""});
               })
    , reader_(files_, sink, std::move(parser))
    , reconciler_(files_, [this](const std::string& path) {
          if (stopping_) {
              throw std::runtime_error("collector is stopping");
          }
          asio::post(pool_, [this, path]() { run_pass(path); });
      })
    , scan_timer_(io_context_)
    , pool_(options_.worker_threads > 0 ? options_.worker_threads : 1)
{
}

Collector::~Collector() {
    stop();
}

void Collector::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) return;

    // Setup error: without the directory watch new files are only seen by scans
    notifier_.subscribe(scanner_.directory());

    started_ = true;
    running_ = true;

    CollectorLog::log("Collector", "Watching " + scanner_.directory() + " for " + scanner_.pattern() +
                      " (scan every " + std::to_string(options_.scan_interval.count()) + " ms)");

    scan_now();
    arm_scan_timer();

    scan_thread_ = std::thread([this]() {
        io_context_.run();
    });
    event_thread_ = std::thread([this]() {
        event_loop();
    });
}

void Collector::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_ || stopping_) return;
    stopping_ = true;

    CollectorLog::log("Collector", "Stopping, draining in-flight passes");

    // No new triggers: close the event feed and the scan timer first
    notifier_.close();
    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    asio::post(io_context_, [this]() { scan_timer_.cancel(); });
    io_context_.stop();
    if (scan_thread_.joinable()) {
        scan_thread_.join();
    }

    // Dispatched passes run to completion
    pool_.join();

    for (const auto& info : files_.list()) {
        CollectorLog::debug("Collector", "Final cursor: " + info.to_json().dump());
    }
    CollectorLog::log("Collector", "Stopped: " + stats().to_json().dump());
}

size_t Collector::scan_now() {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    scans_++;
    try {
        size_t added = scanner_.scan();
        if (added > 0) {
            CollectorLog::debug("Collector", "Scan registered " + std::to_string(added) + " file(s)");
        }
        return added;
    } catch (const ScanError& e) {
        scan_errors_++;
        CollectorLog::error("Collector", std::string("Scan failed, retrying next interval: ") + e.what());
        return 0;
    }
}

void Collector::arm_scan_timer() {
    scan_timer_.expires_after(options_.scan_interval);
    scan_timer_.async_wait([this](const asio::error_code& error) {
        if (error || stopping_) return;
        scan_now();
        arm_scan_timer();
    });
}

void Collector::event_loop() {
    try {
        while (auto event = notifier_.next_event()) {
            events_++;
            EventAction action = reconciler_.handle(*event);
            if (action == EventAction::Coalesced) {
                coalesced_++;
            }
            if (CollectorLog::min_level() == LogLevel::Debug) {
                CollectorLog::debug("Collector", std::string(fs_event_type_to_string(event->type)) + " " +
                                    event->path + ": " + event_action_to_string(action));
            }
        }
        CollectorLog::log("Collector", "Notification channel closed");
    } catch (const std::exception& e) {
        CollectorLog::error("Collector", std::string("Notification loop failed: ") + e.what());
    }
    running_ = false;
}

void Collector::run_pass(const std::string& path) {
    passes_++;
    try {
        TailResult result = reader_.tail(path);
        records_ += result.records;
        failed_records_ += result.failed_records;
        if (result.rotated) rotations_++;
        if (!result.completed) failed_passes_++;
        if (CollectorLog::min_level() == LogLevel::Debug) {
            CollectorLog::debug("Collector", "Pass on " + path + ": " + result.to_json().dump());
        }
    } catch (const std::exception& e) {
        failed_passes_++;
        CollectorLog::error("Collector", "Tail pass failed for " + path + ": " + e.what());
    }
}

CollectorStats Collector::stats() const {
    CollectorStats s;
    s.scans = scans_;
    s.scan_errors = scan_errors_;
    s.events = events_;
    s.passes = passes_;
    s.coalesced = coalesced_;
    s.records = records_;
    s.failed_records = failed_records_;
    s.rotations = rotations_;
    s.failed_passes = failed_passes_;
    s.tracked_files = files_.size();
    return s;
}

} // namespace log_collector
