#pragma once

#include "change_reconciler.hpp"
#include "file_scanner.hpp"
#include "log_record.hpp"
#include "notification_source.hpp"
#include "record_sink.hpp"
#include "tail_reader.hpp"
#include "watch_set.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace log_collector {

struct CollectorOptions {
    std::string directory;
    std::string pattern = "*.log";
    std::chrono::milliseconds scan_interval{10000};
    size_t worker_threads = 4;
};

struct CollectorStats {
    uint64_t scans = 0;
    uint64_t scan_errors = 0;
    uint64_t events = 0;
    uint64_t passes = 0;
    uint64_t coalesced = 0;
    uint64_t records = 0;
    uint64_t failed_records = 0;
    uint64_t rotations = 0;
    uint64_t failed_passes = 0;
    size_t tracked_files = 0;

    nlohmann::json to_json() const {
        return {
            {"scans", scans},
            {"scan_errors", scan_errors},
            {"events", events},
            {"passes", passes},
            {"coalesced", coalesced},
            {"records", records},
            {"failed_records", failed_records},
            {"rotations", rotations},
            {"failed_passes", failed_passes},
            {"tracked_files", tracked_files}
        };
    }
};

// Owns the scan timer, the notification event loop and the tail worker
// pool. Scans run on the timer thread, events are consumed on a dedicated
// thread, and every dispatched pass runs on the pool.
class Collector {
public:
    Collector(CollectorOptions options, NotificationSource& notifier, RecordSink& sink,
              LineParser parser = parse_line);
    ~Collector();

    // Non-copyable
    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    // Subscribes the watch directory, runs a first scan and starts the
    // loops. Throws NotificationError if the directory cannot be watched.
    void start();

    // Stops the scan timer and the event loop, then waits for dispatched
    // passes to finish. Closes the notification source.
    void stop();

    // True while the event loop runs; false once the source is closed
    bool is_running() const { return running_; }

    // Runs one scan on the calling thread; ScanError is logged, not thrown
    size_t scan_now();

    CollectorStats stats() const;
    WatchSet& files() { return files_; }
    const std::string& directory() const { return scanner_.directory(); }

private:
    void arm_scan_timer();
    void event_loop();
    void run_pass(const std::string& path);

    CollectorOptions options_;
    NotificationSource& notifier_;
    WatchSet files_;
    FileScanner scanner_;
    TailReader reader_;
    ChangeReconciler reconciler_;

    asio::io_context io_context_;
    asio::steady_timer scan_timer_;
    asio::thread_pool pool_;
    std::thread scan_thread_;
    std::thread event_thread_;
    std::mutex scan_mutex_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::atomic<uint64_t> scans_{0};
    std::atomic<uint64_t> scan_errors_{0};
    std::atomic<uint64_t> events_{0};
    std::atomic<uint64_t> passes_{0};
    std::atomic<uint64_t> coalesced_{0};
    std::atomic<uint64_t> records_{0};
    std::atomic<uint64_t> failed_records_{0};
    std::atomic<uint64_t> rotations_{0};
    std::atomic<uint64_t> failed_passes_{0};
};

} // namespace log_collector
