#include "collector.hpp"
#include "collector_log.hpp"
#include "config.hpp"
#include "http_sink.hpp"
#include "inotify_source.hpp"
#include "record_sink.hpp"
#include "record_store.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

using namespace log_collector;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parse_command_line(argc, argv);
        if (cmd.show_help) {
            std::cout << usage(argv[0]);
            return 0;
        }
        cmd.config.validate();
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    const CollectorConfig& config = cmd.config;
    if (config.verbose) {
        CollectorLog::set_min_level(LogLevel::Debug);
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        CollectorLog::log("Main", "Log collector starting");
        CollectorLog::log("Main", "Config: " + config.to_json().dump());

        std::error_code ec;
        if (!std::filesystem::exists(config.directory, ec)) {
            CollectorLog::log("Main", "Log directory '" + config.directory + "' not found, creating it");
            std::filesystem::create_directories(config.directory);
        }

        auto sink = std::make_shared<FanoutSink>();
        std::shared_ptr<RecordStore> store;
        if (config.console) {
            sink->add(std::make_shared<ConsoleSink>(std::cout));
        }
        if (config.db_path) {
            store = std::make_shared<RecordStore>(*config.db_path);
            CollectorLog::log("Main", "Storing records in " + *config.db_path +
                              " (" + std::to_string(store->count()) + " existing)");
            sink->add(store);
        }
        if (config.http_url) {
            sink->add(std::make_shared<HttpSink>(*config.http_url));
            CollectorLog::log("Main", "Forwarding records to " + *config.http_url);
        }

        InotifySource notifier;

        CollectorOptions options;
        options.directory = config.directory;
        options.pattern = config.pattern;
        options.scan_interval = config.scan_interval;
        options.worker_threads = config.worker_threads;

        Collector collector(options, notifier, *sink);
        collector.start();

        CollectorLog::log("Main", "Collector ready. Press Ctrl+C to stop.");

        // Main loop
        while (running && collector.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        collector.stop();

        CollectorLog::log("Main", "Shutdown complete. Tracked files: " +
                          std::to_string(collector.stats().tracked_files) +
                          ", records: " + std::to_string(collector.stats().records));

    } catch (const std::exception& e) {
        CollectorLog::error("Main", std::string("Fatal error: ") + e.what());
        return 1;
    }

    return 0;
}
