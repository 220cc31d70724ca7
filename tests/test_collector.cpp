#include <catch2/catch_test_macros.hpp>
#include "collector.hpp"
#include "test_support.hpp"
#include <chrono>
#include <filesystem>

using namespace log_collector;
using namespace log_collector::testing;

namespace {

CollectorOptions options_for(const TempDir& dir, std::chrono::milliseconds interval = std::chrono::hours(1)) {
    CollectorOptions options;
    options.directory = dir.str();
    options.pattern = "*.log";
    options.scan_interval = interval;
    options.worker_threads = 2;
    return options;
}

} // namespace

TEST_CASE("Collector end-to-end with notification events", "[collector]") {
    TempDir dir("collector");
    std::string path = dir.file("app.log");
    write_file(path, "");

    FakeNotificationSource notifier;
    RecordingSink sink;
    Collector collector(options_for(dir), notifier, sink);
    collector.start();

    REQUIRE(collector.is_running());
    REQUIRE(notifier.is_subscribed(collector.directory()));
    REQUIRE(collector.files().contains(path));

    append_file(path, "hello\n");
    notifier.changed(path);
    REQUIRE(wait_until([&]() { return sink.size() == 1; }));
    REQUIRE(sink.records()[0].service == "app");
    REQUIRE(sink.records()[0].message == "hello");

    append_file(path, "wor");
    notifier.changed(path);
    REQUIRE(wait_until([&]() { return collector.stats().passes == 2; }));
    REQUIRE(sink.size() == 1);

    append_file(path, "ld\n");
    notifier.changed(path);
    REQUIRE(wait_until([&]() { return sink.size() == 2; }));
    REQUIRE(sink.records()[1].message == "world");

    write_file(path, "new\n");
    notifier.changed(path);
    REQUIRE(wait_until([&]() { return sink.size() == 3; }));
    REQUIRE(sink.messages() == std::vector<std::string>{"hello", "world", "new"});

    collector.stop();
    REQUIRE_FALSE(collector.is_running());
    REQUIRE(collector.stats().records == 3);
    REQUIRE(collector.stats().rotations == 1);
}

TEST_CASE("Collector defers created files to the periodic scan", "[collector]") {
    TempDir dir("collector_scan");
    FakeNotificationSource notifier;
    RecordingSink sink;
    Collector collector(options_for(dir, std::chrono::milliseconds(50)), notifier, sink);
    collector.start();
    REQUIRE(collector.files().size() == 0);

    std::string path = dir.file("late.log");
    write_file(path, "written before discovery\n");
    notifier.created(path);

    REQUIRE(wait_until([&]() { return collector.files().contains(path); }));
    REQUIRE(notifier.subscribe_calls(path) == 1);

    notifier.changed(path);
    REQUIRE(wait_until([&]() { return collector.stats().passes == 1; }));
    REQUIRE(sink.size() == 0);

    append_file(path, "after discovery\n");
    notifier.changed(path);
    REQUIRE(wait_until([&]() { return sink.size() == 1; }));
    REQUIRE(sink.messages() == std::vector<std::string>{"after discovery"});

    collector.stop();
    REQUIRE(collector.stats().scans >= 2);
}

TEST_CASE("Collector ignores writes on unknown paths and source errors", "[collector]") {
    TempDir dir("collector_ignore");
    FakeNotificationSource notifier;
    RecordingSink sink;
    Collector collector(options_for(dir), notifier, sink);
    collector.start();

    notifier.changed(dir.file("unknown.log"));
    notifier.push({FsEventType::Error, "", "overflow"});
    REQUIRE(wait_until([&]() { return collector.stats().events == 2; }));
    REQUIRE(collector.is_running());
    REQUIRE(collector.stats().passes == 0);

    collector.stop();
}

TEST_CASE("Collector stops when the channel closes and drains passes", "[collector]") {
    TempDir dir("collector_close");
    std::string path = dir.file("app.log");
    write_file(path, "");

    FakeNotificationSource notifier;
    RecordingSink sink;
    Collector collector(options_for(dir), notifier, sink);
    collector.start();

    std::string content;
    for (int i = 0; i < 500; i++) {
        content += "entry " + std::to_string(i) + "\n";
    }
    append_file(path, content);
    for (int i = 0; i < 20; i++) {
        notifier.changed(path);
    }
    notifier.close();

    REQUIRE(wait_until([&]() { return !collector.is_running(); }));
    collector.stop();

    REQUIRE(sink.size() == 500);
    REQUIRE(sink.messages().front() == "entry 0");
    REQUIRE(sink.messages().back() == "entry 499");
    REQUIRE(collector.stats().events == 20);
}

TEST_CASE("Collector scan errors are not fatal", "[collector][errors]") {
    TempDir dir("collector_scan_error");
    FakeNotificationSource notifier;
    RecordingSink sink;

    CollectorOptions options = options_for(dir);
    options.pattern = "[broken";
    Collector collector(options, notifier, sink);
    collector.start();

    REQUIRE(collector.is_running());
    REQUIRE(collector.stats().scan_errors == 1);
    REQUIRE(collector.scan_now() == 0);
    REQUIRE(collector.stats().scan_errors == 2);

    collector.stop();
}

TEST_CASE("Collector setup fails if the directory cannot be watched", "[collector][errors]") {
    TempDir dir("collector_setup");
    FakeNotificationSource notifier;
    RecordingSink sink;

    Collector collector(options_for(dir), notifier, sink);
    notifier.refuse(collector.directory());
    REQUIRE_THROWS_AS(collector.start(), NotificationError);
    REQUIRE_FALSE(collector.is_running());
}

TEST_CASE("Collector keeps reading after rename rotation", "[collector][rotation]") {
    TempDir dir("collector_rename");
    std::string path = dir.file("app.log");
    write_file(path, "");

    FakeNotificationSource notifier;
    RecordingSink sink;
    Collector collector(options_for(dir), notifier, sink);
    collector.start();

    append_file(path, "before\n");
    REQUIRE(notifier.modified(path));
    REQUIRE(wait_until([&]() { return sink.size() == 1; }));

    std::filesystem::rename(path, dir.file("app.log.1"));
    write_file(path, "");
    notifier.created(path);
    append_file(path, "after rotation\n");

    // The watch is still on the renamed file
    REQUIRE_FALSE(notifier.modified(path));

    collector.scan_now();
    REQUIRE(notifier.subscribe_calls(path) == 2);
    REQUIRE(wait_until([&]() { return sink.size() == 2; }));

    append_file(path, "next\n");
    REQUIRE(notifier.modified(path));
    REQUIRE(wait_until([&]() { return sink.size() == 3; }));
    REQUIRE(sink.messages() == std::vector<std::string>{"before", "after rotation", "next"});

    collector.stop();
    REQUIRE(collector.stats().rotations == 1);
}
