#include <catch2/catch_test_macros.hpp>
#include "tail_reader.hpp"
#include "test_support.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace log_collector;
using namespace log_collector::testing;

TEST_CASE("Tail reader follows appends, partial lines and truncation", "[tail]") {
    TempDir dir("tail_scenario");
    std::string path = dir.file("app.log");
    write_file(path, "");

    WatchSet files;
    RecordingSink sink;
    TailReader reader(files, sink);
    files.register_file(path);

    append_file(path, "hello\n");
    auto result = reader.tail(path);
    REQUIRE(result.completed);
    REQUIRE(result.records == 1);
    REQUIRE(sink.size() == 1);
    REQUIRE(sink.records()[0].service == "app");
    REQUIRE(sink.records()[0].message == "hello");

    append_file(path, "wor");
    result = reader.tail(path);
    REQUIRE(result.records == 0);
    REQUIRE(result.offset == 6);
    REQUIRE(sink.size() == 1);

    append_file(path, "ld\n");
    result = reader.tail(path);
    REQUIRE(result.records == 1);
    REQUIRE(sink.size() == 2);
    REQUIRE(sink.records()[1].message == "world");
    REQUIRE(files.get(path)->offset == 12);

    write_file(path, "");
    append_file(path, "new\n");
    result = reader.tail(path);
    REQUIRE(result.rotated);
    REQUIRE(result.records == 1);
    REQUIRE(sink.messages() == std::vector<std::string>{"hello", "world", "new"});
    REQUIRE(files.get(path)->offset == 4);
}

TEST_CASE("Tail reader starts at end of existing content", "[tail]") {
    TempDir dir("tail_from_end");
    std::string path = dir.file("history.log");
    write_file(path, "before 1\nbefore 2\n");

    WatchSet files;
    RecordingSink sink;
    TailReader reader(files, sink);
    files.register_file(path);

    auto result = reader.tail(path);
    REQUIRE(result.completed);
    REQUIRE(result.records == 0);
    REQUIRE(sink.size() == 0);

    append_file(path, "after\n");
    reader.tail(path);
    REQUIRE(sink.messages() == std::vector<std::string>{"after"});
}

TEST_CASE("Tail reader line handling", "[tail]") {
    TempDir dir("tail_lines");
    std::string path = dir.file("svc.log");
    write_file(path, "");

    WatchSet files;
    RecordingSink sink;
    TailReader reader(files, sink, parse_line, 4);   // Tiny chunks split lines across reads
    files.register_file(path);

    SECTION("Several lines in one pass keep their order") {
        append_file(path, "first line\nsecond\nthird one here\n");
        auto result = reader.tail(path);
        REQUIRE(result.records == 3);
        REQUIRE(result.bytes_consumed == 33);
        REQUIRE(sink.messages() == std::vector<std::string>{"first line", "second", "third one here"});
    }

    SECTION("Empty lines are records too") {
        append_file(path, "a\n\nb\n");
        reader.tail(path);
        REQUIRE(sink.messages() == std::vector<std::string>{"a", "", "b"});
    }

    SECTION("CRLF terminators are stripped") {
        append_file(path, "windows\r\n");
        reader.tail(path);
        REQUIRE(sink.messages() == std::vector<std::string>{"windows"});
        REQUIRE(files.get(path)->offset == 9);
    }

    SECTION("Unterminated fragment is emitted whole once terminated") {
        append_file(path, "done\npart");
        reader.tail(path);
        append_file(path, "ial");
        reader.tail(path);
        REQUIRE(sink.messages() == std::vector<std::string>{"done"});
        REQUIRE(files.get(path)->offset == 5);

        append_file(path, " line\n");
        reader.tail(path);
        REQUIRE(sink.messages() == std::vector<std::string>{"done", "partial line"});
    }

    SECTION("Repeated passes without new data emit nothing") {
        append_file(path, "once\n");
        reader.tail(path);
        reader.tail(path);
        reader.tail(path);
        REQUIRE(sink.size() == 1);
    }
}

TEST_CASE("Tail reader rotation", "[tail][rotation]") {
    TempDir dir("tail_rotation");
    std::string path = dir.file("app.log");
    write_file(path, "");

    WatchSet files;
    RecordingSink sink;
    TailReader reader(files, sink);
    files.register_file(path);

    append_file(path, "one\ntwo\nthree\n");
    reader.tail(path);
    REQUIRE(files.get(path)->offset == 14);

    SECTION("Truncate in place") {
        write_file(path, "x\n");
        auto result = reader.tail(path);
        REQUIRE(result.rotated);
        REQUIRE(sink.messages() == std::vector<std::string>{"one", "two", "three", "x"});
        REQUIRE(files.get(path)->offset == 2);
    }

    SECTION("Rename away and recreate") {
        std::filesystem::rename(path, dir.file("app.log.1"));
        write_file(path, "fresh\n");
        append_file(dir.file("app.log.1"), "late write to old file\n");

        auto result = reader.tail(path);
        REQUIRE(result.rotated);
        REQUIRE(sink.messages() == std::vector<std::string>{
            "one", "two", "three", "late write to old file", "fresh"});
        REQUIRE(files.get(path)->offset == 6);

        append_file(path, "next\n");
        reader.tail(path);
        REQUIRE(sink.messages().back() == "next");
    }

    SECTION("Replacement already larger than the old offset") {
        std::filesystem::rename(path, dir.file("app.log.1"));
        write_file(path, "first line of the new file\nsecond line of the new file\n");

        auto result = reader.tail(path);
        REQUIRE(result.rotated);
        REQUIRE(sink.messages() == std::vector<std::string>{
            "one", "two", "three", "first line of the new file", "second line of the new file"});
        REQUIRE(result.offset == 55);
    }

    SECTION("Unterminated remainder of the old file is dropped") {
        append_file(path, "cut off");
        std::filesystem::rename(path, dir.file("app.log.1"));
        write_file(path, "fresh\n");

        reader.tail(path);
        REQUIRE(sink.messages() == std::vector<std::string>{"one", "two", "three", "fresh"});
    }

    SECTION("Replacement not created yet") {
        std::filesystem::rename(path, dir.file("app.log.1"));
        auto result = reader.tail(path);
        REQUIRE_FALSE(result.completed);
        REQUIRE(files.get(path)->offset == 14);

        write_file(path, "later\n");
        result = reader.tail(path);
        REQUIRE(result.rotated);
        REQUIRE(sink.messages().back() == "later");
    }

    SECTION("Truncated file with pending fragment") {
        write_file(path, "abc");
        auto result = reader.tail(path);
        REQUIRE(result.rotated);
        REQUIRE(result.records == 0);
        REQUIRE(files.get(path)->offset == 0);

        append_file(path, "def\n");
        reader.tail(path);
        REQUIRE(sink.messages().back() == "abcdef");
    }
}

TEST_CASE("Tail reader failures", "[tail][errors]") {
    TempDir dir("tail_errors");
    WatchSet files;
    RecordingSink sink;
    TailReader reader(files, sink);

    SECTION("Unknown path is a no-op") {
        auto result = reader.tail(dir.file("nope.log"));
        REQUIRE_FALSE(result.completed);
        REQUIRE(sink.size() == 0);
    }

    SECTION("Stat failure keeps the offset for a retry") {
        std::string path = dir.file("gone.log");
        write_file(path, "kept\n");
        files.register_file(path);
        std::filesystem::remove(path);

        auto result = reader.tail(path);
        REQUIRE_FALSE(result.completed);
        REQUIRE(files.get(path)->offset == 5);
    }

    SECTION("Sink rejection drops one line and keeps going") {
        std::string path = dir.file("api.log");
        write_file(path, "");
        files.register_file(path);
        sink.fail_on("bad");

        append_file(path, "good 1\nbad\ngood 2\n");
        auto result = reader.tail(path);
        REQUIRE(result.completed);
        REQUIRE(result.records == 2);
        REQUIRE(result.failed_records == 1);
        REQUIRE(sink.messages() == std::vector<std::string>{"good 1", "good 2"});
        REQUIRE(files.get(path)->offset == 18);
    }

    SECTION("Failure on one file does not affect another") {
        std::string broken = dir.file("broken.log");
        std::string healthy = dir.file("healthy.log");
        write_file(broken, "");
        write_file(healthy, "");
        files.register_file(broken);
        files.register_file(healthy);
        std::filesystem::remove(broken);

        append_file(healthy, "still here\n");
        REQUIRE_FALSE(reader.tail(broken).completed);
        REQUIRE(reader.tail(healthy).completed);
        REQUIRE(sink.messages() == std::vector<std::string>{"still here"});
    }
}

TEST_CASE("Concurrent passes on one file never duplicate or lose lines", "[tail][concurrency]") {
    TempDir dir("tail_concurrent");
    std::string path = dir.file("busy.log");
    write_file(path, "");

    WatchSet files;
    RecordingSink sink;
    TailReader reader(files, sink, parse_line, 7);
    files.register_file(path);

    const int line_count = 2000;
    std::atomic<bool> writing{true};

    std::thread writer([&]() {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        for (int i = 0; i < line_count; i++) {
            // Split each line over two writes so passes see partial lines
            out << "line-" << i;
            out.flush();
            out << "\n";
            out.flush();
        }
        writing = false;
    });

    std::vector<std::thread> tailers;
    for (int t = 0; t < 4; t++) {
        tailers.emplace_back([&]() {
            while (writing) {
                reader.tail(path);
            }
        });
    }

    writer.join();
    for (auto& t : tailers) t.join();
    reader.tail(path);

    auto messages = sink.messages();
    REQUIRE(messages.size() == static_cast<size_t>(line_count));
    for (int i = 0; i < line_count; i++) {
        REQUIRE(messages[i] == "line-" + std::to_string(i));
    }
}
