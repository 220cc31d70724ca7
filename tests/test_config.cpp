#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "test_support.hpp"
#include <vector>

using namespace log_collector;
using namespace log_collector::testing;

namespace {

CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "log-collector");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("Config defaults", "[config]") {
    CollectorConfig config;
    REQUIRE(config.directory == "./logs");
    REQUIRE(config.pattern == "*.log");
    REQUIRE(config.scan_interval == std::chrono::seconds(10));
    REQUIRE(config.worker_threads == 4);
    REQUIRE(config.console);
    REQUIRE_FALSE(config.db_path);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config validation", "[config]") {
    CollectorConfig config;

    SECTION("Empty directory") {
        config.directory.clear();
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Non-positive interval") {
        config.scan_interval = std::chrono::milliseconds(0);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("No sink") {
        config.console = false;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
        config.db_path = "records.db";
        REQUIRE_NOTHROW(config.validate());
    }
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Known keys override, unknown keys are ignored") {
        auto config = CollectorConfig::from_json(nlohmann::json::object({
            {"directory", "/var/log/app"},
            {"scan_interval_ms", 250},
            {"db_path", "records.db"},
            {"extra", true}
        }));
        REQUIRE(config.directory == "/var/log/app");
        REQUIRE(config.pattern == "*.log");
        REQUIRE(config.scan_interval == std::chrono::milliseconds(250));
        REQUIRE(config.db_path == std::string("records.db"));
        REQUIRE_FALSE(config.http_url);
    }

    SECTION("Wrong types are reported") {
        REQUIRE_THROWS_AS(CollectorConfig::from_json(nlohmann::json::object({{"worker_threads", "many"}})), ConfigError);
        REQUIRE_THROWS_AS(CollectorConfig::from_json(nlohmann::json::array()), ConfigError);
    }

    SECTION("to_json round trip") {
        CollectorConfig original;
        original.http_url = "http://localhost:8080/ingest";
        original.worker_threads = 2;
        auto copy = CollectorConfig::from_json(original.to_json());
        REQUIRE(copy.http_url == original.http_url);
        REQUIRE(copy.worker_threads == 2);
        REQUIRE_FALSE(copy.db_path);
    }
}

TEST_CASE("Config file loading", "[config]") {
    TempDir dir("config");

    SECTION("Valid file") {
        write_file(dir.file("collector.json"), R"({"pattern": "*.txt", "verbose": true})");
        auto config = CollectorConfig::load_file(dir.file("collector.json"));
        REQUIRE(config.pattern == "*.txt");
        REQUIRE(config.verbose);
    }

    SECTION("Missing or malformed file") {
        REQUIRE_THROWS_AS(CollectorConfig::load_file(dir.file("missing.json")), ConfigError);
        write_file(dir.file("broken.json"), "{not json");
        REQUIRE_THROWS_AS(CollectorConfig::load_file(dir.file("broken.json")), ConfigError);
    }
}

TEST_CASE("Command line parsing", "[config]") {
    SECTION("Flags") {
        auto cmd = parse({"--dir", "/tmp/logs", "--pattern", "*.txt", "--interval-ms", "500",
                          "--workers", "8", "--db", "out.db", "--no-console", "--verbose"});
        REQUIRE_FALSE(cmd.show_help);
        REQUIRE(cmd.config.directory == "/tmp/logs");
        REQUIRE(cmd.config.pattern == "*.txt");
        REQUIRE(cmd.config.scan_interval == std::chrono::milliseconds(500));
        REQUIRE(cmd.config.worker_threads == 8);
        REQUIRE(cmd.config.db_path == std::string("out.db"));
        REQUIRE_FALSE(cmd.config.console);
        REQUIRE(cmd.config.verbose);
    }

    SECTION("Flags override the config file regardless of order") {
        TempDir dir("cmdline");
        write_file(dir.file("c.json"), R"({"directory": "/from/file", "pattern": "*.out"})");
        std::string config_path = dir.file("c.json");

        auto cmd = parse({"--dir", "/from/flag", "--config", config_path.c_str()});
        REQUIRE(cmd.config.directory == "/from/flag");
        REQUIRE(cmd.config.pattern == "*.out");
    }

    SECTION("Help") {
        REQUIRE(parse({"--help"}).show_help);
        REQUIRE(usage("log-collector").find("--pattern") != std::string::npos);
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(parse({"--bogus"}), ConfigError);
        REQUIRE_THROWS_AS(parse({"--dir"}), ConfigError);
        REQUIRE_THROWS_AS(parse({"--interval-ms", "soon"}), ConfigError);
        REQUIRE_THROWS_AS(parse({"--workers", "0"}), ConfigError);
    }
}
