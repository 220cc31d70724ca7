#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace log_collector {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CollectorConfig {
    std::string directory = "./logs";
    std::string pattern = "*.log";
    std::chrono::milliseconds scan_interval{10000};
    size_t worker_threads = 4;

    // Sinks; any combination, at least one
    bool console = true;
    std::optional<std::string> db_path;
    std::optional<std::string> http_url;

    bool verbose = false;

    // Throws ConfigError describing the first invalid setting
    void validate() const;

    nlohmann::json to_json() const;

    // Keys missing from `j` keep the value from `base`; unknown keys are ignored
    static CollectorConfig from_json(const nlohmann::json& j);
    static CollectorConfig from_json(const nlohmann::json& j, CollectorConfig base);
    static CollectorConfig load_file(const std::string& path);
    static CollectorConfig load_file(const std::string& path, CollectorConfig base);
};

struct CommandLine {
    CollectorConfig config;
    bool show_help = false;
};

// Defaults, then --config FILE, then the remaining flags. Throws ConfigError.
CommandLine parse_command_line(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace log_collector
