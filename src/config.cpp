#include "config.hpp"
#include <fstream>
#include <sstream>

namespace log_collector {

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

long long parse_number(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size()) {
            throw ConfigError("Invalid number for " + flag + ": " + value);
        }
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid number for " + flag + ": " + value);
    }
}

} // namespace

void CollectorConfig::validate() const {
    if (directory.empty()) {
        throw ConfigError("Watch directory must not be empty");
    }
    if (pattern.empty()) {
        throw ConfigError("File pattern must not be empty");
    }
    if (scan_interval.count() <= 0) {
        throw ConfigError("Scan interval must be positive");
    }
    if (worker_threads == 0) {
        throw ConfigError("Worker thread count must be positive");
    }
    if (!console && !db_path && !http_url) {
        throw ConfigError("No sink configured");
    }
}

nlohmann::json CollectorConfig::to_json() const {
    nlohmann::json j;
    j["directory"] = directory;
    j["pattern"] = pattern;
    j["scan_interval_ms"] = scan_interval.count();
    j["worker_threads"] = worker_threads;
    j["console"] = console;
    j["db_path"] = db_path ? nlohmann::json(*db_path) : nlohmann::json();
    j["http_url"] = http_url ? nlohmann::json(*http_url) : nlohmann::json();
    j["verbose"] = verbose;
    return j;
}

CollectorConfig CollectorConfig::from_json(const nlohmann::json& j) {
    return from_json(j, CollectorConfig{});
}

CollectorConfig CollectorConfig::from_json(const nlohmann::json& j, CollectorConfig base) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    CollectorConfig config = std::move(base);
    read_key(j, "directory", config.directory);
    read_key(j, "pattern", config.pattern);

    long long interval_ms = config.scan_interval.count();
    read_key(j, "scan_interval_ms", interval_ms);
    config.scan_interval = std::chrono::milliseconds(interval_ms);

    long long workers = static_cast<long long>(config.worker_threads);
    read_key(j, "worker_threads", workers);
    if (workers < 0) {
        throw ConfigError("Invalid value for 'worker_threads': " + std::to_string(workers));
    }
    config.worker_threads = static_cast<size_t>(workers);

    read_key(j, "console", config.console);
    if (j.contains("db_path") && !j["db_path"].is_null()) {
        std::string db;
        read_key(j, "db_path", db);
        config.db_path = db;
    }
    if (j.contains("http_url") && !j["http_url"].is_null()) {
        std::string url;
        read_key(j, "http_url", url);
        config.http_url = url;
    }
    read_key(j, "verbose", config.verbose);
    return config;
}

CollectorConfig CollectorConfig::load_file(const std::string& path) {
    return load_file(path, CollectorConfig{});
}

CollectorConfig CollectorConfig::load_file(const std::string& path, CollectorConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
    return from_json(j, std::move(base));
}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Log Collector - tails append-only log files in a directory\n\n";
    ss << "Usage: " << program << " [options]\n\n";
    ss << "Options:\n";
    ss << "  --config PATH       JSON configuration file (flags override it)\n";
    ss << "  --dir PATH          Directory to watch (default: ./logs)\n";
    ss << "  --pattern GLOB      File name pattern (default: *.log)\n";
    ss << "  --interval-ms N     Directory scan interval (default: 10000)\n";
    ss << "  --workers N         Tail worker threads (default: 4)\n";
    ss << "  --db PATH           Also store records in a SQLite database\n";
    ss << "  --http-url URL      Also POST records to an HTTP endpoint\n";
    ss << "  --no-console        Do not print records to stdout\n";
    ss << "  --verbose           Enable debug logging\n";
    ss << "  --help              Show this help message\n\n";
    ss << "Example:\n";
    ss << "  " << program << " --dir /var/log/myapp --pattern '*.log' --db records.db\n";
    return ss.str();
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cmd;

    // The config file is the base layer, wherever it appears
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                throw ConfigError("--config requires a value");
            }
            cmd.config = CollectorConfig::load_file(argv[i + 1], cmd.config);
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
        }
        else if (arg == "--config") {
            ++i;
        }
        else if (arg == "--dir") {
            cmd.config.directory = value();
        }
        else if (arg == "--pattern") {
            cmd.config.pattern = value();
        }
        else if (arg == "--interval-ms") {
            cmd.config.scan_interval = std::chrono::milliseconds(parse_number(arg, value()));
        }
        else if (arg == "--workers") {
            long long n = parse_number(arg, value());
            if (n <= 0) {
                throw ConfigError("--workers must be positive");
            }
            cmd.config.worker_threads = static_cast<size_t>(n);
        }
        else if (arg == "--db") {
            cmd.config.db_path = value();
        }
        else if (arg == "--http-url") {
            cmd.config.http_url = value();
        }
        else if (arg == "--no-console") {
            cmd.config.console = false;
        }
        else if (arg == "--verbose" || arg == "-v") {
            cmd.config.verbose = true;
        }
        else {
            throw ConfigError("Unknown option: " + arg);
        }
    }
    return cmd;
}

} // namespace log_collector
