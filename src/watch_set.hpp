#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>
#include <nlohmann/json.hpp>

namespace log_collector {

// Per-file cursor state. Every field except `path` and `pass_pending` is
// guarded by `mutex`; hold it for the whole of a tail pass.
struct TrackedFile {
    explicit TrackedFile(std::string file_path) : path(std::move(file_path)) {}

    const std::string path;
    std::mutex mutex;
    std::ifstream handle;
    std::uint64_t offset = 0;       // Bytes consumed, always at a line boundary
    std::uint64_t last_size = 0;    // Size seen by the last successful stat
    std::uint64_t inode = 0;        // File behind `handle`
    bool registered = false;        // Set once `handle` is open and sized
    std::atomic<bool> pass_pending{false};
};

struct FileStat {
    std::uint64_t size = 0;
    std::uint64_t inode = 0;
};

// stat(2) of `path`; sets `ec` on failure
FileStat stat_file(const std::string& path, std::error_code& ec);

struct TrackedFileInfo {
    std::string path;
    std::uint64_t offset = 0;
    std::uint64_t last_size = 0;

    nlohmann::json to_json() const {
        return {
            {"path", path},
            {"offset", offset},
            {"last_size", last_size}
        };
    }
};

struct RegisterResult {
    std::shared_ptr<TrackedFile> file;
    bool already_tracked = false;
};

class WatchSet {
public:
    WatchSet() = default;

    // Non-copyable
    WatchSet(const WatchSet&) = delete;
    WatchSet& operator=(const WatchSet&) = delete;

    // Opens `path` and starts tracking it from its current end. The entry is
    // visible from the start and locked until it is sized, so a pass for a
    // write that races the registration waits and reads from the new end.
    // Throws std::runtime_error if the file cannot be opened or sized; the
    // entry is removed again.
    RegisterResult register_file(const std::string& path);

    // Returns nullptr if `path` is not tracked
    std::shared_ptr<TrackedFile> get(const std::string& path) const;

    // Throw std::out_of_range if `path` is not tracked
    void advance(const std::string& path, std::uint64_t new_offset);
    void reset(const std::string& path);

    bool contains(const std::string& path) const;
    size_t size() const;
    std::vector<std::string> paths() const;
    std::vector<TrackedFileInfo> list() const;

private:
    std::shared_ptr<TrackedFile> require(const std::string& path) const;

    std::map<std::string, std::shared_ptr<TrackedFile>> files_;
    mutable std::mutex mutex_;
};

} // namespace log_collector
