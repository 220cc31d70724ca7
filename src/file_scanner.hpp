#pragma once

#include "notification_source.hpp"
#include "watch_set.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

namespace log_collector {

class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Discovers files in one directory whose names match a glob, subscribes
// them to the notification source and registers them in the WatchSet.
// A tracked name that now points at a different file (rename rotation) has
// its subscription moved to the new file.
class FileScanner {
public:
    // Called for a tracked path whose file was replaced, after the watch moved
    using ReplacedHandler = std::function<void(const std::string& path)>;

    // `directory` is made absolute so WatchSet keys match event paths
    FileScanner(WatchSet& files, NotificationSource& notifier,
                const std::string& directory, std::string pattern,
                ReplacedHandler on_replaced = nullptr);

    // Registers every matching, untracked regular file; returns how many
    // were added. Throws ScanError if the pattern is malformed or the
    // directory cannot be listed. Per-file failures are logged and retried
    // on the next call.
    size_t scan();

    const std::string& directory() const { return directory_; }
    const std::string& pattern() const { return pattern_; }

    // fnmatch(3) glob over a single path component: *, ?, [...], \ escapes.
    // Throws ScanError for '/' in the pattern, unterminated classes or a trailing '\'.
    static void validate_pattern(const std::string& pattern);
    static bool matches(const std::string& pattern, const std::string& name);

private:
    void follow_replacement(const std::string& path);

    WatchSet& files_;
    NotificationSource& notifier_;
    std::string directory_;
    std::string pattern_;
    ReplacedHandler on_replaced_;
    std::map<std::string, std::uint64_t> watched_;   // Inode each subscription was made for
};

} // namespace log_collector
