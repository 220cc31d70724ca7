#pragma once

#include "notification_source.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace log_collector {

// Linux inotify backend. Directories report Created for new entries, files
// report Changed on every write. A self-pipe wakes the reader on close().
class InotifySource : public NotificationSource {
public:
    // Throws NotificationError if the inotify instance cannot be created
    InotifySource();
    ~InotifySource() override;

    // Non-copyable
    InotifySource(const InotifySource&) = delete;
    InotifySource& operator=(const InotifySource&) = delete;

    void subscribe(const std::string& path) override;
    void unsubscribe(const std::string& path) override;
    std::optional<FsEvent> next_event() override;
    void close() override;

    bool is_subscribed(const std::string& path) const;

private:
    void read_events();

    int inotify_fd_{-1};
    int pipe_fd_[2]{-1, -1};
    std::atomic<bool> closed_{false};

    std::unordered_map<int, std::string> wd_to_path_;
    std::unordered_map<std::string, int> path_to_wd_;
    mutable std::mutex watch_mutex_;

    // Only touched by the thread calling next_event()
    std::deque<FsEvent> pending_;
};

} // namespace log_collector
