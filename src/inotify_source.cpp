#include "inotify_source.hpp"
#include "collector_log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace log_collector {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

InotifySource::InotifySource() {
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        throw NotificationError(errno_message("inotify_init1 failed"));
    }
    if (pipe2(pipe_fd_, O_NONBLOCK | O_CLOEXEC) != 0) {
        std::string msg = errno_message("pipe2 failed");
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        throw NotificationError(msg);
    }
}

InotifySource::~InotifySource() {
    if (inotify_fd_ >= 0) ::close(inotify_fd_);
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
}

void InotifySource::subscribe(const std::string& path) {
    std::error_code ec;
    bool is_dir = std::filesystem::is_directory(path, ec);
    uint32_t mask = is_dir ? (IN_CREATE | IN_MOVED_TO) : IN_MODIFY;

    std::lock_guard<std::mutex> lock(watch_mutex_);
    int wd = inotify_add_watch(inotify_fd_, path.c_str(), mask);
    if (wd < 0) {
        throw NotificationError(errno_message("Failed to watch " + path));
    }
    auto previous = path_to_wd_.find(path);
    if (previous != path_to_wd_.end() && previous->second != wd) {
        // Same name, different file: drop the watch on the old one
        inotify_rm_watch(inotify_fd_, previous->second);
        wd_to_path_.erase(previous->second);
    }
    wd_to_path_[wd] = path;
    path_to_wd_[path] = wd;
}

void InotifySource::unsubscribe(const std::string& path) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    auto it = path_to_wd_.find(path);
    if (it == path_to_wd_.end()) {
        return;
    }
    if (inotify_rm_watch(inotify_fd_, it->second) != 0) {
        // The kernel drops watches on deleted files by itself
        CollectorLog::debug("Inotify", errno_message("inotify_rm_watch " + path));
    }
    wd_to_path_.erase(it->second);
    path_to_wd_.erase(it);
}

bool InotifySource::is_subscribed(const std::string& path) const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return path_to_wd_.count(path) > 0;
}

void InotifySource::close() {
    if (closed_.exchange(true)) {
        return;
    }
    char byte = 1;
    if (::write(pipe_fd_[1], &byte, 1) < 0) {
        CollectorLog::warn("Inotify", errno_message("Failed to signal shutdown"));
    }
}

std::optional<FsEvent> InotifySource::next_event() {
    while (pending_.empty()) {
        if (closed_) {
            return std::nullopt;
        }

        pollfd fds[2];
        fds[0].fd = inotify_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = pipe_fd_[0];
        fds[1].events = POLLIN;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw NotificationError(errno_message("poll failed"));
        }

        if (fds[1].revents & POLLIN) {
            return std::nullopt;
        }
        if (fds[0].revents & POLLIN) {
            read_events();
        }
    }

    FsEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void InotifySource::read_events() {
    alignas(inotify_event) char buffer[4096];

    for (;;) {
        ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EINTR) continue;
            throw NotificationError(errno_message("Failed to read inotify events"));
        }
        if (length == 0) return;

        std::lock_guard<std::mutex> lock(watch_mutex_);
        char* ptr = buffer;
        while (ptr < buffer + length) {
            auto* ev = reinterpret_cast<inotify_event*>(ptr);
            ptr += sizeof(inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                pending_.push_back({FsEventType::Error, "", "inotify event queue overflow"});
                continue;
            }

            auto it = wd_to_path_.find(ev->wd);
            if (it == wd_to_path_.end()) {
                continue;
            }

            if (ev->mask & IN_IGNORED) {
                // Watched file was deleted or its filesystem unmounted. The
                // path may already be watched again through a newer descriptor.
                auto current = path_to_wd_.find(it->second);
                if (current != path_to_wd_.end() && current->second == ev->wd) {
                    path_to_wd_.erase(current);
                }
                wd_to_path_.erase(it);
                continue;
            }

            if ((ev->mask & (IN_CREATE | IN_MOVED_TO)) && ev->len > 0) {
                auto child = std::filesystem::path(it->second) / ev->name;
                pending_.push_back({FsEventType::Created, child.string(), ""});
            } else if (ev->mask & IN_MODIFY) {
                pending_.push_back({FsEventType::Changed, it->second, ""});
            }
        }
    }
}

} // namespace log_collector
