#include "watch_set.hpp"
#include <cerrno>
#include <stdexcept>

#include <sys/stat.h>

namespace log_collector {

FileStat stat_file(const std::string& path, std::error_code& ec) {
    FileStat result;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return result;
    }
    ec.clear();
    result.size = static_cast<std::uint64_t>(st.st_size);
    result.inode = static_cast<std::uint64_t>(st.st_ino);
    return result;
}

RegisterResult WatchSet::register_file(const std::string& path) {
    auto file = std::make_shared<TrackedFile>(path);
    std::unique_lock<std::mutex> file_lock(file->mutex);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = files_.emplace(path, file);
        if (!inserted) {
            return {it->second, true};
        }
    }

    // File I/O happens under the entry's own lock only
    try {
        file->handle.open(path, std::ios::in | std::ios::binary);
        if (!file->handle.is_open()) {
            throw std::runtime_error("Failed to open " + path);
        }

        std::error_code ec;
        FileStat st = stat_file(path, ec);
        if (ec) {
            throw std::runtime_error("Failed to stat " + path + ": " + ec.message());
        }
        file->offset = st.size;
        file->last_size = st.size;
        file->inode = st.inode;
        file->registered = true;
    } catch (const std::runtime_error&) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.erase(path);
        throw;
    }
    return {file, false};
}

std::shared_ptr<TrackedFile> WatchSet::get(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<TrackedFile> WatchSet::require(const std::string& path) const {
    auto file = get(path);
    if (!file) {
        throw std::out_of_range("Not tracked: " + path);
    }
    return file;
}

void WatchSet::advance(const std::string& path, std::uint64_t new_offset) {
    auto file = require(path);
    std::lock_guard<std::mutex> lock(file->mutex);
    file->offset = new_offset;
    if (file->last_size < new_offset) {
        file->last_size = new_offset;
    }
}

void WatchSet::reset(const std::string& path) {
    auto file = require(path);
    std::lock_guard<std::mutex> lock(file->mutex);
    file->offset = 0;
}

bool WatchSet::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(path) > 0;
}

size_t WatchSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

std::vector<std::string> WatchSet::paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(files_.size());
    for (const auto& [path, file] : files_) {
        result.push_back(path);
    }
    return result;
}

std::vector<TrackedFileInfo> WatchSet::list() const {
    std::vector<std::shared_ptr<TrackedFile>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [path, file] : files_) {
            snapshot.push_back(file);
        }
    }

    std::vector<TrackedFileInfo> result;
    for (const auto& file : snapshot) {
        std::lock_guard<std::mutex> lock(file->mutex);
        TrackedFileInfo info;
        info.path = file->path;
        info.offset = file->offset;
        info.last_size = file->last_size;
        result.push_back(info);
    }
    return result;
}

} // namespace log_collector
