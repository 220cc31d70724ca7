#include "file_scanner.hpp"
#include "collector_log.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fnmatch.h>

namespace log_collector {

namespace fs = std::filesystem;

FileScanner::FileScanner(WatchSet& files, NotificationSource& notifier,
                         const std::string& directory, std::string pattern,
                         ReplacedHandler on_replaced)
    : files_(files)
    , notifier_(notifier)
    , pattern_(std::move(pattern))
    , on_replaced_(std::move(on_replaced))
{
    fs::path dir = fs::absolute(directory).lexically_normal();
    if (!dir.has_filename() && dir.has_parent_path() && dir != dir.root_path()) {
        dir = dir.parent_path();
    }
    directory_ = dir.string();
}

void FileScanner::validate_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw ScanError("Empty file pattern");
    }
    if (pattern.find('/') != std::string::npos) {
        throw ScanError("File pattern must not contain '/': " + pattern);
    }

    for (size_t i = 0; i < pattern.size(); i++) {
        char c = pattern[i];
        if (c == '\\') {
            if (++i >= pattern.size()) {
                throw ScanError("Trailing escape in file pattern: " + pattern);
            }
        } else if (c == '[') {
            size_t j = i + 1;
            if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) j++;
            if (j < pattern.size() && pattern[j] == ']') j++;   // Literal ']' first in class
            while (j < pattern.size() && pattern[j] != ']') j++;
            if (j >= pattern.size()) {
                throw ScanError("Unterminated character class in file pattern: " + pattern);
            }
            i = j;
        }
    }
}

bool FileScanner::matches(const std::string& pattern, const std::string& name) {
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

size_t FileScanner::scan() {
    validate_pattern(pattern_);

    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        throw ScanError("Failed to list " + directory_ + ": " + ec.message());
    }

    std::vector<std::string> candidates;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw ScanError("Failed to list " + directory_ + ": " + ec.message());
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (matches(pattern_, it->path().filename().string())) {
            candidates.push_back(it->path().string());
        }
    }
    if (ec) {
        throw ScanError("Failed to list " + directory_ + ": " + ec.message());
    }
    std::sort(candidates.begin(), candidates.end());

    size_t registered = 0;
    for (const auto& path : candidates) {
        if (files_.contains(path)) {
            follow_replacement(path);
            continue;
        }

        std::error_code stat_ec;
        FileStat before = stat_file(path, stat_ec);
        if (stat_ec) {
            // Gone again since the listing
            continue;
        }

        try {
            notifier_.subscribe(path);
        } catch (const std::exception& e) {
            CollectorLog::warn("Scanner", "Subscribe failed, retrying next scan: " + std::string(e.what()));
            continue;
        }

        try {
            auto result = files_.register_file(path);
            if (!result.already_tracked) {
                std::uint64_t offset;
                {
                    std::lock_guard<std::mutex> lock(result.file->mutex);
                    offset = result.file->offset;
                }
                watched_[path] = before.inode;
                CollectorLog::log("Scanner", "Started tailing: " + path +
                                  " (from byte " + std::to_string(offset) + ")");
                registered++;
            }
        } catch (const std::exception& e) {
            CollectorLog::error("Scanner", "Failed to register " + path + ": " + e.what());
            notifier_.unsubscribe(path);
        }
    }
    return registered;
}

void FileScanner::follow_replacement(const std::string& path) {
    auto it = watched_.find(path);
    if (it == watched_.end()) {
        return;
    }

    std::error_code ec;
    FileStat current = stat_file(path, ec);
    if (ec || current.inode == it->second) {
        return;
    }

    // The old watch stays on the renamed file and never reports writes to the new one
    notifier_.unsubscribe(path);
    try {
        notifier_.subscribe(path);
    } catch (const std::exception& e) {
        CollectorLog::warn("Scanner", "Subscribe failed for replaced file, retrying next scan: " +
                           std::string(e.what()));
        return;
    }
    it->second = current.inode;
    CollectorLog::log("Scanner", "File replaced, watching new file: " + path);

    if (on_replaced_) {
        on_replaced_(path);
    }
}

} // namespace log_collector
