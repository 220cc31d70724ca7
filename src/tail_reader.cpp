#include "tail_reader.hpp"
#include "collector_log.hpp"
#include <algorithm>
#include <vector>

namespace log_collector {

TailReader::TailReader(WatchSet& files, RecordSink& sink, LineParser parser, size_t read_chunk)
    : files_(files)
    , sink_(sink)
    , parser_(parser ? std::move(parser) : LineParser(parse_line))
    , read_chunk_(read_chunk > 0 ? read_chunk : 64 * 1024)
{
}

bool TailReader::reopen(TrackedFile& file, std::uint64_t inode) {
    file.handle.close();
    file.handle.clear();
    file.handle.open(file.path, std::ios::in | std::ios::binary);
    if (!file.handle.is_open()) {
        return false;
    }
    file.inode = inode;
    return true;
}

void TailReader::emit(const std::string& path, std::string line, TailResult& result) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    try {
        sink_.accept(parser_(path, line));
        result.records++;
    } catch (const std::exception& e) {
        result.failed_records++;
        CollectorLog::error("TailReader", "Dropped line from " + path + ": " + e.what());
    }
}

std::uint64_t TailReader::read_lines(TrackedFile& file, std::uint64_t start, TailResult& result,
                                     std::string& carry) {
    // The returned position only moves past complete lines, so an
    // unterminated tail stays unread and is picked up whole by a later pass.
    std::uint64_t consumed = start;
    std::vector<char> buffer(read_chunk_);

    for (;;) {
        file.handle.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<size_t>(file.handle.gcount());
        if (got > 0) {
            carry.append(buffer.data(), got);

            size_t line_start = 0;
            size_t newline;
            while ((newline = carry.find('\n', line_start)) != std::string::npos) {
                emit(file.path, carry.substr(line_start, newline - line_start), result);
                consumed += newline - line_start + 1;
                line_start = newline + 1;
            }
            carry.erase(0, line_start);
        }
        if (!file.handle) break;
    }

    if (file.handle.bad()) {
        CollectorLog::error("TailReader", "Read error on " + file.path + " after byte " + std::to_string(consumed));
    }
    file.handle.clear();
    return consumed;
}

bool TailReader::seek(TrackedFile& file, std::uint64_t position) {
    file.handle.clear();
    file.handle.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (!file.handle) {
        CollectorLog::error("TailReader", "Failed to seek " + file.path + " to " + std::to_string(position));
        file.handle.clear();
        return false;
    }
    return true;
}

TailResult TailReader::tail(const std::string& path) {
    TailResult result;

    auto file = files_.get(path);
    if (!file) {
        CollectorLog::warn("TailReader", "Not tracked, skipping: " + path);
        return result;
    }

    std::lock_guard<std::mutex> lock(file->mutex);

    // Writes that land after this point trigger a fresh pass
    file->pass_pending = false;
    result.offset = file->offset;

    if (!file->registered) {
        CollectorLog::debug("TailReader", "Registration failed, skipping: " + path);
        return result;
    }

    std::error_code ec;
    FileStat current = stat_file(path, ec);
    if (ec) {
        CollectorLog::error("TailReader", "Failed to stat " + path + ": " + ec.message());
        return result;
    }

    std::uint64_t start = file->offset;
    std::uint64_t drained = 0;
    bool rotated = false;
    if (current.inode != file->inode) {
        // Renamed away and recreated: finish the old file through the old
        // handle, then follow the name to the new one.
        CollectorLog::log("TailReader", "File replaced (likely rotated), reading new file from start: " + path);
        if (seek(*file, start)) {
            std::string rest;
            drained = read_lines(*file, start, result, rest) - start;
            if (!rest.empty()) {
                CollectorLog::warn("TailReader", "Discarding " + std::to_string(rest.size()) +
                                   " bytes of unterminated line in rotated file " + path);
            }
        }
        if (!reopen(*file, current.inode)) {
            CollectorLog::error("TailReader", "Failed to reopen rotated file: " + path);
            return result;
        }
        rotated = true;
    } else if (decide_rotation(file->offset, current.size) == RotationDecision::ResetAndReadFromStart) {
        CollectorLog::log("TailReader", "File shrank (likely truncated), reading from start: " + path);
        if (!reopen(*file, current.inode)) {
            CollectorLog::error("TailReader", "Failed to reopen rotated file: " + path);
            return result;
        }
        rotated = true;
    }
    if (rotated) {
        start = 0;
        file->offset = 0;
        result.rotated = true;
        result.offset = 0;
    }

    if (!seek(*file, start)) {
        return result;
    }

    std::string carry;
    std::uint64_t consumed = read_lines(*file, start, result, carry);

    result.bytes_consumed = drained + (consumed - start);
    file->offset = consumed;
    file->last_size = std::max(current.size, consumed);
    result.offset = consumed;
    result.completed = true;

    if (!carry.empty()) {
        CollectorLog::debug("TailReader", "Holding " + std::to_string(carry.size()) +
                            " bytes of unterminated line in " + path);
    }
    return result;
}

} // namespace log_collector
