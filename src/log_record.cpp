#include "log_record.hpp"
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace log_collector {

std::string format_timestamp(Clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    if (nanos.count() < 0) {
        secs -= std::chrono::seconds(1);
        nanos += std::chrono::seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(9) << std::setfill('0') << nanos.count() << 'Z';
    return ss.str();
}

Clock::time_point parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }

    long long nanos = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (digits.empty() || digits.size() > 9) {
            throw std::invalid_argument("Malformed fractional seconds: " + text);
        }
        digits.resize(9, '0');
        nanos = std::stoll(digits);
    }
    if (ss.get() != 'Z') {
        throw std::invalid_argument("Timestamp must be UTC: " + text);
    }

    std::time_t secs = timegm(&tm);
    auto tp = Clock::time_point(std::chrono::seconds(secs));
    return tp + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

std::string service_from_path(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

LogRecord parse_line(const std::string& path, const std::string& line) {
    LogRecord record;
    record.timestamp = Clock::now();
    record.service = service_from_path(path);
    record.message = line;
    return record;
}

LineParser make_line_parser(ServiceLabeler labeler) {
    if (!labeler) {
        return parse_line;
    }
    return [labeler = std::move(labeler)](const std::string& path, const std::string& line) {
        LogRecord record;
        record.timestamp = Clock::now();
        record.service = labeler(path);
        record.message = line;
        return record;
    };
}

} // namespace log_collector
