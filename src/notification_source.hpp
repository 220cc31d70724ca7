#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace log_collector {

enum class FsEventType {
    Changed,    // Content of a subscribed file was written
    Created,    // A new entry appeared in a subscribed directory
    Error       // The source lost events or hit a recoverable fault
};

const char* fs_event_type_to_string(FsEventType type);

struct FsEvent {
    FsEventType type = FsEventType::Changed;
    std::string path;
    std::string message;   // Only set for Error
};

class NotificationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ordered feed of filesystem events for subscribed paths. Delivery may be
// lossy; consumers must not rely on seeing every event.
class NotificationSource {
public:
    virtual ~NotificationSource() = default;

    // Throws NotificationError if the path cannot be watched
    virtual void subscribe(const std::string& path) = 0;
    virtual void unsubscribe(const std::string& path) = 0;

    // Blocks until an event is available. std::nullopt means the feed is
    // closed and no further events will arrive.
    virtual std::optional<FsEvent> next_event() = 0;

    // Wakes a blocked next_event() and ends the feed. Safe to call from any thread.
    virtual void close() = 0;
};

} // namespace log_collector
