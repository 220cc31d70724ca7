#include "notification_source.hpp"

namespace log_collector {

const char* fs_event_type_to_string(FsEventType type) {
    switch (type) {
        case FsEventType::Changed: return "changed";
        case FsEventType::Created: return "created";
        case FsEventType::Error: return "error";
        default: return "unknown";
    }
}

} // namespace log_collector
