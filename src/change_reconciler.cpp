#include "change_reconciler.hpp"
#include "collector_log.hpp"

namespace log_collector {

const char* event_action_to_string(EventAction action) {
    switch (action) {
        case EventAction::Dispatched: return "dispatched";
        case EventAction::Coalesced: return "coalesced";
        case EventAction::Ignored: return "ignored";
        case EventAction::DeferredToScan: return "deferred";
        case EventAction::Reported: return "reported";
        default: return "unknown";
    }
}

ChangeReconciler::ChangeReconciler(WatchSet& files, Dispatcher dispatch)
    : files_(files)
    , dispatch_(std::move(dispatch))
{
}

EventAction ChangeReconciler::handle(const FsEvent& event) {
    switch (event.type) {
        case FsEventType::Changed:
            return on_changed(event.path);
        case FsEventType::Created:
            CollectorLog::debug("Reconciler", "New file, waiting for next scan: " + event.path);
            return EventAction::DeferredToScan;
        case FsEventType::Error:
        default:
            CollectorLog::warn("Reconciler", "Notification source error: " + event.message);
            return EventAction::Reported;
    }
}

EventAction ChangeReconciler::on_changed(const std::string& path) {
    auto file = files_.get(path);
    if (!file) {
        // Deletion raced with delivery, or the path was never registered
        CollectorLog::debug("Reconciler", "Write on untracked path ignored: " + path);
        return EventAction::Ignored;
    }

    // The queued pass clears the flag under the file lock before it reads,
    // so everything written up to now is still ahead of it.
    if (file->pass_pending.exchange(true)) {
        return EventAction::Coalesced;
    }

    state_ = ReconcilerState::Dispatching;
    try {
        dispatch_(path);
    } catch (const std::exception& e) {
        file->pass_pending = false;
        state_ = ReconcilerState::Idle;
        CollectorLog::error("Reconciler", "Failed to dispatch pass for " + path + ": " + e.what());
        return EventAction::Ignored;
    }
    state_ = ReconcilerState::Idle;
    return EventAction::Dispatched;
}

} // namespace log_collector
