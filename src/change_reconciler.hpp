#pragma once

#include "notification_source.hpp"
#include "watch_set.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace log_collector {

enum class ReconcilerState {
    Idle,
    Dispatching
};

// What handle() did with an event
enum class EventAction {
    Dispatched,       // A tail pass was queued for the path
    Coalesced,        // A queued pass for the path had not started yet; it covers this write
    Ignored,          // Write on an untracked path
    DeferredToScan,   // Create event; the periodic scan registers the file
    Reported          // Source error, logged
};

const char* event_action_to_string(EventAction action);

// Maps notification events to tail passes. Dispatch is fire-and-forget:
// handle() never waits for a pass to run.
class ChangeReconciler {
public:
    // Queues a tail pass for the path on some executor; may throw if the
    // executor no longer accepts work.
    using Dispatcher = std::function<void(const std::string& path)>;

    ChangeReconciler(WatchSet& files, Dispatcher dispatch);

    EventAction handle(const FsEvent& event);

    ReconcilerState state() const { return state_; }

private:
    EventAction on_changed(const std::string& path);

    WatchSet& files_;
    Dispatcher dispatch_;
    std::atomic<ReconcilerState> state_{ReconcilerState::Idle};
};

} // namespace log_collector
