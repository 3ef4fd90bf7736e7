#ifndef GDSJAMD_DEBOUNCED_WATCHER_HPP
#define GDSJAMD_DEBOUNCED_WATCHER_HPP

// inotify watcher with a debounce window.
// Raw events are buffered on a background thread; once the oldest buffered
// event is a full window old, the buffer is de-duplicated and delivered as
// one batch. The thread wakes every window/4 while events are pending.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace debounced_watcher {

enum class EventKind {
    modify, // contents or metadata written, or the file was moved
    remove, // the watched file was deleted
    other,
};

struct WatchEvent {
    EventKind kind = EventKind::other;
    std::string path;
};

// Called on the watcher thread with each flushed batch. Must not stop the watcher.
using BatchHandler = std::function<void(const std::vector<WatchEvent> &)>;
// Called on the watcher thread for errors reported by inotify itself.
using ErrorHandler = std::function<void(const std::string &)>;

// Map an inotify event mask to an EventKind.
EventKind classify_mask(std::uint32_t mask);

// Collapse repeated (kind, path) pairs, keeping first-seen order.
std::vector<WatchEvent> deduplicate(const std::vector<WatchEvent> &events);

const char *event_kind_name(EventKind kind);

class DebouncedWatcher {
    // Restricts construction to create().
    struct ConstructionKey {};

public:
    struct CreateResult {
        bool success = false;
        std::unique_ptr<DebouncedWatcher> watcher;
        std::string error_message;
    };

    struct WatchResult {
        bool success = false;
        std::string error_message;
    };

    // Open an inotify instance and start the debounce thread.
    static CreateResult create(std::chrono::milliseconds window,
                               BatchHandler on_batch,
                               ErrorHandler on_error);

    DebouncedWatcher(ConstructionKey, int inotify_descriptor, int wake_descriptor,
                     std::chrono::milliseconds window,
                     BatchHandler on_batch, ErrorHandler on_error);
    ~DebouncedWatcher();

    DebouncedWatcher(const DebouncedWatcher &) = delete;
    DebouncedWatcher &operator=(const DebouncedWatcher &) = delete;

    // Watch a single file (non-recursive).
    WatchResult watch(const std::string &path);

    // Stop the thread and drop any pending events. Idempotent.
    void stop();

    bool is_running() const { return running_.load(); }
    std::chrono::milliseconds window() const { return window_; }

private:
    void run_loop();
    void drain_events();
    void flush_if_due(std::chrono::steady_clock::time_point now);

    int inotify_descriptor_;
    int wake_descriptor_;
    std::chrono::milliseconds window_;
    std::chrono::milliseconds tick_;
    BatchHandler on_batch_;
    ErrorHandler on_error_;

    std::mutex descriptors_mutex_;
    std::unordered_map<int, std::string> path_by_descriptor_;

    // Owned by the watcher thread.
    std::vector<WatchEvent> pending_events_;
    std::chrono::steady_clock::time_point first_pending_time_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace debounced_watcher

#endif // GDSJAMD_DEBOUNCED_WATCHER_HPP
