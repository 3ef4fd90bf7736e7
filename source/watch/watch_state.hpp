#ifndef GDSJAMD_WATCH_STATE_HPP
#define GDSJAMD_WATCH_STATE_HPP

// The single watch target and the watcher(s) serving it.
// Owned by main and handed to command handlers; tests build their own.

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "backend/backend_config.hpp"
#include "bridge/notification_channel.hpp"
#include "watch/debounced_watcher.hpp"

namespace watch_state {

struct WatchResult {
    bool success = false;
    std::string error_message;
};

class WatchState {
public:
    WatchState(backend_config::WatchMode mode,
               std::chrono::milliseconds debounce_window,
               notification_channel::NotificationChannel &channel);

    WatchState(const WatchState &) = delete;
    WatchState &operator=(const WatchState &) = delete;

    // Declare path as the watch target and start a debounced watcher on it.
    // The target stays declared even if the watcher cannot be started.
    WatchResult watch(const std::string &path);

    // Clear the watch target. In replace mode the active watcher is stopped too.
    void unwatch();

    std::optional<std::string> current_target() const;

    // Watchers currently alive (active plus any retained in legacy mode).
    std::size_t live_watcher_count() const;

    backend_config::WatchMode mode() const { return mode_; }

private:
    std::unique_ptr<debounced_watcher::DebouncedWatcher> start_watcher(const std::string &path,
                                                                       std::string &error_message);

    const backend_config::WatchMode mode_;
    const std::chrono::milliseconds debounce_window_;
    notification_channel::NotificationChannel &channel_;

    mutable std::mutex mutex_;
    std::optional<std::filesystem::path> target_;
    std::unique_ptr<debounced_watcher::DebouncedWatcher> active_watcher_;
    // Legacy mode only: superseded watchers that keep running until shutdown.
    std::vector<std::unique_ptr<debounced_watcher::DebouncedWatcher>> retained_watchers_;
};

} // namespace watch_state

#endif // GDSJAMD_WATCH_STATE_HPP
