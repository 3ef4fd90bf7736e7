#include "watch/watch_state.hpp"
#include "utils/debug_log.hpp"
#include "utils/path_text.hpp"

namespace watch_state {

WatchState::WatchState(backend_config::WatchMode mode,
                       std::chrono::milliseconds debounce_window,
                       notification_channel::NotificationChannel &channel)
    : mode_(mode), debounce_window_(debounce_window), channel_(channel) {}

WatchResult WatchState::watch(const std::string &path) {
    WatchResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    target_ = std::filesystem::path(path);

    if (active_watcher_) {
        if (mode_ == backend_config::WatchMode::legacy) {
            retained_watchers_.push_back(std::move(active_watcher_));
        } else {
            active_watcher_->stop();
            active_watcher_.reset();
        }
    }

    std::string error_message;
    active_watcher_ = start_watcher(path, error_message);
    if (!active_watcher_) {
        result.error_message = error_message;
        return result;
    }

    result.success = true;
    return result;
}

void WatchState::unwatch() {
    std::lock_guard<std::mutex> lock(mutex_);
    target_.reset();

    if (mode_ == backend_config::WatchMode::replace && active_watcher_) {
        active_watcher_->stop();
        active_watcher_.reset();
        debug_log::log("Stopped active watcher");
    }
}

std::optional<std::string> WatchState::current_target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_) {
        return std::nullopt;
    }
    return path_text::from_path(*target_);
}

std::size_t WatchState::live_watcher_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = active_watcher_ ? 1 : 0;
    for (const auto &watcher : retained_watchers_) {
        if (watcher->is_running()) {
            count++;
        }
    }
    return count;
}

std::unique_ptr<debounced_watcher::DebouncedWatcher> WatchState::start_watcher(const std::string &path,
                                                                               std::string &error_message) {
    notification_channel::NotificationChannel *channel = &channel_;

    auto on_batch = [channel](const std::vector<debounced_watcher::WatchEvent> &events) {
        for (const auto &event : events) {
            if (event.kind != debounced_watcher::EventKind::modify) {
                debug_log::log(std::string("Ignoring ") + debounced_watcher::event_kind_name(event.kind) +
                               " event on " + event.path);
                continue;
            }
            debug_log::log("File changed: " + event.path);
            if (!channel->send({notification_channel::FILE_CHANGED_EVENT})) {
                debug_log::log("Notification channel closed, dropping file-changed");
            }
        }
    };

    auto on_error = [](const std::string &message) {
        debug_log::error("File watch error: " + message);
    };

    auto created = debounced_watcher::DebouncedWatcher::create(debounce_window_, on_batch, on_error);
    if (!created.success) {
        error_message = created.error_message;
        return nullptr;
    }

    auto attached = created.watcher->watch(path);
    if (!attached.success) {
        error_message = attached.error_message;
        return nullptr;
    }

    return std::move(created.watcher);
}

} // namespace watch_state
