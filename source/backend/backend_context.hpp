#ifndef GDSJAMD_BACKEND_CONTEXT_HPP
#define GDSJAMD_BACKEND_CONTEXT_HPP

// Everything a command handler may touch, owned in one place and passed to
// each handler explicitly. Member order matters: watchers hold a reference
// to the channel, so the watch state is destroyed first.

#include <utility>

#include "backend/backend_config.hpp"
#include "bridge/notification_channel.hpp"
#include "dialog/file_dialog.hpp"
#include "watch/watch_state.hpp"

namespace backend_context {

class BackendContext {
public:
    explicit BackendContext(backend_config::BackendConfig config)
        : config_(std::move(config)),
          watch_state_(config_.watch_mode, config_.debounce_window, notifications_) {}

    BackendContext(const BackendContext &) = delete;
    BackendContext &operator=(const BackendContext &) = delete;

    const backend_config::BackendConfig &config() const { return config_; }
    notification_channel::NotificationChannel &notifications() { return notifications_; }
    watch_state::WatchState &watch_state() { return watch_state_; }
    file_dialog::DialogEnvironment &dialog_environment() { return dialog_environment_; }

private:
    backend_config::BackendConfig config_;
    notification_channel::NotificationChannel notifications_;
    watch_state::WatchState watch_state_;
    file_dialog::DialogEnvironment dialog_environment_;
};

} // namespace backend_context

#endif // GDSJAMD_BACKEND_CONTEXT_HPP
