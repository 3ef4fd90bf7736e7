#ifndef GDSJAMD_NOTIFICATION_CHANNEL_HPP
#define GDSJAMD_NOTIFICATION_CHANNEL_HPP

// One-way message channel from background contexts (watcher threads) to the
// stdout writer. Producers never touch the transport themselves.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace notification_channel {

// Event name emitted when the watched file is modified.
static const char FILE_CHANGED_EVENT[] = "file-changed";

// An outbound event. Events carry no payload.
struct Notification {
    std::string event;
};

class NotificationChannel {
public:
    NotificationChannel() = default;
    NotificationChannel(const NotificationChannel &) = delete;
    NotificationChannel &operator=(const NotificationChannel &) = delete;

    // Queue a notification. Returns false if the channel is closed.
    bool send(Notification notification);

    // Wait until a notification is available or the channel is closed and drained.
    std::optional<Notification> receive();

    // Like receive(), but gives up after timeout.
    std::optional<Notification> receive_for(std::chrono::milliseconds timeout);

    // Stop accepting notifications and wake all receivers. Queued items can still be received.
    void close();

    bool is_closed() const;
    std::size_t pending_count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Notification> queue_;
    bool closed_ = false;
};

} // namespace notification_channel

#endif // GDSJAMD_NOTIFICATION_CHANNEL_HPP
