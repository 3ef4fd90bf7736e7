#include "bridge/notification_channel.hpp"

namespace notification_channel {

bool NotificationChannel::send(Notification notification) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(notification));
    }
    condition_.notify_one();
    return true;
}

std::optional<Notification> NotificationChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Notification notification = std::move(queue_.front());
    queue_.pop_front();
    return notification;
}

std::optional<Notification> NotificationChannel::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); })) {
        return std::nullopt;
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    Notification notification = std::move(queue_.front());
    queue_.pop_front();
    return notification;
}

void NotificationChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool NotificationChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t NotificationChannel::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace notification_channel
