#include "watch/debounced_watcher.hpp"
#include "utils/debug_log.hpp"

#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <exception>

namespace debounced_watcher {

// IN_CLOSE_WRITE is left out: closing a writable descriptor is not a change.
static constexpr std::uint32_t WATCH_MASK = IN_MODIFY | IN_ATTRIB | IN_MOVE_SELF | IN_DELETE_SELF;

static constexpr size_t EVENT_BUFFER_SIZE = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

EventKind classify_mask(std::uint32_t mask) {
    if (mask & (IN_MODIFY | IN_ATTRIB | IN_MOVE_SELF)) {
        return EventKind::modify;
    }
    if (mask & IN_DELETE_SELF) {
        return EventKind::remove;
    }
    return EventKind::other;
}

std::vector<WatchEvent> deduplicate(const std::vector<WatchEvent> &events) {
    std::vector<WatchEvent> unique_events;
    for (const auto &event : events) {
        auto existing = std::find_if(unique_events.begin(), unique_events.end(), [&](const WatchEvent &candidate) {
            return candidate.kind == event.kind && candidate.path == event.path;
        });
        if (existing == unique_events.end()) {
            unique_events.push_back(event);
        }
    }
    return unique_events;
}

const char *event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::modify:
            return "modify";
        case EventKind::remove:
            return "remove";
        case EventKind::other:
            return "other";
    }
    return "unknown";
}

DebouncedWatcher::CreateResult DebouncedWatcher::create(std::chrono::milliseconds window,
                                                        BatchHandler on_batch,
                                                        ErrorHandler on_error) {
    CreateResult result;

    int inotify_descriptor = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_descriptor < 0) {
        result.error_message = "Failed to create file watcher: inotify_init1: " + std::string(strerror(errno));
        return result;
    }

    int wake_descriptor = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_descriptor < 0) {
        result.error_message = "Failed to create file watcher: eventfd: " + std::string(strerror(errno));
        close(inotify_descriptor);
        return result;
    }

    result.watcher = std::make_unique<DebouncedWatcher>(ConstructionKey{}, inotify_descriptor, wake_descriptor,
                                                        window, std::move(on_batch), std::move(on_error));
    result.watcher->running_ = true;
    result.watcher->thread_ = std::thread(&DebouncedWatcher::run_loop, result.watcher.get());
    result.success = true;
    return result;
}

DebouncedWatcher::DebouncedWatcher(ConstructionKey, int inotify_descriptor, int wake_descriptor,
                                   std::chrono::milliseconds window,
                                   BatchHandler on_batch, ErrorHandler on_error)
    : inotify_descriptor_(inotify_descriptor),
      wake_descriptor_(wake_descriptor),
      window_(window),
      tick_(std::max(window / 4, std::chrono::milliseconds(1))),
      on_batch_(std::move(on_batch)),
      on_error_(std::move(on_error)) {}

DebouncedWatcher::~DebouncedWatcher() {
    stop();
    close(wake_descriptor_);
    close(inotify_descriptor_);
}

DebouncedWatcher::WatchResult DebouncedWatcher::watch(const std::string &path) {
    WatchResult result;

    int watch_descriptor = inotify_add_watch(inotify_descriptor_, path.c_str(), WATCH_MASK);
    if (watch_descriptor < 0) {
        result.error_message = "Failed to watch file: " + std::string(strerror(errno)) + " (" + path + ")";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(descriptors_mutex_);
        path_by_descriptor_[watch_descriptor] = path;
    }

    debug_log::log("Watching " + path + " (debounce " + std::to_string(window_.count()) + " ms)");
    result.success = true;
    return result;
}

void DebouncedWatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::uint64_t wake_value = 1;
    if (write(wake_descriptor_, &wake_value, sizeof(wake_value)) < 0) {
        debug_log::log("eventfd wake write failed: " + std::string(strerror(errno)));
    }

    if (thread_.joinable()) {
        thread_.join();
    }
}

void DebouncedWatcher::run_loop() {
    while (running_.load()) {
        struct pollfd poll_descriptors[2];
        poll_descriptors[0].fd = inotify_descriptor_;
        poll_descriptors[0].events = POLLIN;
        poll_descriptors[0].revents = 0;
        poll_descriptors[1].fd = wake_descriptor_;
        poll_descriptors[1].events = POLLIN;
        poll_descriptors[1].revents = 0;

        // Block indefinitely while idle; tick while a batch is pending.
        int timeout_milliseconds = pending_events_.empty() ? -1 : static_cast<int>(tick_.count());
        int ready_count = poll(poll_descriptors, 2, timeout_milliseconds);

        if (ready_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            on_error_("poll on watch descriptor failed: " + std::string(strerror(errno)));
            break;
        }

        if (!running_.load()) {
            break;
        }

        if (poll_descriptors[0].revents & POLLIN) {
            drain_events();
        }

        flush_if_due(std::chrono::steady_clock::now());
    }

    pending_events_.clear();
}

void DebouncedWatcher::drain_events() {
    alignas(struct inotify_event) char buffer[EVENT_BUFFER_SIZE];

    while (true) {
        ssize_t length = read(inotify_descriptor_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                on_error_("reading watch events failed: " + std::string(strerror(errno)));
            }
            return;
        }
        if (length == 0) {
            return;
        }

        ssize_t offset = 0;
        while (offset < length) {
            const struct inotify_event *event = reinterpret_cast<const struct inotify_event *>(buffer + offset);
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);

            if (event->mask & IN_Q_OVERFLOW) {
                on_error_("watch event queue overflowed, some events were lost");
                continue;
            }

            std::string path;
            {
                std::lock_guard<std::mutex> lock(descriptors_mutex_);
                auto found = path_by_descriptor_.find(event->wd);
                if (found == path_by_descriptor_.end()) {
                    continue;
                }
                path = found->second;
                if (event->mask & IN_IGNORED) {
                    path_by_descriptor_.erase(found);
                }
            }

            if (event->mask & IN_IGNORED) {
                debug_log::log("Watch on " + path + " was removed by the kernel");
                continue;
            }

            if (event->len > 0) {
                path += "/";
                path += event->name;
            }

            if (pending_events_.empty()) {
                first_pending_time_ = std::chrono::steady_clock::now();
            }
            pending_events_.push_back(WatchEvent{classify_mask(event->mask), path});
        }
    }
}

void DebouncedWatcher::flush_if_due(std::chrono::steady_clock::time_point now) {
    if (pending_events_.empty() || now - first_pending_time_ < window_) {
        return;
    }

    std::vector<WatchEvent> batch = deduplicate(pending_events_);
    pending_events_.clear();

    debug_log::log("Flushing " + std::to_string(batch.size()) + " debounced watch event(s)");
    try {
        on_batch_(batch);
    } catch (const std::exception &exception) {
        debug_log::error(std::string("watch batch handler threw: ") + exception.what());
    }
}

} // namespace debounced_watcher
