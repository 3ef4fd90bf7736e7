#include "bridge/worker_pool.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <string>

namespace worker_pool {

WorkerPool::WorkerPool(std::size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (std::size_t index = 0; index < worker_count; ++index) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!accepting_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    queue_condition_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        accepting_ = false;
    }
    queue_condition_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this]() { return !accepting_ || !queue_.empty(); });

            if (!accepting_ && queue_.empty()) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception &exception) {
            debug_log::error(std::string("worker task threw: ") + exception.what());
        }
    }
}

} // namespace worker_pool
