#ifndef GDSJAMD_WORKER_POOL_HPP
#define GDSJAMD_WORKER_POOL_HPP

// Fixed-size pool that runs each incoming request as an independent task,
// so a blocking command (the file dialog) holds up only its own worker.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace worker_pool {

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t worker_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Queue a task. Returns false once shutdown() has been called.
    bool submit(Task task);

    // Stop accepting tasks, finish the queued ones, and join all workers.
    void shutdown();

    std::size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::deque<Task> queue_;
    bool accepting_ = true;
    std::vector<std::thread> workers_;
};

} // namespace worker_pool

#endif // GDSJAMD_WORKER_POOL_HPP
