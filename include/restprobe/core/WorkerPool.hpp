#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace restprobe::core {

// Fixed set of worker threads draining a bounded FIFO. submit() blocks while
// the queue is full so producers cannot run ahead of the workers.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t worker_count, std::size_t queue_capacity = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws std::runtime_error once shutdown() has been called.
    void submit(Task task);

    // Runs every queued task, then joins the workers. Idempotent.
    void shutdown();

    std::size_t worker_count() const noexcept { return worker_count_; }
    std::size_t queue_capacity() const noexcept { return capacity_; }

    static std::size_t default_worker_count();

private:
    void worker_loop();

    std::size_t worker_count_;
    std::size_t capacity_;
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    bool stopping_{false};
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

}  // namespace restprobe::core
