#include "restprobe/core/WorkerPool.hpp"

#include "restprobe/log/StructuredLogger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace restprobe::core {

WorkerPool::WorkerPool(std::size_t worker_count, std::size_t queue_capacity)
    : worker_count_(std::max<std::size_t>(worker_count, 1)),
      capacity_(queue_capacity > 0 ? queue_capacity : worker_count_ * 2) {
    workers_.reserve(worker_count_);
    try {
        for (std::size_t i = 0; i < worker_count_; ++i) {
            workers_.emplace_back(&WorkerPool::worker_loop, this);
        }
    } catch (...) {
        shutdown();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Task task) {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [this] { return stopping_ || queue_.size() < capacity_; });
    if (stopping_) {
        throw std::runtime_error("WorkerPool is shut down");
    }
    queue_.push_back(std::move(task));
    lock.unlock();
    not_empty_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t WorkerPool::default_worker_count() {
    const auto hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : static_cast<std::size_t>(hardware);
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();

        try {
            task();
        } catch (const std::exception& ex) {
            log::StructuredLogger::instance().error("worker_task_failed", {{"error", ex.what()}});
        } catch (...) {
            log::StructuredLogger::instance().error("worker_task_failed", {{"error", "unknown exception"}});
        }
    }
}

}  // namespace restprobe::core
