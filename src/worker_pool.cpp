#include "dirmirror/worker_pool.hpp"

#include <algorithm>

namespace dirmirror {

WorkerPool::WorkerPool(std::size_t thread_count) {
    const std::size_t count = std::max<std::size_t>(1, thread_count);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

bool WorkerPool::runPendingHighPriorityTask() {
    std::function<void()> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (high_tasks_.empty()) {
            return false;
        }
        task = std::move(high_tasks_.front());
        high_tasks_.pop_front();
    }
    task();
    return true;
}

void WorkerPool::enqueue(std::function<void()> task, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (priority == TaskPriority::High) {
            high_tasks_.push_back(std::move(task));
        } else {
            normal_tasks_.push_back(std::move(task));
        }
    }
    cv_.notify_one();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !high_tasks_.empty() || !normal_tasks_.empty(); });

            // Queued work is drained before the threads exit.
            if (!high_tasks_.empty()) {
                task = std::move(high_tasks_.front());
                high_tasks_.pop_front();
            } else if (!normal_tasks_.empty()) {
                task = std::move(normal_tasks_.front());
                normal_tasks_.pop_front();
            } else {
                return;
            }
        }
        task();
    }
}

} // namespace dirmirror
