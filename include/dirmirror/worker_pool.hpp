#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace dirmirror {

enum class TaskPriority {
    Normal,
    High,
};

// Fixed set of threads shared by file transfers (Normal) and the chunk
// downloads they fan out into (High). High-priority tasks are always taken
// first, and a task waiting on its children helps run them instead of
// holding its slot idle, so one pool serves both levels without deadlock.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<std::decay_t<F>>> submit(F&& fn, TaskPriority priority = TaskPriority::Normal) {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); }, priority);
        return future;
    }

    // Runs one queued high-priority task on the calling thread.
    bool runPendingHighPriorityTask();

    // Blocks until every future is ready, running high-priority work meanwhile.
    template <typename T>
    void helpUntilReady(std::vector<std::future<T>>& futures) {
        for (auto& future : futures) {
            while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                if (!runPendingHighPriorityTask()) {
                    future.wait_for(std::chrono::milliseconds(10));
                }
            }
        }
    }

    [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
    void enqueue(std::function<void()> task, TaskPriority priority);
    void workerLoop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> normal_tasks_;
    std::deque<std::function<void()>> high_tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

} // namespace dirmirror
