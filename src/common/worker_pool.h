#pragma once

/// @file worker_pool.h
/// @brief Fixed-size worker pool used for bounded fan-out

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace evalkit {

/// @brief A fixed set of worker threads draining a FIFO task queue
///
/// At most Size() tasks run at once; everything else waits in the queue.
/// Tasks passed to Execute() must not throw.
class WorkerPool {
public:
    /// @brief Create a pool with the specified number of workers
    /// @param num_workers Number of worker threads (0 = hardware concurrency)
    explicit WorkerPool(size_t num_workers = 0);

    /// @brief Destructor - runs the remaining queue, then joins the workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// @brief Submit a task and get its result through a future
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Queue a task without a result channel
    template <typename F, typename... Args>
    void Execute(F&& f, Args&&... args);

    /// @brief Number of worker threads
    size_t Size() const { return workers_.size(); }

    /// @brief Number of queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Highest number of tasks observed running at the same time
    size_t PeakActive() const { return peak_active_.load(std::memory_order_relaxed); }

    /// @brief Block until the queue is empty and no task is running
    void Wait();

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();
    void Enqueue(std::function<void()> task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    size_t active_tasks_ = 0;  // guarded by mutex_
    std::atomic<size_t> peak_active_{0};
};

// Template implementations

template <typename F, typename... Args>
auto WorkerPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    Enqueue([task]() { (*task)(); });
    return result;
}

template <typename F, typename... Args>
void WorkerPool::Execute(F&& f, Args&&... args) {
    Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
}

}  // namespace evalkit
