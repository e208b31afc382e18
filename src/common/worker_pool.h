#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace Pushline {

/**
 * Fixed-size thread pool returning std::future results.
 *
 * Used by the remote client for service calls and by stages for per-item
 * work that blocks on those calls. A task must never wait on another task
 * of the same pool.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 4, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Execute callback asynchronously
    template<typename Callback, typename... Args>
    auto ExecuteAsync(Callback&& callback, Args&&... args)
        -> std::future<decltype(callback(args...))> {
        using ReturnType = decltype(callback(args...));

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            [callback = std::forward<Callback>(callback),
             ... args = std::forward<Args>(args)]() mutable {
                return callback(args...);
            }
        );

        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("WorkerPool " + name_ + " is stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return future;
    }

    /// Drops queued tasks; their futures report std::future_error(broken_promise).
    /// Running tasks complete.
    size_t Cancel();

    /// Runs remaining queued tasks, then joins the workers.
    void Stop();

    size_t size() const { return workers_.size(); }
    const std::string& name() const { return name_; }

private:
    void WorkerThread();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

/**
 * Scoped guard for automatic cleanup
 */
class CleanupGuard {
public:
    explicit CleanupGuard(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~CleanupGuard() { if (cleanup_) cleanup_(); }

    // Disable copy
    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

    // Enable move
    CleanupGuard(CleanupGuard&& other) noexcept : cleanup_(std::move(other.cleanup_)) {
        other.cleanup_ = nullptr;
    }

    void Dismiss() { cleanup_ = nullptr; }

private:
    std::function<void()> cleanup_;
};

} // namespace Pushline
