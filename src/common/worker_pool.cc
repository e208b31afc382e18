#include "worker_pool.h"
#include <glog/logging.h>

namespace Pushline {

WorkerPool::WorkerPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerThread, this);
    }
    VLOG(3) << "\t[WorkerPool]\t\t" << name_ << " started with " << num_threads << " threads";
}

WorkerPool::~WorkerPool() {
    Stop();
}

size_t WorkerPool::Cancel() {
    std::queue<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(dropped, tasks_);
    }
    if (!dropped.empty()) {
        VLOG(2) << "\t[WorkerPool]\t\t" << name_ << " cancelled " << dropped.size() << " queued task(s)";
    }
    return dropped.size();
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace Pushline
