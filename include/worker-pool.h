// src/native/fusion/include/worker-pool.h
#pragma once

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

/**
 * Fixed-size pool of worker threads draining a FIFO task queue.
 * Destruction finishes queued tasks before joining.
 */
class WorkerPool {
private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable available_;
    bool stopping_ = false;

public:
    /**
     * @param thread_count Number of workers, 0 picks the hardware concurrency
     */
    explicit WorkerPool(size_t thread_count = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Queue a task. Exceptions it throws are delivered through the future.
     */
    template <typename Task>
    std::future<std::invoke_result_t<Task>> submit(Task&& task) {
        using Result = std::invoke_result_t<Task>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
        std::future<Result> future = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("WorkerPool is shutting down");
            }
            tasks_.emplace([packaged]() { (*packaged)(); });
        }
        available_.notify_one();
        return future;
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();
};
