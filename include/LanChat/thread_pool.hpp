#ifndef LANCHAT_THREAD_POOL_HPP
#define LANCHAT_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * Fixed number of worker threads draining a shared task queue.
 *
 * Connection handlers hold a worker for the whole life of their connection,
 * so the worker count is also the number of connections served at once.
 */
class ThreadPool {
public:
    explicit ThreadPool(std::size_t numThreads) {
        if (numThreads == 0) numThreads = 1;
        workers_.reserve(numThreads);
        for (std::size_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false once the pool is shutting down; the task is dropped.
    bool submit(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stop_) return false;
            tasks_.push(std::move(task));
        }
        condition_.notify_one();
        return true;
    }

    // Runs what is already queued, then joins every worker.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stop_) return;
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::size_t pendingTasks() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return tasks_.size();
    }

    std::size_t size() const { return workers_.size(); }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condition_.wait(lock, [this]() {
                    return stop_ || !tasks_.empty();
                });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

#endif // LANCHAT_THREAD_POOL_HPP
