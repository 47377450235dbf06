#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gemini_mcp {

/**
 * @brief Fixed-size worker pool for concurrent tool calls
 *
 * Tasks are run in FIFO order. shutdown() lets queued tasks finish
 * before joining the workers.
 */
class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task
     * @return false if the pool is already shut down
     */
    bool enqueue(std::function<void()> task);

    std::size_t size() const { return threads_.size(); }

    std::size_t pending() const;

    /**
     * @brief Drain the queue and join all workers (idempotent)
     */
    void shutdown();

private:
    void worker();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace gemini_mcp
