#include "ThreadPool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <pthread.h>
#include <signal.h>

namespace gemini_mcp {

namespace {

// Workers inherit the creating thread's mask; with all signals blocked
// there, SIGINT and SIGTERM land on the thread reading input
class BlockSignalsGuard {
public:
    BlockSignalsGuard() {
        sigset_t all;
        sigfillset(&all);
        pthread_sigmask(SIG_BLOCK, &all, &previous_);
    }

    ~BlockSignalsGuard() {
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    BlockSignalsGuard(const BlockSignalsGuard&) = delete;
    BlockSignalsGuard& operator=(const BlockSignalsGuard&) = delete;

private:
    sigset_t previous_;
};

} // namespace

ThreadPool::ThreadPool(std::size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("Thread pool needs at least one worker");
    }
    BlockSignalsGuard guard;
    for (std::size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    spdlog::debug("Thread pool started with {} workers", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            spdlog::warn("Cannot enqueue task - thread pool is stopped");
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

std::size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("Thread pool shutdown complete");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task threw exception: {}", e.what());
        }
    }
}

} // namespace gemini_mcp
