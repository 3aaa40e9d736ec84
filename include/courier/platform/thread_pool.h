#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace courier::platform {

// Fixed set of workers draining a FIFO task queue.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shut down.
    void post(std::function<void()> task);

    // Blocks until the queue is empty and no task is running.
    void wait_idle();

    size_t size() const;
    size_t queued() const;
    size_t in_flight() const;

    // Runs the remaining queued tasks, then joins the workers.
    void shutdown();
    bool is_running() const;

private:
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    std::atomic<bool> shutdown_{false};
};

} // namespace courier::platform
