#include <courier/platform/thread_pool.h>

#include <stdexcept>

namespace courier::platform {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

size_t ThreadPool::size() const {
    return workers_.size();
}

size_t ThreadPool::queued() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

size_t ThreadPool::in_flight() const {
    std::lock_guard lock(mutex_);
    return active_;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::is_running() const {
    return !shutdown_.load();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() {
                return shutdown_.load() || !tasks_.empty();
            });

            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }

        task();

        {
            std::lock_guard lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace courier::platform
