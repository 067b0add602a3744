#include "concurrency/thread_pool.hpp"

namespace uuidpp {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::is_stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !accepting_;
}

void ThreadPool::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        task_ready_.wait(lock, [this] { return !accepting_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            return;
        }

        std::function<void()> task = std::move(tasks_.front());
        tasks_.pop_front();

        // Errors land in the task's future
        lock.unlock();
        task();
        lock.lock();
    }
}

void ThreadPool::shutdown() {
    std::call_once(shutdown_once_, [this] {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accepting_ = false;
        }
        task_ready_.notify_all();

        for (auto& worker : workers_) {
            worker.join();
        }
    });
}

} // namespace uuidpp
