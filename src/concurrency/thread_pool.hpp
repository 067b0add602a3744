#pragma once

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace uuidpp {

// Exception for work submitted after shutdown()
class PoolStoppedError : public std::runtime_error {
public:
    PoolStoppedError()
        : std::runtime_error("Cannot submit task to stopped thread pool") {}
};

/**
 * @brief Fixed set of worker threads for bulk UUID generation.
 *
 * run_chunked() splits an index range into one slice per worker, which is
 * how generate_bulk and the uuidpp --threads option fill their output.
 * submit() queues single tasks. shutdown() finishes queued work, then joins.
 */
class ThreadPool {
public:
    // 0 selects hardware concurrency (at least one worker)
    explicit ThreadPool(size_t num_threads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief Queues f and returns a future for its result.
     * @throws PoolStoppedError if shutdown() has been called
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /**
     * @brief Calls fill(begin, end) over contiguous slices of [0, count).
     *
     * There are min(size(), count) slices, the last one possibly shorter.
     * fill runs concurrently on the workers and must only touch its slice.
     * Returns after every slice finished. The first exception thrown by a
     * slice is rethrown once the others are done.
     *
     * @throws PoolStoppedError if shutdown() has been called
     */
    template<typename F>
    void run_chunked(size_t count, F&& fill);

    // Number of slices run_chunked() uses for count items
    size_t chunk_count(size_t count) const noexcept { return std::min(size(), count); }

    size_t size() const noexcept { return workers_.size(); }

    bool is_stopped() const;

    // Stops accepting tasks, runs what is queued and joins the workers.
    // Safe to call more than once and from several threads.
    void shutdown();

private:
    void worker_loop();

    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;  // Guards tasks_ and accepting_
    std::condition_variable task_ready_;
    std::deque<std::function<void()>> tasks_;
    bool accepting_ = true;

    std::once_flag shutdown_once_;
};

template<typename F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    std::future<Result> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            throw PoolStoppedError();
        }
        tasks_.emplace_back([task]() { (*task)(); });
    }

    task_ready_.notify_one();
    return result;
}

template<typename F>
void ThreadPool::run_chunked(size_t count, F&& fill) {
    if (count == 0) {
        return;
    }

    const size_t chunks = chunk_count(count);
    const size_t chunk_size = (count + chunks - 1) / chunks;

    std::vector<std::future<void>> slices;
    slices.reserve(chunks);

    // Queued slices reference fill and the caller's output, so every one is
    // waited on before this frame unwinds
    try {
        for (size_t begin = 0; begin < count; begin += chunk_size) {
            const size_t end = std::min(begin + chunk_size, count);
            slices.push_back(submit([&fill, begin, end]() { fill(begin, end); }));
        }
    } catch (const PoolStoppedError&) {
        for (auto& slice : slices) {
            slice.wait();
        }
        throw;
    }

    for (auto& slice : slices) {
        slice.wait();
    }
    for (auto& slice : slices) {
        slice.get();
    }
}

} // namespace uuidpp
