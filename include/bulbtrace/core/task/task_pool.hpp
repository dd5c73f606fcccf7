#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <latch>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace bulbtrace::core {

// Fixed-size thread pool shared by the frame driver and the environment
// prefilter. Tasks observe shutdown via std::stop_token.
class TaskPool {
public:
    using Task = std::function<void(std::stop_token)>;

    TaskPool() = default;
    explicit TaskPool(std::size_t worker_count) { start(worker_count); }
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    ~TaskPool() { shutdown(); }

    void start(std::size_t worker_count);
    // Returns false once shutdown has begun; the task is not run.
    bool submit(Task&& task);
    void shutdown(); // idempotent

    [[nodiscard]] std::size_t worker_count() const noexcept { return threads_.size(); }

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> threads_;
    std::queue<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    bool stopping_ = false;
};

// Process-wide pool, started lazily by parallel_for with one worker per
// hardware thread.
[[nodiscard]] inline TaskPool& global_task_pool() {
    static TaskPool pool{};
    return pool;
}

// Runs body(i) for every i in [0, count) across the pool and blocks until all
// indices are done. Indices are handed out through an atomic counter, so the
// body must only touch state owned by its own index.
template <typename Body>
void parallel_for(TaskPool& pool, std::size_t count, Body&& body) {
    if (count == 0) {
        return;
    }

    pool.start(0); // no-op if already started
    const std::size_t worker_count = std::clamp<std::size_t>(pool.worker_count(), 1, count);

    std::atomic<std::size_t> next{0};
    std::latch done(static_cast<std::ptrdiff_t>(worker_count));

    const auto drain = [&](std::stop_token st) {
        while (!st.stop_requested()) {
            const std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= count) {
                break;
            }
            body(index);
        }
        done.count_down();
    };

    for (std::size_t w = 0; w < worker_count; ++w) {
        if (!pool.submit(drain)) {
            // Pool is shutting down; finish the range on the caller's thread.
            drain(std::stop_token{});
        }
    }

    done.wait();
}

template <typename Body>
void parallel_for(std::size_t count, Body&& body) {
    parallel_for(global_task_pool(), count, std::forward<Body>(body));
}

// ---- Inline implementation ----

inline void TaskPool::start(std::size_t worker_count) {
    std::scoped_lock lock(mutex_);
    if (!threads_.empty() || stopping_) {
        return;
    }
    if (worker_count == 0) {
        const std::size_t hw = std::thread::hardware_concurrency();
        worker_count = hw == 0 ? 1 : hw;
    }

    threads_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        threads_.emplace_back([this](std::stop_token st) { worker_loop(st); });
    }
}

inline bool TaskPool::submit(Task&& task) {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

inline void TaskPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    threads_.clear(); // joins all jthreads
}

inline void TaskPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this]() {
                return stopping_ || !tasks_.empty();
            });
            if (tasks_.empty()) {
                if (stopping_ || stop.stop_requested()) {
                    return;
                }
                continue;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (task) {
            task(stop);
        }
    }
}

} // namespace bulbtrace::core
