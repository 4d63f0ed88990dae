#pragma once

/** \file worker_pool.hpp
 *  \brief Fixed-size FIFO worker pool with a run-scoped lifetime.
 *
 * The pool is created for one indexing run and joined when destroyed. Its size
 * never changes; it is the only concurrency bound on remote calls.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__APPLE__) || defined(__linux__)
#include <pthread.h>
#endif

namespace photolens::pipeline {

class WorkerPool {
public:
    /** \brief Start num_threads workers (0 = hardware concurrency). */
    explicit WorkerPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** \brief Queue a task.
     *
     * \throws std::runtime_error once the pool is being destroyed
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<decltype(func())> {
        using return_type = decltype(func());

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("worker pool is stopped");
            }
            pending_.fetch_add(1, std::memory_order_relaxed);
            tasks_.emplace_back([this, task] {
                (*task)();
                auto rem = pending_.fetch_sub(1, std::memory_order_relaxed) - 1;
                if (rem == 0) {
                    std::unique_lock<std::mutex> lk(queue_mutex_);
                    cv_.notify_all();
                }
            });
        }
        cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t { return workers_.size(); }

    /** \brief Block until every submitted task has finished. */
    auto wait_all() -> void {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        cv_.wait(lock, [this] { return pending_.load(std::memory_order_relaxed) == 0; });
    }

private:
    auto worker_loop() -> void {
#if defined(__APPLE__)
        pthread_setname_np("photolens-work");
#elif defined(__linux__)
        pthread_setname_np(pthread_self(), "photolens-work");
#endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::atomic<std::size_t> pending_{0};
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_;
};

} // namespace photolens::pipeline
