#pragma once

/** \file result_channel.hpp
 *  \brief Unbounded multi-producer queue delivering worker results to one consumer.
 */

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace photolens::pipeline {

template<typename T>
class result_channel {
public:
    auto push(T value) -> void {
        {
            std::lock_guard<std::mutex> lock(mu_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    /** \brief Block until an item is available. */
    auto pop() -> T {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        T v = std::move(items_.front());
        items_.pop_front();
        return v;
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

} // namespace photolens::pipeline
