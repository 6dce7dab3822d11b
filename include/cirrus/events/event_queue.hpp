/**
 * @file event_queue.hpp
 * @brief Blocking FIFO used to hand work between threads
 *
 * The engine uses it for scheduler wake-ups, the bridge for its single
 * stdout writer.
 *
 * EXAMPLE:
 * ThreadSafeQueue<std::string> lines;
 * lines.push("...");           // producer
 * auto line = lines.pop();     // consumer, blocks until available or shutdown
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace cirrus::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - shutdown() wakes every blocked consumer; items already queued are
 *   still handed out before pop() starts returning nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /// Returns false once the queue has been shut down
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front_locked();
    }

    /// Blocks until an item is available or the queue is shut down
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return has_work_locked(); });
        return take_front_locked();
    }

    /// As pop(), giving up after timeout
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return has_work_locked(); });
        return take_front_locked();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    bool has_work_locked() const {
        return closed_ || !items_.empty();
    }

    std::optional<T> take_front_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace cirrus::events
