/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO used for event delivery and in-process streams
 *
 * EXAMPLE:
 * ThreadSafeQueue<Event> queue;
 * queue.push(event);         // Producer
 * auto event = queue.pop();  // Consumer (blocks until available)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace ferry::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - After shutdown(), consumers drain what is left and then get nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item to queue
     *
     * RETURNS: false once the queue is shut down (item dropped)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop item (blocking)
     *
     * BLOCKS: Yes, until item available or shutdown
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);

        cv_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop item with timeout
     *
     * RETURNS: Item if available within timeout, nullopt on timeout or shutdown
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);

        if (!cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

    /**
     * @brief Signal shutdown (wake up all waiting threads)
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::unique_lock lock(mutex_);
        shutdown_ = false;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace ferry::events
