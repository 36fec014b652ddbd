/**
 * @file bounded_queue.hpp
 * @brief Fixed-capacity blocking FIFO shared by producers and workers
 *
 * WHY THIS FILE EXISTS:
 * The scheduler hands work units to its pool through this queue. When the
 * pool falls behind, push() blocks the dispatcher instead of letting the
 * backlog grow without bound. The progress channel uses try_push() so a
 * slow reporter can never stall a worker.
 *
 * EXAMPLE:
 * BoundedQueue<Unit> queue(64);
 * queue.push(unit);          // Producer, blocks while full
 * auto unit = queue.pop();   // Consumer, blocks while empty
 * queue.close();             // Wakes everyone, pop() drains then returns nullopt
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace psync {

/**
 * @brief Thread-safe bounded FIFO queue
 *
 * THREAD SAFETY:
 * - Multiple producers and consumers
 * - Producers wait on not_full_, consumers on not_empty_
 * - After close(), push() refuses new items and pop() drains what is left
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push item, waiting for room
     *
     * RETURNS: false if the queue was closed (item dropped)
     * BLOCKS: Yes, while the queue is full
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return items_.size() < capacity_ || closed_;
            });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push item only if there is room right now
     *
     * RETURNS: false when full or closed
     * BLOCKS: No
     */
    bool try_push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !items_.empty() || closed_;
        });
        return take_front(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !items_.empty() || closed_;
        })) {
            return std::nullopt;
        }
        return take_front(lock);
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return items_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_front(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
};

} // namespace psync
