/**
 * @file thread_safe_queue.hpp
 * @brief Blocking FIFO shared between the executor's worker threads
 *
 * EXAMPLE:
 * ThreadSafeQueue<std::filesystem::path> queue;
 * queue.push(path);          // Producer
 * queue.close();             // No more work
 * auto next = queue.pop();   // Worker (nullopt once closed and drained)
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace mx {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - pop() blocks on a condition variable until an item or close()
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Pop item (blocking)
     *
     * BLOCKS: Until an item is available or the queue is closed.
     * Items pushed before close() are still handed out.
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);

        cv_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Mark the queue as complete and wake all waiting consumers
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace mx
