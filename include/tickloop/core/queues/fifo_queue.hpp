#pragma once

#include <deque>
#include <mutex>
#include <optional>

namespace TickLoop {

/**
 * @class FifoQueue
 * @brief Unbounded mutex-guarded FIFO.
 *
 * Oldest in, oldest out. push never fails and pop never blocks.
 */
template<typename T>
class FifoQueue {
public:
    FifoQueue() = default;

    FifoQueue(const FifoQueue&) = delete;
    FifoQueue& operator=(const FifoQueue&) = delete;

    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(item));
    }

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> items_;
};

} // namespace TickLoop
