#pragma once

#include <atomic>
#include <optional>
#include <cstddef>

namespace TickLoop {

/**
 * @class MpscQueue
 * @brief Unbounded lock-free multi-producer / single-consumer FIFO.
 *
 * Intrusive linked list with a stub node (Vyukov). Any number of threads
 * may push concurrently; only one thread may pop. Items come out in the
 * order their producers linked them in, which for worker tasks is their
 * completion order.
 */
template<typename T>
class MpscQueue {
public:
    MpscQueue() : size_(0) {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_.store(stub, std::memory_order_relaxed);
    }

    ~MpscQueue() {
        while (pop().has_value()) {}
        delete head_.load(std::memory_order_relaxed);
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;
    MpscQueue(MpscQueue&&) = delete;
    MpscQueue& operator=(MpscQueue&&) = delete;

    /**
     * @brief Append an item (safe from any thread, never fails)
     */
    void push(T item) {
        Node* node = new Node(std::move(item));

        // Claim the tail slot, then publish the link from the old tail
        Node* prev = tail_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);

        size_.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Remove the oldest item (consumer thread only, never blocks)
     * @return Item if available, std::nullopt if empty
     *
     * A producer that has swapped the tail but not yet linked its node is
     * reported as empty; the item becomes visible on a later call.
     */
    std::optional<T> pop() {
        Node* head = head_.load(std::memory_order_relaxed);
        Node* next = head->next.load(std::memory_order_acquire);

        if (next == nullptr) {
            return std::nullopt;
        }

        // next becomes the new stub
        std::optional<T> item(std::move(*next->data));
        next->data.reset();
        head_.store(next, std::memory_order_relaxed);
        delete head;

        size_.fetch_sub(1, std::memory_order_relaxed);
        return item;
    }

    // Approximate while producers are active
    size_t size() const {
        return size_.load(std::memory_order_relaxed);
    }

    bool empty() const {
        Node* head = head_.load(std::memory_order_relaxed);
        return head->next.load(std::memory_order_acquire) == nullptr;
    }

private:
    struct Node {
        std::optional<T> data;
        std::atomic<Node*> next{nullptr};

        Node() = default;
        explicit Node(T item) : data(std::move(item)) {}
    };

    alignas(64) std::atomic<Node*> head_;  // consumer side
    alignas(64) std::atomic<Node*> tail_;  // producer side
    alignas(64) std::atomic<size_t> size_;
};

} // namespace TickLoop
