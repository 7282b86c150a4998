#pragma once

#include <atomic>
#include <array>
#include <cstddef>
#include <utility>

namespace loopah {

/// Lock-free single-producer single-consumer queue.
/// Fixed capacity, no dynamic allocation. Used as the command channel from
/// the control side to the render thread.
template <typename T, size_t Capacity>
class SpscQueue {
    static_assert(Capacity > 0, "Capacity must be > 0");

public:
    /// Push an item (producer only).
    /// Returns false if the queue is full.
    bool push(const T& item) {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = (head + 1) % (Capacity + 1);
        if (next == tail_.load(std::memory_order_acquire))
            return false; // full
        buf_[head] = item;
        head_.store(next, std::memory_order_release);
        return true;
    }

    /// Pop an item (consumer only).
    /// The slot is moved from so it does not keep resources alive.
    /// Returns false if the queue is empty.
    bool pop(T& item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false; // empty
        item = std::move(buf_[tail]);
        tail_.store((tail + 1) % (Capacity + 1), std::memory_order_release);
        return true;
    }

    /// Approximate number of queued items (exact from either endpoint's own view)
    size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return (head + Capacity + 1 - tail) % (Capacity + 1);
    }

    bool empty() const { return size() == 0; }

    static constexpr size_t capacity() { return Capacity; }

private:
    std::array<T, Capacity + 1> buf_{};  // one extra slot for full/empty distinction
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace loopah
