#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <optional>

namespace core {

/**
 * Single-Producer-Single-Consumer (SPSC) lock-free ring buffer.
 *
 * Connects a connection's reader thread (producer) to its worker thread
 * (consumer). try_push never blocks: a full queue is reported to the caller,
 * which decides what to drop.
 *
 * @tparam T Element type (must be default-constructible and movable)
 * @tparam Depth Number of elements the queue can hold at once
 */
template<typename T, size_t Depth>
class SpscQueue {
    static_assert(Depth > 0, "SpscQueue needs at least one slot");

public:
    SpscQueue() : head_(0), tail_(0) {}

    // Non-copyable
    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Returns false (and leaves item untouched) if the queue is full.
     * Producer thread only.
     */
    bool try_push(T& item) {
        const size_t current_tail = tail_.load(std::memory_order_relaxed);
        const size_t next_tail = (current_tail + 1) % SLOTS;

        if (next_tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[current_tail] = std::move(item);
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    bool try_push(T&& item) { return try_push(item); }

    /**
     * Consumer thread only.
     */
    std::optional<T> try_pop() {
        const size_t current_head = head_.load(std::memory_order_relaxed);

        if (current_head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        T item = std::move(buffer_[current_head]);
        buffer_[current_head] = T{};
        head_.store((current_head + 1) % SLOTS, std::memory_order_release);
        return item;
    }

    /**
     * Consumer thread only. Returns the number of discarded elements.
     */
    size_t clear() {
        size_t dropped = 0;
        while (try_pop()) ++dropped;
        return dropped;
    }

    [[nodiscard]] bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool full() const {
        const size_t next_tail = (tail_.load(std::memory_order_acquire) + 1) % SLOTS;
        return next_tail == head_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        if (tail >= head) return tail - head;
        return SLOTS + tail - head;
    }

    [[nodiscard]] static constexpr size_t capacity() { return Depth; }

private:
    // One slot stays empty to tell full from empty
    static constexpr size_t SLOTS = Depth + 1;
    static constexpr size_t CACHE_LINE_SIZE = 64;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;

    std::array<T, SLOTS> buffer_;
};

} // namespace core
