#pragma once

#include <atomic>
#include <array>
#include <optional>
#include <cstddef>

namespace core {

/**
 * Single-Producer-Single-Consumer (SPSC) Lock-free Ringbuffer.
 * Carries camera frames from the InputLoop to the FrameLoop, and
 * resolutions from the FrameLoop to the OscSender.
 *
 * Uses std::atomic with acquire/release semantics, no mutexes.
 * One slot is always kept empty, so usable capacity is Capacity - 1.
 *
 * @tparam T Element type (moved in and out)
 * @tparam Capacity Size of the ringbuffer
 */
template<typename T, size_t Capacity>
class SpscQueue {
public:
    SpscQueue() : head_(0), tail_(0) {}

    // Non-copyable
    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Pushes an item. Returns false if the queue is full (caller drops).
     * Producer thread only.
     */
    bool try_push(T item) {
        const size_t current_tail = tail_.load(std::memory_order_relaxed);
        const size_t next_tail = (current_tail + 1) % Capacity;

        if (next_tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[current_tail] = std::move(item);
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    /**
     * Pops the oldest item, std::nullopt if empty.
     * Consumer thread only.
     */
    std::optional<T> try_pop() {
        const size_t current_head = head_.load(std::memory_order_relaxed);

        if (current_head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        T item = std::move(buffer_[current_head]);
        head_.store((current_head + 1) % Capacity, std::memory_order_release);
        return item;
    }

    bool pop_front(T& item) {
        auto val = try_pop();
        if (val) {
            item = std::move(*val);
            return true;
        }
        return false;
    }

    /**
     * Drains the queue and keeps only the newest item.
     * @param item receives the newest item
     * @param skipped number of older items discarded
     * @return false if the queue was empty
     * Consumer thread only.
     */
    bool pop_latest(T& item, size_t& skipped) {
        skipped = 0;
        if (!pop_front(item)) return false;
        T newer;
        while (pop_front(newer)) {
            item = std::move(newer);
            ++skipped;
        }
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        if (tail >= head) return tail - head;
        return Capacity + tail - head;
    }

private:
    // Keep head and tail on separate cache lines
    static constexpr size_t CACHE_LINE_SIZE = 64;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;

    std::array<T, Capacity> buffer_;
};

} // namespace core
