#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxplay::utils {

// Single-producer single-consumer lock-free ring of samples.
// Indices grow monotonically; only their difference is wrapped, so
// read_index()/write_index() double as absolute sample counters.
// push() is producer-only, pop()/discard_until() are consumer-only.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity == 0 ? 1 : capacity), capacity_(capacity == 0 ? 1 : capacity) {}

    size_t capacity() const { return this->capacity_; }

    // Returns samples actually written.
    size_t push(const T* data, size_t n) {
        size_t head = this->head_.load(std::memory_order_relaxed);
        size_t tail = this->tail_.load(std::memory_order_acquire);
        size_t free_space = this->capacity_ - (head - tail);
        size_t to_write = n < free_space ? n : free_space;
        for (size_t i = 0; i < to_write; ++i) {
            this->buffer_[(head + i) % this->capacity_] = data[i];
        }
        this->head_.store(head + to_write, std::memory_order_release);
        return to_write;
    }

    // Returns samples actually read. Never allocates or blocks.
    size_t pop(T* out, size_t n) {
        size_t tail = this->tail_.load(std::memory_order_relaxed);
        size_t head = this->head_.load(std::memory_order_acquire);
        size_t available = head - tail;
        size_t to_read = n < available ? n : available;
        for (size_t i = 0; i < to_read; ++i) {
            out[i] = this->buffer_[(tail + i) % this->capacity_];
        }
        this->tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    // Skips everything written before `index`. Clamped to the write index.
    void discard_until(size_t index) {
        size_t tail = this->tail_.load(std::memory_order_relaxed);
        size_t head = this->head_.load(std::memory_order_acquire);
        if (index > head) index = head;
        if (index > tail) {
            this->tail_.store(index, std::memory_order_release);
        }
    }

    size_t size() const {
        size_t head = this->head_.load(std::memory_order_acquire);
        size_t tail = this->tail_.load(std::memory_order_acquire);
        return head - tail;
    }

    size_t free_space() const { return this->capacity_ - this->size(); }

    size_t read_index() const { return this->tail_.load(std::memory_order_acquire); }
    size_t write_index() const { return this->head_.load(std::memory_order_acquire); }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

using RingBufferI16 = RingBuffer<int16_t>;

} // namespace voxplay::utils
