#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <atomic>

namespace core {

// Single-producer single-consumer ring buffer for int16_t samples.
// The consumer side can look ahead (peek) before it commits (discard),
// which is what overlapping analysis windows need.
class RingBufferI16 {
public:
    explicit RingBufferI16(size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    size_t capacity() const { return capacity_; }

    // Push up to n samples, returns samples actually written.
    size_t push(const int16_t* data, size_t n) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t tail = tail_.load(std::memory_order_acquire);
        size_t free_space = capacity_ - (head - tail);
        size_t to_write = n < free_space ? n : free_space;
        for (size_t i = 0; i < to_write; ++i) {
            buffer_[(head + i) % capacity_] = data[i];
        }
        head_.store(head + to_write, std::memory_order_release);
        return to_write;
    }

    // Copy up to n samples without consuming them.
    size_t peek(int16_t* out, size_t n) const {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);
        size_t available = head - tail;
        size_t to_read = n < available ? n : available;
        for (size_t i = 0; i < to_read; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        return to_read;
    }

    // Drop up to n samples from the read side.
    size_t discard(size_t n) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);
        size_t available = head - tail;
        size_t dropped = n < available ? n : available;
        tail_.store(tail + dropped, std::memory_order_release);
        return dropped;
    }

    // Pop up to n samples, returns samples actually read.
    size_t pop(int16_t* out, size_t n) {
        size_t read = peek(out, n);
        discard(read);
        return read;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return head - tail;
    }

    // Not safe against a concurrent producer.
    void clear() {
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
};

} // namespace core
