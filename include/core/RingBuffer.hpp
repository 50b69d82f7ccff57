#pragma once

#include <array>
#include <cstddef>
#include <utility>

namespace core {

/**
 * Fixed-capacity FIFO ringbuffer for kinematic history.
 *
 * Pushing into a full buffer overwrites the oldest element, so size()
 * never exceeds Capacity. Index 0 is the oldest element, size()-1 the newest.
 *
 * Not thread-safe: owned and accessed by a single tick thread.
 *
 * @tparam T Element type (default-constructible)
 * @tparam Capacity Maximum number of elements
 */
template<typename T, size_t Capacity>
class RingBuffer {
    static_assert(Capacity > 0, "RingBuffer capacity must be positive");

public:
    RingBuffer() = default;

    /**
     * Appends an item, evicting the oldest one when full.
     */
    void push(T item) {
        const size_t tail = (head_ + size_) % Capacity;
        buffer_[tail] = std::move(item);
        if (size_ == Capacity) {
            head_ = (head_ + 1) % Capacity;
        } else {
            ++size_;
        }
    }

    /**
     * Element by recency order, 0 = oldest. Caller checks bounds.
     */
    const T& operator[](size_t index) const {
        return buffer_[(head_ + index) % Capacity];
    }

    const T& front() const { return (*this)[0]; }
    const T& back() const { return (*this)[size_ - 1]; }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == Capacity; }
    static constexpr size_t capacity() { return Capacity; }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::array<T, Capacity> buffer_{};
    size_t head_ = 0;
    size_t size_ = 0;
};

} // namespace core
