#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace core {

/**
 * Fixed-capacity history buffer. Pushing into a full buffer evicts the
 * oldest element. Index 0 is the oldest element, size() - 1 the newest.
 * Not thread-safe; owned by a single connection worker.
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : storage_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be > 0");
        }
    }

    void push(T value) {
        const size_t slot = (start_ + size_) % storage_.size();
        storage_[slot] = std::move(value);
        if (size_ < storage_.size()) {
            ++size_;
        } else {
            start_ = (start_ + 1) % storage_.size();
        }
    }

    void clear() {
        start_ = 0;
        size_ = 0;
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t capacity() const { return storage_.size(); }
    [[nodiscard]] bool empty() const { return size_ == 0; }
    [[nodiscard]] bool full() const { return size_ == storage_.size(); }

    const T& operator[](size_t index) const {
        return storage_[(start_ + index) % storage_.size()];
    }

    const T& at(size_t index) const {
        if (index >= size_) throw std::out_of_range("RingBuffer index");
        return (*this)[index];
    }

    const T& newest() const { return at(size_ - 1); }
    const T& oldest() const { return at(0); }

private:
    std::vector<T> storage_;
    size_t start_ = 0;
    size_t size_ = 0;
};

} // namespace core
