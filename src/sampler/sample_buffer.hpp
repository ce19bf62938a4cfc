#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace clockwork::sampler {

// Bounded FIFO that evicts the oldest element when full.
// Capacity is fixed at construction and must be at least one.
template <typename T>
class SampleBuffer {
public:
    explicit SampleBuffer(size_t capacity)
        : slots_(capacity > 0 ? capacity : 1) {}

    // Always succeeds; returns false when the oldest element was evicted.
    bool push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool evicted = false;
        if (count_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --count_;
            ++dropped_;
            evicted = true;
        }
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return !evicted;
    }

    // Oldest element, if any.
    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ == 0) return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
    }

    // Remove and return everything, oldest first.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            out.push_back(std::move(slots_[(head_ + i) % slots_.size()]));
        }
        head_ = 0;
        count_ = 0;
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    bool empty() const { return size() == 0; }
    size_t capacity() const { return slots_.size(); }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<T> slots_;
    size_t head_ = 0;
    size_t count_ = 0;
    size_t dropped_ = 0;
};

} // namespace clockwork::sampler
