#include "SharedBuffer.hpp"
#include <algorithm>
#include <bit>
#include <cstring>

namespace deck {

SharedBuffer::SharedBuffer(size_t initial_capacity)
    : storage_(initial_capacity ? std::bit_ceil(initial_capacity) : 0, 0.0f)
{
}

void SharedBuffer::push(std::span<const float> samples) {
    if (samples.empty()) return;

    std::vector<float> grown;
    for (;;) {
        size_t required = 0;
        {
            std::lock_guard lock(mutex_);
            required = count_ + samples.size();
            if (required <= storage_.size()) {
                write_locked(samples);
                return;
            }
            if (grown.size() >= required) {
                copy_out_locked(grown.data(), count_);
                storage_.swap(grown);
                head_ = 0;
                write_locked(samples);
                break;
            }
        }
        grown.assign(std::bit_ceil(required), 0.0f);
    }
    // `grown` now holds the old storage and is released here, unlocked
}

size_t SharedBuffer::drain(std::span<float> output) noexcept {
    if (paused_.load(std::memory_order_acquire)) {
        std::fill(output.begin(), output.end(), 0.0f);
        return 0;
    }

    std::unique_lock lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::fill(output.begin(), output.end(), 0.0f);
        return 0;
    }

    const size_t taken = std::min(count_, output.size());
    if (taken > 0) {
        copy_out_locked(output.data(), taken);
        head_ = (head_ + taken) % storage_.size();
        count_ -= taken;
    }
    lock.unlock();

    std::fill(output.begin() + static_cast<std::ptrdiff_t>(taken), output.end(), 0.0f);
    return taken;
}

void SharedBuffer::clear() {
    std::lock_guard lock(mutex_);
    head_ = 0;
    count_ = 0;
}

size_t SharedBuffer::size() const {
    std::lock_guard lock(mutex_);
    return count_;
}

size_t SharedBuffer::capacity() const {
    std::lock_guard lock(mutex_);
    return storage_.size();
}

void SharedBuffer::write_locked(std::span<const float> samples) {
    const size_t cap = storage_.size();
    const size_t tail = (head_ + count_) % cap;
    const size_t first = std::min(samples.size(), cap - tail);
    std::memcpy(storage_.data() + tail, samples.data(), first * sizeof(float));
    std::memcpy(storage_.data(), samples.data() + first, (samples.size() - first) * sizeof(float));
    count_ += samples.size();
}

void SharedBuffer::copy_out_locked(float* destination, size_t count) const {
    if (count == 0) return;
    const size_t cap = storage_.size();
    const size_t first = std::min(count, cap - head_);
    std::memcpy(destination, storage_.data() + head_, first * sizeof(float));
    std::memcpy(destination + first, storage_.data(), (count - first) * sizeof(float));
}

} // namespace deck
