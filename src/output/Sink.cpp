#include "Sink.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>

namespace deck {

size_t SamplesSource::read(std::span<float> output) noexcept {
    const size_t count = std::min(output.size(), remaining());
    std::memcpy(output.data(), samples_.data() + position_, count * sizeof(float));
    position_ += count;
    return count;
}

void Sink::append(std::shared_ptr<Source> source) {
    if (!source) return;
    std::deque<std::shared_ptr<Source>> finished;
    {
        std::lock_guard lock(mutex_);
        auto consumed_end = queue_.begin() + static_cast<std::ptrdiff_t>(cursor_);
        std::move(queue_.begin(), consumed_end, std::back_inserter(finished));
        queue_.erase(queue_.begin(), consumed_end);
        cursor_ = 0;
        queue_.push_back(std::move(source));
    }
}

bool Sink::empty() const {
    std::lock_guard lock(mutex_);
    for (size_t i = cursor_; i < queue_.size(); ++i) {
        if (!queue_[i]->exhausted()) return false;
    }
    return true;
}

void Sink::clear() {
    std::deque<std::shared_ptr<Source>> dropped;
    {
        std::lock_guard lock(mutex_);
        dropped.swap(queue_);
        cursor_ = 0;
    }
}

size_t Sink::render(std::span<float> output) noexcept {
    if (paused_.load(std::memory_order_acquire)) {
        std::fill(output.begin(), output.end(), 0.0f);
        return 0;
    }

    std::unique_lock lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::fill(output.begin(), output.end(), 0.0f);
        return 0;
    }

    size_t written = 0;
    while (written < output.size() && cursor_ < queue_.size()) {
        auto& source = queue_[cursor_];
        const size_t count = source->read(output.subspan(written));
        written += count;
        if (source->exhausted()) {
            ++cursor_;
        } else if (count == 0) {
            break; // Source starved, try again next block
        }
    }
    lock.unlock();

    std::fill(output.begin() + static_cast<std::ptrdiff_t>(written), output.end(), 0.0f);
    return written;
}

} // namespace deck
