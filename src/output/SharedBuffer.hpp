/**
 * @file SharedBuffer.hpp
 * @brief Sample FIFO shared between the engine thread and a render callback.
 */

#ifndef DECK_SHARED_BUFFER_HPP
#define DECK_SHARED_BUFFER_HPP

#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

namespace deck {

/**
 * @brief Growable ring of interleaved float samples plus a pause flag.
 *
 * Producer: the engine thread (push, clear). Consumer: the hardware render
 * callback (drain). The consumer only ever try-locks, so it never waits on the
 * producer; a contended or empty drain renders silence. The pause flag is an
 * atomic read before the lock is touched.
 */
class SharedBuffer {
public:
    explicit SharedBuffer(size_t initial_capacity = 0);

    SharedBuffer(const SharedBuffer&) = delete;
    SharedBuffer& operator=(const SharedBuffer&) = delete;

    /**
     * @brief Append samples in FIFO order.
     *
     * Growth allocates outside the lock; the previous storage is released
     * after the lock is dropped.
     */
    void push(std::span<const float> samples);

    /**
     * @brief Fill `output` from the front of the ring. RT-safe.
     *
     * Paused, contended or short reads zero-fill the rest of `output`.
     * @return Number of samples taken from the ring.
     */
    size_t drain(std::span<float> output) noexcept;

    void clear();

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t capacity() const;

    void set_paused(bool paused) noexcept { paused_.store(paused, std::memory_order_release); }
    bool is_paused() const noexcept { return paused_.load(std::memory_order_acquire); }

private:
    void write_locked(std::span<const float> samples);
    void copy_out_locked(float* destination, size_t count) const;

    mutable std::mutex mutex_;
    std::vector<float> storage_;
    size_t head_ = 0;
    size_t count_ = 0;
    std::atomic<bool> paused_{false};
};

} // namespace deck

#endif // DECK_SHARED_BUFFER_HPP
