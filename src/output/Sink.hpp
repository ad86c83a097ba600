/**
 * @file Sink.hpp
 * @brief Pull-model playback queue: sources appended by the engine, read by the stream.
 */

#ifndef DECK_SINK_HPP
#define DECK_SINK_HPP

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace deck {

/**
 * @brief A finite piece of audio already in the stream's format.
 */
class Source {
public:
    virtual ~Source() = default;

    /**
     * @brief Copy up to output.size() interleaved samples. RT-safe.
     * @return Number of samples written.
     */
    virtual size_t read(std::span<float> output) noexcept = 0;

    virtual bool exhausted() const noexcept = 0;
};

/**
 * @brief Source over an owned, pre-converted sample vector.
 */
class SamplesSource : public Source {
public:
    explicit SamplesSource(std::vector<float> samples)
        : samples_(std::move(samples))
    {
    }

    size_t read(std::span<float> output) noexcept override;
    bool exhausted() const noexcept override { return position_ >= samples_.size(); }

    size_t remaining() const noexcept { return samples_.size() - position_; }

private:
    std::vector<float> samples_;
    size_t position_ = 0;
};

/**
 * @brief FIFO of sources played back to back, with pause.
 *
 * render() runs on the stream's thread and only try-locks. Finished sources
 * are not freed there: render() advances a cursor, and the engine thread
 * compacts the queue on its next append() or clear().
 */
class Sink {
public:
    void append(std::shared_ptr<Source> source);

    void play() noexcept { paused_.store(false, std::memory_order_release); }
    void pause() noexcept { paused_.store(true, std::memory_order_release); }
    bool is_paused() const noexcept { return paused_.load(std::memory_order_acquire); }

    /**
     * @brief True once every queued source has been read to the end.
     */
    bool empty() const;

    /**
     * @brief Drop every queued source.
     */
    void clear();

    /**
     * @brief Fill `output` from the queue; silence when paused, contended or dry. RT-safe.
     * @return Number of samples taken from sources.
     */
    size_t render(std::span<float> output) noexcept;

private:
    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<Source>> queue_;
    size_t cursor_ = 0; // First source not yet exhausted
    std::atomic<bool> paused_{false};
};

} // namespace deck

#endif // DECK_SINK_HPP
