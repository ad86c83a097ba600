/**
 * @file PushRingOutput.hpp
 * @brief Push-model output: a render callback draining a SharedBuffer.
 */

#ifndef DECK_PUSH_RING_OUTPUT_HPP
#define DECK_PUSH_RING_OUTPUT_HPP

#include "OutputBackend.hpp"
#include "SharedBuffer.hpp"
#include <memory>

namespace deck {

/**
 * @brief Open hardware unit plus the ring its callback drains.
 *
 * The unit is opened stopped and started by the first start(). pause() only
 * raises the buffer's pause flag; the unit keeps running and renders silence,
 * so resuming never reopens the device.
 */
class PushRingOutput : public OutputResources {
public:
    explicit PushRingOutput(std::unique_ptr<hal::AudioDriver> driver);
    ~PushRingOutput() override;

    void enqueue(std::vector<float> samples, uint32_t sample_rate, uint16_t channels) override;
    void start() override;
    void play() override;
    void pause() override;
    void stop() override;
    void reset() override;
    bool is_paused() const override;
    bool is_empty() const override;
    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }
    void close() override;

    hal::AudioDriver* driver() { return driver_.get(); }
    SharedBuffer* buffer() { return buffer_.get(); }

private:
    std::unique_ptr<SharedBuffer> buffer_;
    std::unique_ptr<hal::AudioDriver> driver_;
    int sample_rate_;
    int channels_;
};

} // namespace deck

#endif // DECK_PUSH_RING_OUTPUT_HPP
