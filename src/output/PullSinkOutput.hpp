/**
 * @file PullSinkOutput.hpp
 * @brief Pull-model output: a free-running stream draining a Sink.
 */

#ifndef DECK_PULL_SINK_OUTPUT_HPP
#define DECK_PULL_SINK_OUTPUT_HPP

#include "OutputBackend.hpp"
#include "Sink.hpp"
#include <memory>

namespace deck {

/**
 * @brief An open driver that renders from a Sink from the moment it starts.
 *
 * The stream is started on construction and keeps running until close();
 * pausing is the Sink's business, not the hardware's.
 */
class OutputStream {
public:
    /**
     * @throws EngineError(DeviceError) if the driver refuses to start.
     */
    OutputStream(std::unique_ptr<hal::AudioDriver> driver, Sink& sink);
    ~OutputStream();

    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    /**
     * @brief Stop the driver and release it. Idempotent.
     */
    void close();

    hal::AudioDriver* driver() { return driver_.get(); }

private:
    std::unique_ptr<hal::AudioDriver> driver_;
};

class PullSinkOutput : public OutputResources {
public:
    explicit PullSinkOutput(std::unique_ptr<hal::AudioDriver> driver);
    ~PullSinkOutput() override;

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

    OutputStream* stream() { return stream_.get(); }

private:
    std::unique_ptr<Sink> sink_;
    std::unique_ptr<OutputStream> stream_;
    int sample_rate_;
    int channels_;
};

} // namespace deck

#endif // DECK_PULL_SINK_OUTPUT_HPP
