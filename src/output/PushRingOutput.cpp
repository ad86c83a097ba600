#include "PushRingOutput.hpp"
#include "Converter.hpp"
#include "EngineError.hpp"
#include "Logger.hpp"

namespace deck {

PushRingOutput::PushRingOutput(std::unique_ptr<hal::AudioDriver> driver)
    : driver_(std::move(driver))
    , sample_rate_(driver_->sample_rate())
    , channels_(driver_->channels())
{
    // One second of headroom before the first growth
    buffer_ = std::make_unique<SharedBuffer>(static_cast<size_t>(sample_rate_ * channels_));

    SharedBuffer* ring = buffer_.get();
    driver_->set_callback([ring](std::span<float> block) {
        const size_t taken = ring->drain(block);
        if (taken > 0 && taken < block.size()) {
            AudioLogger::instance().log_event("UNDERRUN", static_cast<float>(block.size() - taken));
        }
    });
}

PushRingOutput::~PushRingOutput() {
    close();
}

void PushRingOutput::enqueue(std::vector<float> samples, uint32_t sample_rate, uint16_t channels) {
    if (!buffer_) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
    const auto converted = convert(samples, sample_rate, channels,
                                   static_cast<uint32_t>(sample_rate_), static_cast<uint16_t>(channels_));
    buffer_->push(converted);
}

void PushRingOutput::start() {
    if (!driver_) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
    if (!driver_->is_running() && !driver_->start()) {
        throw EngineError(ErrorKind::DeviceError, "failed to start output unit: " + driver_->last_error());
    }
}

void PushRingOutput::play() {
    if (!buffer_) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
    buffer_->set_paused(false);
}

void PushRingOutput::pause() {
    if (buffer_) buffer_->set_paused(true);
}

void PushRingOutput::stop() {
    if (!buffer_) return;
    buffer_->set_paused(true);
    buffer_->clear();
}

void PushRingOutput::reset() {
    if (!buffer_) return;
    buffer_->clear();
    buffer_->set_paused(false);
}

bool PushRingOutput::is_paused() const {
    return buffer_ ? buffer_->is_paused() : false;
}

bool PushRingOutput::is_empty() const {
    return buffer_ ? buffer_->empty() : true;
}

void PushRingOutput::close() {
    // The callback reads the ring through a raw pointer: stop the unit first
    if (driver_) {
        driver_->stop();
        driver_.reset();
    }
    buffer_.reset();
}

} // namespace deck
