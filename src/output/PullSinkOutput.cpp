#include "PullSinkOutput.hpp"
#include "Converter.hpp"
#include "EngineError.hpp"
#include "Logger.hpp"

namespace deck {

OutputStream::OutputStream(std::unique_ptr<hal::AudioDriver> driver, Sink& sink)
    : driver_(std::move(driver))
{
    Sink* target = &sink;
    driver_->set_callback([target](std::span<float> block) {
        const size_t taken = target->render(block);
        if (taken > 0 && taken < block.size()) {
            AudioLogger::instance().log_event("UNDERRUN", static_cast<float>(block.size() - taken));
        }
    });
    if (!driver_->start()) {
        throw EngineError(ErrorKind::DeviceError, "failed to start output stream: " + driver_->last_error());
    }
}

OutputStream::~OutputStream() {
    close();
}

void OutputStream::close() {
    if (!driver_) return;
    driver_->stop();
    driver_.reset();
}

PullSinkOutput::PullSinkOutput(std::unique_ptr<hal::AudioDriver> driver)
    : sink_(std::make_unique<Sink>())
    , sample_rate_(driver->sample_rate())
    , channels_(driver->channels())
{
    stream_ = std::make_unique<OutputStream>(std::move(driver), *sink_);
}

PullSinkOutput::~PullSinkOutput() {
    close();
}

void PullSinkOutput::enqueue(std::vector<float> samples, uint32_t sample_rate, uint16_t channels) {
    if (!sink_) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
    auto converted = convert(samples, sample_rate, channels,
                             static_cast<uint32_t>(sample_rate_), static_cast<uint16_t>(channels_));
    sink_->append(std::make_shared<SamplesSource>(std::move(converted)));
}

void PullSinkOutput::start() {
    // The stream has been running since it was opened
    if (!stream_ || !stream_->driver()) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
}

void PullSinkOutput::play() {
    if (!sink_) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
    sink_->play();
}

void PullSinkOutput::pause() {
    if (sink_) sink_->pause();
}

void PullSinkOutput::stop() {
    if (!sink_) return;
    sink_->pause();
    sink_->clear();
}

void PullSinkOutput::reset() {
    if (!sink_) return;
    sink_->clear();
    sink_->play();
}

bool PullSinkOutput::is_paused() const {
    return sink_ ? sink_->is_paused() : false;
}

bool PullSinkOutput::is_empty() const {
    return sink_ ? sink_->empty() : true;
}

void PullSinkOutput::close() {
    // Stream first: its callback holds a raw pointer into the sink
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
    sink_.reset();
}

} // namespace deck
