#include "NullDriver.hpp"
#include "EngineError.hpp"
#include <algorithm>
#include <chrono>

namespace deck::hal {

NullDriver::NullDriver(const StreamFormat& format, bool realtime)
    : format_(format)
    , realtime_(realtime)
    , running_(false)
    , frames_rendered_(0)
{
}

NullDriver::~NullDriver() {
    stop();
}

void NullDriver::set_callback(RenderCallback callback) {
    callback_ = std::move(callback);
}

bool NullDriver::start() {
    if (running_) return true;
    running_ = true;
    if (realtime_) {
        processing_thread_ = std::thread(&NullDriver::thread_loop, this);
    }
    return true;
}

void NullDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    // Wait out a pump() that is mid-callback
    std::lock_guard lock(render_mutex_);
}

std::vector<float> NullDriver::pump(size_t frames) {
    std::vector<float> block(frames * static_cast<size_t>(format_.channels), 0.0f);
    std::lock_guard lock(render_mutex_);
    if (!running_) {
        return block;
    }
    if (callback_) {
        callback_(std::span<float>(block));
    }
    frames_rendered_ += frames;
    return block;
}

void NullDriver::thread_loop() {
    const auto period = std::chrono::microseconds(
        static_cast<int64_t>(format_.block_size) * 1000000 / format_.sample_rate);
    std::vector<float> block(static_cast<size_t>(format_.block_size * format_.channels), 0.0f);
    auto next_wakeup = std::chrono::steady_clock::now();

    while (running_) {
        std::fill(block.begin(), block.end(), 0.0f);
        if (callback_) {
            callback_(std::span<float>(block));
        }
        frames_rendered_ += static_cast<size_t>(format_.block_size);
        next_wakeup += period;
        std::this_thread::sleep_until(next_wakeup);
    }
}

NullHost::NullHost(NullHostOptions options)
    : options_(std::move(options))
{
}

std::vector<DeviceInfo> NullHost::output_devices() {
    std::vector<DeviceInfo> devices;
    devices.reserve(options_.devices.size());
    for (size_t i = 0; i < options_.devices.size(); ++i) {
        devices.push_back({std::to_string(i), options_.devices[i], "null:" + std::to_string(i)});
    }
    return devices;
}

std::unique_ptr<AudioDriver> NullHost::open_driver(const DeviceInfo& device, const StreamFormat& format) {
    if (device.id == "default" && options_.devices.empty()) {
        throw EngineError(ErrorKind::DeviceError, "null host has no output devices");
    }
    if (format.sample_rate <= 0 || format.channels <= 0 || format.block_size <= 0) {
        throw EngineError(ErrorKind::DeviceError, "null host: unsupported stream format");
    }
    ++drivers_opened_;
    return std::make_unique<NullDriver>(format, options_.realtime);
}

} // namespace deck::hal
