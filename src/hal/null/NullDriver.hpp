/**
 * @file NullDriver.hpp
 * @brief Headless driver and host with no hardware behind them.
 */

#ifndef DECK_HAL_NULL_DRIVER_HPP
#define DECK_HAL_NULL_DRIVER_HPP

#include "AudioDriver.hpp"
#include "AudioHost.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace deck::hal {

/**
 * @brief Driver that renders into a scratch buffer and discards it.
 *
 * In realtime mode a thread pulls one block every block_size / sample_rate
 * seconds, like hardware would. Otherwise nothing is rendered unless pump()
 * is called, which makes callback timing fully deterministic for tests.
 */
class NullDriver : public AudioDriver {
public:
    NullDriver(const StreamFormat& format, bool realtime);
    ~NullDriver() override;

    NullDriver(const NullDriver&) = delete;
    NullDriver& operator=(const NullDriver&) = delete;

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_; }
    void set_callback(RenderCallback callback) override;
    int sample_rate() const override { return format_.sample_rate; }
    int channels() const override { return format_.channels; }
    int block_size() const override { return format_.block_size; }
    std::string last_error() const override { return {}; }

    /**
     * @brief Render `frames` frames synchronously on the calling thread.
     *
     * Has no effect while the driver is stopped.
     * @return Copy of the rendered interleaved block.
     */
    std::vector<float> pump(size_t frames);

    /**
     * @brief Total frames rendered since construction.
     */
    size_t frames_rendered() const { return frames_rendered_; }

private:
    void thread_loop();

    StreamFormat format_;
    bool realtime_;
    RenderCallback callback_;
    std::atomic<bool> running_;
    std::atomic<size_t> frames_rendered_;
    std::mutex render_mutex_; // Serializes pump() against stop()
    std::thread processing_thread_;
};

/**
 * @brief Host exposing a fixed list of fake devices.
 *
 * With an empty device list the host reports no default device, so resolving
 * "default" fails like it does on a machine without sound hardware.
 */
class NullHost : public AudioHost {
public:
    explicit NullHost(NullHostOptions options = {});

    std::string name() const override { return "Null"; }
    std::string default_device_name() const override { return "System default (null)"; }
    bool has_default_device() override { return !options_.devices.empty(); }
    std::vector<DeviceInfo> output_devices() override;
    std::unique_ptr<AudioDriver> open_driver(const DeviceInfo& device, const StreamFormat& format) override;

    /**
     * @brief Number of drivers opened so far.
     */
    size_t drivers_opened() const { return drivers_opened_; }

private:
    NullHostOptions options_;
    size_t drivers_opened_ = 0;
};

} // namespace deck::hal

#endif // DECK_HAL_NULL_DRIVER_HPP
