/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver and AudioHost interfaces.
 */

#ifndef DECK_HAL_ALSA_DRIVER_HPP
#define DECK_HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include "AudioHost.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace deck::hal {

/**
 * @brief ALSA playback unit driven by a dedicated writer thread.
 *
 * The writer thread asks the render callback for one period of interleaved
 * float samples, converts it to the negotiated integer format and blocks in
 * snd_pcm_writei(). The PCM stays open across stop()/start() so pausing and
 * resuming never renegotiates the hardware.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param device ALSA PCM name ("default", "hw:CARD=PCH,DEV=0", ...).
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels.
     */
    AlsaDriver(const std::string& device, int sample_rate = 48000, int block_size = 512, int num_channels = 2);
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    /**
     * @brief Open and configure the PCM. Must succeed before start().
     */
    bool open();

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_; }
    void set_callback(RenderCallback callback) override;
    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return num_channels_; }
    int block_size() const override { return block_size_; }
    std::string last_error() const override { return last_error_; }

private:
    void thread_loop();
    bool setup_pcm();
    void recover_pcm(int err);
    void close_pcm();
    bool fail(const std::string& what, int err);

    snd_pcm_t* pcm_handle_;
    snd_pcm_format_t format_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    RenderCallback callback_;
    std::atomic<bool> running_;
    std::thread processing_thread_;
    std::string last_error_;

    // Integer samples handed to snd_pcm_writei
    std::vector<uint8_t> interleaved_buffer_;
};

/**
 * @brief Enumerates ALSA PCM playback devices through the device-name hints.
 *
 * Device ids are positions in the hint list at the time of the call.
 */
class AlsaHost : public AudioHost {
public:
    std::string name() const override { return "ALSA"; }
    std::string default_device_name() const override { return "System default (ALSA)"; }
    bool has_default_device() override;
    std::vector<DeviceInfo> output_devices() override;
    std::unique_ptr<AudioDriver> open_driver(const DeviceInfo& device, const StreamFormat& format) override;
};

} // namespace deck::hal

#endif // DECK_HAL_ALSA_DRIVER_HPP
