/**
 * @file CoreAudioDriver.hpp
 * @brief macOS CoreAudio implementation of the AudioDriver and AudioHost interfaces.
 */

#ifndef DECK_HAL_COREAUDIO_DRIVER_HPP
#define DECK_HAL_COREAUDIO_DRIVER_HPP

#include "AudioDriver.hpp"
#include "AudioHost.hpp"
#include <AudioToolbox/AudioToolbox.h>
#include <CoreAudio/CoreAudio.h>
#include <atomic>
#include <string>

namespace deck::hal {

/**
 * @brief Output AudioUnit whose render callback is invoked by the CoreAudio IO thread.
 *
 * Device 0 selects the system default output unit, any other value binds a
 * HAL output unit to that AudioDeviceID.
 */
class CoreAudioDriver : public AudioDriver {
public:
    CoreAudioDriver(AudioDeviceID device, int sample_rate = 48000, int block_size = 512, int num_channels = 2);
    ~CoreAudioDriver() override;

    CoreAudioDriver(const CoreAudioDriver&) = delete;
    CoreAudioDriver& operator=(const CoreAudioDriver&) = delete;

    /**
     * @brief Create, configure and initialize the AudioUnit.
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
    static OSStatus render_callback(
        void* inRefCon,
        AudioUnitRenderActionFlags* ioActionFlags,
        const AudioTimeStamp* inTimeStamp,
        UInt32 inBusNumber,
        UInt32 inNumberFrames,
        AudioBufferList* ioData);

    bool fail(const std::string& what, OSStatus status);

    AudioComponentInstance audio_unit_;
    AudioDeviceID device_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    bool initialized_;
    RenderCallback callback_;
    std::atomic<bool> running_;
    std::string last_error_;
};

/**
 * @brief Enumerates CoreAudio devices that expose output streams.
 *
 * Device ids are the decimal AudioDeviceIDs, which stay stable while the
 * device is connected.
 */
class CoreAudioHost : public AudioHost {
public:
    std::string name() const override { return "CoreAudio"; }
    std::string default_device_name() const override { return "System default (CoreAudio)"; }
    bool has_default_device() override;
    std::vector<DeviceInfo> output_devices() override;
    std::unique_ptr<AudioDriver> open_driver(const DeviceInfo& device, const StreamFormat& format) override;
};

} // namespace deck::hal

#endif // DECK_HAL_COREAUDIO_DRIVER_HPP
