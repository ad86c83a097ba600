/**
 * @file AudioHost.hpp
 * @brief Platform device enumeration and driver factory.
 */

#ifndef DECK_HAL_AUDIO_HOST_HPP
#define DECK_HAL_AUDIO_HOST_HPP

#include "AudioDriver.hpp"
#include <memory>
#include <string>
#include <vector>

namespace deck::hal {

/**
 * @brief A discovered output device.
 *
 * `id` is what callers pass back to select the device: the decimal position
 * in the enumeration on index-based hosts, the decimal native ID on hosts with
 * stable IDs. `address` is the backend's own open name and never leaves the HAL.
 */
struct DeviceInfo {
    std::string id;
    std::string name;
    std::string address;
};

/**
 * @brief Options for the headless host.
 */
struct NullHostOptions {
    std::vector<std::string> devices{"Null Output"};
    bool realtime = false; // Pace the render thread like real hardware
};

/**
 * @brief Abstract platform audio host (ALSA, CoreAudio, Null).
 */
class AudioHost {
public:
    virtual ~AudioHost() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Display name for the synthetic "default" entry.
     */
    virtual std::string default_device_name() const = 0;

    /**
     * @brief Whether the platform reports a default output device right now.
     */
    virtual bool has_default_device() = 0;

    /**
     * @brief Discovered output devices, in enumeration order.
     *
     * @throws EngineError(DeviceError) if the platform query fails.
     */
    virtual std::vector<DeviceInfo> output_devices() = 0;

    /**
     * @brief Open (but do not start) a driver on a device.
     *
     * @param device A device from output_devices(), or one with id "default".
     * @throws EngineError(DeviceError) if the device cannot be opened or configured.
     */
    virtual std::unique_ptr<AudioDriver> open_driver(const DeviceInfo& device, const StreamFormat& format) = 0;
};

/**
 * @brief Create a host by name: "auto", "alsa", "coreaudio" or "null".
 *
 * "auto" picks CoreAudio on macOS and ALSA elsewhere.
 * @throws EngineError(DeviceError) for a host not compiled into this build.
 */
std::unique_ptr<AudioHost> create_host(const std::string& kind, const NullHostOptions& null_options = {});

} // namespace deck::hal

#endif // DECK_HAL_AUDIO_HOST_HPP
