/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio hardware drivers.
 *
 * Hardware/OS audio code (ALSA, CoreAudio) stays behind this interface; the
 * engine and output layers never include a platform header.
 */

#ifndef DECK_HAL_AUDIO_DRIVER_HPP
#define DECK_HAL_AUDIO_DRIVER_HPP

#include <functional>
#include <span>
#include <string>

namespace deck::hal {

/**
 * @brief Format requested when a driver is opened.
 */
struct StreamFormat {
    int sample_rate = 48000;
    int channels = 2;
    int block_size = 512;
};

/**
 * @brief One open hardware output unit.
 *
 * The driver owns the thread that invokes the render callback. The callback
 * is installed before start() and is not replaced while the unit runs.
 */
class AudioDriver {
public:
    /**
     * @brief Render callback: fill an interleaved block of channels() * N floats.
     *
     * Runs on a real-time thread. Must not block or allocate.
     */
    using RenderCallback = std::function<void(std::span<float> interleaved)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Start invoking the render callback.
     *
     * @return true if the unit is running, false otherwise (see last_error()).
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the unit. Returns only after the last callback has finished.
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    virtual void set_callback(RenderCallback callback) = 0;

    /**
     * @brief Negotiated sample rate in Hz.
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Negotiated channel count.
     */
    virtual int channels() const = 0;

    /**
     * @brief Frames per callback block.
     */
    virtual int block_size() const = 0;

    /**
     * @brief Description of the most recent failure, empty if none.
     */
    virtual std::string last_error() const = 0;
};

} // namespace deck::hal

#endif // DECK_HAL_AUDIO_DRIVER_HPP
