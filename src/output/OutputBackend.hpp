/**
 * @file OutputBackend.hpp
 * @brief Output resources owned by a player and the backend that opens them.
 */

#ifndef DECK_OUTPUT_BACKEND_HPP
#define DECK_OUTPUT_BACKEND_HPP

#include "AudioHost.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace deck {

/**
 * @brief How decoded audio reaches the hardware.
 */
enum class OutputModel {
    Pull, // Sources appended to a sink that the running stream drains on its own
    Push  // Samples written to a ring that the render callback drains on demand
};

const char* to_string(OutputModel model) noexcept;

/**
 * @brief One entry of the caller-facing device list.
 */
struct OutputDevice {
    std::string id;
    std::string name;
};

/**
 * @brief Live output of a single player: an open unit plus its queue.
 *
 * Exclusively owned by one PlayerState and only touched from the engine
 * thread, except for the queue the render callback drains.
 */
class OutputResources {
public:
    virtual ~OutputResources() = default;

    /**
     * @brief Queue PCM for playback, converting it to the device format first.
     */
    virtual void enqueue(std::vector<float> samples, uint32_t sample_rate, uint16_t channels) = 0;

    /**
     * @brief Make sure the unit is rendering. Queue and pause flag are untouched.
     * @throws EngineError(DeviceError) if the unit cannot be started.
     */
    virtual void start() = 0;

    /**
     * @brief Clear the pause flag. Callers start() the unit first.
     */
    virtual void play() = 0;

    /**
     * @brief Mute without stopping the unit; queued audio is kept.
     */
    virtual void pause() = 0;

    /**
     * @brief Drop queued audio and pause. The unit stays open.
     */
    virtual void stop() = 0;

    /**
     * @brief Drop queued audio and return to the freshly opened state (unpaused).
     */
    virtual void reset() = 0;

    virtual bool is_paused() const = 0;
    virtual bool is_empty() const = 0;

    virtual int sample_rate() const = 0;
    virtual int channels() const = 0;

    /**
     * @brief Stop the unit, then release it, then release the queue.
     *
     * Idempotent. Destructors call it, but owners call it explicitly so
     * teardown order never depends on member destruction order.
     */
    virtual void close() = 0;
};

/**
 * @brief Resolves device ids and opens output resources of one model.
 */
class OutputBackend {
public:
    OutputBackend(hal::AudioHost& host, OutputModel model, hal::StreamFormat format);

    /**
     * @brief "default" first, then every discovered device.
     */
    std::vector<OutputDevice> list_devices();

    /**
     * @brief Resolve `device_id` and open output on it.
     * @throws EngineError(DeviceError) if the id does not resolve or the device fails to open.
     */
    std::unique_ptr<OutputResources> open(const std::string& device_id);

    OutputModel model() const { return model_; }

private:
    hal::AudioHost& host_;
    OutputModel model_;
    hal::StreamFormat format_;
};

/**
 * @brief Map a caller-supplied device id to a host device.
 *
 * "default" maps to the host default (DeviceError if the host has none). Any
 * other id must be a base-10 unsigned integer matching a live device id.
 */
hal::DeviceInfo resolve_output_device(hal::AudioHost& host, const std::string& device_id);

/**
 * @brief Device list with the synthetic "default" entry prepended.
 */
std::vector<OutputDevice> list_output_devices(hal::AudioHost& host);

} // namespace deck

#endif // DECK_OUTPUT_BACKEND_HPP
