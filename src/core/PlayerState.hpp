/**
 * @file PlayerState.hpp
 * @brief One player: device binding, loaded asset, output and transport.
 */

#ifndef DECK_PLAYER_STATE_HPP
#define DECK_PLAYER_STATE_HPP

#include "Decoder.hpp"
#include "OutputBackend.hpp"
#include "PlayerSnapshot.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace deck {

/**
 * @brief Per-player record, touched only by the engine thread.
 *
 * Output resources are opened lazily on the first operation that needs them.
 * Each operation commits only what succeeded: a failed device switch leaves
 * device_id unchanged, a failed decode leaves the queue untouched.
 *
 * Transport:
 *   NoAudio --load--> Stopped --toggle(empty)--> Playing --toggle--> Paused
 *   Paused --toggle--> Playing (no re-decode), any --stop--> Stopped
 */
class PlayerState {
public:
    PlayerState(PlayerHandle handle, OutputBackend& backend, Decoder& decoder);
    ~PlayerState();

    PlayerState(const PlayerState&) = delete;
    PlayerState& operator=(const PlayerState&) = delete;

    PlayerSnapshot snapshot() const;

    /**
     * @brief Tear down current output and reopen on `device_id`.
     *
     * On failure the old output stays closed and device_id is not changed.
     */
    void set_device(const std::string& device_id);

    /**
     * @brief Replace the stored asset; queued audio from the previous one is dropped.
     */
    void load_asset(std::vector<uint8_t> bytes, std::string name);

    void toggle_playback();

    /**
     * @brief Clear and pause the output. The hardware stays open.
     */
    void stop();

    /**
     * @throws EngineError(InvalidArgument) for a zero rate or channel count.
     */
    void play_raw_pcm(uint32_t sample_rate, uint16_t channels, std::vector<float> samples);

    /**
     * @brief Stop and release output resources, if any.
     */
    void close_output();

    bool has_output() const { return output_ != nullptr; }
    OutputResources* output() { return output_.get(); }
    const std::string& device_id() const { return device_id_; }

private:
    OutputResources& ensure_output();

    PlayerHandle handle_;
    OutputBackend& backend_;
    Decoder& decoder_;
    std::string device_id_ = "default";
    std::shared_ptr<const std::vector<uint8_t>> asset_;
    std::string asset_name_;
    std::unique_ptr<OutputResources> output_;
};

} // namespace deck

#endif // DECK_PLAYER_STATE_HPP
