/**
 * @file AudioEngine.hpp
 * @brief Command actor owning every player.
 */

#ifndef DECK_AUDIO_ENGINE_HPP
#define DECK_AUDIO_ENGINE_HPP

#include "AudioHost.hpp"
#include "CommandQueue.hpp"
#include "Decoder.hpp"
#include "OutputBackend.hpp"
#include "PlayerState.hpp"
#include <functional>
#include <memory>
#include <unordered_map>

namespace deck {

/**
 * @brief Issues player handles: 1, 2, 3, ... wrapping back to 1 after the
 * maximum. 0 is never issued, nor is a handle still in use.
 */
class HandleIssuer {
public:
    explicit HandleIssuer(PlayerHandle next = 1) : next_(next == 0 ? 1 : next) {}

    PlayerHandle issue(const std::function<bool(PlayerHandle)>& in_use);

private:
    PlayerHandle next_;
};

/**
 * @brief Single-threaded owner of the player table.
 *
 * run() is the actor loop: it pops commands until the queue is closed and
 * drained, then destroys every player, closing their hardware. The handler
 * methods are public so the engine can be driven synchronously in tests;
 * in production only the engine thread calls them, through dispatch().
 */
class AudioEngine {
public:
    AudioEngine(std::unique_ptr<hal::AudioHost> host,
                OutputModel model,
                hal::StreamFormat format,
                std::unique_ptr<Decoder> decoder,
                bool verbose = false);
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    void run(CommandQueue& queue);

    /**
     * @brief Execute one command and fulfill its reply.
     */
    void dispatch(Command& command);

    std::vector<OutputDevice> list_devices();
    PlayerHandle create_player();
    void destroy_player(PlayerHandle handle);
    PlayerSnapshot set_player_device(PlayerHandle handle, const std::string& device_id);
    PlayerSnapshot load_asset(PlayerHandle handle, std::vector<uint8_t> bytes, std::string name);
    PlayerSnapshot toggle_playback(PlayerHandle handle);
    PlayerSnapshot stop(PlayerHandle handle);
    PlayerSnapshot get_state(PlayerHandle handle) const;
    PlayerSnapshot play_raw_pcm(PlayerHandle handle, uint32_t sample_rate, uint16_t channels,
                                std::vector<float> samples);

    size_t player_count() const { return players_.size(); }

    /**
     * @return nullptr for an unknown handle.
     */
    PlayerState* find_player(PlayerHandle handle);

    OutputModel model() const { return backend_.model(); }

private:
    PlayerState& player(PlayerHandle handle);
    const PlayerState& player(PlayerHandle handle) const;
    void flush_log();

    std::unique_ptr<hal::AudioHost> host_;
    OutputBackend backend_;
    std::unique_ptr<Decoder> decoder_;
    std::unordered_map<PlayerHandle, PlayerState> players_;
    HandleIssuer issuer_;
    bool verbose_;
};

} // namespace deck

#endif // DECK_AUDIO_ENGINE_HPP
