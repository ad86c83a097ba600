/**
 * @file EngineController.hpp
 * @brief Thread-safe, blocking client handle for the engine thread.
 */

#ifndef DECK_ENGINE_CONTROLLER_HPP
#define DECK_ENGINE_CONTROLLER_HPP

#include "AudioEngine.hpp"
#include "CommandQueue.hpp"
#include "EngineConfig.hpp"
#include <memory>
#include <mutex>
#include <thread>

namespace deck {

/**
 * @brief Turns each call into a command and waits for the engine's reply.
 *
 * Copies share one engine thread. The thread exits when shutdown() is called
 * or the last copy goes away; pending commands are served first. Any call
 * made afterwards throws EngineError(Disconnected).
 */
class EngineController {
public:
    /**
     * @brief Build host, backend and decoder from `config` and start the engine thread.
     * @throws EngineError(DeviceError) if the configured host is unavailable.
     */
    static EngineController start(const EngineConfig& config);

    /**
     * @brief Start the engine thread on an already constructed engine.
     */
    static EngineController start(std::unique_ptr<AudioEngine> engine);

    std::vector<OutputDevice> list_output_devices();
    PlayerHandle create_player();
    void destroy_player(PlayerHandle handle);
    PlayerSnapshot set_player_device(PlayerHandle handle, const std::string& device_id);
    PlayerSnapshot load_asset(PlayerHandle handle, std::vector<uint8_t> bytes, const std::string& name);
    PlayerSnapshot toggle_playback(PlayerHandle handle);
    PlayerSnapshot stop(PlayerHandle handle);
    PlayerSnapshot get_state(PlayerHandle handle);
    PlayerSnapshot play_raw_pcm(PlayerHandle handle, uint32_t sample_rate, uint16_t channels,
                                std::vector<float> samples);

    /**
     * @brief Close the queue and join the engine thread. Safe to call repeatedly.
     */
    void shutdown();

private:
    struct Link {
        CommandQueue queue;
        std::thread thread;
        std::once_flag joined;

        void close();
        ~Link() { close(); }
    };

    explicit EngineController(std::shared_ptr<Link> link);

    template<typename T, typename Cmd>
    T call(Cmd command);

    std::shared_ptr<Link> link_;
};

/**
 * @brief "pull" / "push", or the platform's natural model for "auto".
 */
OutputModel resolve_output_model(const std::string& backend);

} // namespace deck

#endif // DECK_ENGINE_CONTROLLER_HPP
