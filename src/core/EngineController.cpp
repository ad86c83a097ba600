#include "EngineController.hpp"
#include "EngineError.hpp"
#include <future>

namespace deck {

OutputModel resolve_output_model(const std::string& backend) {
    if (backend == "pull") return OutputModel::Pull;
    if (backend == "push") return OutputModel::Push;
#ifdef __APPLE__
    return OutputModel::Push;
#else
    return OutputModel::Pull;
#endif
}

void EngineController::Link::close() {
    std::call_once(joined, [this] {
        queue.close();
        if (thread.joinable()) {
            thread.join();
        }
    });
}

EngineController::EngineController(std::shared_ptr<Link> link)
    : link_(std::move(link))
{
}

EngineController EngineController::start(const EngineConfig& config) {
    hal::NullHostOptions null_options;
    null_options.devices = config.null_devices;
    null_options.realtime = config.null_realtime;

    hal::StreamFormat format;
    format.sample_rate = config.sample_rate;
    format.channels = config.channels;
    format.block_size = config.block_size;

    auto engine = std::make_unique<AudioEngine>(hal::create_host(config.host, null_options),
                                                resolve_output_model(config.backend),
                                                format,
                                                make_mp3_decoder(),
                                                config.verbose);
    return start(std::move(engine));
}

EngineController EngineController::start(std::unique_ptr<AudioEngine> engine) {
    auto link = std::make_shared<Link>();
    // The engine lives and dies on its own thread
    link->thread = std::thread([queue = &link->queue, owned = std::move(engine)]() mutable {
        owned->run(*queue);
        owned.reset();
    });
    return EngineController(std::move(link));
}

template<typename T, typename Cmd>
T EngineController::call(Cmd command) {
    auto reply = command.reply.get_future();
    if (!link_->queue.push(std::move(command))) {
        throw EngineError(ErrorKind::Disconnected, "audio engine is not running");
    }
    try {
        return reply.get();
    } catch (const std::future_error&) {
        throw EngineError(ErrorKind::Disconnected, "audio engine stopped before replying");
    }
}

std::vector<OutputDevice> EngineController::list_output_devices() {
    return call<std::vector<OutputDevice>>(command::ListDevices{});
}

PlayerHandle EngineController::create_player() {
    return call<PlayerHandle>(command::CreatePlayer{});
}

void EngineController::destroy_player(PlayerHandle handle) {
    call<void>(command::DestroyPlayer{handle, {}});
}

PlayerSnapshot EngineController::set_player_device(PlayerHandle handle, const std::string& device_id) {
    return call<PlayerSnapshot>(command::SetPlayerDevice{handle, device_id, {}});
}

PlayerSnapshot EngineController::load_asset(PlayerHandle handle, std::vector<uint8_t> bytes, const std::string& name) {
    return call<PlayerSnapshot>(command::LoadAsset{handle, std::move(bytes), name, {}});
}

PlayerSnapshot EngineController::toggle_playback(PlayerHandle handle) {
    return call<PlayerSnapshot>(command::TogglePlayback{handle, {}});
}

PlayerSnapshot EngineController::stop(PlayerHandle handle) {
    return call<PlayerSnapshot>(command::StopPlayback{handle, {}});
}

PlayerSnapshot EngineController::get_state(PlayerHandle handle) {
    return call<PlayerSnapshot>(command::GetState{handle, {}});
}

PlayerSnapshot EngineController::play_raw_pcm(PlayerHandle handle, uint32_t sample_rate, uint16_t channels,
                                              std::vector<float> samples) {
    return call<PlayerSnapshot>(command::PlayRawPcm{handle, sample_rate, channels, std::move(samples), {}});
}

void EngineController::shutdown() {
    link_->close();
}

} // namespace deck
