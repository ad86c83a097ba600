#include "AudioEngine.hpp"
#include "EngineError.hpp"
#include "Logger.hpp"
#include <iostream>
#include <limits>
#include <type_traits>

namespace deck {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @brief Run a handler and hand its outcome to the waiting caller.
 */
template<typename T, typename Handler>
void fulfill(std::promise<T>& reply, Handler&& handler) {
    try {
        if constexpr (std::is_void_v<T>) {
            handler();
            reply.set_value();
        } else {
            reply.set_value(handler());
        }
    } catch (...) {
        reply.set_exception(std::current_exception());
    }
}

} // namespace

PlayerHandle HandleIssuer::issue(const std::function<bool(PlayerHandle)>& in_use) {
    for (;;) {
        PlayerHandle candidate = next_;
        next_ = (next_ == std::numeric_limits<PlayerHandle>::max()) ? 1 : next_ + 1;
        if (!in_use(candidate)) {
            return candidate;
        }
    }
}

AudioEngine::AudioEngine(std::unique_ptr<hal::AudioHost> host,
                         OutputModel model,
                         hal::StreamFormat format,
                         std::unique_ptr<Decoder> decoder,
                         bool verbose)
    : host_(std::move(host))
    , backend_(*host_, model, format)
    , decoder_(std::move(decoder))
    , verbose_(verbose)
{
    if (verbose_) {
        std::cout << "[AudioEngine] Host: " << host_->name() << ", model: " << to_string(model)
                  << ", decoder: " << decoder_->name() << std::endl;
    }
}

AudioEngine::~AudioEngine() {
    // Players reference the backend and decoder: close them first
    players_.clear();
    flush_log();
}

void AudioEngine::run(CommandQueue& queue) {
    while (auto command = queue.pop()) {
        dispatch(*command);
    }
    players_.clear();
    flush_log();
}

void AudioEngine::dispatch(Command& command) {
    std::visit(overloaded{
        [this](command::ListDevices& c) {
            fulfill(c.reply, [&] { return list_devices(); });
        },
        [this](command::CreatePlayer& c) {
            fulfill(c.reply, [&] { return create_player(); });
        },
        [this](command::DestroyPlayer& c) {
            fulfill(c.reply, [&] { destroy_player(c.handle); });
        },
        [this](command::SetPlayerDevice& c) {
            fulfill(c.reply, [&] { return set_player_device(c.handle, c.device_id); });
        },
        [this](command::LoadAsset& c) {
            fulfill(c.reply, [&] { return load_asset(c.handle, std::move(c.bytes), std::move(c.name)); });
        },
        [this](command::TogglePlayback& c) {
            fulfill(c.reply, [&] { return toggle_playback(c.handle); });
        },
        [this](command::StopPlayback& c) {
            fulfill(c.reply, [&] { return stop(c.handle); });
        },
        [this](command::GetState& c) {
            fulfill(c.reply, [&] { return get_state(c.handle); });
        },
        [this](command::PlayRawPcm& c) {
            fulfill(c.reply, [&] {
                return play_raw_pcm(c.handle, c.sample_rate, c.channels, std::move(c.samples));
            });
        },
    }, command);
    flush_log();
}

std::vector<OutputDevice> AudioEngine::list_devices() {
    return backend_.list_devices();
}

PlayerHandle AudioEngine::create_player() {
    const PlayerHandle handle = issuer_.issue([this](PlayerHandle h) { return players_.count(h) != 0; });
    players_.try_emplace(handle, handle, backend_, *decoder_);
    return handle;
}

void AudioEngine::destroy_player(PlayerHandle handle) {
    auto it = players_.find(handle);
    if (it == players_.end()) {
        throw EngineError(ErrorKind::NotFound, "player not found: " + std::to_string(handle));
    }
    it->second.close_output();
    players_.erase(it);
}

PlayerSnapshot AudioEngine::set_player_device(PlayerHandle handle, const std::string& device_id) {
    auto& p = player(handle);
    p.set_device(device_id);
    return p.snapshot();
}

PlayerSnapshot AudioEngine::load_asset(PlayerHandle handle, std::vector<uint8_t> bytes, std::string name) {
    auto& p = player(handle);
    p.load_asset(std::move(bytes), std::move(name));
    return p.snapshot();
}

PlayerSnapshot AudioEngine::toggle_playback(PlayerHandle handle) {
    auto& p = player(handle);
    p.toggle_playback();
    return p.snapshot();
}

PlayerSnapshot AudioEngine::stop(PlayerHandle handle) {
    auto& p = player(handle);
    p.stop();
    return p.snapshot();
}

PlayerSnapshot AudioEngine::get_state(PlayerHandle handle) const {
    return player(handle).snapshot();
}

PlayerSnapshot AudioEngine::play_raw_pcm(PlayerHandle handle, uint32_t sample_rate, uint16_t channels,
                                         std::vector<float> samples) {
    auto& p = player(handle);
    p.play_raw_pcm(sample_rate, channels, std::move(samples));
    return p.snapshot();
}

PlayerState* AudioEngine::find_player(PlayerHandle handle) {
    auto it = players_.find(handle);
    return it == players_.end() ? nullptr : &it->second;
}

PlayerState& AudioEngine::player(PlayerHandle handle) {
    auto it = players_.find(handle);
    if (it == players_.end()) {
        throw EngineError(ErrorKind::NotFound, "player not found: " + std::to_string(handle));
    }
    return it->second;
}

const PlayerState& AudioEngine::player(PlayerHandle handle) const {
    auto it = players_.find(handle);
    if (it == players_.end()) {
        throw EngineError(ErrorKind::NotFound, "player not found: " + std::to_string(handle));
    }
    return it->second;
}

void AudioEngine::flush_log() {
    auto& logger = AudioLogger::instance();
    if (verbose_) {
        logger.drain_to(std::clog);
        return;
    }
    while (logger.pop_entry()) {
    }
}

} // namespace deck
