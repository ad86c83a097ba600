#include "PlayerState.hpp"
#include "EngineError.hpp"

namespace deck {

PlayerState::PlayerState(PlayerHandle handle, OutputBackend& backend, Decoder& decoder)
    : handle_(handle)
    , backend_(backend)
    , decoder_(decoder)
{
}

PlayerState::~PlayerState() {
    close_output();
}

PlayerSnapshot PlayerState::snapshot() const {
    PlayerSnapshot s;
    s.handle = handle_;
    s.device_id = device_id_;
    s.asset_name = asset_name_;
    s.has_audio = asset_ != nullptr;
    if (output_) {
        s.is_paused = output_->is_paused();
        s.is_empty = output_->is_empty();
    }
    s.is_playing = !s.is_paused && !s.is_empty;
    return s;
}

OutputResources& PlayerState::ensure_output() {
    if (!output_) {
        output_ = backend_.open(device_id_);
    }
    if (!output_) {
        throw EngineError(ErrorKind::UninitializedOutput, "output is not initialized");
    }
    return *output_;
}

void PlayerState::close_output() {
    if (!output_) return;
    output_->close();
    output_.reset();
}

void PlayerState::set_device(const std::string& device_id) {
    close_output();
    output_ = backend_.open(device_id);
    device_id_ = device_id;
}

void PlayerState::load_asset(std::vector<uint8_t> bytes, std::string name) {
    asset_ = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    asset_name_ = std::move(name);
    if (output_) {
        output_->reset();
    }
}

void PlayerState::toggle_playback() {
    auto& output = ensure_output();

    const bool is_playing = !output.is_paused() && !output.is_empty();
    if (is_playing) {
        output.pause();
        return;
    }

    if (output.is_empty()) {
        if (!asset_) {
            throw EngineError(ErrorKind::InvalidArgument, "no audio loaded");
        }
        DecodedAudio decoded = decoder_.decode(*asset_);
        if (decoded.sample_rate == 0 || decoded.channels == 0) {
            throw EngineError(ErrorKind::DecodeError, "decoder returned no stream format");
        }
        // Nothing is queued until the unit is known to run
        output.start();
        output.enqueue(std::move(decoded.samples), decoded.sample_rate, decoded.channels);
    } else {
        output.start();
    }

    output.play();
}

void PlayerState::stop() {
    ensure_output().stop();
}

void PlayerState::play_raw_pcm(uint32_t sample_rate, uint16_t channels, std::vector<float> samples) {
    if (sample_rate == 0) {
        throw EngineError(ErrorKind::InvalidArgument, "sample_rate must be > 0");
    }
    if (channels == 0) {
        throw EngineError(ErrorKind::InvalidArgument, "channels must be > 0");
    }

    auto& output = ensure_output();
    output.start();
    output.enqueue(std::move(samples), sample_rate, channels);
    output.play();
}

} // namespace deck
