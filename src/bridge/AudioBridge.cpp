/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the engine controller.
 */

#include "CInterface.h"
#include "EngineController.hpp"
#include "EngineError.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

namespace {

thread_local std::string last_error;

// Internal handle structure (hidden from C API)
struct EngineHandleImpl {
    deck::EngineController controller;

    explicit EngineHandleImpl(deck::EngineController c)
        : controller(std::move(c))
    {
    }
};

int error_code(deck::ErrorKind kind) {
    switch (kind) {
        case deck::ErrorKind::NotFound: return DECK_ERROR_NOT_FOUND;
        case deck::ErrorKind::DeviceError: return DECK_ERROR_DEVICE;
        case deck::ErrorKind::DecodeError: return DECK_ERROR_DECODE;
        case deck::ErrorKind::InvalidArgument: return DECK_ERROR_INVALID_ARGUMENT;
        case deck::ErrorKind::UninitializedOutput: return DECK_ERROR_UNINITIALIZED_OUTPUT;
        case deck::ErrorKind::Disconnected: return DECK_ERROR_DISCONNECTED;
    }
    return DECK_ERROR_INTERNAL;
}

int fail(int code, const std::string& message) {
    last_error = message;
    return code;
}

void copy_string(char* destination, size_t size, const std::string& source) {
    const size_t count = std::min(size - 1, source.size());
    std::memcpy(destination, source.data(), count);
    destination[count] = '\0';
}

void fill_state(DeckPlayerState* out, const deck::PlayerSnapshot& s) {
    if (!out) return;
    out->player_id = s.handle;
    copy_string(out->device_id, sizeof(out->device_id), s.device_id);
    copy_string(out->file_name, sizeof(out->file_name), s.asset_name);
    out->has_audio = s.has_audio ? 1 : 0;
    out->is_playing = s.is_playing ? 1 : 0;
    out->is_paused = s.is_paused ? 1 : 0;
    out->is_empty = s.is_empty ? 1 : 0;
}

/**
 * @brief Run `body` against the controller, mapping exceptions to codes.
 */
template<typename Body>
int guarded(DeckEngineHandle handle, Body&& body) {
    if (!handle) return fail(DECK_ERROR_INVALID_ARGUMENT, "null engine handle");
    auto* impl = static_cast<EngineHandleImpl*>(handle);
    try {
        return body(impl->controller);
    } catch (const deck::EngineError& e) {
        return fail(error_code(e.kind()), e.what());
    } catch (const std::exception& e) {
        return fail(DECK_ERROR_INTERNAL, e.what());
    }
}

} // namespace

extern "C" {

DeckEngineHandle deck_engine_create(const char* config_json) {
    last_error.clear();
    deck::EngineConfig config;
    if (config_json && !deck::ConfigStore::deserialize(config, config_json)) {
        last_error = "invalid engine configuration";
        return nullptr;
    }
    try {
        return new EngineHandleImpl(deck::EngineController::start(config));
    } catch (const std::exception& e) {
        std::cerr << "[AudioBridge] Failed to start engine: " << e.what() << std::endl;
        last_error = e.what();
        return nullptr;
    }
}

void deck_engine_destroy(DeckEngineHandle handle) {
    last_error.clear();
    if (!handle) return;
    auto* impl = static_cast<EngineHandleImpl*>(handle);
    impl->controller.shutdown();
    delete impl;
}

int deck_list_output_devices_json(DeckEngineHandle handle, char* buffer, size_t buffer_size, size_t* required_size) {
    last_error.clear();
    return guarded(handle, [&](deck::EngineController& controller) {
        const std::string text = nlohmann::json(controller.list_output_devices()).dump();
        if (required_size) *required_size = text.size() + 1;
        if (!buffer || buffer_size < text.size() + 1) {
            return fail(DECK_ERROR_INVALID_ARGUMENT, "buffer too small for device list");
        }
        std::memcpy(buffer, text.c_str(), text.size() + 1);
        return static_cast<int>(DECK_OK);
    });
}

int deck_create_player(DeckEngineHandle handle, uint64_t* player_id) {
    last_error.clear();
    if (!player_id) return fail(DECK_ERROR_INVALID_ARGUMENT, "null player_id");
    return guarded(handle, [&](deck::EngineController& controller) {
        *player_id = controller.create_player();
        return static_cast<int>(DECK_OK);
    });
}

int deck_destroy_player(DeckEngineHandle handle, uint64_t player_id) {
    last_error.clear();
    return guarded(handle, [&](deck::EngineController& controller) {
        controller.destroy_player(player_id);
        return static_cast<int>(DECK_OK);
    });
}

int deck_set_player_device(DeckEngineHandle handle, uint64_t player_id, const char* device_id, DeckPlayerState* state) {
    last_error.clear();
    if (!device_id) return fail(DECK_ERROR_INVALID_ARGUMENT, "null device_id");
    return guarded(handle, [&](deck::EngineController& controller) {
        fill_state(state, controller.set_player_device(player_id, device_id));
        return static_cast<int>(DECK_OK);
    });
}

int deck_load_asset(DeckEngineHandle handle, uint64_t player_id,
                    const uint8_t* bytes, size_t size, const char* name,
                    DeckPlayerState* state) {
    last_error.clear();
    if (!bytes && size > 0) return fail(DECK_ERROR_INVALID_ARGUMENT, "null asset bytes");
    return guarded(handle, [&](deck::EngineController& controller) {
        std::vector<uint8_t> payload(bytes, bytes + size);
        fill_state(state, controller.load_asset(player_id, std::move(payload), name ? name : ""));
        return static_cast<int>(DECK_OK);
    });
}

int deck_toggle_playback(DeckEngineHandle handle, uint64_t player_id, DeckPlayerState* state) {
    last_error.clear();
    return guarded(handle, [&](deck::EngineController& controller) {
        fill_state(state, controller.toggle_playback(player_id));
        return static_cast<int>(DECK_OK);
    });
}

int deck_stop(DeckEngineHandle handle, uint64_t player_id, DeckPlayerState* state) {
    last_error.clear();
    return guarded(handle, [&](deck::EngineController& controller) {
        fill_state(state, controller.stop(player_id));
        return static_cast<int>(DECK_OK);
    });
}

int deck_get_state(DeckEngineHandle handle, uint64_t player_id, DeckPlayerState* state) {
    last_error.clear();
    return guarded(handle, [&](deck::EngineController& controller) {
        fill_state(state, controller.get_state(player_id));
        return static_cast<int>(DECK_OK);
    });
}

int deck_play_raw_pcm(DeckEngineHandle handle, uint64_t player_id,
                      uint32_t sample_rate, uint16_t channels,
                      const float* samples, size_t count,
                      DeckPlayerState* state) {
    last_error.clear();
    if (!samples && count > 0) return fail(DECK_ERROR_INVALID_ARGUMENT, "null samples");
    return guarded(handle, [&](deck::EngineController& controller) {
        std::vector<float> pcm(samples, samples + count);
        fill_state(state, controller.play_raw_pcm(player_id, sample_rate, channels, std::move(pcm)));
        return static_cast<int>(DECK_OK);
    });
}

const char* deck_error_message(void) {
    return last_error.c_str();
}

} // extern "C"
