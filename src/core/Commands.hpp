/**
 * @file Commands.hpp
 * @brief Messages accepted by the engine thread.
 *
 * Every command carries its own one-shot reply channel. The engine fulfills
 * it exactly once, with a value or with the EngineError the handler threw.
 */

#ifndef DECK_COMMANDS_HPP
#define DECK_COMMANDS_HPP

#include "PlayerSnapshot.hpp"
#include <future>
#include <string>
#include <variant>
#include <vector>

namespace deck::command {

struct ListDevices {
    std::promise<std::vector<OutputDevice>> reply;
};

struct CreatePlayer {
    std::promise<PlayerHandle> reply;
};

struct DestroyPlayer {
    PlayerHandle handle;
    std::promise<void> reply;
};

struct SetPlayerDevice {
    PlayerHandle handle;
    std::string device_id;
    std::promise<PlayerSnapshot> reply;
};

struct LoadAsset {
    PlayerHandle handle;
    std::vector<uint8_t> bytes;
    std::string name;
    std::promise<PlayerSnapshot> reply;
};

struct TogglePlayback {
    PlayerHandle handle;
    std::promise<PlayerSnapshot> reply;
};

struct StopPlayback {
    PlayerHandle handle;
    std::promise<PlayerSnapshot> reply;
};

struct GetState {
    PlayerHandle handle;
    std::promise<PlayerSnapshot> reply;
};

struct PlayRawPcm {
    PlayerHandle handle;
    uint32_t sample_rate;
    uint16_t channels;
    std::vector<float> samples;
    std::promise<PlayerSnapshot> reply;
};

} // namespace deck::command

namespace deck {

using Command = std::variant<command::ListDevices,
                             command::CreatePlayer,
                             command::DestroyPlayer,
                             command::SetPlayerDevice,
                             command::LoadAsset,
                             command::TogglePlayback,
                             command::StopPlayback,
                             command::GetState,
                             command::PlayRawPcm>;

} // namespace deck

#endif // DECK_COMMANDS_HPP
