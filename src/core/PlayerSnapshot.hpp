/**
 * @file PlayerSnapshot.hpp
 * @brief Caller-facing projection of a player and its JSON form.
 */

#ifndef DECK_PLAYER_SNAPSHOT_HPP
#define DECK_PLAYER_SNAPSHOT_HPP

#include "OutputBackend.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace deck {

using PlayerHandle = uint64_t;

/**
 * @brief Value returned to callers; never stored by the engine.
 *
 * is_playing is derived: !is_paused && !is_empty.
 */
struct PlayerSnapshot {
    PlayerHandle handle = 0;
    std::string device_id;
    std::string asset_name;
    bool has_audio = false;
    bool is_playing = false;
    bool is_paused = false;
    bool is_empty = true;

    bool operator==(const PlayerSnapshot&) const = default;
};

inline void to_json(nlohmann::json& j, const PlayerSnapshot& s) {
    j = nlohmann::json{
        {"player_id", s.handle},
        {"device_id", s.device_id},
        {"file_name", s.asset_name},
        {"has_audio", s.has_audio},
        {"is_playing", s.is_playing},
        {"is_paused", s.is_paused},
        {"is_empty", s.is_empty}
    };
}

inline void to_json(nlohmann::json& j, const OutputDevice& d) {
    j = nlohmann::json{{"id", d.id}, {"name", d.name}};
}

} // namespace deck

#endif // DECK_PLAYER_SNAPSHOT_HPP
