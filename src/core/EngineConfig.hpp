/**
 * @file EngineConfig.hpp
 * @brief Engine configuration and its JSON persistence.
 */

#ifndef DECK_ENGINE_CONFIG_HPP
#define DECK_ENGINE_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace deck {

using json = nlohmann::json;

/**
 * @brief Everything needed to bring an engine up.
 */
struct EngineConfig {
    std::string backend = "auto"; // "auto", "pull" or "push"
    std::string host = "auto";    // "auto", "alsa", "coreaudio" or "null"
    int sample_rate = 48000;
    int channels = 2;
    int block_size = 512;
    bool verbose = false;

    // Null host only
    std::vector<std::string> null_devices{"Null Output"};
    bool null_realtime = false;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(EngineConfig, backend, host, sample_rate, channels,
                                                block_size, verbose, null_devices, null_realtime)
};

/**
 * @brief Manages saving and loading of EngineConfig.
 */
class ConfigStore {
public:
    static bool save_to_file(const EngineConfig& config, const std::string& path);
    static bool load_from_file(EngineConfig& config, const std::string& path);

    static std::string serialize(const EngineConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Parse and validate. `config` is only replaced on success.
     *
     * Missing keys keep their defaults.
     */
    static bool deserialize(EngineConfig& config, const std::string& data);

    /**
     * @brief Check enum-like strings and positive stream parameters.
     */
    static bool validate(const EngineConfig& config);
};

} // namespace deck

#endif // DECK_ENGINE_CONFIG_HPP
