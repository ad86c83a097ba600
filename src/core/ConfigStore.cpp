#include "EngineConfig.hpp"
#include <fstream>
#include <iostream>

namespace deck {

bool ConfigStore::validate(const EngineConfig& config) {
    if (config.backend != "auto" && config.backend != "pull" && config.backend != "push") {
        std::cerr << "[ConfigStore] Unknown backend: " << config.backend << std::endl;
        return false;
    }
    if (config.host != "auto" && config.host != "alsa" && config.host != "coreaudio" && config.host != "null") {
        std::cerr << "[ConfigStore] Unknown host: " << config.host << std::endl;
        return false;
    }
    if (config.sample_rate <= 0 || config.channels <= 0 || config.channels > 64 || config.block_size <= 0) {
        std::cerr << "[ConfigStore] Invalid stream format" << std::endl;
        return false;
    }
    return true;
}

bool ConfigStore::deserialize(EngineConfig& config, const std::string& data) {
    try {
        EngineConfig parsed = json::parse(data).get<EngineConfig>();
        if (!validate(parsed)) {
            return false;
        }
        config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] " << e.what() << std::endl;
        return false;
    }
}

bool ConfigStore::save_to_file(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(EngineConfig& config, const std::string& path) {
    std::cout << "[ConfigStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    bool success = deserialize(config, content);
    if (success) {
        std::cout << "[ConfigStore] Loaded config (host=" << config.host << ", backend=" << config.backend << ")" << std::endl;
    } else {
        std::cerr << "[ConfigStore] Failed to deserialize config from: " << path << std::endl;
    }
    return success;
}

} // namespace deck
