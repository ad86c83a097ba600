/**
 * @file main.cpp
 * @brief deck_play: list output devices or play an MP3 file to completion.
 */

#include "EngineController.hpp"
#include "EngineError.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>

namespace {

void print_usage() {
    std::cout << "Usage: deck_play --list [--config file.json]" << std::endl;
    std::cout << "       deck_play [--config file.json] [--device ID] file.mp3" << std::endl;
    std::cout << "Flags: --list    : Print output devices as JSON" << std::endl;
    std::cout << "       --device  : \"default\" or an id from --list" << std::endl;
    std::cout << "Example: ./deck_play --device 1 song.mp3" << std::endl;
}

void print_state(const deck::PlayerSnapshot& snapshot) {
    std::cout << nlohmann::json(snapshot).dump() << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    bool list = false;
    std::string config_path;
    std::string device_id = "default";
    std::string file_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            device_id = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && file_path.empty()) {
            file_path = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            return 1;
        }
    }

    if (!list && file_path.empty()) {
        print_usage();
        return 1;
    }

    deck::EngineConfig config;
    if (!config_path.empty() && !deck::ConfigStore::load_from_file(config, config_path)) {
        return 1;
    }

    try {
        auto engine = deck::EngineController::start(config);

        if (list) {
            std::cout << nlohmann::json(engine.list_output_devices()).dump(4) << std::endl;
            return 0;
        }

        std::ifstream file(file_path, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Failed to open file: " << file_path << std::endl;
            return 1;
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());

        const auto player = engine.create_player();
        if (device_id != "default") {
            print_state(engine.set_player_device(player, device_id));
        }
        const auto name = file_path.substr(file_path.find_last_of("/\\") + 1);
        print_state(engine.load_asset(player, std::move(bytes), name));

        auto state = engine.toggle_playback(player);
        print_state(state);
        while (state.is_playing) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            state = engine.get_state(player);
        }
        print_state(state);

        engine.destroy_player(player);
        engine.shutdown();
    } catch (const deck::EngineError& e) {
        std::cerr << "Error (" << deck::to_string(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
