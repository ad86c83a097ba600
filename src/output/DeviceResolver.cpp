/**
 * @file DeviceResolver.cpp
 * @brief Device id parsing, matching and enumeration.
 */

#include "OutputBackend.hpp"
#include "EngineError.hpp"
#include <charconv>

namespace deck {

hal::DeviceInfo resolve_output_device(hal::AudioHost& host, const std::string& device_id) {
    if (device_id == "default") {
        if (!host.has_default_device()) {
            throw EngineError(ErrorKind::DeviceError, "default output device not found");
        }
        return {"default", host.default_device_name(), "default"};
    }

    uint64_t value = 0;
    const char* first = device_id.data();
    const char* last = first + device_id.size();
    auto [end, ec] = std::from_chars(first, last, value, 10);
    if (device_id.empty() || ec != std::errc() || end != last) {
        throw EngineError(ErrorKind::DeviceError, "invalid device id: " + device_id);
    }

    const std::string canonical = std::to_string(value);
    for (auto& device : host.output_devices()) {
        if (device.id == canonical) {
            return device;
        }
    }
    throw EngineError(ErrorKind::DeviceError, "output device not found (id=" + device_id + ")");
}

std::vector<OutputDevice> list_output_devices(hal::AudioHost& host) {
    std::vector<OutputDevice> result;
    result.push_back({"default", host.default_device_name()});
    for (auto& device : host.output_devices()) {
        result.push_back({device.id, device.name});
    }
    return result;
}

} // namespace deck
