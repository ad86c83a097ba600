#include "OutputBackend.hpp"
#include "PullSinkOutput.hpp"
#include "PushRingOutput.hpp"
#include <iostream>

namespace deck {

const char* to_string(OutputModel model) noexcept {
    switch (model) {
        case OutputModel::Pull: return "pull";
        case OutputModel::Push: return "push";
    }
    return "unknown";
}

OutputBackend::OutputBackend(hal::AudioHost& host, OutputModel model, hal::StreamFormat format)
    : host_(host)
    , model_(model)
    , format_(format)
{
}

std::vector<OutputDevice> OutputBackend::list_devices() {
    return list_output_devices(host_);
}

std::unique_ptr<OutputResources> OutputBackend::open(const std::string& device_id) {
    const auto device = resolve_output_device(host_, device_id);
    auto driver = host_.open_driver(device, format_);

    std::cout << "[OutputBackend] Opened '" << device.name << "' (" << to_string(model_) << ", "
              << driver->sample_rate() << " Hz, " << driver->channels() << " ch)" << std::endl;

    if (model_ == OutputModel::Push) {
        return std::make_unique<PushRingOutput>(std::move(driver));
    }
    return std::make_unique<PullSinkOutput>(std::move(driver));
}

} // namespace deck
