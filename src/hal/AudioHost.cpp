#include "AudioHost.hpp"
#include "EngineError.hpp"
#include "null/NullDriver.hpp"
#ifdef __APPLE__
#include "coreaudio/CoreAudioDriver.hpp"
#else
#include "alsa/AlsaDriver.hpp"
#endif

namespace deck::hal {

std::unique_ptr<AudioHost> create_host(const std::string& kind, const NullHostOptions& null_options) {
    if (kind == "null") {
        return std::make_unique<NullHost>(null_options);
    }
#ifdef __APPLE__
    if (kind == "auto" || kind == "coreaudio") {
        return std::make_unique<CoreAudioHost>();
    }
#else
    if (kind == "auto" || kind == "alsa") {
        return std::make_unique<AlsaHost>();
    }
#endif
    throw EngineError(ErrorKind::DeviceError, "audio host not available in this build: " + kind);
}

} // namespace deck::hal
