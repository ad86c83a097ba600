#include "EngineError.hpp"

namespace deck {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::DeviceError: return "DeviceError";
        case ErrorKind::DecodeError: return "DecodeError";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::UninitializedOutput: return "UninitializedOutput";
        case ErrorKind::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

} // namespace deck
