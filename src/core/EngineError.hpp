/**
 * @file EngineError.hpp
 * @brief Error kinds reported by the playback engine.
 */

#ifndef DECK_ENGINE_ERROR_HPP
#define DECK_ENGINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace deck {

/**
 * @brief Classification of every failure the engine reports to a caller.
 */
enum class ErrorKind {
    NotFound,            // Unknown player handle
    DeviceError,         // Device resolution, open or reconfigure failure
    DecodeError,         // Malformed or unsupported compressed payload
    InvalidArgument,     // Zero sample rate / channel count, nothing loaded
    UninitializedOutput, // Output resources absent and not creatable
    Disconnected         // Engine thread unreachable
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception carrying an ErrorKind across the command channel.
 *
 * Handlers throw it on the engine thread; the reply promise transports it
 * back to the blocked caller, which sees it rethrown from the controller.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace deck

#endif // DECK_ENGINE_ERROR_HPP
