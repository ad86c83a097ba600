/**
 * @file Decoder.hpp
 * @brief Abstract compressed-audio decoder.
 */

#ifndef DECK_DECODER_HPP
#define DECK_DECODER_HPP

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace deck {

/**
 * @brief Fully decoded PCM: interleaved float samples plus their format.
 */
struct DecodedAudio {
    std::vector<float> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

/**
 * @brief Turns a compressed payload into PCM.
 *
 * Called on the engine thread only. Implementations throw
 * EngineError(DecodeError) for malformed or unsupported input.
 */
class Decoder {
public:
    virtual ~Decoder() = default;

    virtual DecodedAudio decode(std::span<const uint8_t> bytes) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Create the MPEG audio decoder (minimp3).
 */
std::unique_ptr<Decoder> make_mp3_decoder();

} // namespace deck

#endif // DECK_DECODER_HPP
