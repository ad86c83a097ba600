/**
 * @file Mp3Decoder.hpp
 * @brief MPEG-1/2 Layer III decoder built on minimp3.
 */

#ifndef DECK_MP3_DECODER_HPP
#define DECK_MP3_DECODER_HPP

#include "Decoder.hpp"

namespace deck {

/**
 * @brief Decodes a whole in-memory MP3 file in one call.
 *
 * ID3 tags are skipped by minimp3. Mixed-format streams keep the format of
 * the first frame, which is what minimp3 reports.
 */
class Mp3Decoder : public Decoder {
public:
    DecodedAudio decode(std::span<const uint8_t> bytes) override;

    std::string name() const override { return "MP3 (minimp3)"; }
};

} // namespace deck

#endif // DECK_MP3_DECODER_HPP
