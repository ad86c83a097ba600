/**
 * @file Converter.hpp
 * @brief Channel-count and sample-rate conversion for interleaved PCM.
 *
 * Rate conversion is plain linear interpolation between neighbouring frames.
 * It is not band-limited: downsampling aliases content above the new Nyquist
 * frequency. That is accepted for speech and preview playback.
 */

#ifndef DECK_CONVERTER_HPP
#define DECK_CONVERTER_HPP

#include <cstdint>
#include <span>
#include <vector>

namespace deck {

/**
 * @brief Remap interleaved samples from src_channels to dst_channels.
 *
 * - Equal counts: copy.
 * - Mono to stereo: each sample duplicated.
 * - Stereo to mono: pairs averaged; a trailing odd sample passes through.
 * - Anything else: frame by frame, destination channel c reads source channel
 *   min(c, src_channels - 1). A trailing partial frame is dropped.
 */
std::vector<float> convert_channels(std::span<const float> samples,
                                    uint16_t src_channels,
                                    uint16_t dst_channels);

/**
 * @brief Resample interleaved frames from src_rate to dst_rate.
 *
 * Produces floor(frames * dst_rate / src_rate) frames. Output frame i reads
 * source position i * src_rate / dst_rate; the right-hand neighbour is clamped
 * to the last input frame.
 *
 * Mind the direction: the frame count scales by dst/src, so converting rate 1
 * to rate 2 doubles the frames. It is 2 to 1 that halves them.
 */
std::vector<float> convert_rate(std::span<const float> samples,
                                uint16_t channels,
                                uint32_t src_rate,
                                uint32_t dst_rate);

/**
 * @brief Channel conversion followed by rate conversion.
 *
 * @throws EngineError(InvalidArgument) when any rate or channel count is zero.
 */
std::vector<float> convert(std::span<const float> samples,
                           uint32_t src_rate,
                           uint16_t src_channels,
                           uint32_t dst_rate,
                           uint16_t dst_channels);

} // namespace deck

#endif // DECK_CONVERTER_HPP
