/**
 * @file Converter.cpp
 * @brief Implementation of the PCM channel/rate converter.
 */

#include "Converter.hpp"
#include "EngineError.hpp"
#include <algorithm>
#include <string>

namespace deck {

std::vector<float> convert_channels(std::span<const float> samples,
                                    uint16_t src_channels,
                                    uint16_t dst_channels) {
    if (src_channels == dst_channels) {
        return std::vector<float>(samples.begin(), samples.end());
    }

    std::vector<float> output;

    if (src_channels == 1 && dst_channels == 2) {
        output.reserve(samples.size() * 2);
        for (float sample : samples) {
            output.push_back(sample);
            output.push_back(sample);
        }
        return output;
    }

    if (src_channels == 2 && dst_channels == 1) {
        output.reserve((samples.size() + 1) / 2);
        size_t i = 0;
        for (; i + 1 < samples.size(); i += 2) {
            output.push_back((samples[i] + samples[i + 1]) * 0.5f);
        }
        if (i < samples.size()) {
            output.push_back(samples[i]);
        }
        return output;
    }

    const size_t frames = samples.size() / src_channels;
    output.resize(frames * dst_channels);
    for (size_t frame = 0; frame < frames; ++frame) {
        const float* in = samples.data() + frame * src_channels;
        float* out = output.data() + frame * dst_channels;
        for (uint16_t c = 0; c < dst_channels; ++c) {
            out[c] = in[std::min<uint16_t>(c, static_cast<uint16_t>(src_channels - 1))];
        }
    }
    return output;
}

std::vector<float> convert_rate(std::span<const float> samples,
                                uint16_t channels,
                                uint32_t src_rate,
                                uint32_t dst_rate) {
    if (src_rate == dst_rate) {
        return std::vector<float>(samples.begin(), samples.end());
    }

    const size_t in_frames = samples.size() / channels;
    if (in_frames == 0) {
        return {};
    }

    const uint64_t out_frames = static_cast<uint64_t>(in_frames) * dst_rate / src_rate;
    const double step = static_cast<double>(src_rate) / static_cast<double>(dst_rate);
    const size_t last = in_frames - 1;

    std::vector<float> output(static_cast<size_t>(out_frames) * channels);
    for (size_t i = 0; i < out_frames; ++i) {
        const double position = static_cast<double>(i) * step;
        const size_t i0 = std::min(static_cast<size_t>(position), last);
        const size_t i1 = std::min(i0 + 1, last);
        const float frac = static_cast<float>(std::clamp(position - static_cast<double>(i0), 0.0, 1.0));

        const float* a = samples.data() + i0 * channels;
        const float* b = samples.data() + i1 * channels;
        float* out = output.data() + i * channels;
        for (uint16_t c = 0; c < channels; ++c) {
            out[c] = a[c] + (b[c] - a[c]) * frac;
        }
    }
    return output;
}

std::vector<float> convert(std::span<const float> samples,
                           uint32_t src_rate,
                           uint16_t src_channels,
                           uint32_t dst_rate,
                           uint16_t dst_channels) {
    if (src_rate == 0 || dst_rate == 0) {
        throw EngineError(ErrorKind::InvalidArgument, "sample_rate must be > 0");
    }
    if (src_channels == 0 || dst_channels == 0) {
        throw EngineError(ErrorKind::InvalidArgument, "channels must be > 0");
    }

    auto remapped = convert_channels(samples, src_channels, dst_channels);
    if (src_rate == dst_rate) {
        return remapped;
    }
    return convert_rate(remapped, dst_channels, src_rate, dst_rate);
}

} // namespace deck
