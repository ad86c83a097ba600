/**
 * @file Mp3Decoder.cpp
 * @brief minimp3-backed implementation of Mp3Decoder.
 */

#define MINIMP3_IMPLEMENTATION
#define MINIMP3_FLOAT_OUTPUT
#include <minimp3.h>
#include <minimp3_ex.h>

#include "Mp3Decoder.hpp"
#include "EngineError.hpp"
#include <cstdlib>
#include <memory>

namespace deck {

namespace {

std::string describe_status(int status) {
    switch (status) {
        case MP3D_E_PARAM: return "invalid parameter";
        case MP3D_E_MEMORY: return "out of memory";
        case MP3D_E_IOERROR: return "I/O error";
        case MP3D_E_USER: return "aborted";
        case MP3D_E_DECODE: return "malformed MPEG audio data";
        default: return "error " + std::to_string(status);
    }
}

} // namespace

DecodedAudio Mp3Decoder::decode(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        throw EngineError(ErrorKind::DecodeError, "MP3 payload is empty");
    }

    mp3dec_t mp3d;
    mp3dec_init(&mp3d);

    mp3dec_file_info_t info{};
    const int status = mp3dec_load_buf(&mp3d, bytes.data(), bytes.size(), &info, nullptr, nullptr);
    std::unique_ptr<mp3d_sample_t, decltype(&std::free)> buffer(info.buffer, &std::free);

    if (status != 0) {
        throw EngineError(ErrorKind::DecodeError, "MP3 decode failed: " + describe_status(status));
    }
    if (info.samples == 0 || info.channels <= 0 || info.hz <= 0 || !buffer) {
        throw EngineError(ErrorKind::DecodeError, "no MPEG audio frames found");
    }

    DecodedAudio decoded;
    decoded.sample_rate = static_cast<uint32_t>(info.hz);
    decoded.channels = static_cast<uint16_t>(info.channels);
    decoded.samples.assign(buffer.get(), buffer.get() + info.samples);
    return decoded;
}

std::unique_ptr<Decoder> make_mp3_decoder() {
    return std::make_unique<Mp3Decoder>();
}

} // namespace deck
