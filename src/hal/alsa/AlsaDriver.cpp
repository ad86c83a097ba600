/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "EngineError.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <pthread.h>

namespace deck::hal {

namespace {

struct HwParamsDeleter {
    void operator()(snd_pcm_hw_params_t* params) const { snd_pcm_hw_params_free(params); }
};

struct HintStringDeleter {
    void operator()(char* text) const { std::free(text); }
};

using HintString = std::unique_ptr<char, HintStringDeleter>;

// ALSA descriptions are "Card name, Device name\nLong description"
std::string first_line(const char* text) {
    std::string line(text);
    if (auto newline = line.find('\n'); newline != std::string::npos) {
        line.resize(newline);
    }
    return line;
}

} // namespace

AlsaDriver::AlsaDriver(const std::string& device, int sample_rate, int block_size, int num_channels)
    : pcm_handle_(nullptr)
    , format_(SND_PCM_FORMAT_S32_LE)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , running_(false)
{
}

AlsaDriver::~AlsaDriver() {
    stop();
    close_pcm();
}

bool AlsaDriver::open() {
    if (pcm_handle_) return true;
    if (!setup_pcm()) {
        close_pcm();
        return false;
    }
    return true;
}

void AlsaDriver::set_callback(RenderCallback callback) {
    callback_ = std::move(callback);
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!pcm_handle_) {
        last_error_ = "ALSA: device " + device_name_ + " is not open";
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }

    if (pcm_handle_) {
        // Discard what is still queued in hardware and re-arm for the next start()
        snd_pcm_drop(pcm_handle_);
        snd_pcm_prepare(pcm_handle_);
    }
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::fail(const std::string& what, int err) {
    last_error_ = "ALSA: " + what + " on " + device_name_ + " (" + snd_strerror(err) + ")";
    std::cerr << last_error_ << std::endl;
    return false;
}

bool AlsaDriver::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        pcm_handle_ = nullptr;
        return fail("Cannot open audio device", err);
    }

    snd_pcm_hw_params_t* raw_params = nullptr;
    if ((err = snd_pcm_hw_params_malloc(&raw_params)) < 0) {
        return fail("Cannot allocate hardware parameter structure", err);
    }
    std::unique_ptr<snd_pcm_hw_params_t, HwParamsDeleter> hw_params(raw_params);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params.get())) < 0) {
        return fail("Cannot initialize hardware parameter structure", err);
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params.get(), SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type", err);
    }

    // Prefer S32_LE for resolution, fall back to S16_LE
    format_ = SND_PCM_FORMAT_S32_LE;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format_)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        format_ = SND_PCM_FORMAT_S16_LE;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format_)) < 0) {
            return fail("Cannot set sample format", err);
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params.get(), &rate, nullptr)) < 0) {
        return fail("Cannot set sample rate", err);
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params.get(), &channels)) < 0) {
        return fail("Cannot set channel count", err);
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params.get(), &frames, nullptr)) < 0) {
        return fail("Cannot set period size", err);
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params.get(), &periods, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period count, keeping driver default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params.get())) < 0) {
        return fail("Cannot set parameters", err);
    }

    const size_t bytes_per_sample = static_cast<size_t>(snd_pcm_format_physical_width(format_) / 8);
    interleaved_buffer_.assign(static_cast<size_t>(block_size_ * num_channels_) * bytes_per_sample, 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        return fail("Cannot prepare audio interface for use", err);
    }

    return true;
}

void AlsaDriver::thread_loop() {
    auto& logger = AudioLogger::instance();

    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            logger.log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            logger.log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        logger.log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    // RT-Safe: Pre-allocate float buffer for the render callback
    std::vector<float> float_interleaved(static_cast<size_t>(block_size_ * num_channels_), 0.0f);

    while (running_) {
        // Gaps the callback leaves unwritten must be silent
        std::fill(float_interleaved.begin(), float_interleaved.end(), 0.0f);

        if (callback_) {
            callback_(std::span<float>(float_interleaved));
        }

        if (format_ == SND_PCM_FORMAT_S16_LE) {
            auto* s16_ptr = reinterpret_cast<int16_t*>(interleaved_buffer_.data());
            for (size_t i = 0; i < float_interleaved.size(); ++i) {
                const float sample = std::clamp(float_interleaved[i], -1.0f, 1.0f);
                s16_ptr[i] = static_cast<int16_t>(sample * 32767.0f);
            }
        } else {
            auto* s32_ptr = reinterpret_cast<int32_t*>(interleaved_buffer_.data());
            for (size_t i = 0; i < float_interleaved.size(); ++i) {
                const float sample = std::clamp(float_interleaved[i], -1.0f, 1.0f);
                s32_ptr[i] = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
            }
        }

        snd_pcm_sframes_t written = snd_pcm_writei(pcm_handle_, interleaved_buffer_.data(),
                                                   static_cast<snd_pcm_uframes_t>(block_size_));
        if (written < 0) {
            recover_pcm(static_cast<int>(written));
        }
    }
}

void AlsaDriver::recover_pcm(int err) {
    auto& logger = AudioLogger::instance();
    if (err == -EPIPE) {
        logger.log_event("XRUN", static_cast<float>(block_size_));
        snd_pcm_prepare(pcm_handle_);
    } else if (err == -ESTRPIPE) {
        logger.log_message("ALSA", "Stream suspended, resuming");
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            snd_pcm_prepare(pcm_handle_);
        }
    } else {
        logger.log_message("ALSA", snd_strerror(err));
        snd_pcm_prepare(pcm_handle_);
    }
}

bool AlsaHost::has_default_device() {
    int card = -1;
    return snd_card_next(&card) == 0 && card >= 0;
}

std::vector<DeviceInfo> AlsaHost::output_devices() {
    void** hints = nullptr;
    if (int err = snd_device_name_hint(-1, "pcm", &hints); err < 0) {
        throw EngineError(ErrorKind::DeviceError,
                          std::string("ALSA: cannot enumerate devices (") + snd_strerror(err) + ")");
    }

    std::vector<DeviceInfo> devices;
    for (void** hint = hints; *hint != nullptr; ++hint) {
        HintString name(snd_device_name_get_hint(*hint, "NAME"));
        HintString desc(snd_device_name_get_hint(*hint, "DESC"));
        HintString ioid(snd_device_name_get_hint(*hint, "IOID"));

        // A missing IOID means the PCM supports both directions
        const bool is_output = !ioid || std::strcmp(ioid.get(), "Output") == 0;
        if (!name || !is_output || std::strcmp(name.get(), "null") == 0) {
            continue;
        }

        DeviceInfo info;
        info.id = std::to_string(devices.size());
        info.name = desc ? first_line(desc.get()) : std::string(name.get());
        info.address = name.get();
        devices.push_back(std::move(info));
    }
    snd_device_name_free_hint(hints);
    return devices;
}

std::unique_ptr<AudioDriver> AlsaHost::open_driver(const DeviceInfo& device, const StreamFormat& format) {
    const std::string pcm_name = device.address.empty() ? std::string("default") : device.address;
    auto driver = std::make_unique<AlsaDriver>(pcm_name, format.sample_rate, format.block_size, format.channels);
    if (!driver->open()) {
        throw EngineError(ErrorKind::DeviceError, driver->last_error());
    }
    return driver;
}

} // namespace deck::hal
