/**
 * @file CoreAudioDriver.cpp
 * @brief Implementation of the CoreAudio driver for macOS.
 */

#include "CoreAudioDriver.hpp"
#include "EngineError.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <span>
#include <vector>

namespace deck::hal {

namespace {

AudioObjectPropertyAddress global_address(AudioObjectPropertySelector selector) {
    return AudioObjectPropertyAddress{selector, kAudioObjectPropertyScopeGlobal, kAudioObjectPropertyElementMain};
}

bool has_output_streams(AudioDeviceID device) {
    AudioObjectPropertyAddress address{
        kAudioDevicePropertyStreams, kAudioDevicePropertyScopeOutput, kAudioObjectPropertyElementMain};
    UInt32 size = 0;
    return AudioObjectGetPropertyDataSize(device, &address, 0, nullptr, &size) == noErr && size > 0;
}

std::string device_name(AudioDeviceID device) {
    AudioObjectPropertyAddress address = global_address(kAudioObjectPropertyName);
    CFStringRef name = nullptr;
    UInt32 size = sizeof(name);
    if (AudioObjectGetPropertyData(device, &address, 0, nullptr, &size, &name) != noErr || !name) {
        return "Output device " + std::to_string(device);
    }
    char buffer[256] = {};
    const Boolean ok = CFStringGetCString(name, buffer, sizeof(buffer), kCFStringEncodingUTF8);
    CFRelease(name);
    return ok ? std::string(buffer) : "Output device " + std::to_string(device);
}

} // namespace

CoreAudioDriver::CoreAudioDriver(AudioDeviceID device, int sample_rate, int block_size, int num_channels)
    : audio_unit_(nullptr)
    , device_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , initialized_(false)
    , running_(false)
{
}

CoreAudioDriver::~CoreAudioDriver() {
    stop();
    if (audio_unit_) {
        if (initialized_) {
            AudioUnitUninitialize(audio_unit_);
        }
        AudioComponentInstanceDispose(audio_unit_);
    }
}

bool CoreAudioDriver::fail(const std::string& what, OSStatus status) {
    last_error_ = "CoreAudioDriver: " + what + " (OSStatus " + std::to_string(status) + ")";
    std::cerr << last_error_ << std::endl;
    return false;
}

bool CoreAudioDriver::open() {
    if (initialized_) return true;

    // 1. Describe the audio unit
    AudioComponentDescription desc;
    desc.componentType = kAudioUnitType_Output;
    desc.componentSubType = device_ == 0 ? kAudioUnitSubType_DefaultOutput : kAudioUnitSubType_HALOutput;
    desc.componentManufacturer = kAudioUnitManufacturer_Apple;
    desc.componentFlags = 0;
    desc.componentFlagsMask = 0;

    // 2. Find the component
    AudioComponent comp = AudioComponentFindNext(nullptr, &desc);
    if (comp == nullptr) {
        return fail("Failed to find output component", kAudioUnitErr_InvalidElement);
    }

    // 3. Open the audio unit
    OSStatus status = AudioComponentInstanceNew(comp, &audio_unit_);
    if (status != noErr) {
        audio_unit_ = nullptr;
        return fail("AudioComponentInstanceNew failed", status);
    }

    // 4. Bind a specific device
    if (device_ != 0) {
        status = AudioUnitSetProperty(
            audio_unit_,
            kAudioOutputUnitProperty_CurrentDevice,
            kAudioUnitScope_Global,
            0,
            &device_,
            sizeof(device_));
        if (status != noErr) {
            return fail("Failed to select device " + std::to_string(device_), status);
        }
    }

    // Query hardware sample rate
    AudioStreamBasicDescription hwFormat;
    UInt32 propSize = sizeof(hwFormat);
    status = AudioUnitGetProperty(
        audio_unit_,
        kAudioUnitProperty_StreamFormat,
        kAudioUnitScope_Output,
        0,
        &hwFormat,
        &propSize);

    if (status == noErr && hwFormat.mSampleRate > 0) {
        sample_rate_ = static_cast<int>(hwFormat.mSampleRate);
    }

    // 5. Set the stream format (PCM Float32, interleaved)
    AudioStreamBasicDescription streamFormat;
    std::memset(&streamFormat, 0, sizeof(streamFormat));
    streamFormat.mSampleRate = static_cast<double>(sample_rate_);
    streamFormat.mFormatID = kAudioFormatLinearPCM;
    streamFormat.mFormatFlags = kAudioFormatFlagIsFloat | kAudioFormatFlagIsPacked;
    streamFormat.mFramesPerPacket = 1;
    streamFormat.mChannelsPerFrame = static_cast<UInt32>(num_channels_);
    streamFormat.mBitsPerChannel = 32;
    streamFormat.mBytesPerFrame = 4 * static_cast<UInt32>(num_channels_);
    streamFormat.mBytesPerPacket = streamFormat.mBytesPerFrame;

    status = AudioUnitSetProperty(
        audio_unit_,
        kAudioUnitProperty_StreamFormat,
        kAudioUnitScope_Input,
        0, // Output bus
        &streamFormat,
        sizeof(streamFormat));

    if (status != noErr) {
        return fail("Failed to set stream format", status);
    }

    UInt32 max_frames = static_cast<UInt32>(block_size_);
    propSize = sizeof(max_frames);
    if (AudioUnitGetProperty(audio_unit_, kAudioUnitProperty_MaximumFramesPerSlice,
                             kAudioUnitScope_Global, 0, &max_frames, &propSize) == noErr) {
        block_size_ = static_cast<int>(max_frames);
    }

    // 6. Set the render callback
    AURenderCallbackStruct callbackStruct;
    callbackStruct.inputProc = CoreAudioDriver::render_callback;
    callbackStruct.inputProcRefCon = this;

    status = AudioUnitSetProperty(
        audio_unit_,
        kAudioUnitProperty_SetRenderCallback,
        kAudioUnitScope_Input,
        0,
        &callbackStruct,
        sizeof(callbackStruct));

    if (status != noErr) {
        return fail("Failed to set render callback", status);
    }

    // 7. Initialize the audio unit
    status = AudioUnitInitialize(audio_unit_);
    if (status != noErr) {
        return fail("AudioUnitInitialize failed", status);
    }
    initialized_ = true;
    return true;
}

bool CoreAudioDriver::start() {
    if (running_) return true;
    if (!initialized_) {
        last_error_ = "CoreAudioDriver: unit is not initialized";
        return false;
    }

    OSStatus status = AudioOutputUnitStart(audio_unit_);
    if (status != noErr) {
        return fail("AudioOutputUnitStart failed", status);
    }
    running_ = true;
    return true;
}

void CoreAudioDriver::stop() {
    if (!running_) return;
    if (audio_unit_) {
        AudioOutputUnitStop(audio_unit_);
    }
    running_ = false;
}

void CoreAudioDriver::set_callback(RenderCallback callback) {
    callback_ = std::move(callback);
}

OSStatus CoreAudioDriver::render_callback(
    void* inRefCon,
    AudioUnitRenderActionFlags* /* ioActionFlags */,
    const AudioTimeStamp* /* inTimeStamp */,
    UInt32 /* inBusNumber */,
    UInt32 inNumberFrames,
    AudioBufferList* ioData)
{
    auto* driver = static_cast<CoreAudioDriver*>(inRefCon);

    // Silence first so anything the callback leaves unwritten is quiet
    for (UInt32 b = 0; b < ioData->mNumberBuffers; ++b) {
        std::memset(ioData->mBuffers[b].mData, 0, ioData->mBuffers[b].mDataByteSize);
    }

    if (driver->callback_ && ioData->mNumberBuffers > 0) {
        const size_t samples = std::min<size_t>(
            static_cast<size_t>(inNumberFrames) * static_cast<size_t>(driver->num_channels_),
            ioData->mBuffers[0].mDataByteSize / sizeof(float));
        driver->callback_(std::span<float>(static_cast<float*>(ioData->mBuffers[0].mData), samples));
    }

    return noErr;
}

bool CoreAudioHost::has_default_device() {
    AudioObjectPropertyAddress address = global_address(kAudioHardwarePropertyDefaultOutputDevice);
    AudioDeviceID device = kAudioObjectUnknown;
    UInt32 size = sizeof(device);
    OSStatus status = AudioObjectGetPropertyData(kAudioObjectSystemObject, &address, 0, nullptr, &size, &device);
    return status == noErr && device != kAudioObjectUnknown;
}

std::vector<DeviceInfo> CoreAudioHost::output_devices() {
    AudioObjectPropertyAddress address = global_address(kAudioHardwarePropertyDevices);
    UInt32 size = 0;
    OSStatus status = AudioObjectGetPropertyDataSize(kAudioObjectSystemObject, &address, 0, nullptr, &size);
    if (status != noErr) {
        throw EngineError(ErrorKind::DeviceError,
                          "CoreAudio: cannot enumerate devices (OSStatus " + std::to_string(status) + ")");
    }

    std::vector<AudioDeviceID> ids(size / sizeof(AudioDeviceID));
    status = AudioObjectGetPropertyData(kAudioObjectSystemObject, &address, 0, nullptr, &size, ids.data());
    if (status != noErr) {
        throw EngineError(ErrorKind::DeviceError,
                          "CoreAudio: cannot enumerate devices (OSStatus " + std::to_string(status) + ")");
    }
    ids.resize(size / sizeof(AudioDeviceID));

    std::vector<DeviceInfo> devices;
    for (AudioDeviceID id : ids) {
        if (!has_output_streams(id)) continue;
        DeviceInfo info;
        info.id = std::to_string(id);
        info.name = device_name(id);
        info.address = info.id;
        devices.push_back(std::move(info));
    }
    return devices;
}

std::unique_ptr<AudioDriver> CoreAudioHost::open_driver(const DeviceInfo& device, const StreamFormat& format) {
    AudioDeviceID id = 0;
    if (!device.address.empty() && device.address != "default") {
        id = static_cast<AudioDeviceID>(std::stoul(device.address));
    }
    auto driver = std::make_unique<CoreAudioDriver>(id, format.sample_rate, format.block_size, format.channels);
    if (!driver->open()) {
        throw EngineError(ErrorKind::DeviceError, driver->last_error());
    }
    return driver;
}

} // namespace deck::hal
