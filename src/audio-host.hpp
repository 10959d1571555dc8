// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-probe.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// --------------------------------------------------------------------------------------------------------------------

enum AudioErrorKind {
    kAudioErrorNone = 0,
    // device or host API enumeration failed
    kAudioErrorQuery,
    // requested direction not supported by the device
    kAudioErrorDeviceCapability,
    // open, play, record or wait failed
    kAudioErrorStream,
};

struct AudioError {
    AudioErrorKind kind = kAudioErrorNone;
    std::string message;
};

void setAudioError(AudioError& error, AudioErrorKind kind, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

const char* getAudioErrorKindName(AudioErrorKind kind) noexcept;

// --------------------------------------------------------------------------------------------------------------------

struct DeviceDescriptor {
    int index = -1;
    std::string name;
    int hostApiId = 0;
    unsigned maxInputChannels = 0;
    unsigned maxOutputChannels = 0;
    std::optional<double> defaultSampleRate;
};

// host API id -> display name
typedef std::map<int, std::string> HostApiTable;

struct DefaultDeviceIndices {
    std::optional<int> input;
    std::optional<int> output;
};

// everything a single listing or test pass needs, queried together
struct DeviceCatalog {
    std::vector<DeviceDescriptor> devices;
    HostApiTable hostApis;
    DefaultDeviceIndices defaults;
};

// interleaved float samples
struct AudioBuffer {
    unsigned numChannels = 0;
    uint32_t numFrames = 0;
    std::vector<float> samples;

    void resize(unsigned channels, uint32_t frames)
    {
        numChannels = channels;
        numFrames = frames;
        samples.assign(static_cast<size_t>(channels) * frames, 0.f);
    }

    float sample(uint32_t frame, unsigned channel) const
    {
        return samples[static_cast<size_t>(frame) * numChannels + channel];
    }
};

// --------------------------------------------------------------------------------------------------------------------

// native audio subsystem as seen by the probe code.
// every call blocks the calling thread until the native layer is done.
class AudioHost {
public:
    virtual ~AudioHost() {}

    virtual bool queryDevices(std::vector<DeviceDescriptor>& devices, AudioError& error) = 0;
    virtual bool queryHostApis(HostApiTable& hostApis, AudioError& error) = 0;
    virtual bool queryDefaults(DefaultDeviceIndices& defaults, AudioError& error) = 0;
    virtual bool queryDevice(int index, DeviceDescriptor& device, AudioError& error) = 0;

    // global default sample rate, used for devices which report none
    virtual std::optional<double> getDefaultSampleRate() const = 0;

    // play buffer and wait until it has been fully rendered
    virtual bool play(int index, const AudioBuffer& buffer, uint32_t sampleRate, AudioError& error) = 0;

    // record numFrames and wait until they have been fully captured
    virtual bool record(int index,
                        unsigned numChannels,
                        uint32_t numFrames,
                        uint32_t sampleRate,
                        AudioBuffer& buffer,
                        AudioError& error) = 0;
};

// --------------------------------------------------------------------------------------------------------------------

bool queryDeviceCatalog(AudioHost& host, DeviceCatalog& catalog, AudioError& error);

const char* getHostApiName(const HostApiTable& hostApis, int hostApiId);

// resolve the sample rate a test should run at: device default, host default, then fallback
uint32_t getTestSampleRate(const DeviceDescriptor& device, const AudioHost& host);

// --------------------------------------------------------------------------------------------------------------------
