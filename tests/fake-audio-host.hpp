// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-host.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

// --------------------------------------------------------------------------------------------------------------------

// in-memory audio host, records every stream request instead of touching hardware
class FakeAudioHost : public AudioHost {
public:
    struct PlayCall {
        int index;
        AudioBuffer buffer;
        uint32_t sampleRate;
    };

    struct RecordCall {
        int index;
        unsigned numChannels;
        uint32_t numFrames;
        uint32_t sampleRate;
    };

    std::vector<DeviceDescriptor> devices;
    HostApiTable hostApis;
    DefaultDeviceIndices defaults;
    std::optional<double> defaultSampleRate;

    bool failQuery = false;
    bool failPlay = false;
    bool failRecord = false;

    // constant value written to every recorded sample
    float recordValue = 0.f;

    std::vector<PlayCall> playCalls;
    std::vector<RecordCall> recordCalls;

    FakeAudioHost()
    {
        hostApis[0] = "ALSA";
    }

    void addDevice(const char* const name,
                   const unsigned ins,
                   const unsigned outs,
                   const std::optional<double> sampleRate = std::nullopt,
                   const int hostApiId = 0)
    {
        DeviceDescriptor device;
        device.index = static_cast<int>(devices.size());
        device.name = name;
        device.hostApiId = hostApiId;
        device.maxInputChannels = ins;
        device.maxOutputChannels = outs;
        device.defaultSampleRate = sampleRate;
        devices.push_back(device);
    }

    bool queryDevices(std::vector<DeviceDescriptor>& out, AudioError& error) override
    {
        if (failQuery)
        {
            setAudioError(error, kAudioErrorQuery, "no audio subsystem");
            return false;
        }

        out = devices;
        return true;
    }

    bool queryHostApis(HostApiTable& out, AudioError& error) override
    {
        if (failQuery)
        {
            setAudioError(error, kAudioErrorQuery, "no audio subsystem");
            return false;
        }

        out = hostApis;
        return true;
    }

    bool queryDefaults(DefaultDeviceIndices& out, AudioError& error) override
    {
        if (failQuery)
        {
            setAudioError(error, kAudioErrorQuery, "no audio subsystem");
            return false;
        }

        out = defaults;
        return true;
    }

    bool queryDevice(const int index, DeviceDescriptor& device, AudioError& error) override
    {
        if (failQuery || index < 0 || static_cast<size_t>(index) >= devices.size())
        {
            setAudioError(error, kAudioErrorQuery, "Error querying device %d", index);
            return false;
        }

        device = devices[index];
        return true;
    }

    std::optional<double> getDefaultSampleRate() const override
    {
        return defaultSampleRate;
    }

    bool play(const int index, const AudioBuffer& buffer, const uint32_t sampleRate, AudioError& error) override
    {
        playCalls.push_back({ index, buffer, sampleRate });

        if (failPlay)
        {
            setAudioError(error, kAudioErrorStream, "device busy");
            return false;
        }

        return true;
    }

    bool record(const int index,
                const unsigned numChannels,
                const uint32_t numFrames,
                const uint32_t sampleRate,
                AudioBuffer& buffer,
                AudioError& error) override
    {
        recordCalls.push_back({ index, numChannels, numFrames, sampleRate });

        if (failRecord)
        {
            setAudioError(error, kAudioErrorStream, "device unplugged");
            return false;
        }

        buffer.resize(numChannels, numFrames);
        for (float& s : buffer.samples)
            s = recordValue;

        return true;
    }
};

// --------------------------------------------------------------------------------------------------------------------

// FILE* backed by memory, for checking printed output
struct OutputCapture {
    char* data = nullptr;
    size_t size = 0;
    FILE* const file;

    OutputCapture()
        : file(open_memstream(&data, &size)) {}

    ~OutputCapture()
    {
        std::fclose(file);
        std::free(data);
    }

    std::string str()
    {
        std::fflush(file);
        return std::string(data, size);
    }

    bool contains(const char* const text)
    {
        return str().find(text) != std::string::npos;
    }
};

// FILE* reading from a fixed script, for feeding prompts
struct InputScript {
    std::string text;
    FILE* const file;

    explicit InputScript(const char* const script)
        : text(script),
          file(fmemopen(&text[0], text.size(), "r")) {}

    ~InputScript()
    {
        std::fclose(file);
    }
};

// --------------------------------------------------------------------------------------------------------------------
