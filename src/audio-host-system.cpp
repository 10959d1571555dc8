// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "audio-host-system.hpp"
#include "audio-host-impl.hpp"

// --------------------------------------------------------------------------------------------------------------------

class SystemAudioHost : public AudioHost {
public:
    explicit SystemAudioHost(const std::optional<double> defaultSampleRate)
        : defaultSampleRate(defaultSampleRate) {}

    ~SystemAudioHost() override
    {
        cleanupAlsaDevices();
    }

    bool queryDevices(std::vector<DeviceDescriptor>& devices, AudioError& error) override
    {
        std::vector<NativeDevice> natives;
        if (! enumerate(natives, error))
            return false;

        devices.clear();
        devices.reserve(natives.size());

        for (size_t i = 0; i < natives.size(); ++i)
            devices.push_back(toDescriptor(natives[i], static_cast<int>(i)));

        return true;
    }

    bool queryHostApis(HostApiTable& hostApis, AudioError&) override
    {
        hostApis.clear();
        hostApis[kHostApiAlsa] = "ALSA";
       #if AUDIO_PROBE_JACK
        hostApis[kHostApiJack] = "JACK Audio Connection Kit";
       #endif
        return true;
    }

    bool queryDefaults(DefaultDeviceIndices& defaults, AudioError& error) override
    {
        std::vector<NativeDevice> natives;
        if (! enumerate(natives, error))
            return false;

        defaults = DefaultDeviceIndices();

        for (size_t i = 0; i < natives.size(); ++i)
        {
            const NativeDevice& native(natives[i]);

            if (! native.isDefault)
                continue;
            if (native.maxChansIn != 0 && ! defaults.input)
                defaults.input = static_cast<int>(i);
            if (native.maxChansOut != 0 && ! defaults.output)
                defaults.output = static_cast<int>(i);
        }

        return true;
    }

    bool queryDevice(const int index, DeviceDescriptor& device, AudioError& error) override
    {
        NativeDevice native;
        if (! findDevice(index, native, error))
            return false;

        device = toDescriptor(native, index);
        return true;
    }

    std::optional<double> getDefaultSampleRate() const override
    {
        return defaultSampleRate;
    }

    bool play(const int index, const AudioBuffer& buffer, const uint32_t sampleRate, AudioError& error) override
    {
        NativeDevice native;
        if (! findDevice(index, native, error))
            return false;

        if (native.maxChansOut == 0)
        {
            setAudioError(error, kAudioErrorDeviceCapability, "device %d has no output channels", index);
            return false;
        }

        DEBUGPRINT("play %u frames on %s", buffer.numFrames, native.id.c_str());

       #if AUDIO_PROBE_JACK
        if (native.hostApiId == kHostApiJack)
            return runJackPlayback(buffer, sampleRate, error);
       #endif

        return runAlsaPlayback(native.id, buffer, sampleRate, error);
    }

    bool record(const int index,
                const unsigned numChannels,
                const uint32_t numFrames,
                const uint32_t sampleRate,
                AudioBuffer& buffer,
                AudioError& error) override
    {
        NativeDevice native;
        if (! findDevice(index, native, error))
            return false;

        if (native.maxChansIn == 0)
        {
            setAudioError(error, kAudioErrorDeviceCapability, "device %d has no input channels", index);
            return false;
        }

        DEBUGPRINT("record %u frames from %s", numFrames, native.id.c_str());

       #if AUDIO_PROBE_JACK
        if (native.hostApiId == kHostApiJack)
            return runJackCapture(numChannels, numFrames, sampleRate, buffer, error);
       #endif

        return runAlsaCapture(native.id, numChannels, numFrames, sampleRate, buffer, error);
    }

private:
    const std::optional<double> defaultSampleRate;

    static DeviceDescriptor toDescriptor(const NativeDevice& native, const int index)
    {
        DeviceDescriptor device;
        device.index = index;
        device.name = native.name;
        device.hostApiId = native.hostApiId;
        device.maxInputChannels = native.maxChansIn;
        device.maxOutputChannels = native.maxChansOut;
        device.defaultSampleRate = native.sampleRate;
        return device;
    }

    // always a fresh enumeration, nothing is cached between calls
    static bool enumerate(std::vector<NativeDevice>& natives, AudioError& error)
    {
        if (! enumerateAlsaDevices(natives, error))
            return false;

       #if AUDIO_PROBE_JACK
        enumerateJackServer(natives);
       #endif

        return true;
    }

    static bool findDevice(const int index, NativeDevice& native, AudioError& error)
    {
        std::vector<NativeDevice> natives;
        if (! enumerate(natives, error))
            return false;

        if (index < 0 || static_cast<size_t>(index) >= natives.size())
        {
            setAudioError(error, kAudioErrorQuery, "Error querying device %d", index);
            return false;
        }

        native = natives[index];
        return true;
    }
};

// --------------------------------------------------------------------------------------------------------------------

std::unique_ptr<AudioHost> createSystemAudioHost(const std::optional<double> defaultSampleRate)
{
    return std::unique_ptr<AudioHost>(new SystemAudioHost(defaultSampleRate));
}

// --------------------------------------------------------------------------------------------------------------------
