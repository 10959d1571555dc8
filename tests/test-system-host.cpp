// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#undef NDEBUG
#include <cassert>

#include "audio-host-system.hpp"

// enumerates whatever the machine has, no streams are opened
int main()
{
    const std::unique_ptr<AudioHost> host = createSystemAudioHost(std::nullopt);

    AudioError error;
    DeviceCatalog catalog;

    if (! queryDeviceCatalog(*host, catalog, error))
    {
        printf("query failed: %s | %s\n", getAudioErrorKindName(error.kind), error.message.c_str());
        assert(error.kind == kAudioErrorQuery);
        return 0;
    }

    assert(catalog.hostApis.count(0) == 1);
    assert(catalog.hostApis.at(0) == "ALSA");
    assert(! host->getDefaultSampleRate());

    for (size_t i = 0; i < catalog.devices.size(); ++i)
    {
        const DeviceDescriptor& device(catalog.devices[i]);

        printf("%d | %s | %s | ins %u | outs %u | sr %g\n",
               device.index, device.name.c_str(), getHostApiName(catalog.hostApis, device.hostApiId),
               device.maxInputChannels, device.maxOutputChannels,
               device.defaultSampleRate ? *device.defaultSampleRate : 0.0);

        assert(device.index == static_cast<int>(i));
        assert(device.maxInputChannels <= 32 && device.maxOutputChannels <= 32);
    }

    if (catalog.defaults.input)
        assert(catalog.devices.at(*catalog.defaults.input).maxInputChannels != 0);
    if (catalog.defaults.output)
        assert(catalog.devices.at(*catalog.defaults.output).maxOutputChannels != 0);

    DeviceDescriptor device;
    assert(! host->queryDevice(-1, device, error));
    assert(error.kind == kAudioErrorQuery);
    assert(! host->queryDevice(static_cast<int>(catalog.devices.size()) + 100, device, error));
    assert(error.message.find("Error querying device") == 0);

    // nothing to play to, so stream requests are rejected before touching ALSA
    if (catalog.devices.empty())
    {
        AudioBuffer buffer;
        buffer.resize(1, 16);
        assert(! host->play(0, buffer, 48000, error));
    }

    return 0;
}
