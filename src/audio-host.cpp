// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "audio-host.hpp"

#include <cstdarg>

// --------------------------------------------------------------------------------------------------------------------

void setAudioError(AudioError& error, const AudioErrorKind kind, const char* const format, ...)
{
    char msg[512];

    va_list args;
    va_start(args, format);
    std::vsnprintf(msg, sizeof(msg), format, args);
    va_end(args);

    error.kind = kind;
    error.message = msg;

    DEBUGPRINT("audio error %s: %s", getAudioErrorKindName(kind), msg);
}

const char* getAudioErrorKindName(const AudioErrorKind kind) noexcept
{
    switch (kind)
    {
    case kAudioErrorNone:
        return "none";
    case kAudioErrorQuery:
        return "query";
    case kAudioErrorDeviceCapability:
        return "device-capability";
    case kAudioErrorStream:
        return "stream";
    }

    return "";
}

// --------------------------------------------------------------------------------------------------------------------

bool queryDeviceCatalog(AudioHost& host, DeviceCatalog& catalog, AudioError& error)
{
    catalog.devices.clear();
    catalog.hostApis.clear();
    catalog.defaults = DefaultDeviceIndices();

    return host.queryDevices(catalog.devices, error)
        && host.queryHostApis(catalog.hostApis, error)
        && host.queryDefaults(catalog.defaults, error);
}

const char* getHostApiName(const HostApiTable& hostApis, const int hostApiId)
{
    const HostApiTable::const_iterator it = hostApis.find(hostApiId);
    return it != hostApis.end() ? it->second.c_str() : "Unknown API";
}

uint32_t getTestSampleRate(const DeviceDescriptor& device, const AudioHost& host)
{
    if (device.defaultSampleRate && *device.defaultSampleRate > 0.0)
        return static_cast<uint32_t>(*device.defaultSampleRate);

    const std::optional<double> hostRate = host.getDefaultSampleRate();
    if (hostRate && *hostRate > 0.0)
        return static_cast<uint32_t>(*hostRate);

    return AUDIO_PROBE_FALLBACK_SAMPLE_RATE;
}

// --------------------------------------------------------------------------------------------------------------------
