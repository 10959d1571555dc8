// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-host.hpp"

// --------------------------------------------------------------------------------------------------------------------

enum HostApiId {
    kHostApiAlsa = 0,
    kHostApiJack = 1,
};

// sane channel limit for any reported device
static constexpr const unsigned kMaxDeviceChannels = 32;

// device as found by a backend, before it gets a catalog index
struct NativeDevice {
    // backend-specific id used to open streams
    std::string id;
    std::string name;
    int hostApiId = kHostApiAlsa;
    unsigned maxChansIn = 0;
    unsigned maxChansOut = 0;
    std::optional<double> sampleRate;
    // system default for the directions it supports
    bool isDefault = false;
};

// --------------------------------------------------------------------------------------------------------------------
// ALSA

bool enumerateAlsaDevices(std::vector<NativeDevice>& devices, AudioError& error);

bool runAlsaPlayback(const std::string& deviceID, const AudioBuffer& buffer, uint32_t sampleRate, AudioError& error);

bool runAlsaCapture(const std::string& deviceID,
                    unsigned numChannels,
                    uint32_t numFrames,
                    uint32_t sampleRate,
                    AudioBuffer& buffer,
                    AudioError& error);

void cleanupAlsaDevices();

// --------------------------------------------------------------------------------------------------------------------
// JACK

#if AUDIO_PROBE_JACK
// appends the JACK server device, returns false if no server is running
bool enumerateJackServer(std::vector<NativeDevice>& devices);

bool runJackPlayback(const AudioBuffer& buffer, uint32_t sampleRate, AudioError& error);

bool runJackCapture(unsigned numChannels,
                    uint32_t numFrames,
                    uint32_t sampleRate,
                    AudioBuffer& buffer,
                    AudioError& error);
#endif

// --------------------------------------------------------------------------------------------------------------------
