// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-host.hpp"

// --------------------------------------------------------------------------------------------------------------------

struct ChannelLevels {
    std::vector<double> rms;
    std::vector<double> dbfs;
    double peak = 0.0;
};

// number of whole frames in `duration` seconds, 0 for negative or empty durations
uint32_t getFrameCount(uint32_t sampleRate, double duration) noexcept;

// mono sine duplicated into `numChannels` interleaved channels
void synthesizeSineTone(AudioBuffer& buffer,
                        unsigned numChannels,
                        uint32_t sampleRate,
                        double duration,
                        double frequency,
                        double amplitude);

// 20*log10(rms), with rms floored to AUDIO_PROBE_DBFS_FLOOR
double rmsToDbfs(double rms) noexcept;

// per-channel RMS/dBFS and peak absolute amplitude across all channels
void measureChannelLevels(const AudioBuffer& buffer, ChannelLevels& levels);

void applyGain(AudioBuffer& buffer, float gain) noexcept;

// --------------------------------------------------------------------------------------------------------------------
