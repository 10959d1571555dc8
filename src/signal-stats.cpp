// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "signal-stats.hpp"

#include <algorithm>
#include <cmath>

// --------------------------------------------------------------------------------------------------------------------

uint32_t getFrameCount(const uint32_t sampleRate, const double duration) noexcept
{
    const double frames = sampleRate * duration;

    if (! (frames >= 1.0))
        return 0;
    if (frames >= static_cast<double>(UINT32_MAX))
        return UINT32_MAX;

    return static_cast<uint32_t>(frames);
}

void synthesizeSineTone(AudioBuffer& buffer,
                        const unsigned numChannels,
                        const uint32_t sampleRate,
                        const double duration,
                        const double frequency,
                        const double amplitude)
{
    const uint32_t numFrames = getFrameCount(sampleRate, duration);
    buffer.resize(numChannels, numFrames);

    if (numFrames == 0)
        return;

    // evenly spaced over [0, duration), endpoint excluded
    const double step = duration / numFrames;

    for (uint32_t i = 0; i < numFrames; ++i)
    {
        const float value = static_cast<float>(amplitude * std::sin(2.0 * M_PI * frequency * (i * step)));

        for (unsigned c = 0; c < numChannels; ++c)
            buffer.samples[static_cast<size_t>(i) * numChannels + c] = value;
    }
}

double rmsToDbfs(const double rms) noexcept
{
    return 20.0 * std::log10(std::max(rms, AUDIO_PROBE_DBFS_FLOOR));
}

void measureChannelLevels(const AudioBuffer& buffer, ChannelLevels& levels)
{
    const unsigned numChannels = buffer.numChannels;
    const uint32_t numFrames = buffer.numFrames;

    levels.rms.assign(numChannels, 0.0);
    levels.dbfs.assign(numChannels, rmsToDbfs(0.0));
    levels.peak = 0.0;

    if (numFrames == 0)
        return;

    for (unsigned c = 0; c < numChannels; ++c)
    {
        double sum = 0.0;

        for (uint32_t i = 0; i < numFrames; ++i)
        {
            const double s = buffer.sample(i, c);
            sum += s * s;
            levels.peak = std::max(levels.peak, std::fabs(s));
        }

        levels.rms[c] = std::sqrt(sum / numFrames);
        levels.dbfs[c] = rmsToDbfs(levels.rms[c]);
    }
}

void applyGain(AudioBuffer& buffer, const float gain) noexcept
{
    for (float& s : buffer.samples)
        s *= gain;
}

// --------------------------------------------------------------------------------------------------------------------
