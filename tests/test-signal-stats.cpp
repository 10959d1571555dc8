// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#undef NDEBUG
#include <cassert>
#include <cmath>

#include "signal-stats.hpp"

static bool near(const double a, const double b, const double tolerance = 1e-6)
{
    return std::fabs(a - b) <= tolerance;
}

int main()
{
    // frame counts truncate, empty and negative durations give nothing
    assert(getFrameCount(44100, 2.0) == 88200);
    assert(getFrameCount(48000, 0.5) == 24000);
    assert(getFrameCount(44100, 0.0) == 0);
    assert(getFrameCount(44100, -1.0) == 0);
    assert(getFrameCount(44100, NAN) == 0);

    // dBFS floor
    assert(near(rmsToDbfs(0.0), -240.0));
    assert(near(rmsToDbfs(1.0), 0.0));
    assert(near(rmsToDbfs(0.5), -6.0206, 1e-4));

    // sine tone, duplicated into every channel
    {
        AudioBuffer tone;
        synthesizeSineTone(tone, 2, 8000, 1.0, 1000.0, 0.5);

        assert(tone.numChannels == 2);
        assert(tone.numFrames == 8000);
        assert(tone.samples.size() == 16000);

        assert(near(tone.sample(0, 0), 0.0));
        assert(near(tone.sample(2, 0), 0.5));
        assert(near(tone.sample(6, 1), -0.5));

        for (uint32_t i = 0; i < tone.numFrames; ++i)
            assert(tone.sample(i, 0) == tone.sample(i, 1));

        ChannelLevels levels;
        measureChannelLevels(tone, levels);

        assert(levels.rms.size() == 2);
        assert(near(levels.rms[0], 0.5 / std::sqrt(2.0), 1e-4));
        assert(near(levels.rms[1], levels.rms[0]));
        assert(near(levels.dbfs[0], rmsToDbfs(levels.rms[0])));
        assert(near(levels.peak, 0.5, 1e-4));
    }

    // mono, too short for a single frame
    {
        AudioBuffer tone;
        synthesizeSineTone(tone, 1, 44100, 0.00001, 1000.0, 0.2);

        assert(tone.numChannels == 1);
        assert(tone.numFrames == 0);
        assert(tone.samples.empty());
    }

    // silence
    {
        AudioBuffer silence;
        silence.resize(2, 1000);

        ChannelLevels levels;
        measureChannelLevels(silence, levels);

        assert(levels.rms.size() == 2);
        assert(levels.rms[0] == 0.0 && levels.rms[1] == 0.0);
        assert(near(levels.dbfs[0], -240.0));
        assert(near(levels.dbfs[1], -240.0));
        assert(levels.peak == 0.0);
    }

    // empty capture
    {
        AudioBuffer empty;
        empty.resize(1, 0);

        ChannelLevels levels;
        measureChannelLevels(empty, levels);

        assert(levels.rms.size() == 1);
        assert(levels.rms[0] == 0.0);
        assert(near(levels.dbfs[0], -240.0));
        assert(levels.peak == 0.0);
    }

    // peak is taken across channels, per-channel RMS stays separate
    {
        AudioBuffer buffer;
        buffer.resize(2, 4);
        for (uint32_t i = 0; i < 4; ++i)
        {
            buffer.samples[i * 2] = 0.25f;
            buffer.samples[i * 2 + 1] = (i % 2) ? -0.75f : 0.75f;
        }

        ChannelLevels levels;
        measureChannelLevels(buffer, levels);

        assert(near(levels.rms[0], 0.25));
        assert(near(levels.rms[1], 0.75));
        assert(near(levels.peak, 0.75));

        applyGain(buffer, 0.8f);
        assert(near(buffer.sample(0, 0), 0.2));
        assert(near(buffer.sample(1, 1), -0.6));
    }

    return 0;
}
