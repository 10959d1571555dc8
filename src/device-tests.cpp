// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "device-tests.hpp"

#include <algorithm>
#include <exception>

// --------------------------------------------------------------------------------------------------------------------

static bool playCaptureOnDefaultOutput(AudioHost& host,
                                       const int index,
                                       const AudioBuffer& capture,
                                       const uint32_t sampleRate,
                                       FILE* const out)
{
    AudioError error;
    DefaultDeviceIndices defaults;

    if (! host.queryDefaults(defaults, error))
    {
        fprintf(out, "[in  %d] playback failed: %s\n", index, error.message.c_str());
        return false;
    }

    if (defaults.output)
        fprintf(out, "[in  %d] playing back recording on output device %d ...\n", index, *defaults.output);
    else
        fprintf(out, "[in  %d] playing back recording on output device None ...\n", index);

    if (! defaults.output)
    {
        fprintf(out, "[in  %d] playback failed: no default output device\n", index);
        return false;
    }

    try {
        AudioBuffer echo(capture);
        applyGain(echo, AUDIO_PROBE_ECHO_GAIN);

        if (! host.play(*defaults.output, echo, sampleRate, error))
        {
            fprintf(out, "[in  %d] playback failed: %s\n", index, error.message.c_str());
            return false;
        }
    } catch (const std::exception& e) {
        fprintf(out, "[in  %d] playback failed: %s\n", index, e.what());
        return false;
    }

    fprintf(out, "[in  %d] playback finished\n", index);
    return true;
}

// --------------------------------------------------------------------------------------------------------------------

bool playTestTone(AudioHost& host,
                  const int index,
                  const double duration,
                  const double frequency,
                  const double amplitude,
                  FILE* const out)
{
    AudioError error;
    DeviceDescriptor device;

    if (! host.queryDevice(index, device, error))
    {
        fprintf(out, "[out %d] cannot query device: %s\n", index, error.message.c_str());
        return false;
    }

    if (device.maxOutputChannels == 0)
    {
        fprintf(out, "[out %d] no output channels, skipping\n", index);
        return false;
    }

    const uint32_t sampleRate = getTestSampleRate(device, host);
    const unsigned numChannels = device.maxOutputChannels >= 2 ? 2 : 1;

    try {
        AudioBuffer tone;
        synthesizeSineTone(tone, numChannels, sampleRate, duration, frequency, amplitude);

        fprintf(out, "[out %d] playing %gHz tone for %gs (sr=%u)\n", index, frequency, duration, sampleRate);
        fflush(out);

        if (! host.play(index, tone, sampleRate, error))
        {
            fprintf(out, "[out %d] playback failed: %s\n", index, error.message.c_str());
            return false;
        }
    } catch (const std::exception& e) {
        fprintf(out, "[out %d] playback failed: %s\n", index, e.what());
        return false;
    }

    fprintf(out, "[out %d] finished\n", index);
    return true;
}

bool testInputDevice(AudioHost& host, const int index, const double duration, FILE* const out, InputTestResult& result)
{
    result = InputTestResult();

    AudioError error;
    DeviceDescriptor device;

    if (! host.queryDevice(index, device, error))
    {
        fprintf(out, "[in  %d] cannot query device: %s\n", index, error.message.c_str());
        return false;
    }

    if (device.maxInputChannels == 0)
    {
        fprintf(out, "[in  %d] no input channels, skipping\n", index);
        return false;
    }

    const uint32_t sampleRate = getTestSampleRate(device, host);
    const unsigned numChannels = std::min<unsigned>(device.maxInputChannels, AUDIO_PROBE_MAX_RECORD_CHANNELS);
    const uint32_t numFrames = getFrameCount(sampleRate, duration);

    result.sampleRate = sampleRate;

    AudioBuffer capture;

    try {
        fprintf(out, "[in  %d] recording %gs (sr=%u, ch=%u) ...\n", index, duration, sampleRate, numChannels);
        fflush(out);

        if (! host.record(index, numChannels, numFrames, sampleRate, capture, error))
        {
            fprintf(out, "[in  %d] recording failed: %s\n", index, error.message.c_str());
            return false;
        }
    } catch (const std::exception& e) {
        fprintf(out, "[in  %d] recording failed: %s\n", index, e.what());
        return false;
    }

    result.recordOk = true;

    measureChannelLevels(capture, result.levels);

    for (unsigned c = 0; c < capture.numChannels; ++c)
        fprintf(out, "  channel %u: RMS=%.6f, dBFS=%.1f dB\n", c + 1, result.levels.rms[c], result.levels.dbfs[c]);

    fprintf(out, "  peak amplitude: %.6f\n", result.levels.peak);
    fflush(out);

    result.echoOk = playCaptureOnDefaultOutput(host, index, capture, sampleRate, out);

    return result.recordOk;
}

bool testInputDevice(AudioHost& host, const int index, const double duration, FILE* const out)
{
    InputTestResult result;
    return testInputDevice(host, index, duration, out, result);
}

// --------------------------------------------------------------------------------------------------------------------

unsigned testAllOutputs(AudioHost& host,
                        const double duration,
                        const double frequency,
                        const double amplitude,
                        FILE* const out)
{
    AudioError error;
    std::vector<DeviceDescriptor> devices;

    if (! host.queryDevices(devices, error))
    {
        fprintf(out, "Failed to query audio devices: %s\n", error.message.c_str());
        return 0;
    }

    unsigned passed = 0;

    for (const DeviceDescriptor& device : devices)
    {
        if (device.maxOutputChannels == 0)
            continue;
        if (playTestTone(host, device.index, duration, frequency, amplitude, out))
            ++passed;
    }

    return passed;
}

unsigned testAllInputs(AudioHost& host, const double duration, FILE* const out)
{
    AudioError error;
    std::vector<DeviceDescriptor> devices;

    if (! host.queryDevices(devices, error))
    {
        fprintf(out, "Failed to query audio devices: %s\n", error.message.c_str());
        return 0;
    }

    unsigned passed = 0;

    for (const DeviceDescriptor& device : devices)
    {
        if (device.maxInputChannels == 0)
            continue;
        if (testInputDevice(host, device.index, duration, out))
            ++passed;
    }

    return passed;
}

// --------------------------------------------------------------------------------------------------------------------
