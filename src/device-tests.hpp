// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "signal-stats.hpp"

// --------------------------------------------------------------------------------------------------------------------

// outcome of an input test, recording and echo playback are reported separately
struct InputTestResult {
    bool recordOk = false;
    bool echoOk = false;
    uint32_t sampleRate = 0;
    ChannelLevels levels;
};

// --------------------------------------------------------------------------------------------------------------------

// play a sine tone on output device `index`, blocking until done.
// failures are printed to `out` and reported as false, never thrown.
bool playTestTone(AudioHost& host, int index, double duration, double frequency, double amplitude, FILE* out);

// record from input device `index`, print levels and echo the capture to the default output.
// returns whether recording succeeded, echo playback does not affect it.
bool testInputDevice(AudioHost& host, int index, double duration, FILE* out, InputTestResult& result);
bool testInputDevice(AudioHost& host, int index, double duration, FILE* out);

// test every device with output (or input) channels, in catalog order.
// returns the number of devices that passed.
unsigned testAllOutputs(AudioHost& host, double duration, double frequency, double amplitude, FILE* out);
unsigned testAllInputs(AudioHost& host, double duration, FILE* out);

// --------------------------------------------------------------------------------------------------------------------
