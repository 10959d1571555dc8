// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-host.hpp"

// --------------------------------------------------------------------------------------------------------------------

// values shown as defaults in the menu prompts
struct TestParameters {
    double duration = AUDIO_PROBE_DEFAULT_DURATION;
    double frequency = AUDIO_PROBE_DEFAULT_FREQUENCY;
    double amplitude = AUDIO_PROBE_DEFAULT_AMPLITUDE;
};

// read one line, without the trailing newline and surrounding whitespace.
// returns false at end of input.
bool readPromptLine(FILE* in, std::string& line);

// read-eval loop over the test menu, returns on "q", empty input or end of input
void runInteractiveMenu(AudioHost& host, const TestParameters& defaults, FILE* in, FILE* out);

// --------------------------------------------------------------------------------------------------------------------
