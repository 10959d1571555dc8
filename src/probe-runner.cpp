// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-runner.hpp"
#include "device-tests.hpp"

// --------------------------------------------------------------------------------------------------------------------

int runAudioProbe(AudioHost& host, const ProbeOptions& options, FILE* const in, FILE* const out, const bool interactive)
{
    // always list devices first
    if (! listDevices(host, options.sortOrder, options.json, options.showSampleRate, out))
        return 1;

    const TestParameters& params = options.params;
    bool ranTests = false;

    if (options.testOutputIndex)
    {
        ranTests = true;
        playTestTone(host, *options.testOutputIndex, params.duration, params.frequency, params.amplitude, out);
    }

    if (options.testInputIndex)
    {
        ranTests = true;
        testInputDevice(host, *options.testInputIndex, params.duration, out);
    }

    if (options.testAllOutputs)
    {
        ranTests = true;
        testAllOutputs(host, params.duration, params.frequency, params.amplitude, out);
    }

    if (options.testAllInputs)
    {
        ranTests = true;
        testAllInputs(host, params.duration, out);
    }

    if (! ranTests && interactive)
    {
        fprintf(out, "\nRun tests now? [Y/N]: ");
        fflush(out);

        std::string resp;
        if (readPromptLine(in, resp) && (resp == "y" || resp == "Y"))
            runInteractiveMenu(host, params, in, out);
    }

    fflush(out);
    return 0;
}

// --------------------------------------------------------------------------------------------------------------------
