// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "device-listing.hpp"
#include "interactive-menu.hpp"

// --------------------------------------------------------------------------------------------------------------------

struct ProbeOptions {
    // listing
    bool json = false;
    DeviceSortOrder sortOrder = kSortByIndex;
    bool showSampleRate = false;

    // tests
    std::optional<int> testOutputIndex;
    std::optional<int> testInputIndex;
    bool testAllOutputs = false;
    bool testAllInputs = false;
    TestParameters params;

    // global default sample rate
    std::optional<double> sampleRate;
};

enum ProbeParseResult {
    kProbeParseOk = 0,
    kProbeParseHelp,
    kProbeParseError,
};

// parse command-line arguments, errors are printed to `err`
ProbeParseResult parseProbeOptions(int argc, char* argv[], ProbeOptions& options, FILE* err);

void printProbeUsage(const char* progname, FILE* out);

// --------------------------------------------------------------------------------------------------------------------
