// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-options.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <getopt.h>

// --------------------------------------------------------------------------------------------------------------------

enum ProbeOptionId {
    kOptionJson = 0x100,
    kOptionSort,
    kOptionShowSampleRate,
    kOptionTestOutputIndex,
    kOptionTestInputIndex,
    kOptionTestAllOutputs,
    kOptionTestAllInputs,
    kOptionDuration,
    kOptionFrequency,
    kOptionAmplitude,
    kOptionSampleRate,
};

static const struct option kProbeLongOptions[] = {
    { "json",              no_argument,       nullptr, kOptionJson },
    { "sort",              required_argument, nullptr, kOptionSort },
    { "show-sr",           no_argument,       nullptr, kOptionShowSampleRate },
    { "test-output-index", required_argument, nullptr, kOptionTestOutputIndex },
    { "test-input-index",  required_argument, nullptr, kOptionTestInputIndex },
    { "test-all-outputs",  no_argument,       nullptr, kOptionTestAllOutputs },
    { "test-all-inputs",   no_argument,       nullptr, kOptionTestAllInputs },
    { "duration",          required_argument, nullptr, kOptionDuration },
    { "freq",              required_argument, nullptr, kOptionFrequency },
    { "amp",               required_argument, nullptr, kOptionAmplitude },
    { "samplerate",        required_argument, nullptr, kOptionSampleRate },
    { "help",              no_argument,       nullptr, 'h' },
    { nullptr, 0, nullptr, 0 }
};

// --------------------------------------------------------------------------------------------------------------------

static bool parseIntArg(const char* const str, int& value)
{
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(str, &end, 10);

    if (end == str || *end != '\0' || errno != 0 || v < INT_MIN || v > INT_MAX)
        return false;

    value = static_cast<int>(v);
    return true;
}

static bool parseDoubleArg(const char* const str, double& value)
{
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(str, &end);

    if (end == str || *end != '\0' || errno != 0)
        return false;

    value = v;
    return true;
}

// --------------------------------------------------------------------------------------------------------------------

void printProbeUsage(const char* const progname, FILE* const out)
{
    fprintf(out,
            "usage: %s [-h] [--json] [--sort {index,name,in,out}] [--show-sr]\n"
            "       [--test-output-index N] [--test-input-index N]\n"
            "       [--test-all-outputs] [--test-all-inputs]\n"
            "       [--duration S] [--freq HZ] [--amp A] [--samplerate HZ]\n"
            "\n"
            "List and test audio devices\n"
            "\n"
            "options:\n"
            "  -h, --help              show this help message and exit\n"
            "  --json                  output device list as JSON\n"
            "  --sort {index,name,in,out}\n"
            "                          sort devices\n"
            "  --show-sr               show default samplerate\n"
            "  --test-output-index N   play test tone to output device index\n"
            "  --test-input-index N    record short sample from input device index\n"
            "  --test-all-outputs      play test tone to all output devices\n"
            "  --test-all-inputs       record short sample from all input devices\n"
            "  --duration S            duration in seconds for tests (default: %g)\n"
            "  --freq HZ               frequency for output test tone (default: %g)\n"
            "  --amp A                 amplitude for output test tone, 0.0-1.0 (default: %g)\n"
            "  --samplerate HZ         sample rate for devices that report none (default: %d)\n",
            progname,
            AUDIO_PROBE_DEFAULT_DURATION,
            AUDIO_PROBE_DEFAULT_FREQUENCY,
            AUDIO_PROBE_DEFAULT_AMPLITUDE,
            AUDIO_PROBE_FALLBACK_SAMPLE_RATE);
}

ProbeParseResult parseProbeOptions(const int argc, char* argv[], ProbeOptions& options, FILE* const err)
{
    const char* const progname = argc > 0 ? argv[0] : "audio-probe";

    // full rescan, needed when called more than once per process
    optind = 0;
    opterr = 0;

    int value, longindex = 0;
    double dvalue;

    for (int opt; (opt = getopt_long(argc, argv, ":h", kProbeLongOptions, &longindex)) != -1;)
    {
        switch (opt)
        {
        case kOptionJson:
            options.json = true;
            break;

        case kOptionSort:
            if (! parseDeviceSortOrder(optarg, options.sortOrder))
            {
                fprintf(err, "%s: error: argument --sort: invalid choice: '%s' (choose from index, name, in, out)\n",
                        progname, optarg);
                return kProbeParseError;
            }
            break;

        case kOptionShowSampleRate:
            options.showSampleRate = true;
            break;

        case kOptionTestOutputIndex:
        case kOptionTestInputIndex:
            if (! parseIntArg(optarg, value))
            {
                fprintf(err, "%s: error: argument --%s: invalid int value: '%s'\n",
                        progname, kProbeLongOptions[longindex].name, optarg);
                return kProbeParseError;
            }
            if (opt == kOptionTestOutputIndex)
                options.testOutputIndex = value;
            else
                options.testInputIndex = value;
            break;

        case kOptionTestAllOutputs:
            options.testAllOutputs = true;
            break;

        case kOptionTestAllInputs:
            options.testAllInputs = true;
            break;

        case kOptionDuration:
        case kOptionFrequency:
        case kOptionAmplitude:
        case kOptionSampleRate:
            if (! parseDoubleArg(optarg, dvalue))
            {
                fprintf(err, "%s: error: argument --%s: invalid float value: '%s'\n",
                        progname, kProbeLongOptions[longindex].name, optarg);
                return kProbeParseError;
            }
            switch (opt)
            {
            case kOptionDuration:
                options.params.duration = dvalue;
                break;
            case kOptionFrequency:
                options.params.frequency = dvalue;
                break;
            case kOptionAmplitude:
                options.params.amplitude = dvalue;
                break;
            case kOptionSampleRate:
                if (dvalue <= 0.0)
                {
                    fprintf(err, "%s: error: argument --samplerate: must be positive\n", progname);
                    return kProbeParseError;
                }
                options.sampleRate = dvalue;
                break;
            }
            break;

        case 'h':
            return kProbeParseHelp;

        case ':':
            fprintf(err, "%s: error: argument %s: expected one argument\n", progname, argv[optind - 1]);
            return kProbeParseError;

        default:
            fprintf(err, "%s: error: unrecognized argument: %s\n", progname, argv[optind - 1]);
            return kProbeParseError;
        }
    }

    if (optind < argc)
    {
        fprintf(err, "%s: error: unrecognized argument: %s\n", progname, argv[optind]);
        return kProbeParseError;
    }

    return kProbeParseOk;
}

// --------------------------------------------------------------------------------------------------------------------
