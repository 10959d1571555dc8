// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "interactive-menu.hpp"
#include "device-tests.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

// --------------------------------------------------------------------------------------------------------------------

static bool parseIndex(const std::string& str, int& value)
{
    if (str.empty())
        return false;

    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(str.c_str(), &end, 10);

    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX)
        return false;

    value = static_cast<int>(v);
    return true;
}

static bool parseNumber(const std::string& str, double& value)
{
    if (str.empty())
        return false;

    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(str.c_str(), &end);

    if (errno != 0 || *end != '\0')
        return false;

    value = v;
    return true;
}

// prompt for a number, empty or invalid input falls back to `defvalue`
static double promptNumber(FILE* const in, FILE* const out, const char* const label, const double defvalue)
{
    fprintf(out, "%s [%g]: ", label, defvalue);
    fflush(out);

    std::string line;
    if (! readPromptLine(in, line) || line.empty())
        return defvalue;

    double value;
    if (parseNumber(line, value))
        return value;

    fprintf(out, "Invalid value '%s', using %g\n", line.c_str(), defvalue);
    return defvalue;
}

static bool promptIndex(FILE* const in, FILE* const out, const char* const label, int& index)
{
    fprintf(out, "%s: ", label);
    fflush(out);

    std::string line;
    if (readPromptLine(in, line) && parseIndex(line, index))
        return true;

    fprintf(out, "Invalid index\n");
    return false;
}

// --------------------------------------------------------------------------------------------------------------------

bool readPromptLine(FILE* const in, std::string& line)
{
    line.clear();

    char buf[256];
    bool gotData = false;

    while (std::fgets(buf, sizeof(buf), in) != nullptr)
    {
        gotData = true;
        line += buf;

        if (! line.empty() && line.back() == '\n')
            break;
    }

    if (! gotData)
        return false;

    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
        ++start;

    size_t end = line.size();
    while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1])))
        --end;

    line = line.substr(start, end - start);
    return true;
}

void runInteractiveMenu(AudioHost& host, const TestParameters& defaults, FILE* const in, FILE* const out)
{
    fprintf(out, "\nInteractive test mode. Press Enter to accept defaults or 'q' to quit.\n");

    std::string choice;

    for (;;)
    {
        fprintf(out, "\nOptions:\n");
        fprintf(out, "  1) Test single output by index\n");
        fprintf(out, "  2) Test single input by index\n");
        fprintf(out, "  3) Test all outputs\n");
        fprintf(out, "  4) Test all inputs\n");
        fprintf(out, "  q) Quit\n");
        fprintf(out, "Select option [q]: ");
        fflush(out);

        if (! readPromptLine(in, choice))
            break;

        for (char& c : choice)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (choice.empty() || choice == "q")
            break;

        if (choice == "1")
        {
            int index = -1;
            if (! promptIndex(in, out, "Output device index", index))
                continue;

            const double duration = promptNumber(in, out, "Duration seconds", defaults.duration);
            const double frequency = promptNumber(in, out, "Tone freq Hz", defaults.frequency);
            const double amplitude = promptNumber(in, out, "Amp 0..1", defaults.amplitude);

            playTestTone(host, index, duration, frequency, amplitude, out);
        }
        else if (choice == "2")
        {
            int index = -1;
            if (! promptIndex(in, out, "Input device index", index))
                continue;

            const double duration = promptNumber(in, out, "Duration seconds", defaults.duration);

            testInputDevice(host, index, duration, out);
        }
        else if (choice == "3")
        {
            const double duration = promptNumber(in, out, "Duration seconds", defaults.duration);
            const double frequency = promptNumber(in, out, "Tone freq Hz", defaults.frequency);
            const double amplitude = promptNumber(in, out, "Amp 0..1", defaults.amplitude);

            testAllOutputs(host, duration, frequency, amplitude, out);
        }
        else if (choice == "4")
        {
            const double duration = promptNumber(in, out, "Duration seconds", defaults.duration);

            testAllInputs(host, duration, out);
        }
        else
        {
            fprintf(out, "Unknown option\n");
        }
    }

    fprintf(out, "Exiting interactive test mode.\n");
}

// --------------------------------------------------------------------------------------------------------------------
