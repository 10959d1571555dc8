// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#undef NDEBUG
#include <cassert>

#include "interactive-menu.hpp"
#include "fake-audio-host.hpp"

static void setupDevices(FakeAudioHost& host)
{
    host.addDevice("Mic", 1, 0, 48000.0);
    host.addDevice("Speaker", 0, 2, 48000.0);
    host.defaults.input = 0;
    host.defaults.output = 1;
}

static TestParameters shortParameters()
{
    TestParameters params;
    params.duration = 0.5;
    return params;
}

int main()
{
    // prompt lines are trimmed, end of input is reported
    {
        InputScript in("  1 \n\t\nlast");
        std::string line;

        assert(readPromptLine(in.file, line) && line == "1");
        assert(readPromptLine(in.file, line) && line.empty());
        assert(readPromptLine(in.file, line) && line == "last");
        assert(! readPromptLine(in.file, line));
    }

    // immediate quit
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("q\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("Interactive test mode. Press Enter to accept defaults or 'q' to quit.\n"));
        assert(out.contains("  1) Test single output by index\n"));
        assert(out.contains("  4) Test all inputs\n"));
        assert(out.contains("Select option [q]: "));
        assert(out.contains("Exiting interactive test mode.\n"));
        assert(host.playCalls.empty() && host.recordCalls.empty());
    }

    // empty selection quits too
    {
        FakeAudioHost host;

        InputScript in("\n1\n1\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("Exiting interactive test mode.\n"));
        assert(! out.contains("Output device index"));
    }

    // invalid index goes back to the menu
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("1\nabc\nQ\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("Output device index: Invalid index\n"));
        assert(! out.contains("Duration seconds"));
        assert(out.contains("Exiting interactive test mode.\n"));
        assert(host.playCalls.empty());
    }

    // single output, defaults accepted and one bad value reverted
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("1\n1\n\nxyz\n0.3\nq\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("Duration seconds [0.5]: "));
        assert(out.contains("Tone freq Hz [1000]: "));
        assert(out.contains("Invalid value 'xyz', using 1000\n"));
        assert(out.contains("Amp 0..1 [0.2]: "));
        assert(out.contains("[out 1] playing 1000Hz tone for 0.5s (sr=48000)\n"));
        assert(out.contains("[out 1] finished\n"));

        assert(host.playCalls.size() == 1);
        assert(host.playCalls[0].buffer.numFrames == 24000);
    }

    // values entered replace the defaults for one run only
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("1\n1\n0.25\n440\n0.1\n1\n1\n\n\n\nq\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("[out 1] playing 440Hz tone for 0.25s (sr=48000)\n"));
        assert(out.contains("[out 1] playing 1000Hz tone for 0.5s (sr=48000)\n"));
        assert(host.playCalls.size() == 2);
        assert(host.playCalls[0].buffer.numFrames == 12000);
        assert(host.playCalls[1].buffer.numFrames == 24000);
    }

    // single input
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("2\n0\n\nq\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("Input device index: "));
        assert(out.contains("[in  0] recording 0.5s (sr=48000, ch=1) ...\n"));
        assert(host.recordCalls.size() == 1);
        assert(host.playCalls.size() == 1);
    }

    // test everything
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("3\n\n\n\n4\n\nq\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("[out 1] finished\n"));
        assert(out.contains("[in  0] playback finished\n"));
        assert(host.recordCalls.size() == 1);
        assert(host.playCalls.size() == 2);
    }

    // unknown options and end of input
    {
        FakeAudioHost host;
        setupDevices(host);

        InputScript in("9\n2\n");
        OutputCapture out;
        runInteractiveMenu(host, shortParameters(), in.file, out.file);

        assert(out.contains("Unknown option\n"));
        assert(out.contains("Input device index: Invalid index\n"));
        assert(out.contains("Exiting interactive test mode.\n"));
        assert(host.recordCalls.empty());
    }

    return 0;
}
