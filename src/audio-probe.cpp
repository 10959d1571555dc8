// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "audio-host-system.hpp"
#include "probe-runner.hpp"

#include <unistd.h>

int main(int argc, char* argv[])
{
    ProbeOptions options;

    switch (parseProbeOptions(argc, argv, options, stderr))
    {
    case kProbeParseOk:
        break;
    case kProbeParseHelp:
        printProbeUsage(argv[0], stdout);
        return 0;
    case kProbeParseError:
        printProbeUsage(argv[0], stderr);
        return 2;
    }

    const std::unique_ptr<AudioHost> host = createSystemAudioHost(options.sampleRate);

    return runAudioProbe(*host, options, stdin, stdout, isatty(STDIN_FILENO) != 0);
}
