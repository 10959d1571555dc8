// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-options.hpp"

// --------------------------------------------------------------------------------------------------------------------

// list devices, run the requested tests and optionally the interactive menu.
// returns the process exit status, non-zero only if the initial device listing failed.
int runAudioProbe(AudioHost& host, const ProbeOptions& options, FILE* in, FILE* out, bool interactive);

// --------------------------------------------------------------------------------------------------------------------
