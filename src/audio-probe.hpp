// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include <cstdio>

// --------------------------------------------------------------------------------------------------------------------

// print debug messages for development
// 1 = backend messages, 2 = also let ALSA and JACK print their own errors while probing
#ifndef AUDIO_PROBE_DEBUG
#define AUDIO_PROBE_DEBUG 0
#endif

// duration in seconds for tone and record tests
#ifndef AUDIO_PROBE_DEFAULT_DURATION
#define AUDIO_PROBE_DEFAULT_DURATION 2.0
#endif

// frequency in Hz for the output test tone
#ifndef AUDIO_PROBE_DEFAULT_FREQUENCY
#define AUDIO_PROBE_DEFAULT_FREQUENCY 1000.0
#endif

// amplitude (0.0-1.0) for the output test tone
#ifndef AUDIO_PROBE_DEFAULT_AMPLITUDE
#define AUDIO_PROBE_DEFAULT_AMPLITUDE 0.2
#endif

// sample rate to use when neither the device nor the host report one
#ifndef AUDIO_PROBE_FALLBACK_SAMPLE_RATE
#define AUDIO_PROBE_FALLBACK_SAMPLE_RATE 44100
#endif

// record at most this many channels on input tests
#ifndef AUDIO_PROBE_MAX_RECORD_CHANNELS
#define AUDIO_PROBE_MAX_RECORD_CHANNELS 2
#endif

// gain applied when playing back a recording, avoids loud playback and feedback
#ifndef AUDIO_PROBE_ECHO_GAIN
#define AUDIO_PROBE_ECHO_GAIN 0.8f
#endif

// RMS floor for dBFS conversion, keeps silence away from -inf
#ifndef AUDIO_PROBE_DBFS_FLOOR
#define AUDIO_PROBE_DBFS_FLOOR 1e-12
#endif

// list a running JACK server as an extra host API
#ifndef AUDIO_PROBE_JACK
#define AUDIO_PROBE_JACK 1
#endif

// --------------------------------------------------------------------------------------------------------------------

#if AUDIO_PROBE_DEBUG
#define DEBUGPRINT(...) { fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); }
#else
#define DEBUGPRINT(...) { }
#endif

// --------------------------------------------------------------------------------------------------------------------
