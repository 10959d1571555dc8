// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-host.hpp"

#include <memory>

// --------------------------------------------------------------------------------------------------------------------

// audio host backed by ALSA, plus a running JACK server if AUDIO_PROBE_JACK is enabled.
// devices are re-enumerated on every call, indices follow enumeration order.
std::unique_ptr<AudioHost> createSystemAudioHost(std::optional<double> defaultSampleRate);

// --------------------------------------------------------------------------------------------------------------------
