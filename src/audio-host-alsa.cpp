// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "audio-host-impl.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>

//#define ALSA_PCM_NEW_HW_PARAMS_API
//#define ALSA_PCM_NEW_SW_PARAMS_API
#include <alsa/asoundlib.h>

// --------------------------------------------------------------------------------------------------------------------

static constexpr const unsigned kSampleRatesToTry[] = { 48000, 44100, 96000, 88200 };

// stream latency requested from ALSA, in microseconds
static constexpr const unsigned kStreamLatency = 100000;

// frames to read or write per call
static constexpr const snd_pcm_uframes_t kStreamChunkFrames = 1024;

typedef std::unique_ptr<snd_pcm_t, int(*)(snd_pcm_t*)> ScopedPcm;

// --------------------------------------------------------------------------------------------------------------------

#if AUDIO_PROBE_DEBUG < 2
static void _snd_lib_error_silence(const char*, int, const char*, int, const char*, ...) {}
#endif

static bool isdigit(const char* const s)
{
    const size_t len = std::strlen(s);

    if (len == 0)
        return false;

    for (size_t i=0; i<len; ++i)
    {
        if (std::isdigit(static_cast<unsigned char>(s[i])))
            continue;
        return false;
    }

    return true;
}

// open `pcmID` in one direction and read its channel and sample rate limits
static bool fillDeviceProperties(const char* const pcmID, const bool isOutput, NativeDevice& device)
{
    snd_pcm_t* pcm;
    const snd_pcm_stream_t mode = isOutput ? SND_PCM_STREAM_PLAYBACK : SND_PCM_STREAM_CAPTURE;

    int err = snd_pcm_open(&pcm, pcmID, mode, SND_PCM_NONBLOCK);
    if (err < 0)
    {
        DEBUGPRINT("snd_pcm_open %s %s fail %s", pcmID, isOutput ? "playback" : "capture", snd_strerror(err));
        return false;
    }

    snd_pcm_hw_params_t* params;
    snd_pcm_hw_params_alloca(&params);

    bool ok = false;

    if ((err = snd_pcm_hw_params_any(pcm, params)) >= 0)
    {
        unsigned maxChans = 0;
        snd_pcm_hw_params_get_channels_max(params, &maxChans);

        // put some sane limits
        maxChans = std::min(maxChans, kMaxDeviceChannels);

        if (isOutput)
            device.maxChansOut = maxChans;
        else
            device.maxChansIn = maxChans;

        if (! device.sampleRate)
        {
            for (unsigned rate : kSampleRatesToTry)
            {
                if (snd_pcm_hw_params_test_rate(pcm, params, rate, 0) == 0)
                {
                    device.sampleRate = rate;
                    break;
                }
            }
        }

        ok = maxChans != 0;
    }
    else
    {
        DEBUGPRINT("snd_pcm_hw_params_any %s fail %s", pcmID, snd_strerror(err));
    }

    snd_pcm_close(pcm);
    return ok;
}

static bool enumerateSoundcards(std::vector<NativeDevice>& devices, AudioError& error)
{
    snd_ctl_t* ctl = nullptr;
    snd_ctl_card_info_t* cardinfo = nullptr;
    snd_ctl_card_info_alloca(&cardinfo);

    snd_pcm_info_t* pcminfo;
    snd_pcm_info_alloca(&pcminfo);

    int card = -1;
    int err;
    char hwcard[32];
    char reserve[32];

    for (;;)
    {
        if ((err = snd_card_next(&card)) != 0)
        {
            setAudioError(error, kAudioErrorQuery, "snd_card_next failed: %s", snd_strerror(err));
            return false;
        }

        if (card < 0)
            break;

        std::snprintf(hwcard, sizeof(hwcard), "hw:%i", card);

        if (snd_ctl_open(&ctl, hwcard, SND_CTL_NONBLOCK) < 0)
        {
            DEBUGPRINT("snd_ctl_open %s fail", hwcard);
            continue;
        }

        if (snd_ctl_card_info(ctl, cardinfo) >= 0)
        {
            const char* cardId = snd_ctl_card_info_get_id(cardinfo);
            const char* cardName = snd_ctl_card_info_get_name(cardinfo);

            if (cardId == nullptr || ::isdigit(cardId))
            {
                std::snprintf(reserve, sizeof(reserve), "%i", card);
                cardId = reserve;
            }

            if (cardName == nullptr || *cardName == '\0')
                cardName = cardId;

            for (int device = -1;;)
            {
                if (snd_ctl_pcm_next_device(ctl, &device) < 0 || device < 0)
                    break;

                snd_pcm_info_set_device(pcminfo, device);
                snd_pcm_info_set_subdevice(pcminfo, 0);

                snd_pcm_info_set_stream(pcminfo, SND_PCM_STREAM_CAPTURE);
                const bool isInput = (snd_ctl_pcm_info(ctl, pcminfo) >= 0);

                snd_pcm_info_set_stream(pcminfo, SND_PCM_STREAM_PLAYBACK);
                const bool isOutput = (snd_ctl_pcm_info(ctl, pcminfo) >= 0);

                if (! (isInput || isOutput))
                    continue;

                std::string strid(hwcard);
                strid += ",";
                strid += std::to_string(device);

                NativeDevice dev;
                dev.hostApiId = kHostApiAlsa;
                dev.name = cardName;

                if (const char* const pcmName = snd_pcm_info_get_name(pcminfo))
                {
                    if (pcmName[0] != '\0')
                    {
                        dev.name += ", ";
                        dev.name += pcmName;
                    }
                }

                dev.name += " (" + strid + ")";

                if (isInput)
                    fillDeviceProperties(strid.c_str(), false, dev);
                if (isOutput)
                    fillDeviceProperties(strid.c_str(), true, dev);

                // streams go through the plug layer for format and rate conversion
                dev.id = "plug" + strid;

                devices.push_back(dev);
            }
        }

        snd_ctl_close(ctl);
    }

    return true;
}

// --------------------------------------------------------------------------------------------------------------------

static bool openStream(const std::string& deviceID,
                       const snd_pcm_stream_t mode,
                       const unsigned numChannels,
                       const uint32_t sampleRate,
                       ScopedPcm& pcm,
                       AudioError& error)
{
    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, deviceID.c_str(), mode, 0);

    if (err < 0)
    {
        setAudioError(error, kAudioErrorStream, "cannot open %s: %s", deviceID.c_str(), snd_strerror(err));
        return false;
    }

    pcm.reset(handle);

    err = snd_pcm_set_params(handle,
                             SND_PCM_FORMAT_FLOAT,
                             SND_PCM_ACCESS_RW_INTERLEAVED,
                             numChannels,
                             sampleRate,
                             1,
                             kStreamLatency);

    if (err < 0)
    {
        setAudioError(error, kAudioErrorStream, "cannot configure %s for %u channels at %u Hz: %s",
                      deviceID.c_str(), numChannels, sampleRate, snd_strerror(err));
        return false;
    }

    DEBUGPRINT("opened %s %s, %u channels at %u Hz", deviceID.c_str(),
               mode == SND_PCM_STREAM_PLAYBACK ? "playback" : "capture", numChannels, sampleRate);
    return true;
}

// --------------------------------------------------------------------------------------------------------------------

bool enumerateAlsaDevices(std::vector<NativeDevice>& devices, AudioError& error)
{
   #if AUDIO_PROBE_DEBUG < 2
    // silence warnings when opening PCMs
    snd_lib_error_set_handler(_snd_lib_error_silence);
   #endif

    NativeDevice def;
    def.id = "default";
    def.name = "default";
    def.hostApiId = kHostApiAlsa;
    def.isDefault = true;

    const bool defaultIn = fillDeviceProperties("default", false, def);
    const bool defaultOut = fillDeviceProperties("default", true, def);

    if (defaultIn || defaultOut)
        devices.push_back(def);

    const bool ok = enumerateSoundcards(devices, error);

   #if AUDIO_PROBE_DEBUG < 2
    snd_lib_error_set_handler(nullptr);
   #endif

    return ok;
}

bool runAlsaPlayback(const std::string& deviceID, const AudioBuffer& buffer, const uint32_t sampleRate, AudioError& error)
{
    const unsigned numChannels = buffer.numChannels;
    ScopedPcm pcm(nullptr, snd_pcm_close);

    if (! openStream(deviceID, SND_PCM_STREAM_PLAYBACK, numChannels, sampleRate, pcm, error))
        return false;

    const float* data = buffer.samples.data();
    snd_pcm_sframes_t err;

    for (uint32_t remaining = buffer.numFrames; remaining != 0;)
    {
        const snd_pcm_uframes_t frames = std::min<snd_pcm_uframes_t>(remaining, kStreamChunkFrames);

        err = snd_pcm_writei(pcm.get(), data, frames);

        if (err < 0)
        {
            DEBUGPRINT("%s | playback | write error: %s", deviceID.c_str(), snd_strerror(err));

            if ((err = snd_pcm_recover(pcm.get(), err, 1)) < 0)
            {
                setAudioError(error, kAudioErrorStream, "write to %s failed: %s",
                              deviceID.c_str(), snd_strerror(err));
                return false;
            }

            continue;
        }

        data += err * numChannels;
        remaining -= err;
    }

    // wait until everything has been played
    if ((err = snd_pcm_drain(pcm.get())) < 0)
    {
        setAudioError(error, kAudioErrorStream, "drain of %s failed: %s", deviceID.c_str(), snd_strerror(err));
        return false;
    }

    return true;
}

bool runAlsaCapture(const std::string& deviceID,
                    const unsigned numChannels,
                    const uint32_t numFrames,
                    const uint32_t sampleRate,
                    AudioBuffer& buffer,
                    AudioError& error)
{
    ScopedPcm pcm(nullptr, snd_pcm_close);

    if (! openStream(deviceID, SND_PCM_STREAM_CAPTURE, numChannels, sampleRate, pcm, error))
        return false;

    buffer.resize(numChannels, numFrames);

    float* data = buffer.samples.data();
    snd_pcm_sframes_t err;

    for (uint32_t remaining = numFrames; remaining != 0;)
    {
        const snd_pcm_uframes_t frames = std::min<snd_pcm_uframes_t>(remaining, kStreamChunkFrames);

        err = snd_pcm_readi(pcm.get(), data, frames);

        if (err < 0)
        {
            DEBUGPRINT("%s | capture | read error: %s", deviceID.c_str(), snd_strerror(err));

            if ((err = snd_pcm_recover(pcm.get(), err, 1)) < 0)
            {
                setAudioError(error, kAudioErrorStream, "read from %s failed: %s",
                              deviceID.c_str(), snd_strerror(err));
                return false;
            }

            continue;
        }

        data += err * numChannels;
        remaining -= err;
    }

    snd_pcm_drop(pcm.get());
    return true;
}

void cleanupAlsaDevices()
{
    snd_config_update_free_global();
}

// --------------------------------------------------------------------------------------------------------------------
