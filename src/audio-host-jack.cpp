// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "audio-host-impl.hpp"
#include "Semaphore.hpp"

#include <algorithm>
#include <atomic>

#include <jack/jack.h>

// --------------------------------------------------------------------------------------------------------------------

// extra time to wait for the JACK process callback to finish, in seconds
static constexpr const double kJackStreamTimeout = 5.0;

struct JackStream {
    jack_client_t* client = nullptr;
    jack_port_t** ports = nullptr;

    // whether we are doing playback, or otherwise capture
    bool playback = false;

    uint8_t numChannels = 0;
    uint32_t numFrames = 0;

    // interleaved, source for playback and destination for capture
    float* samples = nullptr;

    // only touched by the process callback while the client is active
    uint32_t position = 0;
    bool finished = false;
    bool posted = false;

    // set by the shutdown callback if the server goes away
    std::atomic<bool> shutdown = { false };

    d_semaphore sem;
};

// --------------------------------------------------------------------------------------------------------------------

#if AUDIO_PROBE_DEBUG < 2
static void _jack_error_silence(const char*) {}
#endif

static jack_client_t* openJackClient()
{
   #if AUDIO_PROBE_DEBUG < 2
    // silence "cannot connect to server" messages
    jack_set_error_function(_jack_error_silence);
   #endif

    jack_status_t status;
    jack_client_t* const client = jack_client_open("audio-probe", JackNoStartServer, &status);

    if (client == nullptr)
        DEBUGPRINT("jack_client_open fail, status 0x%x", status);

    return client;
}

static const char** getPhysicalPorts(jack_client_t* const client, const bool playback)
{
    // physical playback ports are inputs from the JACK client point of view
    return jack_get_ports(client, nullptr, JACK_DEFAULT_AUDIO_TYPE,
                          JackPortIsPhysical | (playback ? JackPortIsInput : JackPortIsOutput));
}

static unsigned countPhysicalPorts(jack_client_t* const client, const bool playback)
{
    const char** const ports = getPhysicalPorts(client, playback);

    if (ports == nullptr)
        return 0;

    unsigned count = 0;
    while (ports[count] != nullptr)
        ++count;

    jack_free(ports);
    return std::min(count, kMaxDeviceChannels);
}

// --------------------------------------------------------------------------------------------------------------------

static int jack_process(const jack_nframes_t frames, void* const arg)
{
    JackStream* const s = static_cast<JackStream*>(arg);

    const uint8_t numChannels = s->numChannels;
    const uint32_t position = s->position;
    const uint32_t todo = s->finished ? 0 : std::min<uint32_t>(frames, s->numFrames - position);

    for (uint8_t c = 0; c < numChannels; ++c)
    {
        float* const buffer = static_cast<float*>(jack_port_get_buffer(s->ports[c], frames));

        if (s->playback)
        {
            for (uint32_t i = 0; i < todo; ++i)
                buffer[i] = s->samples[static_cast<size_t>(position + i) * numChannels + c];
            for (uint32_t i = todo; i < frames; ++i)
                buffer[i] = 0.f;
        }
        else
        {
            for (uint32_t i = 0; i < todo; ++i)
                s->samples[static_cast<size_t>(position + i) * numChannels + c] = buffer[i];
        }
    }

    s->position = position + todo;

    if (s->finished)
    {
        // last block was handed to the server on the previous cycle
        if (! s->posted)
        {
            s->posted = true;
            semaphore_post(&s->sem);
        }
    }
    else if (s->position >= s->numFrames)
    {
        s->finished = true;

        if (! s->playback)
        {
            s->posted = true;
            semaphore_post(&s->sem);
        }
    }

    return 0;
}

static void jack_shutdown(void* const arg)
{
    JackStream* const s = static_cast<JackStream*>(arg);

    s->shutdown.store(true);
    semaphore_post(&s->sem);
}

// --------------------------------------------------------------------------------------------------------------------

static void closeJackStream(JackStream& s)
{
    if (s.client != nullptr)
    {
        jack_deactivate(s.client);
        jack_client_close(s.client);
        s.client = nullptr;
    }

    delete[] s.ports;
    s.ports = nullptr;
}

static bool runJackStream(JackStream& s, const uint32_t sampleRate, AudioError& error)
{
    if ((s.client = openJackClient()) == nullptr)
    {
        setAudioError(error, kAudioErrorStream, "JACK server is not running");
        return false;
    }

    const uint32_t serverRate = jack_get_sample_rate(s.client);

    if (serverRate != sampleRate)
    {
        setAudioError(error, kAudioErrorStream, "JACK server runs at %u Hz, requested %u Hz", serverRate, sampleRate);
        closeJackStream(s);
        return false;
    }

    s.ports = new jack_port_t*[s.numChannels];

    for (uint8_t c = 0; c < s.numChannels; ++c)
    {
        char name[16] = {};
        std::snprintf(name, sizeof(name) - 1, s.playback ? "p%d" : "c%d", c + 1);

        const unsigned long flags = s.playback ? JackPortIsOutput : JackPortIsInput;
        s.ports[c] = jack_port_register(s.client, name, JACK_DEFAULT_AUDIO_TYPE, flags, 0);

        if (s.ports[c] == nullptr)
        {
            setAudioError(error, kAudioErrorStream, "cannot register JACK port %s", name);
            closeJackStream(s);
            return false;
        }
    }

    jack_set_process_callback(s.client, jack_process, &s);
    jack_on_shutdown(s.client, jack_shutdown, &s);

    if (jack_activate(s.client) != 0)
    {
        setAudioError(error, kAudioErrorStream, "cannot activate JACK client");
        closeJackStream(s);
        return false;
    }

    if (const char** const physical = getPhysicalPorts(s.client, s.playback))
    {
        for (uint8_t c = 0; c < s.numChannels && physical[c] != nullptr; ++c)
        {
            const char* const own = jack_port_name(s.ports[c]);

            if (s.playback)
                jack_connect(s.client, own, physical[c]);
            else
                jack_connect(s.client, physical[c], own);
        }

        jack_free(physical);
    }

    const double timeout = static_cast<double>(s.numFrames) / sampleRate + kJackStreamTimeout;
    const bool signaled = semaphore_timedwait(&s.sem, timeout);

    closeJackStream(s);

    if (s.shutdown.load())
    {
        setAudioError(error, kAudioErrorStream, "JACK server shut down");
        return false;
    }

    if (! signaled)
    {
        setAudioError(error, kAudioErrorStream, "timed out waiting for JACK");
        return false;
    }

    return true;
}

// --------------------------------------------------------------------------------------------------------------------

bool enumerateJackServer(std::vector<NativeDevice>& devices)
{
    jack_client_t* const client = openJackClient();

    if (client == nullptr)
        return false;

    NativeDevice dev;
    dev.id = "jack";
    dev.name = "JACK server";
    dev.hostApiId = kHostApiJack;
    dev.maxChansIn = countPhysicalPorts(client, false);
    dev.maxChansOut = countPhysicalPorts(client, true);
    dev.sampleRate = jack_get_sample_rate(client);

    jack_client_close(client);

    DEBUGPRINT("JACK server found, ins %u outs %u", dev.maxChansIn, dev.maxChansOut);

    devices.push_back(dev);
    return true;
}

bool runJackPlayback(const AudioBuffer& buffer, const uint32_t sampleRate, AudioError& error)
{
    if (buffer.numFrames == 0)
        return true;

    JackStream s;
    s.playback = true;
    s.numChannels = static_cast<uint8_t>(buffer.numChannels);
    s.numFrames = buffer.numFrames;
    s.samples = const_cast<float*>(buffer.samples.data());

    if (! semaphore_init(&s.sem))
    {
        setAudioError(error, kAudioErrorStream, "cannot create semaphore");
        return false;
    }

    const bool ok = runJackStream(s, sampleRate, error);

    semaphore_destroy(&s.sem);
    return ok;
}

bool runJackCapture(const unsigned numChannels,
                    const uint32_t numFrames,
                    const uint32_t sampleRate,
                    AudioBuffer& buffer,
                    AudioError& error)
{
    buffer.resize(numChannels, numFrames);

    if (numFrames == 0)
        return true;

    JackStream s;
    s.playback = false;
    s.numChannels = static_cast<uint8_t>(numChannels);
    s.numFrames = numFrames;
    s.samples = buffer.samples.data();

    if (! semaphore_init(&s.sem))
    {
        setAudioError(error, kAudioErrorStream, "cannot create semaphore");
        return false;
    }

    const bool ok = runJackStream(s, sampleRate, error);

    semaphore_destroy(&s.sem);
    return ok;
}

// --------------------------------------------------------------------------------------------------------------------
