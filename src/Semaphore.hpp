// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include <cerrno>
#include <cmath>
#include <ctime>

#include <semaphore.h>

typedef sem_t d_semaphore;

static inline
bool semaphore_init(d_semaphore* const sem, const unsigned int value = 0)
{
    return sem_init(sem, 0, value) == 0;
}

static inline
bool semaphore_destroy(d_semaphore* const sem)
{
    return sem_destroy(sem) == 0;
}

static inline
bool semaphore_post(d_semaphore* const sem)
{
    return sem_post(sem) == 0;
}

// wait up to `seconds`, returns false on timeout
static inline
bool semaphore_timedwait(d_semaphore* const sem, const double seconds)
{
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);

    double secs;
    const double frac = std::modf(seconds > 0.0 ? seconds : 0.0, &secs);

    ts.tv_sec += static_cast<time_t>(secs);
    ts.tv_nsec += static_cast<long>(frac * 1000000000.0);
    if (ts.tv_nsec >= 1000000000L)
    {
        ++ts.tv_sec;
        ts.tv_nsec -= 1000000000L;
    }

    for (int r;;)
    {
        r = sem_timedwait(sem, &ts);

        if (r < 0)
            r = errno;

        if (r == EINTR)
            continue;

        return r == 0;
    }
}
