// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2023-2025 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "Thread.h"
#include "Log.h"

#include <signal.h>

#include <cerrno>
#include <cstring>
#include <ctime>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Thread class. */

Thread::Thread() :
    m_thread(),
    m_started(false)
{
    /* stub */
}

/* Finalizes a instance of the Thread class. */

Thread::~Thread() = default;

/* Starts the thread execution. */

bool Thread::run()
{
    if (m_started)
        return m_started;

    int err = ::pthread_create(&m_thread, NULL, helper, this);
    if (err != 0) {
        LogError(LOG_HOST, "Error returned from pthread_create, err: %d (%s)", err, strerror(err));
        return false;
    }

    m_started = true;
    return m_started;
}

/* Make calling thread wait for termination of the thread. */

void Thread::wait()
{
    if (!m_started)
        return;

    ::pthread_join(m_thread, NULL);
    m_started = false;
}

/* Set thread name visible in the kernel and its interfaces. */

void Thread::setName(std::string name)
{
    if (!m_started)
        return;
    if (pthread_kill(m_thread, 0) != 0)
        return;
#ifdef _GNU_SOURCE
    // kernel thread names are limited to 15 characters
    if (name.length() > 15U)
        name = name.substr(0U, 15U);
    ::pthread_setname_np(m_thread, name.c_str());
#endif // _GNU_SOURCE
}

/* Helper to sleep the current thread. */

void Thread::sleep(uint32_t ms, uint32_t us)
{
    struct timespec ts;
    ts.tv_sec = ms / 1000U;
    ts.tv_nsec = ((ms % 1000U) * 1000000L) + (us * 1000L);

    while (::nanosleep(&ts, &ts) == -1 && errno == EINTR)
        ;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper thats used as the entry point for the thread. */

void* Thread::helper(void* arg)
{
    Thread* p = (Thread*)arg;
    p->entry();

    return nullptr;
}
