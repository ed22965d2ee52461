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
/**
 * @file Thread.h
 * @ingroup common
 * @file Thread.cpp
 * @ingroup common
 */
#if !defined(__THREAD_H__)
#define __THREAD_H__

#include "common/Defines.h"

#include <pthread.h>

#include <string>

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Implements a simple threading mechanism.
 * @ingroup common
 */
class RELAY_SW_API Thread {
public:
    /**
     * @brief Initializes a new instance of the Thread class.
     */
    Thread();
    /**
     * @brief Finalizes a instance of the Thread class.
     */
    virtual ~Thread();

    /**
     * @brief Starts the thread execution.
     * @returns bool True, if thread started, otherwise false.
     */
    virtual bool run();

    /**
     * @brief User-defined function to run for the thread main.
     */
    virtual void entry() = 0;

    /**
     * @brief Make calling thread wait for termination of the thread.
     */
    virtual void wait();

    /**
     * @brief Set thread name visible in the kernel and its interfaces.
     * @param name Textual name for thread.
     */
    void setName(std::string name);

    /**
     * @brief Flag indicating whether the thread was started.
     * @returns bool True, if the thread was started, otherwise false.
     */
    bool isStarted() const { return m_started; }

    /**
     * @brief Helper to sleep the current thread.
     * @param ms Time in milliseconds to sleep.
     * @param us Time in microseconds to sleep.
     */
    static void sleep(uint32_t ms, uint32_t us = 0U);

private:
    pthread_t m_thread;
    bool m_started;

    /**
     * @brief Internal helper thats used as the entry point for the thread.
     * @param arg Thread instance.
     * @returns void*
     */
    static void* helper(void* arg);
};

#endif // __THREAD_H__
