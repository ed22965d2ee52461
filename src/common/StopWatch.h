// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file StopWatch.h
 * @ingroup common
 */
#if !defined(__STOPWATCH_H__)
#define __STOPWATCH_H__

#include "common/Defines.h"

#include <chrono>

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Implements a stop watch.
 * @ingroup common
 */
class RELAY_SW_API StopWatch {
public:
    /**
     * @brief Initializes a new instance of the StopWatch class.
     */
    StopWatch() : m_startMS(0ULL) { /* stub */ }

    /**
     * @brief Gets the current running time.
     * @returns uint64_t Current monotonic time, in milliseconds.
     */
    static uint64_t time()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Starts the stop watch.
     * @returns uint64_t Start time, in milliseconds.
     */
    uint64_t start()
    {
        m_startMS = time();
        return m_startMS;
    }

    /**
     * @brief Gets the elapsed time since the stop watch started.
     * @returns uint32_t Elapsed time, in milliseconds.
     */
    uint32_t elapsed() const
    {
        return (uint32_t)(time() - m_startMS);
    }

private:
    uint64_t m_startMS;
};

#endif // __STOPWATCH_H__
