// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2010,2015 Jonathan Naylor, G4KLX
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file Timer.h
 * @ingroup common
 * @file Timer.cpp
 * @ingroup common
 */
#if !defined(__TIMER_H__)
#define __TIMER_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Implements a timer.
 * @ingroup common
 *
 * The timer counts clock ticks handed to it through clock(); it never reads the
 * system clock itself, so a timer clocked with milliseconds (ticksPerSec = 1000)
 * expires after the configured number of clocked milliseconds.
 */
class RELAY_SW_API Timer {
public:
    /**
     * @brief Initializes a new instance of the Timer class.
     */
    Timer();
    /**
     * @brief Initializes a new instance of the Timer class.
     * @param ticksPerSec Number of ticks per second.
     * @param secs Seconds before timeout.
     * @param msecs Milliseconds before timeout.
     */
    Timer(uint32_t ticksPerSec, uint32_t secs = 0U, uint32_t msecs = 0U);

    /**
     * @brief Sets the timeout for the timer.
     * @param secs Seconds before timeout.
     * @param msecs Milliseconds before timeout.
     */
    void setTimeout(uint32_t secs, uint32_t msecs = 0U);
    /**
     * @brief Gets the timeout for the timer.
     * @returns uint32_t Timeout for the timer, in seconds.
     */
    uint32_t getTimeout() const;
    /**
     * @brief Gets the current time for the timer.
     * @returns uint32_t Current time, in seconds.
     */
    uint32_t getTimer() const;

    /**
     * @brief Gets the time remaining for the timer.
     * @returns uint32_t Time remaining, in seconds.
     */
    uint32_t getRemaining() const
    {
        if (m_timeout == 0U || m_timer == 0U)
            return 0U;
        if (m_timer >= m_timeout)
            return 0U;

        return (m_timeout - m_timer) / m_ticksPerSec;
    }

    /**
     * @brief Flag indicating whether the timer is running.
     * @returns bool True, if the timer is still running, otherwise false.
     */
    bool isRunning() const { return m_timer > 0U; }

    /**
     * @brief Starts the timer with a new timeout.
     * @param secs Seconds before timeout.
     * @param msecs Milliseconds before timeout.
     */
    void start(uint32_t secs, uint32_t msecs = 0U)
    {
        setTimeout(secs, msecs);
        start();
    }
    /**
     * @brief Starts the timer.
     */
    void start()
    {
        if (m_timeout > 0U)
            m_timer = 1U;
    }

    /**
     * @brief Stops the timer.
     */
    void stop() { m_timer = 0U; }

    /**
     * @brief Flag indicating whether or not the timer has expired.
     * @returns bool True, if the timer has expired, otherwise false.
     */
    bool hasExpired() const
    {
        if (m_timeout == 0U || m_timer == 0U)
            return false;
        if (m_timer >= m_timeout)
            return true;

        return false;
    }

    /**
     * @brief Updates the timer by the passed number of ticks.
     * @param ticks Number of ticks to update the timer by.
     */
    void clock(uint32_t ticks = 1U)
    {
        if (m_timer > 0U && m_timeout > 0U)
            m_timer += ticks;
    }

private:
    uint32_t m_ticksPerSec;
    uint32_t m_timeout;
    uint32_t m_timer;
};

#endif // __TIMER_H__
