// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "network/ReconnectBackoff.h"

using namespace network;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the ReconnectBackoff class. */

ReconnectBackoff::ReconnectBackoff(uint32_t minMs, uint32_t maxMs, uint32_t stableMs) :
    m_minMs(minMs),
    m_maxMs(maxMs),
    m_stableMs(stableMs),
    m_current(minMs)
{
    if (m_minMs == 0U)
        m_minMs = 1U;
    if (m_maxMs < m_minMs)
        m_maxMs = m_minMs;

    m_current = m_minMs;
}

/* Returns the current delay and doubles it for the next attempt, up to the maximum. */

uint32_t ReconnectBackoff::next()
{
    uint32_t delay = m_current;

    if (m_current >= m_maxMs / 2U)
        m_current = m_maxMs;
    else
        m_current *= 2U;

    return delay;
}
