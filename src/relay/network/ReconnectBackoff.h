// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file ReconnectBackoff.h
 * @ingroup relay
 * @file ReconnectBackoff.cpp
 * @ingroup relay
 */
#if !defined(__RECONNECT_BACKOFF_H__)
#define __RECONNECT_BACKOFF_H__

#include "relay/Defines.h"

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a capped exponential reconnect delay.
     * @ingroup relay
     */
    class RELAY_SW_API ReconnectBackoff {
    public:
        /**
         * @brief Initializes a new instance of the ReconnectBackoff class.
         * @param minMs Minimum (initial) delay, in milliseconds.
         * @param maxMs Maximum delay, in milliseconds.
         * @param stableMs Connected duration after which the delay is reset, in milliseconds.
         */
        ReconnectBackoff(uint32_t minMs, uint32_t maxMs, uint32_t stableMs);

        /**
         * @brief Returns the current delay and doubles it for the next attempt, up to the maximum.
         * @returns uint32_t Delay, in milliseconds.
         */
        uint32_t next();
        /**
         * @brief Resets the delay to the minimum.
         */
        void reset() { m_current = m_minMs; }

        /**
         * @brief Flag indicating whether a link was up long enough to reset the delay.
         * @param connectedMs Duration the link was connected, in milliseconds.
         * @returns bool True, if the link was stable, otherwise false.
         */
        bool isStable(uint64_t connectedMs) const { return connectedMs >= m_stableMs; }

        /**
         * @brief Gets the delay the next call to next() will return.
         * @returns uint32_t Delay, in milliseconds.
         */
        uint32_t current() const { return m_current; }

    public:
        /**
         * @brief Minimum Delay (ms).
         */
        DECLARE_RO_PROPERTY_PLAIN(uint32_t, minMs);
        /**
         * @brief Maximum Delay (ms).
         */
        DECLARE_RO_PROPERTY_PLAIN(uint32_t, maxMs);
        /**
         * @brief Stable Link Duration (ms).
         */
        DECLARE_RO_PROPERTY_PLAIN(uint32_t, stableMs);

    private:
        uint32_t m_current;
    };
} // namespace network

#endif // __RECONNECT_BACKOFF_H__
