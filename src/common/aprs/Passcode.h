// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file Passcode.h
 * @ingroup aprs
 * @file Passcode.cpp
 * @ingroup aprs
 */
#if !defined(__APRS__PASSCODE_H__)
#define  __APRS__PASSCODE_H__

#include "common/Defines.h"
#include "common/aprs/AprsDefines.h"

#include <string>

namespace aprs
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the APRS-IS callsign passcode hash.
     * @ingroup aprs
     */
    class RELAY_SW_API Passcode {
    public:
        /**
         * @brief Computes the passcode for a callsign; any SSID is ignored.
         * @param callsign Callsign (case-insensitive, with or without SSID).
         * @returns int32_t Passcode (0 - 32767).
         */
        static int32_t compute(const std::string& callsign);

        /**
         * @brief Verifies a passcode against a callsign.
         * @param callsign Callsign.
         * @param passcode Passcode.
         * @returns bool True, if the passcode is the receive-only sentinel or matches the callsign.
         */
        static bool verify(const std::string& callsign, int32_t passcode);

        /**
         * @brief Flag indicating whether the passcode is the receive-only sentinel.
         * @param passcode Passcode.
         * @returns bool True, if the passcode is receive-only, otherwise false.
         */
        static bool isReceiveOnly(int32_t passcode) { return passcode == defines::PASSCODE_RECEIVE_ONLY; }
    };
} // namespace aprs

#endif // __APRS__PASSCODE_H__
