// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "common/aprs/Passcode.h"
#include "common/Utils.h"

using namespace aprs;
using namespace aprs::defines;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Computes the passcode for a callsign; any SSID is ignored. */

int32_t Passcode::compute(const std::string& callsign)
{
    std::string call = Utils::toUpper(callsign);
    size_t dash = call.find('-');
    if (dash != std::string::npos)
        call = call.substr(0U, dash);

    uint16_t hash = PASSCODE_HASH_SEED;
    for (size_t i = 0U; i < call.length(); i += 2U) {
        hash ^= (uint16_t)((uint8_t)call[i] << 8);
        if (i + 1U < call.length())
            hash ^= (uint8_t)call[i + 1U];
    }

    return (int32_t)(hash & PASSCODE_HASH_MASK);
}

/* Verifies a passcode against a callsign. */

bool Passcode::verify(const std::string& callsign, int32_t passcode)
{
    if (isReceiveOnly(passcode))
        return true;

    return passcode == compute(callsign);
}
