// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "common/aprs/StationId.h"
#include "common/Utils.h"

using namespace aprs;
using namespace aprs::defines;

#include <cctype>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the StationId class. */

StationId::StationId() :
    m_callsign(),
    m_ssid(0U)
{
    /* stub */
}

/* Initializes a new instance of the StationId class. */

StationId::StationId(const std::string& callsign, uint8_t ssid) :
    m_callsign(callsign),
    m_ssid(ssid)
{
    /* stub */
}

/* Decodes a station identifier. */

bool StationId::decode(const std::string& text, StationId& id)
{
    std::string call = text;
    std::string ssidText;

    size_t dash = text.find('-');
    if (dash != std::string::npos) {
        call = text.substr(0U, dash);
        ssidText = text.substr(dash + 1U);

        // "CALL-" and "CALL-1-2" are both invalid
        if (ssidText.empty() || ssidText.length() > 2U)
            return false;
    }

    if (call.empty() || call.length() > MAX_CALLSIGN_LEN)
        return false;

    for (char c : call) {
        if (!::isalnum((unsigned char)c))
            return false;
    }

    uint32_t ssid = 0U;
    for (char c : ssidText) {
        if (!::isdigit((unsigned char)c))
            return false;
        ssid = (ssid * 10U) + (uint32_t)(c - '0');
    }

    if (ssid > MAX_SSID)
        return false;

    id = StationId(Utils::toUpper(call), (uint8_t)ssid);
    return true;
}

/* Encodes the station identifier. */

std::string StationId::encode() const
{
    if (m_ssid == 0U)
        return m_callsign;

    return m_callsign + "-" + std::to_string(m_ssid);
}

/* Checks whether the text matches a station identifier pattern. */

bool StationId::matches(const std::string& pattern) const
{
    std::string text = encode();
    if (!pattern.empty() && pattern.back() == '*') {
        std::string prefix = pattern.substr(0U, pattern.length() - 1U);
        return text.compare(0U, prefix.length(), prefix) == 0;
    }

    return text == pattern;
}

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Checks whether the text is a valid server identity. */

bool aprs::isValidServerId(const std::string& text)
{
    if (text.empty() || text.length() > MAX_SERVER_ID_LEN)
        return false;

    for (char c : text) {
        if (!::isalnum((unsigned char)c) && c != '-')
            return false;
    }

    return true;
}
