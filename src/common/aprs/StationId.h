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
 * @file StationId.h
 * @ingroup aprs
 * @file StationId.cpp
 * @ingroup aprs
 */
#if !defined(__APRS__STATION_ID_H__)
#define  __APRS__STATION_ID_H__

#include "common/Defines.h"
#include "common/aprs/AprsDefines.h"

#include <string>

namespace aprs
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents an APRS station identifier (callsign and optional SSID).
     * @ingroup aprs
     *
     * Callsigns are 1-6 alphanumeric characters and are uppercased on parse; an SSID
     * of 0 is never written out, so "N0CALL-0" and "N0CALL" decode to the same identifier.
     */
    class RELAY_SW_API StationId {
    public:
        /**
         * @brief Initializes a new instance of the StationId class.
         */
        StationId();
        /**
         * @brief Initializes a new instance of the StationId class.
         * @param callsign Callsign (must already be valid and uppercased).
         * @param ssid SSID.
         */
        StationId(const std::string& callsign, uint8_t ssid);

        /**
         * @brief Decodes a station identifier.
         * @param text Identifier text (e.g. "N0CALL-5").
         * @param id Decoded station identifier.
         * @returns bool True, if the identifier was valid, otherwise false.
         */
        static bool decode(const std::string& text, StationId& id);

        /**
         * @brief Encodes the station identifier.
         * @returns std::string Identifier text.
         */
        std::string encode() const;

        /**
         * @brief Flag indicating whether this identifier holds a callsign.
         * @returns bool True, if the identifier is set, otherwise false.
         */
        bool isValid() const { return !m_callsign.empty(); }

        /**
         * @brief Checks whether the text matches a station identifier pattern; a trailing
         *  '*' in the pattern matches any remaining characters.
         * @param pattern Pattern (uppercase).
         * @returns bool True, if the identifier matches, otherwise false.
         */
        bool matches(const std::string& pattern) const;

        /**
         * @brief Equals operator.
         * @param data Instance of StationId to compare.
         */
        bool operator==(const StationId& data) const { return m_callsign == data.m_callsign && m_ssid == data.m_ssid; }
        /**
         * @brief Not-equals operator.
         * @param data Instance of StationId to compare.
         */
        bool operator!=(const StationId& data) const { return !(*this == data); }

    public:
        /**
         * @brief Callsign.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, callsign);
        /**
         * @brief Secondary Station Identifier.
         */
        DECLARE_RO_PROPERTY_PLAIN(uint8_t, ssid);
    };

    /**
     * @brief Checks whether the text is a valid server identity (1-9 alphanumerics or '-').
     * @param text Server identity.
     * @returns bool True, if valid, otherwise false.
     */
    extern RELAY_SW_API bool isValidServerId(const std::string& text);
} // namespace aprs

#endif // __APRS__STATION_ID_H__
