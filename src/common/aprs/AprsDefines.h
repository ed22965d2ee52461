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
 * @defgroup aprs APRS-IS Protocol
 * @brief Implementation for the APRS-IS TNC2 text packet format, passcodes and filters.
 * @ingroup common
 *
 * @file AprsDefines.h
 * @ingroup aprs
 */
#if !defined(__APRS_DEFINES_H__)
#define  __APRS_DEFINES_H__

#include "common/Defines.h"

// Shorthand macro to aprs::defines -- keeps source code that doesn't use "using" concise
#define APRSDEF aprs::defines
namespace aprs
{
    namespace defines
    {
        // ---------------------------------------------------------------------------
        //  Constants
        // ---------------------------------------------------------------------------

        /**
         * @addtogroup aprs
         * @{
         */

        const uint32_t  MAX_LINE_LEN = 512U;                    //!< Maximum length of an APRS-IS line (excluding CR/LF)
        const uint32_t  MAX_CALLSIGN_LEN = 6U;                  //!< Maximum callsign length (excluding SSID)
        const uint8_t   MAX_SSID = 15U;                         //!< Maximum station SSID
        const uint32_t  MAX_SERVER_ID_LEN = 9U;                 //!< Maximum length of a server identity
        const uint32_t  DEFAULT_MAX_PATH = 10U;                 //!< Default maximum number of path elements

        const uint32_t  MESSAGE_ADDRESSEE_LEN = 9U;             //!< Length of a message addressee field

        const int32_t   PASSCODE_RECEIVE_ONLY = -1;             //!< Receive-only (unverified) passcode sentinel
        const uint16_t  PASSCODE_HASH_SEED = 0x73E2U;           //!< Passcode hash seed
        const uint16_t  PASSCODE_HASH_MASK = 0x7FFFU;           //!< Passcode hash mask

        const char      RELAY_Q_CONSTRUCT[] = "qAS";            //!< q-construct marking a server-to-server relay hop

        /** @} */

        /** @brief Packet Codec Errors */
        namespace PacketError {
            /** @brief Packet Codec Errors */
            enum ENUM : uint8_t {
                NONE = 0U,                  //!< No Error
                MALFORMED_PACKET = 1U,      //!< Unparseable Header
                INVALID_CALLSIGN = 2U,      //!< Bad Station Identifier Syntax
                PATH_TOO_LONG = 3U,         //!< Path Exceeds Configured Maximum
            };
        }

        /** @brief Path Element Kind */
        namespace PathElementKind {
            /** @brief Path Element Kind */
            enum ENUM : uint8_t {
                HOP = 0U,                   //!< Digipeater/Relay Hop
                Q_CONSTRUCT = 1U,           //!< q-Construct with Server Identity
            };
        }

        /** @brief Filter Term Types */
        namespace FilterType {
            /** @brief Filter Term Types */
            enum ENUM : uint8_t {
                PREFIX = 0U,                //!< p/ Source Callsign Prefix
                BUDDY = 1U,                 //!< b/ Source Station
                DIGI = 2U,                  //!< d/ Path Hop
                UNPROTO = 3U,               //!< u/ Destination
                ALL = 4U,                   //!< a/* or all
            };
        }

        /**
         * @brief Returns a printable name for a packet codec error.
         * @param err Packet codec error.
         * @returns const char* Printable name.
         */
        inline const char* packetErrorToString(PacketError::ENUM err)
        {
            switch (err) {
            case PacketError::NONE:
                return "none";
            case PacketError::MALFORMED_PACKET:
                return "malformed packet";
            case PacketError::INVALID_CALLSIGN:
                return "invalid callsign";
            case PacketError::PATH_TOO_LONG:
                return "path too long";
            default:
                return "unknown";
            }
        }
    } // namespace defines
} // namespace aprs

#endif // __APRS_DEFINES_H__
