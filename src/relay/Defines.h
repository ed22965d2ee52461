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
 * @defgroup relay Relay Daemon
 * @brief Implementation for the APRS-IS relay daemon, sessions, routing and peering.
 *
 * @file Defines.h
 * @ingroup relay
 */
#if !defined(__RELAY_DEFINES_H__)
#define __RELAY_DEFINES_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

/**
 * @addtogroup relay
 * @{
 */

#define DEFAULT_CONF_FILE "aprsrelay.yml"

/** @} */

namespace relay
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /**
     * @addtogroup relay
     * @{
     */

    const uint16_t  DEFAULT_USER_PORT = 14580U;             //!< Default client port
    const uint16_t  DEFAULT_S2S_PORT = 14579U;              //!< Default server-to-server port

    const uint32_t  DEFAULT_LOGIN_TIMEOUT = 30U;            //!< Default client login timeout (seconds)
    const uint32_t  DEFAULT_CLIENT_HEARTBEAT = 20U;         //!< Default client heartbeat interval (seconds)
    const uint32_t  DEFAULT_CLIENT_IDLE_TIMEOUT = 600U;     //!< Default client idle timeout (seconds)
    const uint32_t  DEFAULT_MAX_QUEUE_LINES = 2048U;        //!< Default outbound queue bound (lines)
    const uint32_t  DEFAULT_MAX_BAD_PACKETS = 10U;          //!< Default consecutive codec errors before disconnect

    const uint32_t  DEFAULT_DEDUP_WINDOW = 30U;             //!< Default dedup window (seconds)
    const uint32_t  DEFAULT_DEDUP_MAX_ENTRIES = 100000U;    //!< Default dedup cache size bound
    const uint32_t  DEFAULT_STATUS_INTERVAL = 300U;         //!< Default status log interval (seconds)

    const uint32_t  DEFAULT_PEER_HEARTBEAT = 30U;           //!< Default S2S keepalive interval (seconds)
    const uint32_t  DEFAULT_PEER_IDLE_TIMEOUT = 120U;       //!< Default S2S idle timeout (seconds)
    const uint32_t  DEFAULT_HANDSHAKE_TIMEOUT = 20U;        //!< Default S2S handshake timeout (seconds)
    const uint32_t  DEFAULT_CONNECT_TIMEOUT = 10U;          //!< Default connect timeout (seconds)
    const uint32_t  DEFAULT_BACKOFF_MIN = 1U;               //!< Default minimum reconnect delay (seconds)
    const uint32_t  DEFAULT_BACKOFF_MAX = 60U;              //!< Default maximum reconnect delay (seconds)
    const uint32_t  DEFAULT_BACKOFF_STABLE = 300U;          //!< Default stable link duration resetting backoff (seconds)

    const uint32_t  SESSION_POLL_MS = 50U;                  //!< Session socket poll interval (milliseconds)
    const uint32_t  SESSION_WRITE_TIMEOUT_MS = 5000U;       //!< Session socket write timeout (milliseconds)

    /** @} */

    /** @brief Session Kind */
    namespace SessionKind {
        /** @brief Session Kind */
        enum ENUM : uint8_t {
            CLIENT = 0U,                //!< Local Client
            PEER = 1U,                  //!< Server-to-Server Peer
            UPLINK = 2U,                //!< Client-style Uplink to an Upstream Server
        };
    }

    /** @brief Session Login State */
    namespace SessionState {
        /** @brief Session Login State */
        enum ENUM : uint8_t {
            CONNECTED = 0U,             //!< Transport Connected
            AWAITING_LOGIN = 1U,        //!< Awaiting Login Line
            AUTHENTICATED = 2U,         //!< Authenticated / Link Established
            REJECTED = 3U,              //!< Login Rejected
            CLOSED = 4U,                //!< Closed
        };
    }

    /** @brief Peer Link State */
    namespace PeerState {
        /** @brief Peer Link State */
        enum ENUM : uint8_t {
            DISCONNECTED = 0U,          //!< Disconnected
            CONNECTING = 1U,            //!< Transport Connecting
            HANDSHAKING = 2U,           //!< Login Exchange in Progress
            CONNECTED = 3U,             //!< Link Established
            BACKOFF = 4U,               //!< Waiting to Reconnect
        };
    }

    /** @brief Session Errors / Closure Reasons */
    namespace SessionError {
        /** @brief Session Errors / Closure Reasons */
        enum ENUM : uint8_t {
            NONE = 0U,                  //!< No Error
            MALFORMED_PACKET = 1U,      //!< Repeated Unparseable Packets
            INVALID_CALLSIGN = 2U,      //!< Repeated Bad Station Identifiers
            PATH_TOO_LONG = 3U,         //!< Repeated Overlong Paths
            AUTH_FAILED = 4U,           //!< Authentication Failed
            LOGIN_TIMEOUT = 5U,         //!< No Login Within Timeout
            CONNECT_FAILED = 6U,        //!< Outbound Connect Failed
            HANDSHAKE_TIMEOUT = 7U,     //!< S2S Login Exchange Timed Out
            PEER_IDLE = 8U,             //!< No Traffic Within Idle Timeout
            QUEUE_OVERFLOW = 9U,        //!< Outbound Queue Full (slow consumer)
            REMOTE_CLOSED = 10U,        //!< Remote End Closed the Connection
            SHUTDOWN = 11U,             //!< Local Shutdown
            CLIENT_IDLE = 12U,          //!< No Client Traffic Within Idle Timeout
            DUPLICATE_LINK = 13U,       //!< Another Link to the Same Peer is Up
        };
    }

    /** @brief Router Dispatch Result */
    namespace DispatchResult {
        /** @brief Router Dispatch Result */
        enum ENUM : uint8_t {
            DELIVERED = 0U,             //!< Accepted and Fanned Out
            DROP_LOOP = 1U,             //!< Dropped, Already Relayed by this Server
            DROP_DUPLICATE = 2U,        //!< Dropped, Seen Within the Dedup Window
            DROP_READONLY = 3U,         //!< Dropped, Receive-only Origin
        };
    }

    /**
     * @brief Returns a printable name for a session error.
     * @param err Session error.
     * @returns const char* Printable name.
     */
    inline const char* sessionErrorToString(SessionError::ENUM err)
    {
        switch (err) {
        case SessionError::NONE:
            return "none";
        case SessionError::MALFORMED_PACKET:
            return "malformed packet";
        case SessionError::INVALID_CALLSIGN:
            return "invalid callsign";
        case SessionError::PATH_TOO_LONG:
            return "path too long";
        case SessionError::AUTH_FAILED:
            return "authentication failed";
        case SessionError::LOGIN_TIMEOUT:
            return "login timeout";
        case SessionError::CONNECT_FAILED:
            return "connect failed";
        case SessionError::HANDSHAKE_TIMEOUT:
            return "handshake timeout";
        case SessionError::PEER_IDLE:
            return "peer idle";
        case SessionError::QUEUE_OVERFLOW:
            return "queue overflow";
        case SessionError::REMOTE_CLOSED:
            return "remote closed";
        case SessionError::SHUTDOWN:
            return "shutdown";
        case SessionError::CLIENT_IDLE:
            return "client idle";
        case SessionError::DUPLICATE_LINK:
            return "duplicate link";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Returns a printable name for a peer link state.
     * @param state Peer link state.
     * @returns const char* Printable name.
     */
    inline const char* peerStateToString(PeerState::ENUM state)
    {
        switch (state) {
        case PeerState::DISCONNECTED:
            return "disconnected";
        case PeerState::CONNECTING:
            return "connecting";
        case PeerState::HANDSHAKING:
            return "handshaking";
        case PeerState::CONNECTED:
            return "connected";
        case PeerState::BACKOFF:
            return "backoff";
        default:
            return "unknown";
        }
    }
} // namespace relay

#endif // __RELAY_DEFINES_H__
