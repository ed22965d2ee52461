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
 * @file Router.h
 * @ingroup relay
 * @file Router.cpp
 * @ingroup relay
 */
#if !defined(__ROUTER_H__)
#define __ROUTER_H__

#include "relay/Defines.h"
#include "common/aprs/Packet.h"
#include "common/Timer.h"
#include "network/DedupCache.h"

#include <mutex>
#include <string>
#include <vector>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class RELAY_SW_API Session;
    class RELAY_SW_API ClientSession;
    class RELAY_SW_API PeerSession;

    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Router configuration.
     * @ingroup relay
     */
    struct RouterConfig {
        uint32_t maxPath;               //!< Maximum path elements
        uint32_t dedupWindow;           //!< Dedup window (seconds)
        uint32_t dedupMaxEntries;       //!< Dedup cache size bound
        bool allowReadOnlyLocal;        //!< Forward receive-only client packets to local clients

        /**
         * @brief Initializes a new instance of the RouterConfig struct.
         */
        RouterConfig() :
            maxPath(aprs::defines::DEFAULT_MAX_PATH),
            dedupWindow(relay::DEFAULT_DEDUP_WINDOW),
            dedupMaxEntries(relay::DEFAULT_DEDUP_MAX_ENTRIES),
            allowReadOnlyLocal(false)
        {
            /* stub */
        }
    };

    /**
     * @brief Read-only router counters and state.
     * @ingroup relay
     */
    struct RouterStatus {
        uint32_t clients;               //!< Authenticated client sessions
        uint32_t peers;                 //!< Connected S2S peer sessions
        bool uplinkConnected;           //!< Flag indicating an uplink is connected
        uint32_t dedupSize;             //!< Dedup cache entries
        uint64_t packetsRx;             //!< Packets handed to dispatch
        uint64_t packetsTx;             //!< Lines queued to sessions
        uint64_t duplicates;            //!< Packets dropped as duplicates
        uint64_t loops;                 //!< Packets dropped as loops
        uint64_t readOnlyDrops;         //!< Receive-only packets dropped
        uint32_t packetsPerSec;         //!< Packets handed to dispatch per second
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the packet hub: loop and duplicate suppression, then fan-out
     *  to every other live session.
     * @ingroup relay
     *
     * Registration, deregistration, dispatch and the dedup sweep all run under a single
     * mutex. A session removed by unregisterSession() is therefore never touched by a
     * dispatch that starts afterwards, and a dispatch already in flight completes before
     * the removal does.
     */
    class RELAY_SW_API Router {
    public:
        /**
         * @brief Initializes a new instance of the Router class.
         * @param serverId This server's identity (used as its path marker).
         * @param config Router configuration.
         */
        Router(const std::string& serverId, const RouterConfig& config);

        /**
         * @brief Registers a session for fan-out.
         * @param session Session (not owned).
         */
        void registerSession(Session* session);
        /**
         * @brief Removes a session from fan-out.
         * @param session Session.
         */
        void unregisterSession(Session* session);

        /**
         * @brief Dispatches a packet to every eligible session other than the origin.
         * @param pkt Packet.
         * @param origin Session the packet arrived on (may be nullptr for locally generated packets).
         * @returns relay::DispatchResult::ENUM Dispatch result.
         */
        relay::DispatchResult::ENUM dispatch(const aprs::Packet& pkt, Session* origin);

        /**
         * @brief Updates the router time, sweeps the dedup cache and computes the packet rate.
         * @param ms Number of milliseconds since the last call.
         */
        void clock(uint32_t ms);

        /**
         * @brief Gets a snapshot of the router counters and state.
         * @returns RouterStatus Router status.
         */
        RouterStatus getStatus() const;

    public:
        /**
         * @brief Server Identity.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, serverId);

    private:
        RouterConfig m_config;

        DedupCache m_dedup;
        DedupCache m_localDedup;        // packets delivered to local clients only
        std::vector<ClientSession*> m_clients;
        std::vector<PeerSession*> m_peers;

        uint64_t m_now;
        Timer m_sweepTimer;
        uint32_t m_rateMs;
        uint64_t m_rateLastRx;
        uint32_t m_packetsPerSec;

        uint64_t m_packetsRx;
        uint64_t m_packetsTx;
        uint64_t m_duplicates;
        uint64_t m_loops;
        uint64_t m_readOnlyDrops;

        mutable std::mutex m_mutex;

        Router(const Router&) = delete;
        Router& operator=(const Router&) = delete;
    };
} // namespace network

#endif // __ROUTER_H__
