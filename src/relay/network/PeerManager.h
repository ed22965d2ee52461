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
 * @file PeerManager.h
 * @ingroup relay
 * @file PeerManager.cpp
 * @ingroup relay
 */
#if !defined(__PEER_MANAGER_H__)
#define __PEER_MANAGER_H__

#include "relay/Defines.h"
#include "common/network/tcp/Socket.h"
#include "network/PeerSession.h"
#include "network/ReconnectBackoff.h"

#include <mutex>
#include <string>
#include <vector>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class RELAY_SW_API Router;

    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Peer manager configuration.
     * @ingroup relay
     */
    struct PeerManagerConfig {
        PeerSessionConfig session;      //!< Peer session configuration
        uint32_t backoffMin;            //!< Minimum reconnect delay (seconds)
        uint32_t backoffMax;            //!< Maximum reconnect delay (seconds)
        uint32_t backoffStable;         //!< Link duration that resets the backoff (seconds)
        uint32_t maxQueueLines;         //!< Outbound queue bound per session

        /**
         * @brief Initializes a new instance of the PeerManagerConfig struct.
         */
        PeerManagerConfig() :
            session(),
            backoffMin(relay::DEFAULT_BACKOFF_MIN),
            backoffMax(relay::DEFAULT_BACKOFF_MAX),
            backoffStable(relay::DEFAULT_BACKOFF_STABLE),
            maxQueueLines(relay::DEFAULT_MAX_QUEUE_LINES)
        {
            /* stub */
        }
    };

    /**
     * @brief Read-only snapshot of one configured remote server.
     * @ingroup relay
     */
    struct PeerStatus {
        std::string peerName;           //!< Peer name (uplink: login callsign)
        std::string host;               //!< Hostname or IP address
        uint16_t port;                  //!< Port
        bool uplink;                    //!< Flag indicating the descriptor is the uplink
        bool receiveOnly;               //!< Flag indicating the peer is receive-only
        relay::PeerState::ENUM state;   //!< Link state
        uint32_t connects;              //!< Links established
        uint32_t failures;              //!< Outbound attempts that never established a link
        uint32_t packetsRx;             //!< Packets received on the current link
        uint32_t packetsTx;             //!< Lines sent on the current link
        uint32_t backoffMs;             //!< Remaining reconnect delay (milliseconds)
        relay::SessionError::ENUM lastError; //!< Closure reason of the last link or attempt
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Owns the configured remote servers, dials them with exponential backoff
     *  and admits inbound S2S links.
     * @ingroup relay
     *
     * All descriptor state is guarded by the manager mutex. The manager owns every
     * PeerSession it creates and reaps them from clock() once their threads finish.
     */
    class RELAY_SW_API PeerManager {
    public:
        /**
         * @brief Initializes a new instance of the PeerManager class.
         * @param router Router instance.
         * @param config Peer manager configuration.
         * @param descriptors Configured remote servers.
         */
        PeerManager(Router* router, const PeerManagerConfig& config, const std::vector<PeerDescriptor>& descriptors);
        /**
         * @brief Finalizes a instance of the PeerManager class.
         */
        ~PeerManager();

        /**
         * @brief Updates manager time, starts due outbound sessions and reaps finished sessions.
         * @param ms Number of milliseconds since the last call.
         */
        void clock(uint32_t ms);

        /**
         * @brief Creates an acceptor session for an inbound S2S connection.
         * @param socket Accepted socket (ownership passes to the manager).
         */
        void acceptInbound(tcp::Socket* socket);

        /**
         * @brief Admits an inbound S2S login.
         * @param session Acceptor session.
         * @param peerName Server identity given in the login line.
         * @param passcode Passcode given in the login line.
         * @param index Matched descriptor index.
         * @param descriptor Matched descriptor.
         * @param reason Rejection reason.
         * @returns bool True, if the peer is admitted, otherwise false.
         */
        bool authenticateInbound(PeerSession* session, const std::string& peerName, int32_t passcode, int32_t& index,
            PeerDescriptor& descriptor, std::string& reason);
        /**
         * @brief Binds an established link to its descriptor.
         *
         * When two servers dial each other, the link initiated by the lower server ID is
         * kept on both ends; a preferred link replaces the other, which is closed.
         * @param session Peer session.
         * @returns bool True, if the link is bound, false if the preferred link to the peer is already up.
         */
        bool linkEstablished(PeerSession* session);

        /**
         * @brief Gets a snapshot of every configured remote server.
         * @returns std::vector<PeerStatus> Peer status, in descriptor order.
         */
        std::vector<PeerStatus> getPeerStatus() const;

        /**
         * @brief Stops dialing, closes every session and waits for their threads.
         */
        void close();

    private:
        /**
         * @brief Internal state of one configured remote server.
         */
        struct PeerEntry {
            PeerDescriptor descriptor;
            relay::PeerState::ENUM state;
            uint64_t backoffUntil;
            ReconnectBackoff backoff;
            PeerSession* outbound;
            PeerSession* link;
            uint32_t connects;
            uint32_t failures;
            relay::SessionError::ENUM lastError;

            PeerEntry(const PeerDescriptor& desc, uint32_t minMs, uint32_t maxMs, uint32_t stableMs) :
                descriptor(desc),
                state(relay::PeerState::DISCONNECTED),
                backoffUntil(0U),
                backoff(minMs, maxMs, stableMs),
                outbound(nullptr),
                link(nullptr),
                connects(0U),
                failures(0U),
                lastError(relay::SessionError::NONE)
            {
                /* stub */
            }
        };

        Router* m_router;
        PeerManagerConfig m_config;

        std::vector<PeerEntry> m_entries;
        std::vector<PeerSession*> m_sessions;

        uint64_t m_now;
        uint32_t m_nextId;
        bool m_running;

        mutable std::mutex m_mutex;

        /**
         * @brief Helper to start an outbound session for a descriptor (called with the mutex held).
         * @param index Descriptor index.
         */
        void dial(uint32_t index);
        /**
         * @brief Helper to update the descriptor of a finished session and schedule the next attempt.
         * @param session Finished session.
         */
        void sessionEnded(PeerSession* session);
        /**
         * @brief Helper to determine whether a link of the given role is the one kept when two links to a peer are up.
         * @param role Session role.
         * @param remoteId Remote server identity.
         * @returns bool True, if the link is preferred, otherwise false.
         */
        bool isPreferredLink(PeerRole::ENUM role, const std::string& remoteId) const;
        /**
         * @brief Helper to find a descriptor whose host resolves to the given address.
         * @param address Remote address.
         * @returns int32_t Descriptor index, or -1.
         */
        int32_t findByAddress(const std::string& address) const;

        PeerManager(const PeerManager&) = delete;
        PeerManager& operator=(const PeerManager&) = delete;
    };
} // namespace network

#endif // __PEER_MANAGER_H__
