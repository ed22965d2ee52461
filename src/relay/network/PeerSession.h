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
 * @file PeerSession.h
 * @ingroup relay
 * @file PeerSession.cpp
 * @ingroup relay
 */
#if !defined(__PEER_SESSION_H__)
#define __PEER_SESSION_H__

#include "relay/Defines.h"
#include "common/aprs/Packet.h"
#include "common/Timer.h"
#include "network/Session.h"

#include <atomic>
#include <string>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class RELAY_SW_API PeerManager;

    /** @brief Peer Session Role */
    namespace PeerRole {
        /** @brief Peer Session Role */
        enum ENUM : uint8_t {
            INITIATOR = 0U,             //!< Outbound S2S Link
            ACCEPTOR = 1U,              //!< Inbound S2S Link
            UPLINK = 2U,                //!< Outbound Client-style Uplink
        };
    }

    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Configured remote server.
     * @ingroup relay
     */
    struct PeerDescriptor {
        std::string host;               //!< Hostname or IP address
        uint16_t port;                  //!< Port
        int32_t passcode;               //!< Shared S2S passcode (uplink: login passcode)
        std::string peerName;           //!< Expected server identity (uplink: login callsign)
        bool receiveOnly;               //!< Never send packets to this peer
        bool connect;                   //!< Dial this peer (otherwise only accept it)
        bool uplink;                    //!< Client-style uplink rather than an S2S peer
        bool enabled;                   //!< Descriptor is enabled

        /**
         * @brief Initializes a new instance of the PeerDescriptor struct.
         */
        PeerDescriptor() :
            host(),
            port(relay::DEFAULT_S2S_PORT),
            passcode(0),
            peerName(),
            receiveOnly(false),
            connect(true),
            uplink(false),
            enabled(true)
        {
            /* stub */
        }
    };

    /**
     * @brief Peer session configuration.
     * @ingroup relay
     */
    struct PeerSessionConfig {
        std::string serverId;           //!< This server's identity
        uint16_t s2sPort;               //!< Advertised S2S listening port
        uint32_t heartbeat;             //!< Keepalive interval (seconds)
        uint32_t idleTimeout;           //!< Idle timeout (seconds)
        uint32_t handshakeTimeout;      //!< Handshake timeout (seconds)
        uint32_t connectTimeout;        //!< Connect timeout (seconds)
        uint32_t maxPath;               //!< Maximum path elements

        /**
         * @brief Initializes a new instance of the PeerSessionConfig struct.
         */
        PeerSessionConfig() :
            serverId(),
            s2sPort(relay::DEFAULT_S2S_PORT),
            heartbeat(relay::DEFAULT_PEER_HEARTBEAT),
            idleTimeout(relay::DEFAULT_PEER_IDLE_TIMEOUT),
            handshakeTimeout(relay::DEFAULT_HANDSHAKE_TIMEOUT),
            connectTimeout(relay::DEFAULT_CONNECT_TIMEOUT),
            maxPath(aprs::defines::DEFAULT_MAX_PATH)
        {
            /* stub */
        }
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents one server-to-server link, or the client-style uplink.
     * @ingroup relay
     *
     * Link state: CONNECTING -> HANDSHAKING -> CONNECTED, and DISCONNECTED once the
     * session thread exits. Retry scheduling belongs to the PeerManager.
     */
    class RELAY_SW_API PeerSession : public Session {
    public:
        /**
         * @brief Initializes a new instance of the PeerSession class.
         * @param id Unique connection identity.
         * @param role Session role.
         * @param socket Connection socket (owned by the session; unconnected for outbound roles; may be nullptr).
         * @param router Router instance.
         * @param manager Peer manager instance (may be nullptr).
         * @param config Peer session configuration.
         * @param descriptor Remote server descriptor (outbound roles).
         * @param peerIndex Descriptor index (-1 if not yet known).
         * @param maxQueueLines Outbound queue bound.
         */
        PeerSession(uint32_t id, PeerRole::ENUM role, tcp::Socket* socket, Router* router, PeerManager* manager,
            const PeerSessionConfig& config, const PeerDescriptor& descriptor, int32_t peerIndex, uint32_t maxQueueLines);

        /**
         * @brief Connects (outbound roles) and starts the login exchange.
         * @returns bool True, if the session should continue, otherwise false.
         */
        bool open() override;
        /**
         * @brief Processes a received line.
         * @param line Line text.
         */
        void processLine(const std::string& line) override;
        /**
         * @brief Updates the session timers.
         * @param ms Number of milliseconds.
         */
        void clock(uint32_t ms) override;

        /**
         * @brief Gets a printable name for the session.
         * @returns std::string Session name.
         */
        std::string name() const override;

        /**
         * @brief Flag indicating whether packets must not be sent to this peer.
         * @returns bool True, if the peer is receive-only, otherwise false.
         */
        bool isReceiveOnly() const { return m_descriptor.receiveOnly; }
        /**
         * @brief Gets the remote server identity (valid once the link is established).
         * @returns std::string Remote server identity.
         */
        std::string remoteId() const { return m_remoteId; }
        /**
         * @brief Gets the link state.
         * @returns relay::PeerState::ENUM Link state.
         */
        relay::PeerState::ENUM linkState() const { return m_linkState; }
        /**
         * @brief Gets the time the link has been established, in milliseconds.
         * @returns uint64_t Connected time.
         */
        uint64_t connectedMs() const { return m_connectedMs; }

        /**
         * @brief Builds the S2S login line.
         * @param serverId Server identity.
         * @param passcode Shared passcode.
         * @param s2sPort Advertised S2S port.
         * @returns std::string Login line.
         */
        static std::string s2sLoginLine(const std::string& serverId, int32_t passcode, uint16_t s2sPort);

    public:
        /**
         * @brief Session Role.
         */
        DECLARE_RO_PROPERTY_PLAIN(PeerRole::ENUM, role);
        /**
         * @brief Descriptor Index.
         */
        DECLARE_RO_PROPERTY_PLAIN(int32_t, peerIndex);

    protected:
        /**
         * @brief Logs the link going down.
         */
        void closed() override;

    private:
        PeerManager* m_manager;
        PeerSessionConfig m_config;
        PeerDescriptor m_descriptor;

        std::string m_remoteId;
        std::atomic<relay::PeerState::ENUM> m_linkState;
        std::atomic<uint64_t> m_connectedMs;
        bool m_linkUp;

        Timer m_handshakeTimer;
        Timer m_heartbeatTimer;
        Timer m_idleTimer;

        /**
         * @brief Helper to process a line received during the login exchange.
         * @param line Line text.
         */
        void processHandshake(const std::string& line);
        /**
         * @brief Helper to process the S2S login line of an inbound peer.
         * @param line Line text.
         */
        void processInboundLogin(const std::string& line);
        /**
         * @brief Helper to process the S2S acknowledgement from an outbound peer.
         * @param line Line text.
         */
        void processOutboundAck(const std::string& line);
        /**
         * @brief Helper to process the login response from the upstream server.
         * @param line Line text.
         */
        void processUplinkResponse(const std::string& line);
        /**
         * @brief Helper to decode and dispatch a packet line.
         * @param line Line text.
         */
        void processPacket(const std::string& line);

        /**
         * @brief Helper to complete the link and register it with the Router.
         */
        void linkUp();
        /**
         * @brief Helper to fail the login exchange.
         * @param reason Reason written to the log.
         */
        void handshakeFailed(const std::string& reason);
    };
} // namespace network

#endif // __PEER_SESSION_H__
