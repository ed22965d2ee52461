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
 * @file ClientSession.h
 * @ingroup relay
 * @file ClientSession.cpp
 * @ingroup relay
 */
#if !defined(__CLIENT_SESSION_H__)
#define __CLIENT_SESSION_H__

#include "relay/Defines.h"
#include "common/aprs/Filter.h"
#include "common/aprs/Packet.h"
#include "common/aprs/StationId.h"
#include "common/Timer.h"
#include "network/Session.h"

#include <mutex>
#include <string>
#include <vector>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Client session configuration.
     * @ingroup relay
     */
    struct ClientSessionConfig {
        std::string serverId;                       //!< This server's identity
        uint32_t loginTimeout;                      //!< Login timeout (seconds)
        uint32_t heartbeat;                         //!< Heartbeat comment interval (seconds; 0 disables)
        uint32_t idleTimeout;                       //!< Idle timeout (seconds; 0 disables)
        uint32_t maxBadPackets;                     //!< Consecutive codec errors before disconnect
        uint32_t maxPath;                           //!< Maximum path elements
        std::vector<std::string> allowCallsigns;    //!< If non-empty, only these base callsigns may log in
        std::vector<std::string> denyCallsigns;     //!< Base callsigns refused at login

        /**
         * @brief Initializes a new instance of the ClientSessionConfig struct.
         */
        ClientSessionConfig() :
            serverId(),
            loginTimeout(relay::DEFAULT_LOGIN_TIMEOUT),
            heartbeat(relay::DEFAULT_CLIENT_HEARTBEAT),
            idleTimeout(relay::DEFAULT_CLIENT_IDLE_TIMEOUT),
            maxBadPackets(relay::DEFAULT_MAX_BAD_PACKETS),
            maxPath(aprs::defines::DEFAULT_MAX_PATH),
            allowCallsigns(),
            denyCallsigns()
        {
            /* stub */
        }
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents one inbound APRS-IS client connection.
     * @ingroup relay
     *
     * Login state machine: CONNECTED -> AWAITING_LOGIN -> (AUTHENTICATED | REJECTED).
     */
    class RELAY_SW_API ClientSession : public Session {
    public:
        /**
         * @brief Initializes a new instance of the ClientSession class.
         * @param id Unique connection identity.
         * @param socket Connection socket (owned by the session; may be nullptr).
         * @param router Router instance.
         * @param config Client session configuration.
         * @param maxQueueLines Outbound queue bound.
         */
        ClientSession(uint32_t id, tcp::Socket* socket, Router* router, const ClientSessionConfig& config, uint32_t maxQueueLines);

        /**
         * @brief Sends the server banner and starts waiting for the login line.
         * @returns bool True.
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
         * @brief Checks whether a packet should be delivered to this client; messages
         *  addressed to the client's own callsign bypass the filter.
         * @param pkt Packet.
         * @returns bool True, if the packet should be delivered, otherwise false.
         */
        bool filterMatches(const aprs::Packet& pkt) const;
        /**
         * @brief Gets the active filter expression.
         * @returns std::string Filter expression.
         */
        std::string filterExpression() const;

        /**
         * @brief Flag indicating whether the client logged in with the receive-only passcode.
         * @returns bool True, if the client is receive-only, otherwise false.
         */
        bool isReceiveOnly() const { return m_receiveOnly; }

    public:
        /**
         * @brief Login Callsign.
         */
        DECLARE_RO_PROPERTY_PLAIN(aprs::StationId, callsign);
        /**
         * @brief Client Software Name and Version.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, software);

    protected:
        /**
         * @brief Logs the client logout.
         */
        void closed() override;

    private:
        ClientSessionConfig m_config;
        bool m_receiveOnly;

        aprs::Filter m_filter;
        mutable std::mutex m_filterMutex;

        Timer m_loginTimer;
        Timer m_heartbeatTimer;
        Timer m_idleTimer;

        uint32_t m_badPackets;
        uint64_t m_uptimeMs;

        /**
         * @brief Helper to process the login line.
         * @param line Line text.
         */
        void processLogin(const std::string& line);
        /**
         * @brief Helper to process a comment line from an authenticated client.
         * @param line Line text.
         */
        void processComment(const std::string& line);
        /**
         * @brief Helper to decode and dispatch a packet line.
         * @param line Line text.
         */
        void processPacket(const std::string& line);

        /**
         * @brief Helper to check the login allow and deny lists.
         * @param callsign Login callsign.
         * @returns bool True, if the callsign may log in, otherwise false.
         */
        bool isLoginAllowed(const aprs::StationId& callsign) const;
        /**
         * @brief Helper to reject the login and close the session.
         * @param reply Diagnostic line sent to the client.
         * @param reason Reason written to the log.
         */
        void rejectLogin(const std::string& reply, const std::string& reason);
        /**
         * @brief Helper to replace the active filter.
         * @param expr Filter expression.
         * @param error Reason the expression was rejected.
         * @returns bool True, if the filter was replaced, otherwise false.
         */
        bool setFilter(const std::string& expr, std::string& error);
    };
} // namespace network

#endif // __CLIENT_SESSION_H__
