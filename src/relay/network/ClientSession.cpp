// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "relay/Defines.h"
#include "common/aprs/Passcode.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "network/ClientSession.h"
#include "network/Router.h"
#include "relay/ActivityLog.h"

using namespace network;
using namespace relay;
using namespace aprs;
using namespace aprs::defines;

#include <ctime>

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Helper to map a codec error onto the session error taxonomy. */

static SessionError::ENUM toSessionError(PacketError::ENUM err)
{
    switch (err) {
    case PacketError::INVALID_CALLSIGN:
        return SessionError::INVALID_CALLSIGN;
    case PacketError::PATH_TOO_LONG:
        return SessionError::PATH_TOO_LONG;
    default:
        return SessionError::MALFORMED_PACKET;
    }
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the ClientSession class. */

ClientSession::ClientSession(uint32_t id, tcp::Socket* socket, Router* router, const ClientSessionConfig& config, uint32_t maxQueueLines) :
    Session(id, SessionKind::CLIENT, socket, router, maxQueueLines),
    m_callsign(),
    m_software(),
    m_config(config),
    m_receiveOnly(false),
    m_filter(),
    m_filterMutex(),
    m_loginTimer(1000U, config.loginTimeout),
    m_heartbeatTimer(1000U, config.heartbeat),
    m_idleTimer(1000U, config.idleTimeout),
    m_badPackets(0U),
    m_uptimeMs(0U)
{
    for (std::string& call : m_config.allowCallsigns)
        call = Utils::toUpper(call);
    for (std::string& call : m_config.denyCallsigns)
        call = Utils::toUpper(call);
}

/* Sends the server banner and starts waiting for the login line. */

bool ClientSession::open()
{
    write("# " __EXE_NAME__ " " __SW_VER__);

    setState(SessionState::AWAITING_LOGIN);
    m_loginTimer.start();

    LogInfoEx(LOG_CLIENT, "client connection %u from %s", id(), address().c_str());
    return true;
}

/* Processes a received line. */

void ClientSession::processLine(const std::string& line)
{
    if (isClosing())
        return;
    if (Utils::trim(line).empty())
        return;

    m_idleTimer.start();

    switch (state()) {
    case SessionState::AWAITING_LOGIN:
        processLogin(line);
        break;
    case SessionState::AUTHENTICATED:
        if (line[0U] == '#')
            processComment(line);
        else
            processPacket(line);
        break;
    default:
        break;
    }
}

/* Updates the session timers. */

void ClientSession::clock(uint32_t ms)
{
    if (isClosing())
        return;

    m_uptimeMs += ms;

    if (state() == SessionState::AWAITING_LOGIN) {
        m_loginTimer.clock(ms);
        if (m_loginTimer.isRunning() && m_loginTimer.hasExpired()) {
            m_loginTimer.stop();

            write("# login timeout");
            setState(SessionState::REJECTED);

            LogWarning(LOG_CLIENT, "client connection %u from %s, no login within %us", id(), address().c_str(), m_config.loginTimeout);
            ActivityLog("client %s login timeout", address().c_str());
            close(SessionError::LOGIN_TIMEOUT);
        }

        return;
    }

    if (state() != SessionState::AUTHENTICATED)
        return;

    m_heartbeatTimer.clock(ms);
    if (m_heartbeatTimer.isRunning() && m_heartbeatTimer.hasExpired()) {
        time_t now;
        ::time(&now);
        struct tm tm;
        ::gmtime_r(&now, &tm);

        char timeBuf[64U];
        ::strftime(timeBuf, sizeof(timeBuf), "%d %b %Y %H:%M:%S GMT", &tm);

        write(std::string("# " __EXE_NAME__ " " __SW_VER__ " ") + timeBuf + " " + m_config.serverId);
        m_heartbeatTimer.start();
    }

    m_idleTimer.clock(ms);
    if (m_idleTimer.isRunning() && m_idleTimer.hasExpired()) {
        m_idleTimer.stop();

        LogInfoEx(LOG_CLIENT, "%s, no traffic for %us, disconnecting", name().c_str(), m_config.idleTimeout);
        close(SessionError::CLIENT_IDLE);
    }
}

/* Gets a printable name for the session. */

std::string ClientSession::name() const
{
    if (m_callsign.isValid())
        return m_callsign.encode() + " (" + address() + ")";

    return "client " + std::to_string(id()) + " (" + address() + ")";
}

/* Checks whether a packet should be delivered to this client. */

bool ClientSession::filterMatches(const aprs::Packet& pkt) const
{
    std::string addressee = pkt.messageAddressee();
    if (!addressee.empty() && m_callsign.isValid() && addressee == m_callsign.encode())
        return true;

    std::lock_guard<std::mutex> lock(m_filterMutex);
    return m_filter.matches(pkt);
}

/* Gets the active filter expression. */

std::string ClientSession::filterExpression() const
{
    std::lock_guard<std::mutex> lock(m_filterMutex);
    return m_filter.expression();
}

// ---------------------------------------------------------------------------
//  Protected Class Members
// ---------------------------------------------------------------------------

/* Logs the client logout. */

void ClientSession::closed()
{
    if (state() == SessionState::REJECTED)
        return;

    if (m_callsign.isValid()) {
        LogInfoEx(LOG_CLIENT, "%s, logged out, %s, rx = %u, tx = %u", name().c_str(), sessionErrorToString(closeReason()),
            rxPackets(), txLines());
        ActivityLog("client %s logout from %s, %s", m_callsign.encode().c_str(), address().c_str(), sessionErrorToString(closeReason()));
    }
    else {
        LogInfoEx(LOG_CLIENT, "client connection %u from %s closed, %s", id(), address().c_str(), sessionErrorToString(closeReason()));
    }
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Helper to process the login line. */

void ClientSession::processLogin(const std::string& line)
{
    // comments ahead of the login are ignored
    if (line[0U] == '#')
        return;

    std::vector<std::string> tokens = Utils::tokenize(line);
    if (tokens.size() < 4U || !Utils::iequals(tokens[0U], "user") || !Utils::iequals(tokens[2U], "pass")) {
        rejectLogin("# invalid login", "malformed login line");
        return;
    }

    StationId callsign;
    if (!StationId::decode(tokens[1U], callsign)) {
        rejectLogin("# invalid login", "bad callsign " + tokens[1U]);
        return;
    }

    int32_t passcode = 0;
    if (!Utils::parseInt(tokens[3U], passcode)) {
        rejectLogin("# invalid login", "bad passcode field " + tokens[3U]);
        return;
    }

    std::string software;
    std::string filterExpr;
    for (size_t i = 4U; i < tokens.size(); i++) {
        if (Utils::iequals(tokens[i], "vers")) {
            if (i + 1U < tokens.size())
                software = tokens[++i];
            if (i + 1U < tokens.size() && !Utils::iequals(tokens[i + 1U], "filter"))
                software += " " + tokens[++i];
        }
        else if (Utils::iequals(tokens[i], "filter")) {
            for (size_t j = i + 1U; j < tokens.size(); j++) {
                if (!filterExpr.empty())
                    filterExpr += " ";
                filterExpr += tokens[j];
            }
            break;
        }
    }

    if (!isLoginAllowed(callsign)) {
        rejectLogin("# login denied for " + callsign.encode(), "callsign " + callsign.encode() + " not permitted");
        return;
    }

    if (!Passcode::verify(callsign.encode(), passcode)) {
        rejectLogin("# invalid passcode for " + callsign.encode(), "bad passcode for " + callsign.encode());
        return;
    }

    m_callsign = callsign;
    m_software = software;
    m_receiveOnly = Passcode::isReceiveOnly(passcode);

    std::string filterError;
    bool filterOk = filterExpr.empty() || setFilter(filterExpr, filterError);

    write("# logresp " + callsign.encode() + (m_receiveOnly ? " unverified" : " verified") + ", server " + m_config.serverId);
    if (!filterOk)
        write("# invalid filter: " + filterError);

    setState(SessionState::AUTHENTICATED);
    m_loginTimer.stop();
    m_heartbeatTimer.start();
    m_idleTimer.start();

    if (m_router != nullptr)
        m_router->registerSession(this);

    LogInfoEx(LOG_CLIENT, "%s, logged in, %s, software = %s, filter = %s", name().c_str(),
        m_receiveOnly ? "receive-only" : "verified", m_software.empty() ? "unknown" : m_software.c_str(),
        filterExpression().empty() ? "none" : filterExpression().c_str());
    ActivityLog("client %s login from %s, %s", callsign.encode().c_str(), address().c_str(), m_receiveOnly ? "receive-only" : "verified");
}

/* Helper to process a comment line from an authenticated client. */

void ClientSession::processComment(const std::string& line)
{
    std::string text = Utils::trim(line.substr(1U));
    std::vector<std::string> tokens = Utils::tokenize(text);
    if (tokens.empty())
        return;

    if (Utils::iequals(tokens[0U], "filter")) {
        std::string expr = Utils::trim(text.substr(tokens[0U].length()));

        std::string error;
        if (!setFilter(expr, error)) {
            write("# invalid filter: " + error);
            return;
        }

        std::string active = filterExpression();
        if (active.empty())
            write("# filter cleared");
        else
            write("# filter " + active + " active");
        return;
    }

    if (Utils::iequals(tokens[0U], "stats")) {
        write("# stats: uptime=" + std::to_string(m_uptimeMs / 1000U) + "s received=" + std::to_string(rxPackets()) +
            " dropped=" + std::to_string(dropped()) + " duplicated=" + std::to_string(duplicates()));
        return;
    }
}

/* Helper to decode and dispatch a packet line. */

void ClientSession::processPacket(const std::string& line)
{
    Packet pkt;
    PacketError::ENUM err = pkt.decode(line, m_config.maxPath);
    if (err != PacketError::NONE) {
        m_dropped++;
        m_badPackets++;

        LogWarning(LOG_CLIENT, "%s, dropped packet, %s", name().c_str(), packetErrorToString(err));
        if (m_badPackets >= m_config.maxBadPackets) {
            LogError(LOG_CLIENT, "%s, %u consecutive bad packets, disconnecting", name().c_str(), m_badPackets);
            close(toSessionError(err));
        }

        return;
    }

    m_badPackets = 0U;
    dispatchPacket(pkt);
}

/* Helper to check the login allow and deny lists. */

bool ClientSession::isLoginAllowed(const aprs::StationId& callsign) const
{
    const std::string& call = callsign.callsign();
    for (const std::string& deny : m_config.denyCallsigns) {
        if (deny == call)
            return false;
    }

    if (m_config.allowCallsigns.empty())
        return true;

    for (const std::string& allow : m_config.allowCallsigns) {
        if (allow == call)
            return true;
    }

    return false;
}

/* Helper to reject the login and close the session. */

void ClientSession::rejectLogin(const std::string& reply, const std::string& reason)
{
    write(reply);
    setState(SessionState::REJECTED);
    m_loginTimer.stop();

    LogWarning(LOG_CLIENT, "client connection %u from %s, login rejected, %s", id(), address().c_str(), reason.c_str());
    ActivityLog("client %s login rejected, %s", address().c_str(), reason.c_str());
    close(SessionError::AUTH_FAILED);
}

/* Helper to replace the active filter. */

bool ClientSession::setFilter(const std::string& expr, std::string& error)
{
    Filter filter;
    if (!Filter::parse(expr, filter, error))
        return false;

    std::lock_guard<std::mutex> lock(m_filterMutex);
    m_filter = filter;
    return true;
}
