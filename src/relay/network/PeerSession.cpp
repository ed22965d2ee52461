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
#include "common/Log.h"
#include "common/Utils.h"
#include "network/PeerSession.h"
#include "network/PeerManager.h"
#include "network/Router.h"
#include "relay/ActivityLog.h"

using namespace network;
using namespace relay;
using namespace aprs;
using namespace aprs::defines;

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Helper to parse the identity and passcode out of an S2S login line. */

static bool parseS2SLogin(const std::string& line, std::string& serverId, int32_t& passcode)
{
    if (line.empty() || line[0U] != '#')
        return false;

    std::vector<std::string> tokens = Utils::tokenize(line.substr(1U));
    for (size_t i = 0U; i < tokens.size(); i++) {
        if (!Utils::iequals(tokens[i], "s2s"))
            continue;
        if (i + 2U >= tokens.size())
            return false;

        if (!isValidServerId(tokens[i + 1U]))
            return false;
        if (!Utils::parseInt(tokens[i + 2U], passcode))
            return false;

        serverId = Utils::toUpper(tokens[i + 1U]);
        return true;
    }

    return false;
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the PeerSession class. */

PeerSession::PeerSession(uint32_t id, PeerRole::ENUM role, tcp::Socket* socket, Router* router, PeerManager* manager,
    const PeerSessionConfig& config, const PeerDescriptor& descriptor, int32_t peerIndex, uint32_t maxQueueLines) :
    Session(id, (role == PeerRole::UPLINK) ? SessionKind::UPLINK : SessionKind::PEER, socket, router, maxQueueLines),
    m_role(role),
    m_peerIndex(peerIndex),
    m_manager(manager),
    m_config(config),
    m_descriptor(descriptor),
    m_remoteId(),
    m_linkState(PeerState::DISCONNECTED),
    m_connectedMs(0U),
    m_linkUp(false),
    m_handshakeTimer(1000U, config.handshakeTimeout),
    m_heartbeatTimer(1000U, config.heartbeat),
    m_idleTimer(1000U, config.idleTimeout)
{
    m_config.serverId = Utils::toUpper(m_config.serverId);

    if (m_role != PeerRole::ACCEPTOR && !m_descriptor.host.empty())
        setAddress(m_descriptor.host + ":" + std::to_string(m_descriptor.port));
}

/* Connects (outbound roles) and starts the login exchange. */

bool PeerSession::open()
{
    if (m_role == PeerRole::ACCEPTOR) {
        m_linkState = PeerState::HANDSHAKING;
        setState(SessionState::AWAITING_LOGIN);
        m_handshakeTimer.start();

        LogInfoEx(LOG_PEER, "inbound S2S connection %u from %s", id(), address().c_str());
        return true;
    }

    m_linkState = PeerState::CONNECTING;
    if (m_socket != nullptr && !m_socket->isOpen()) {
        LogInfoEx(LOG_PEER, "%s, connecting", name().c_str());
        if (!m_socket->connect(m_descriptor.host, m_descriptor.port, m_config.connectTimeout * 1000U)) {
            LogError(LOG_PEER, "%s, failed to connect", name().c_str());
            return false;
        }
    }

    m_linkState = PeerState::HANDSHAKING;
    setState(SessionState::AWAITING_LOGIN);
    m_handshakeTimer.start();

    if (m_role == PeerRole::UPLINK) {
        write("user " + Utils::toUpper(m_descriptor.peerName) + " pass " + std::to_string(m_descriptor.passcode) +
            " vers " __EXE_NAME__ " " __SW_VER__);
    }
    else {
        write(s2sLoginLine(m_config.serverId, m_descriptor.passcode, m_config.s2sPort));
    }

    return true;
}

/* Processes a received line. */

void PeerSession::processLine(const std::string& line)
{
    if (isClosing())
        return;

    m_idleTimer.start();

    switch (state()) {
    case SessionState::AWAITING_LOGIN:
        processHandshake(line);
        break;
    case SessionState::AUTHENTICATED:
        // keepalives and server comments only count as activity
        if (line[0U] != '#')
            processPacket(line);
        break;
    default:
        break;
    }
}

/* Updates the session timers. */

void PeerSession::clock(uint32_t ms)
{
    if (isClosing())
        return;

    if (state() == SessionState::AWAITING_LOGIN) {
        m_handshakeTimer.clock(ms);
        if (m_handshakeTimer.isRunning() && m_handshakeTimer.hasExpired()) {
            m_handshakeTimer.stop();

            LogWarning(LOG_PEER, "%s, no login exchange within %us", name().c_str(), m_config.handshakeTimeout);
            close(SessionError::HANDSHAKE_TIMEOUT);
        }

        return;
    }

    if (state() != SessionState::AUTHENTICATED)
        return;

    m_connectedMs += ms;

    m_heartbeatTimer.clock(ms);
    if (m_heartbeatTimer.isRunning() && m_heartbeatTimer.hasExpired()) {
        write("# keepalive " + m_config.serverId);
        m_heartbeatTimer.start();
    }

    m_idleTimer.clock(ms);
    if (m_idleTimer.isRunning() && m_idleTimer.hasExpired()) {
        m_idleTimer.stop();

        LogWarning(LOG_PEER, "%s, no traffic for %us", name().c_str(), m_config.idleTimeout);
        close(SessionError::PEER_IDLE);
    }
}

/* Gets a printable name for the session. */

std::string PeerSession::name() const
{
    std::string label;
    switch (m_role) {
    case PeerRole::UPLINK:
        label = "uplink";
        break;
    case PeerRole::ACCEPTOR:
        label = "inbound peer";
        break;
    default:
        label = "peer";
        break;
    }

    if (!m_descriptor.peerName.empty())
        return label + " " + m_descriptor.peerName + " (" + address() + ")";

    return label + " " + std::to_string(id()) + " (" + address() + ")";
}

/* Builds the S2S login line. */

std::string PeerSession::s2sLoginLine(const std::string& serverId, int32_t passcode, uint16_t s2sPort)
{
    return "# " __EXE_NAME__ " " __SW_VER__ " s2s " + serverId + " " + std::to_string(passcode) + " " + std::to_string(s2sPort);
}

// ---------------------------------------------------------------------------
//  Protected Class Members
// ---------------------------------------------------------------------------

/* Logs the link going down. */

void PeerSession::closed()
{
    m_linkState = PeerState::DISCONNECTED;

    if (m_linkUp) {
        LogInfoEx(LOG_PEER, "%s, link down, %s, rx = %u, tx = %u", name().c_str(), sessionErrorToString(closeReason()),
            rxPackets(), txLines());
        ActivityLog("%s %s link down, %s", (m_role == PeerRole::UPLINK) ? "uplink" : "peer",
            m_descriptor.peerName.c_str(), sessionErrorToString(closeReason()));
    }
    else {
        LogWarning(LOG_PEER, "%s, link not established, %s", name().c_str(), sessionErrorToString(closeReason()));
    }
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Helper to process a line received during the login exchange. */

void PeerSession::processHandshake(const std::string& line)
{
    switch (m_role) {
    case PeerRole::ACCEPTOR:
        processInboundLogin(line);
        break;
    case PeerRole::INITIATOR:
        processOutboundAck(line);
        break;
    case PeerRole::UPLINK:
        processUplinkResponse(line);
        break;
    default:
        break;
    }
}

/* Helper to process the S2S login line of an inbound peer. */

void PeerSession::processInboundLogin(const std::string& line)
{
    std::string serverId;
    int32_t passcode = 0;
    if (!parseS2SLogin(line, serverId, passcode)) {
        write("# s2s login rejected: malformed login");
        handshakeFailed("malformed login line");
        return;
    }

    std::string reason = "unknown peer";
    int32_t index = -1;
    PeerDescriptor descriptor;
    if (m_manager == nullptr || !m_manager->authenticateInbound(this, serverId, passcode, index, descriptor, reason)) {
        write("# s2s login rejected: " + reason);
        handshakeFailed(serverId + ", " + reason);
        return;
    }

    m_peerIndex = index;
    m_descriptor = descriptor;
    m_remoteId = serverId;

    write(s2sLoginLine(m_config.serverId, m_descriptor.passcode, m_config.s2sPort));
    linkUp();
}

/* Helper to process the S2S acknowledgement from an outbound peer. */

void PeerSession::processOutboundAck(const std::string& line)
{
    if (line[0U] != '#')
        return;

    if (Utils::istartsWith(line, "# s2s login rejected")) {
        // the remote kept the link it initiated to us
        if (line.find("already connected") != std::string::npos) {
            setState(SessionState::REJECTED);
            m_handshakeTimer.stop();

            LogInfoEx(LOG_PEER, "%s, remote already has a link to this server, closing", name().c_str());
            close(SessionError::DUPLICATE_LINK);
            return;
        }

        handshakeFailed("remote rejected login, " + Utils::trim(line.substr(1U)));
        return;
    }

    std::string serverId;
    int32_t passcode = 0;
    if (!parseS2SLogin(line, serverId, passcode))
        return; // banner or other server comment

    if (passcode != m_descriptor.passcode) {
        handshakeFailed("passcode mismatch in acknowledgement");
        return;
    }

    if (!m_descriptor.peerName.empty() && !Utils::iequals(serverId, m_descriptor.peerName)) {
        handshakeFailed("remote identifies as " + serverId + ", expected " + Utils::toUpper(m_descriptor.peerName));
        return;
    }

    m_remoteId = serverId;
    linkUp();
}

/* Helper to process the login response from the upstream server. */

void PeerSession::processUplinkResponse(const std::string& line)
{
    if (line[0U] != '#')
        return;

    std::vector<std::string> tokens = Utils::tokenize(line.substr(1U));
    if (tokens.empty() || !Utils::iequals(tokens[0U], "logresp"))
        return; // server banner

    bool verified = true;
    for (size_t i = 1U; i < tokens.size(); i++) {
        std::string token = tokens[i];
        if (!token.empty() && token.back() == ',')
            token.pop_back();

        if (Utils::iequals(token, "unverified"))
            verified = false;
        if (Utils::iequals(token, "server") && i + 1U < tokens.size())
            m_remoteId = Utils::toUpper(tokens[i + 1U]);
    }

    if (!verified) {
        LogWarning(LOG_PEER, "%s, upstream server reports login %s unverified, packets will not be accepted upstream",
            name().c_str(), m_descriptor.peerName.c_str());
    }

    linkUp();
}

/* Helper to decode and dispatch a packet line. */

void PeerSession::processPacket(const std::string& line)
{
    Packet pkt;
    PacketError::ENUM err = pkt.decode(line, m_config.maxPath);
    if (err != PacketError::NONE) {
        m_dropped++;
        LogWarning(LOG_PEER, "%s, dropped packet, %s", name().c_str(), packetErrorToString(err));
        return;
    }

    // normalize provenance for peers that do not mark what they relay
    if (m_role != PeerRole::UPLINK && !m_remoteId.empty() && !pkt.hasRelayMarker(m_remoteId)) {
        if (!pkt.addRelayMarker(m_remoteId, m_config.maxPath)) {
            LogDebugEx(LOG_PEER, "PeerSession::processPacket()", "%s, path full, cannot mark %s", name().c_str(), line.c_str());
        }
    }

    dispatchPacket(pkt);
}

/* Helper to complete the link and register it with the Router. */

void PeerSession::linkUp()
{
    if (m_manager != nullptr && !m_manager->linkEstablished(this)) {
        LogWarning(LOG_PEER, "%s, another link to %s is already up, closing", name().c_str(), m_remoteId.c_str());
        close(SessionError::DUPLICATE_LINK);
        return;
    }

    setState(SessionState::AUTHENTICATED);
    m_linkState = PeerState::CONNECTED;
    m_linkUp = true;
    m_connectedMs = 0U;

    m_handshakeTimer.stop();
    m_heartbeatTimer.start();
    m_idleTimer.start();

    if (m_router != nullptr)
        m_router->registerSession(this);

    LogInfoEx(LOG_PEER, "%s, link established, remote = %s%s", name().c_str(), m_remoteId.empty() ? "unknown" : m_remoteId.c_str(),
        isReceiveOnly() ? ", receive-only" : "");
    ActivityLog("%s %s link up from %s", (m_role == PeerRole::UPLINK) ? "uplink" : "peer",
        m_descriptor.peerName.empty() ? m_remoteId.c_str() : m_descriptor.peerName.c_str(), address().c_str());
}

/* Helper to fail the login exchange. */

void PeerSession::handshakeFailed(const std::string& reason)
{
    setState(SessionState::REJECTED);
    m_handshakeTimer.stop();

    LogWarning(LOG_PEER, "%s, login exchange failed, %s", name().c_str(), reason.c_str());
    ActivityLog("peer %s login rejected, %s", address().c_str(), reason.c_str());
    close(SessionError::AUTH_FAILED);
}
