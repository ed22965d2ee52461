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
#include "network/PeerManager.h"
#include "network/Router.h"

using namespace network;
using namespace relay;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the PeerManager class. */

PeerManager::PeerManager(Router* router, const PeerManagerConfig& config, const std::vector<PeerDescriptor>& descriptors) :
    m_router(router),
    m_config(config),
    m_entries(),
    m_sessions(),
    m_now(0U),
    m_nextId(1U),
    m_running(true),
    m_mutex()
{
    for (const PeerDescriptor& desc : descriptors) {
        m_entries.push_back(PeerEntry(desc, config.backoffMin * 1000U, config.backoffMax * 1000U, config.backoffStable * 1000U));
    }
}

/* Finalizes a instance of the PeerManager class. */

PeerManager::~PeerManager()
{
    close();
}

/* Updates manager time, starts due outbound sessions and reaps finished sessions. */

void PeerManager::clock(uint32_t ms)
{
    std::vector<PeerSession*> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += ms;

        if (m_running) {
            for (uint32_t i = 0U; i < m_entries.size(); i++) {
                PeerEntry& entry = m_entries[i];
                if (!entry.descriptor.enabled || !entry.descriptor.connect)
                    continue;
                if (entry.link != nullptr || entry.outbound != nullptr)
                    continue;

                if (entry.state == PeerState::DISCONNECTED ||
                    (entry.state == PeerState::BACKOFF && m_now >= entry.backoffUntil)) {
                    dial(i);
                }
            }
        }

        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            if ((*it)->isFinished()) {
                finished.push_back(*it);
                it = m_sessions.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    for (PeerSession* session : finished) {
        session->wait();
        sessionEnded(session);
        delete session;
    }
}

/* Creates an acceptor session for an inbound S2S connection. */

void PeerManager::acceptInbound(tcp::Socket* socket)
{
    if (socket == nullptr)
        return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        delete socket;
        return;
    }

    PeerSession* session = new PeerSession(m_nextId++, PeerRole::ACCEPTOR, socket, m_router, this, m_config.session,
        PeerDescriptor(), -1, m_config.maxQueueLines);
    if (!session->run()) {
        LogError(LOG_PEER, "failed to start inbound S2S session for %s", session->address().c_str());
        delete session;
        return;
    }

    session->setName("s2s:in");
    m_sessions.push_back(session);
}

/* Admits an inbound S2S login. */

bool PeerManager::authenticateInbound(PeerSession* session, const std::string& peerName, int32_t passcode, int32_t& index,
    PeerDescriptor& descriptor, std::string& reason)
{
    std::string address = session->address();

    int32_t found = -1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (uint32_t i = 0U; i < m_entries.size() && found < 0; i++) {
            const PeerDescriptor& desc = m_entries[i].descriptor;
            if (desc.enabled && !desc.uplink && !desc.peerName.empty() && Utils::iequals(desc.peerName, peerName))
                found = (int32_t)i;
        }

        for (uint32_t i = 0U; i < m_entries.size() && found < 0; i++) {
            const PeerDescriptor& desc = m_entries[i].descriptor;
            if (desc.enabled && !desc.uplink && desc.host == address)
                found = (int32_t)i;
        }
    }

    // name resolution may block; it runs outside the manager lock
    if (found < 0)
        found = findByAddress(address);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (found < 0) {
        reason = "unknown peer";
    }
    else if (m_entries[found].descriptor.passcode != passcode) {
        reason = "bad passcode";
    }
    else if (m_entries[found].link != nullptr &&
        (m_entries[found].link->role() == PeerRole::ACCEPTOR || !isPreferredLink(PeerRole::ACCEPTOR, peerName))) {
        reason = "already connected";
    }
    else {
        index = found;
        descriptor = m_entries[found].descriptor;
        return true;
    }

    LogWarning(LOG_PEER, "inbound S2S login from %s (%s) rejected, %s", peerName.c_str(), address.c_str(), reason.c_str());
    return false;
}

/* Binds an established link to its descriptor. */

bool PeerManager::linkEstablished(PeerSession* session)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    int32_t index = session->peerIndex();
    if (index < 0 || index >= (int32_t)m_entries.size())
        return false;

    PeerEntry& entry = m_entries[index];
    if (entry.link == session)
        return true;

    if (entry.link != nullptr) {
        // both servers dialed each other; each side keeps the link initiated by the lower server ID
        if (entry.link->role() == session->role() || !isPreferredLink(session->role(), session->remoteId()))
            return false;

        LogInfoEx(LOG_PEER, "%s, replaces %s", session->name().c_str(), entry.link->name().c_str());
        entry.link->close(SessionError::DUPLICATE_LINK);
    }
    else {
        entry.connects++;
    }

    entry.link = session;
    entry.state = PeerState::CONNECTED;
    entry.lastError = SessionError::NONE;
    return true;
}

/* Gets a snapshot of every configured remote server. */

std::vector<PeerStatus> PeerManager::getPeerStatus() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<PeerStatus> status;
    for (const PeerEntry& entry : m_entries) {
        PeerStatus s;
        s.peerName = entry.descriptor.peerName;
        s.host = entry.descriptor.host;
        s.port = entry.descriptor.port;
        s.uplink = entry.descriptor.uplink;
        s.receiveOnly = entry.descriptor.receiveOnly;
        s.connects = entry.connects;
        s.failures = entry.failures;
        s.lastError = entry.lastError;
        s.packetsRx = 0U;
        s.packetsTx = 0U;
        s.backoffMs = 0U;

        if (entry.link != nullptr) {
            s.state = PeerState::CONNECTED;
            s.packetsRx = entry.link->rxPackets();
            s.packetsTx = entry.link->txLines();
        }
        else if (entry.outbound != nullptr) {
            s.state = entry.outbound->linkState();
            if (s.state == PeerState::DISCONNECTED)
                s.state = PeerState::CONNECTING;
        }
        else {
            s.state = entry.state;
            if (entry.state == PeerState::BACKOFF && entry.backoffUntil > m_now)
                s.backoffMs = (uint32_t)(entry.backoffUntil - m_now);
        }

        status.push_back(s);
    }

    return status;
}

/* Stops dialing, closes every session and waits for their threads. */

void PeerManager::close()
{
    std::vector<PeerSession*> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        sessions.swap(m_sessions);

        for (PeerSession* session : sessions)
            session->stop();
    }

    for (PeerSession* session : sessions) {
        session->wait();
        sessionEnded(session);
        delete session;
    }
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Helper to start an outbound session for a descriptor (called with the mutex held). */

void PeerManager::dial(uint32_t index)
{
    PeerEntry& entry = m_entries[index];
    PeerRole::ENUM role = entry.descriptor.uplink ? PeerRole::UPLINK : PeerRole::INITIATOR;

    PeerSession* session = new PeerSession(m_nextId++, role, new tcp::Socket(), m_router, this, m_config.session,
        entry.descriptor, (int32_t)index, m_config.maxQueueLines);
    if (!session->run()) {
        LogError(LOG_PEER, "%s, failed to start session thread", session->name().c_str());
        delete session;

        entry.failures++;
        entry.state = PeerState::BACKOFF;
        entry.backoffUntil = m_now + entry.backoff.next();
        return;
    }

    session->setName(entry.descriptor.uplink ? "s2s:uplink" : "s2s:out");

    entry.outbound = session;
    entry.state = PeerState::CONNECTING;
    m_sessions.push_back(session);
}

/* Helper to update the descriptor of a finished session and schedule the next attempt. */

void PeerManager::sessionEnded(PeerSession* session)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    int32_t index = session->peerIndex();
    if (index < 0 || index >= (int32_t)m_entries.size())
        return;

    PeerEntry& entry = m_entries[index];
    SessionError::ENUM reason = session->closeReason();

    bool wasLink = (entry.link == session);
    if (wasLink) {
        entry.link = nullptr;
        entry.lastError = reason;
    }

    if (entry.outbound == session) {
        entry.outbound = nullptr;
        if (!wasLink && reason != SessionError::DUPLICATE_LINK) {
            entry.failures++;
            entry.lastError = reason;
        }
    }
    else if (!wasLink) {
        // a rejected or duplicate inbound link never owned the descriptor
        return;
    }

    if (entry.link != nullptr) {
        entry.state = PeerState::CONNECTED;
        return;
    }

    if (entry.outbound != nullptr)
        return;

    if (!m_running || !entry.descriptor.connect || !entry.descriptor.enabled) {
        entry.state = PeerState::DISCONNECTED;
        return;
    }

    if (wasLink && entry.backoff.isStable(session->connectedMs()))
        entry.backoff.reset();

    uint32_t delay = entry.backoff.next();
    entry.backoffUntil = m_now + delay;
    entry.state = PeerState::BACKOFF;

    LogInfoEx(LOG_PEER, "%s, %s, reconnecting in %ums", session->name().c_str(), sessionErrorToString(reason), delay);
}

/* Helper to determine whether a link of the given role is the one kept when two links to a peer are up. */

bool PeerManager::isPreferredLink(PeerRole::ENUM role, const std::string& remoteId) const
{
    std::string serverId = Utils::toUpper(m_config.session.serverId);
    std::string remote = Utils::toUpper(remoteId);

    if (role == PeerRole::INITIATOR)
        return serverId < remote;
    if (role == PeerRole::ACCEPTOR)
        return remote < serverId;

    return false;
}

/* Helper to find a descriptor whose host resolves to the given address. */

int32_t PeerManager::findByAddress(const std::string& address) const
{
    std::vector<PeerDescriptor> descriptors;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const PeerEntry& entry : m_entries)
            descriptors.push_back(entry.descriptor);
    }

    for (uint32_t i = 0U; i < descriptors.size(); i++) {
        const PeerDescriptor& desc = descriptors[i];
        if (!desc.enabled || desc.uplink || desc.host.empty())
            continue;

        sockaddr_storage addr;
        uint32_t addrLen = 0U;
        if (tcp::Socket::lookup(desc.host, desc.port, addr, addrLen) != 0)
            continue;

        if (tcp::Socket::address(addr) == address)
            return (int32_t)i;
    }

    return -1;
}
