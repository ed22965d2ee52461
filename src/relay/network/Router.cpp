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
#include "network/Router.h"
#include "network/ClientSession.h"
#include "network/PeerSession.h"

using namespace network;
using namespace relay;

#include <algorithm>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t SWEEP_INTERVAL_MS = 1000U;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Router class. */

Router::Router(const std::string& serverId, const RouterConfig& config) :
    m_serverId(Utils::toUpper(serverId)),
    m_config(config),
    m_dedup((uint64_t)config.dedupWindow * 1000ULL, config.dedupMaxEntries),
    m_localDedup((uint64_t)config.dedupWindow * 1000ULL, config.dedupMaxEntries),
    m_clients(),
    m_peers(),
    m_now(0U),
    m_sweepTimer(1000U, 0U, SWEEP_INTERVAL_MS),
    m_rateMs(0U),
    m_rateLastRx(0U),
    m_packetsPerSec(0U),
    m_packetsRx(0U),
    m_packetsTx(0U),
    m_duplicates(0U),
    m_loops(0U),
    m_readOnlyDrops(0U),
    m_mutex()
{
    m_sweepTimer.start();
}

/* Registers a session for fan-out. */

void Router::registerSession(Session* session)
{
    if (session == nullptr)
        return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (session->kind() == SessionKind::CLIENT) {
        ClientSession* client = static_cast<ClientSession*>(session);
        if (std::find(m_clients.begin(), m_clients.end(), client) == m_clients.end())
            m_clients.push_back(client);
    }
    else {
        PeerSession* peer = static_cast<PeerSession*>(session);
        if (std::find(m_peers.begin(), m_peers.end(), peer) == m_peers.end())
            m_peers.push_back(peer);
    }

    LogDebugEx(LOG_ROUTER, "Router::registerSession()", "registered %s, clients = %u, peers = %u", session->name().c_str(),
        (uint32_t)m_clients.size(), (uint32_t)m_peers.size());
}

/* Removes a session from fan-out. */

void Router::unregisterSession(Session* session)
{
    if (session == nullptr)
        return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (session->kind() == SessionKind::CLIENT) {
        auto it = std::find(m_clients.begin(), m_clients.end(), static_cast<ClientSession*>(session));
        if (it != m_clients.end())
            m_clients.erase(it);
    }
    else {
        auto it = std::find(m_peers.begin(), m_peers.end(), static_cast<PeerSession*>(session));
        if (it != m_peers.end())
            m_peers.erase(it);
    }
}

/* Dispatches a packet to every eligible session other than the origin. */

DispatchResult::ENUM Router::dispatch(const aprs::Packet& pkt, Session* origin)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_packetsRx++;

    // this server already relayed the packet once; re-accepting it would cycle
    if (pkt.hasRelayMarker(m_serverId)) {
        m_loops++;
        LogDebugEx(LOG_ROUTER, "Router::dispatch()", "loop, dropped %s", pkt.encode().c_str());
        return DispatchResult::DROP_LOOP;
    }

    bool fromClient = (origin != nullptr && origin->kind() == SessionKind::CLIENT);
    bool fromUplink = (origin != nullptr && origin->kind() == SessionKind::UPLINK);
    bool readOnlyOrigin = fromClient && static_cast<ClientSession*>(origin)->isReceiveOnly();

    // checked ahead of the dedup cache so a dropped copy cannot suppress a later verified one
    if (readOnlyOrigin && !m_config.allowReadOnlyLocal) {
        m_readOnlyDrops++;
        return DispatchResult::DROP_READONLY;
    }

    uint64_t fingerprint = pkt.fingerprint();

    // local-only deliveries are tracked apart so a later verified copy still reaches the peers
    bool deliveredLocally = false;
    if (readOnlyOrigin) {
        if (m_dedup.contains(fingerprint, m_now) || m_localDedup.checkAndInsert(fingerprint, m_now)) {
            m_duplicates++;
            return DispatchResult::DROP_DUPLICATE;
        }
    }
    else {
        if (m_dedup.checkAndInsert(fingerprint, m_now)) {
            m_duplicates++;
            return DispatchResult::DROP_DUPLICATE;
        }

        deliveredLocally = m_localDedup.contains(fingerprint, m_now);
    }

    std::string line = pkt.encode();
    for (ClientSession* client : m_clients) {
        if (deliveredLocally)
            break;
        if (client == origin)
            continue;
        if (client->state() != SessionState::AUTHENTICATED)
            continue;
        if (!client->filterMatches(pkt))
            continue;

        if (client->write(line))
            m_packetsTx++;
    }

    // receive-only and uplink traffic stays local
    if (readOnlyOrigin || fromUplink)
        return DispatchResult::DELIVERED;

    bool marked = false;
    bool pathFull = false;
    std::string markedLine;
    for (PeerSession* peer : m_peers) {
        if (peer == origin)
            continue;
        if (peer->state() != SessionState::AUTHENTICATED)
            continue;
        if (peer->isReceiveOnly())
            continue;

        if (peer->kind() == SessionKind::UPLINK) {
            if (!fromClient)
                continue;

            if (peer->write(line))
                m_packetsTx++;
            continue;
        }

        // the peer has already seen this packet
        if (pkt.hasRelayMarker(peer->remoteId()))
            continue;

        if (!marked && !pathFull) {
            aprs::Packet copy = pkt;
            if (copy.addRelayMarker(m_serverId, m_config.maxPath)) {
                markedLine = copy.encode();
                marked = true;
            }
            else {
                pathFull = true;
                LogDebugEx(LOG_ROUTER, "Router::dispatch()", "path full, not relaying %s", line.c_str());
            }
        }

        if (!marked)
            continue;

        if (peer->write(markedLine))
            m_packetsTx++;
    }

    return DispatchResult::DELIVERED;
}

/* Updates the router time, sweeps the dedup cache and computes the packet rate. */

void Router::clock(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += ms;

    m_sweepTimer.clock(ms);
    if (m_sweepTimer.isRunning() && m_sweepTimer.hasExpired()) {
        uint32_t purged = m_dedup.sweep(m_now);
        m_localDedup.sweep(m_now);
        if (purged > 0U) {
            LogDebugEx(LOG_ROUTER, "Router::clock()", "purged %u dedup entries, %u remain", purged, (uint32_t)m_dedup.size());
        }

        m_sweepTimer.start();
    }

    m_rateMs += ms;
    if (m_rateMs >= 1000U) {
        m_packetsPerSec = (uint32_t)(((m_packetsRx - m_rateLastRx) * 1000ULL) / m_rateMs);
        m_rateLastRx = m_packetsRx;
        m_rateMs = 0U;
    }
}

/* Gets a snapshot of the router counters and state. */

RouterStatus Router::getStatus() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    RouterStatus status;
    status.clients = (uint32_t)m_clients.size();
    status.peers = 0U;
    status.uplinkConnected = false;
    for (PeerSession* peer : m_peers) {
        if (peer->kind() == SessionKind::UPLINK)
            status.uplinkConnected = true;
        else
            status.peers++;
    }

    status.dedupSize = (uint32_t)m_dedup.size();
    status.packetsRx = m_packetsRx;
    status.packetsTx = m_packetsTx;
    status.duplicates = m_duplicates;
    status.loops = m_loops;
    status.readOnlyDrops = m_readOnlyDrops;
    status.packetsPerSec = m_packetsPerSec;
    return status;
}
