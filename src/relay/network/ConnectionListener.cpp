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
#include "network/ConnectionListener.h"

using namespace network;

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t ACCEPT_POLL_MS = 100U;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the ConnectionListener class. */

ConnectionListener::ConnectionListener(const std::string& name, std::function<void(tcp::Socket*)>&& accepted) :
    m_name(name),
    m_listener(),
    m_accepted(accepted),
    m_running(false)
{
    /* stub */
}

/* Finalizes a instance of the ConnectionListener class. */

ConnectionListener::~ConnectionListener()
{
    close();
}

/* Binds the listening socket. */

bool ConnectionListener::open(const std::string& address, uint16_t port)
{
    if (!m_listener.open(address, port)) {
        LogError(LOG_NET, "%s listener, failed to bind %s:%u", m_name.c_str(), address.empty() ? "*" : address.c_str(), port);
        return false;
    }

    m_running = true;
    LogInfoEx(LOG_NET, "%s listener on %s:%u", m_name.c_str(), address.empty() ? "*" : address.c_str(), m_listener.localPort());
    return true;
}

/* Stops accepting, waits for the thread and closes the listening socket. */

void ConnectionListener::close()
{
    m_running = false;
    wait();

    m_listener.close();
}

/* Thread entry point. */

void ConnectionListener::entry()
{
    while (m_running) {
        tcp::Socket* socket = m_listener.accept(ACCEPT_POLL_MS);
        if (socket == nullptr)
            continue;

        LogDebugEx(LOG_NET, "ConnectionListener::entry()", "%s listener, accepted %s:%u", m_name.c_str(),
            socket->getRemoteAddress().c_str(), socket->getRemotePort());

        if (m_accepted)
            m_accepted(socket);
        else
            delete socket;
    }
}
