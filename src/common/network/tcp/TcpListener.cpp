// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "common/Defines.h"
#include "common/network/tcp/TcpListener.h"
#include "common/Log.h"

using namespace network;
using namespace network::tcp;

#include <cerrno>
#include <cstring>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const int LISTEN_BACKLOG = 16;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the TcpListener class. */

TcpListener::TcpListener() :
    m_localAddress(),
    m_localPort(0U),
    m_fd(-1)
{
    /* stub */
}

/* Finalizes a instance of the TcpListener class. */

TcpListener::~TcpListener()
{
    close();
}

/* Binds and listens on the given address and port. */

bool TcpListener::open(const std::string& address, uint16_t port)
{
    close();

    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));
    hints.ai_flags = AI_PASSIVE;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    sockaddr_storage addr;
    uint32_t addrLen = 0U;
    if (Socket::lookup(address, port, addr, addrLen, hints) != 0) {
        LogError(LOG_NET, "The local address is invalid - %s", address.c_str());
        return false;
    }

    m_fd = ::socket(addr.ss_family, SOCK_STREAM, 0);
    if (m_fd < 0) {
        LogError(LOG_NET, "Cannot create the TCP socket, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    int reuse = 1;
    if (::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, (char*)&reuse, sizeof(reuse)) == -1) {
        LogError(LOG_NET, "Cannot set the TCP socket option, err: %d (%s)", errno, strerror(errno));
        close();
        return false;
    }

    if (::bind(m_fd, (sockaddr*)&addr, addrLen) < 0) {
        LogError(LOG_NET, "Cannot bind the TCP address %s:%u, err: %d (%s)", address.c_str(), port, errno, strerror(errno));
        close();
        return false;
    }

    if (::listen(m_fd, LISTEN_BACKLOG) < 0) {
        LogError(LOG_NET, "Cannot listen on the TCP socket, err: %d (%s)", errno, strerror(errno));
        close();
        return false;
    }

    // fetch the bound port; port 0 asks the kernel for an ephemeral one
    sockaddr_storage bound;
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(m_fd, (sockaddr*)&bound, &boundLen) == 0)
        port = Socket::port(bound);

    m_localAddress = address;
    m_localPort = port;
    return true;
}

/* Waits for and accepts an incoming connection. */

Socket* TcpListener::accept(uint32_t timeoutMs)
{
    if (m_fd < 0)
        return nullptr;

    struct pollfd pfd;
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, (int)timeoutMs);
    if (ret < 0) {
        if (errno != EINTR)
            LogError(LOG_NET, "Error returned from TCP poll, err: %d (%s)", errno, strerror(errno));
        return nullptr;
    }

    if (ret == 0 || (pfd.revents & POLLIN) == 0)
        return nullptr;

    sockaddr_storage addr;
    socklen_t addrLen = sizeof(addr);
    int fd = ::accept(m_fd, (sockaddr*)&addr, &addrLen);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && errno != ECONNABORTED)
            LogError(LOG_NET, "Error returned from accept, err: %d (%s)", errno, strerror(errno));
        return nullptr;
    }

    return new Socket(fd, addr, (uint32_t)addrLen);
}

/* Closes the listener. */

void TcpListener::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}
