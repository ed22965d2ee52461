// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2006-2016,2020 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2025 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "common/Defines.h"
#include "common/network/tcp/Socket.h"
#include "common/Log.h"

using namespace network;
using namespace network::tcp;

#include <cerrno>
#include <cstring>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Socket class. */

Socket::Socket() :
    m_fd(-1),
    m_remoteAddr(),
    m_remoteAddrLen(0U)
{
    ::memset(&m_remoteAddr, 0x00U, sizeof(m_remoteAddr));
}

/* Initializes a new instance of the Socket class for an accepted connection. */

Socket::Socket(int fd, const sockaddr_storage& address, uint32_t addrLen) :
    m_fd(fd),
    m_remoteAddr(address),
    m_remoteAddrLen(addrLen)
{
    /* stub */
}

/* Finalizes a instance of the Socket class. */

Socket::~Socket()
{
    close();
}

/* Connects to a remote host. */

bool Socket::connect(const std::string& hostname, uint16_t port, uint32_t timeoutMs)
{
    close();

    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    sockaddr_storage addr;
    uint32_t addrLen = 0U;
    if (lookup(hostname, port, addr, addrLen, hints) != 0)
        return false;

    m_fd = ::socket(addr.ss_family, SOCK_STREAM, 0);
    if (m_fd < 0) {
        LogError(LOG_NET, "Cannot create the TCP socket, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    if (!setNonBlocking(true)) {
        close();
        return false;
    }

    int ret = ::connect(m_fd, (sockaddr*)&addr, addrLen);
    if (ret < 0 && errno != EINPROGRESS) {
        LogError(LOG_NET, "Cannot connect to %s:%u, err: %d (%s)", hostname.c_str(), port, errno, strerror(errno));
        close();
        return false;
    }

    if (ret < 0) {
        struct pollfd pfd;
        pfd.fd = m_fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        ret = ::poll(&pfd, 1, (int)timeoutMs);
        if (ret == 0) {
            LogError(LOG_NET, "Timed out connecting to %s:%u", hostname.c_str(), port);
            close();
            return false;
        }

        if (ret < 0) {
            LogError(LOG_NET, "Error returned from TCP poll, err: %d (%s)", errno, strerror(errno));
            close();
            return false;
        }

        int err = 0;
        socklen_t errLen = sizeof(err);
        if (::getsockopt(m_fd, SOL_SOCKET, SO_ERROR, (char*)&err, &errLen) < 0 || err != 0) {
            if (err == 0)
                err = errno;
            LogError(LOG_NET, "Cannot connect to %s:%u, err: %d (%s)", hostname.c_str(), port, err, strerror(err));
            close();
            return false;
        }
    }

    if (!setNonBlocking(false)) {
        close();
        return false;
    }

    int noDelay = 1;
    if (::setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, (char*)&noDelay, sizeof(noDelay)) == -1) {
        LogWarning(LOG_NET, "Cannot set the TCP socket option, err: %d (%s)", errno, strerror(errno));
    }

    m_remoteAddr = addr;
    m_remoteAddrLen = addrLen;
    return true;
}

/* Read data from the socket. */

ssize_t Socket::read(uint8_t* buffer, uint32_t length, uint32_t timeoutMs) noexcept
{
    if (buffer == nullptr || length == 0U)
        return -1;
    if (m_fd < 0)
        return -1;

    // check that the recv() won't block
    struct pollfd pfd;
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, (int)timeoutMs);
    if (ret < 0) {
        if (errno == EINTR)
            return 0;

        LogError(LOG_NET, "Error returned from TCP poll, err: %d (%s)", errno, strerror(errno));
        return -1;
    }

    if (ret == 0)
        return 0;

    if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0)
        return 0;

    ssize_t len = ::recv(m_fd, (char*)buffer, length, 0);
    if (len == 0) {
        // orderly shutdown by the remote
        return -1;
    }

    if (len < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;

        LogError(LOG_NET, "Error returned from recv, err: %d (%s)", errno, strerror(errno));
        return -1;
    }

    return len;
}

/* Write the full buffer to the socket. */

bool Socket::write(const uint8_t* buffer, uint32_t length, uint32_t timeoutMs) noexcept
{
    if (buffer == nullptr)
        return false;
    if (m_fd < 0)
        return false;

    uint32_t offset = 0U;
    while (offset < length) {
        struct pollfd pfd;
        pfd.fd = m_fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, (int)timeoutMs);
        if (ret < 0) {
            if (errno == EINTR)
                continue;

            LogError(LOG_NET, "Error returned from TCP poll, err: %d (%s)", errno, strerror(errno));
            return false;
        }

        if (ret == 0) {
            LogError(LOG_NET, "Timed out writing to %s:%u", getRemoteAddress().c_str(), getRemotePort());
            return false;
        }

        ssize_t sent = ::send(m_fd, (const char*)(buffer + offset), length - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;

            LogError(LOG_NET, "Error returned from send, err: %d (%s)", errno, strerror(errno));
            return false;
        }

        offset += (uint32_t)sent;
    }

    return true;
}

/* Closes the socket. */

void Socket::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

/* Helper to lookup a hostname and resolve it to an IP address. */

int Socket::lookup(const std::string& hostname, uint16_t port, sockaddr_storage& address, uint32_t& addrLen)
{
    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));
    hints.ai_socktype = SOCK_STREAM;

    return lookup(hostname, port, address, addrLen, hints);
}

/* Helper to lookup a hostname and resolve it to an IP address. */

int Socket::lookup(const std::string& hostname, uint16_t port, sockaddr_storage& address, uint32_t& addrLen, struct addrinfo& hints)
{
    std::string portstr = std::to_string(port);
    struct addrinfo* res;

    // port is always digits, no needs to lookup service
    hints.ai_flags |= AI_NUMERICSERV;

    int err = ::getaddrinfo(hostname.empty() ? NULL : hostname.c_str(), portstr.c_str(), &hints, &res);
    if (err != 0) {
        sockaddr_in* paddr = (sockaddr_in*)&address;
        ::memset(paddr, 0x00U, addrLen = sizeof(sockaddr_in));
        paddr->sin_family = AF_INET;
        paddr->sin_port = htons(port);
        paddr->sin_addr.s_addr = htonl(INADDR_NONE);
        LogError(LOG_NET, "Cannot find address for host %s", hostname.c_str());
        return err;
    }

    ::memcpy(&address, res->ai_addr, addrLen = res->ai_addrlen);

    ::freeaddrinfo(res);
    return 0;
}

/* Helper to return the IP address text of a socket address. */

std::string Socket::address(const sockaddr_storage& addr)
{
    std::string address = std::string();
    char str[INET6_ADDRSTRLEN];

    switch (addr.ss_family) {
    case AF_INET:
    {
        struct sockaddr_in* in;
        in = (struct sockaddr_in*)&addr;
        ::inet_ntop(AF_INET, &(in->sin_addr), str, INET6_ADDRSTRLEN);
        address = std::string(str);
    }
    break;
    case AF_INET6:
    {
        struct sockaddr_in6* in6;
        in6 = (struct sockaddr_in6*)&addr;
        ::inet_ntop(AF_INET6, &(in6->sin6_addr), str, INET6_ADDRSTRLEN);
        address = std::string(str);
    }
    break;
    default:
        break;
    }

    return address;
}

/* Helper to return the port of a socket address. */

uint16_t Socket::port(const sockaddr_storage& addr)
{
    uint16_t port = 0U;

    switch (addr.ss_family) {
    case AF_INET:
    {
        struct sockaddr_in* in;
        in = (struct sockaddr_in*)&addr;
        port = ntohs(in->sin_port);
    }
    break;
    case AF_INET6:
    {
        struct sockaddr_in6* in6;
        in6 = (struct sockaddr_in6*)&addr;
        port = ntohs(in6->sin6_port);
    }
    break;
    default:
        break;
    }

    return port;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Helper to set or clear the non-blocking flag. */

bool Socket::setNonBlocking(bool nonBlocking)
{
    int flags = ::fcntl(m_fd, F_GETFL, 0);
    if (flags < 0) {
        LogError(LOG_NET, "Cannot get the TCP socket flags, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    flags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(m_fd, F_SETFL, flags) < 0) {
        LogError(LOG_NET, "Cannot set the TCP socket flags, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    return true;
}
