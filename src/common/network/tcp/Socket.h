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
/**
 * @defgroup tcp_socket TCP Sockets
 * @brief Implementation for the TCP stream sockets.
 * @ingroup socket
 *
 * @file Socket.h
 * @ingroup tcp_socket
 * @file Socket.cpp
 * @ingroup tcp_socket
 */
#if !defined(__TCP_SOCKET_H__)
#define __TCP_SOCKET_H__

#include "common/Defines.h"

#include <string>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

namespace network
{
    namespace tcp
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief This class implements low-level routines to communicate over a TCP
         *  stream socket.
         * @ingroup tcp_socket
         *
         * A socket is owned and used by a single thread.
         */
        class RELAY_SW_API Socket {
        public:
            /**
             * @brief Initializes a new instance of the Socket class.
             */
            Socket();
            /**
             * @brief Initializes a new instance of the Socket class for an accepted connection.
             * @param fd Connected socket descriptor.
             * @param address Remote socket address.
             * @param addrLen Length of the remote socket address.
             */
            Socket(int fd, const sockaddr_storage& address, uint32_t addrLen);
            /**
             * @brief Finalizes a instance of the Socket class.
             */
            ~Socket();

            /**
             * @brief Connects to a remote host.
             * @param hostname Remote hostname or IP address.
             * @param port Remote port.
             * @param timeoutMs Connect timeout in milliseconds.
             * @returns bool True, if connected, otherwise false.
             */
            bool connect(const std::string& hostname, uint16_t port, uint32_t timeoutMs);

            /**
             * @brief Read data from the socket.
             * @param[out] buffer Buffer to read data into.
             * @param length Length of data to read.
             * @param timeoutMs Time to wait for data, in milliseconds.
             * @returns ssize_t Bytes read; 0 if no data arrived before the timeout, -1 if the
             *  connection was closed or failed.
             */
            ssize_t read(uint8_t* buffer, uint32_t length, uint32_t timeoutMs) noexcept;
            /**
             * @brief Write the full buffer to the socket.
             * @param buffer Buffer containing data to write.
             * @param length Length of data to write.
             * @param timeoutMs Time to wait for the socket to become writable, in milliseconds.
             * @returns bool True, if the entire buffer was written, otherwise false.
             */
            bool write(const uint8_t* buffer, uint32_t length, uint32_t timeoutMs) noexcept;

            /**
             * @brief Closes the socket.
             */
            void close();

            /**
             * @brief Flag indicating whether the socket is open.
             * @returns bool True, if the socket is open, otherwise false.
             */
            bool isOpen() const { return m_fd >= 0; }

            /**
             * @brief Gets the remote address (IP address text).
             * @returns std::string Remote address.
             */
            std::string getRemoteAddress() const { return address(m_remoteAddr); }
            /**
             * @brief Gets the remote port.
             * @returns uint16_t Remote port.
             */
            uint16_t getRemotePort() const { return port(m_remoteAddr); }

            /**
             * @brief Helper to lookup a hostname and resolve it to an IP address.
             * @param[in] hostname String containing hostname to resolve.
             * @param[in] port Numeric port number of service to resolve.
             * @param[out] address Socket address structure.
             * @param[out] addrLen Length of the socket address.
             * @returns int Zero on success, nonzero error code on failure.
             */
            static int lookup(const std::string& hostname, uint16_t port, sockaddr_storage& address, uint32_t& addrLen);
            /**
             * @brief Helper to lookup a hostname and resolve it to an IP address.
             * @param[in] hostname String containing hostname to resolve.
             * @param[in] port Numeric port number of service to resolve.
             * @param[out] address Socket address structure.
             * @param[out] addrLen Length of the socket address.
             * @param[in] hints Hints for resolving the host.
             * @returns int Zero on success, nonzero error code on failure.
             */
            static int lookup(const std::string& hostname, uint16_t port, sockaddr_storage& address, uint32_t& addrLen, struct addrinfo& hints);

            /**
             * @brief Helper to return the IP address text of a socket address.
             * @param addr Socket address.
             * @returns std::string IP address.
             */
            static std::string address(const sockaddr_storage& addr);
            /**
             * @brief Helper to return the port of a socket address.
             * @param addr Socket address.
             * @returns uint16_t Port.
             */
            static uint16_t port(const sockaddr_storage& addr);

        private:
            int m_fd;
            sockaddr_storage m_remoteAddr;
            uint32_t m_remoteAddrLen;

            /**
             * @brief Helper to set or clear the non-blocking flag.
             * @param nonBlocking Flag indicating the socket should be non-blocking.
             * @returns bool True, if the flag was set, otherwise false.
             */
            bool setNonBlocking(bool nonBlocking);

            Socket(const Socket&) = delete;
            Socket& operator=(const Socket&) = delete;
        };
    } // namespace tcp
} // namespace network

#endif // __TCP_SOCKET_H__
