// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file TcpListener.h
 * @ingroup tcp_socket
 * @file TcpListener.cpp
 * @ingroup tcp_socket
 */
#if !defined(__TCP_LISTENER_H__)
#define __TCP_LISTENER_H__

#include "common/Defines.h"
#include "common/network/tcp/Socket.h"

#include <string>

namespace network
{
    namespace tcp
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief This class implements a listening TCP socket.
         * @ingroup tcp_socket
         */
        class RELAY_SW_API TcpListener {
        public:
            /**
             * @brief Initializes a new instance of the TcpListener class.
             */
            TcpListener();
            /**
             * @brief Finalizes a instance of the TcpListener class.
             */
            ~TcpListener();

            /**
             * @brief Binds and listens on the given address and port.
             * @param address Local address to bind (empty binds all interfaces).
             * @param port Local port (0 selects an ephemeral port).
             * @returns bool True, if the listener is open, otherwise false.
             */
            bool open(const std::string& address, uint16_t port);

            /**
             * @brief Waits for and accepts an incoming connection.
             * @param timeoutMs Time to wait for a connection, in milliseconds.
             * @returns Socket* Accepted connection (owned by the caller), or nullptr.
             */
            Socket* accept(uint32_t timeoutMs);

            /**
             * @brief Closes the listener.
             */
            void close();

            /**
             * @brief Flag indicating whether the listener is open.
             * @returns bool True, if the listener is open, otherwise false.
             */
            bool isOpen() const { return m_fd >= 0; }

        public:
            /**
             * @brief Local Address.
             */
            DECLARE_RO_PROPERTY_PLAIN(std::string, localAddress);
            /**
             * @brief Local Port (the bound port, once open).
             */
            DECLARE_RO_PROPERTY_PLAIN(uint16_t, localPort);

        private:
            int m_fd;

            TcpListener(const TcpListener&) = delete;
            TcpListener& operator=(const TcpListener&) = delete;
        };
    } // namespace tcp
} // namespace network

#endif // __TCP_LISTENER_H__
