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
 * @file ConnectionListener.h
 * @ingroup relay
 * @file ConnectionListener.cpp
 * @ingroup relay
 */
#if !defined(__CONNECTION_LISTENER_H__)
#define __CONNECTION_LISTENER_H__

#include "relay/Defines.h"
#include "common/network/tcp/TcpListener.h"
#include "common/Thread.h"

#include <atomic>
#include <functional>
#include <string>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Accepts connections on a listening port and hands each accepted
     *  socket to a callback.
     * @ingroup relay
     */
    class RELAY_SW_API ConnectionListener : public Thread {
    public:
        /**
         * @brief Initializes a new instance of the ConnectionListener class.
         * @param name Listener name (used for logging).
         * @param accepted Callback receiving each accepted socket (ownership passes to the callback).
         */
        ConnectionListener(const std::string& name, std::function<void(tcp::Socket*)>&& accepted);
        /**
         * @brief Finalizes a instance of the ConnectionListener class.
         */
        ~ConnectionListener() override;

        /**
         * @brief Binds the listening socket.
         * @param address Local address to bind.
         * @param port Local port.
         * @returns bool True, if the port was bound, otherwise false.
         */
        bool open(const std::string& address, uint16_t port);
        /**
         * @brief Stops accepting, waits for the thread and closes the listening socket.
         */
        void close();

        /**
         * @brief Thread entry point.
         */
        void entry() override;

        /**
         * @brief Gets the bound port.
         * @returns uint16_t Bound port.
         */
        uint16_t port() const { return m_listener.localPort(); }

    public:
        /**
         * @brief Listener Name.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, name);

    private:
        tcp::TcpListener m_listener;
        std::function<void(tcp::Socket*)> m_accepted;
        std::atomic<bool> m_running;
    };
} // namespace network

#endif // __CONNECTION_LISTENER_H__
