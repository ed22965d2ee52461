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
 * @file Session.h
 * @ingroup relay
 * @file Session.cpp
 * @ingroup relay
 */
#if !defined(__SESSION_H__)
#define __SESSION_H__

#include "relay/Defines.h"
#include "common/aprs/Packet.h"
#include "common/network/tcp/Socket.h"
#include "common/Thread.h"

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class RELAY_SW_API Router;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents one line-oriented TCP connection (client or peer).
     * @ingroup relay
     *
     * Each session runs on its own thread: it flushes its outbound queue, reads and
     * assembles lines, and clocks its timers. Other threads only ever enqueue lines
     * through write() or request closure through close(); the session thread performs
     * the actual socket I/O and, on exit, deregisters from the Router before the
     * socket is closed.
     */
    class RELAY_SW_API Session : public Thread {
    public:
        /**
         * @brief Initializes a new instance of the Session class.
         * @param id Unique connection identity.
         * @param kind Session kind.
         * @param socket Connection socket (owned by the session; may be nullptr for detached use).
         * @param router Router instance.
         * @param maxQueueLines Outbound queue bound.
         */
        Session(uint32_t id, relay::SessionKind::ENUM kind, tcp::Socket* socket, Router* router, uint32_t maxQueueLines);
        /**
         * @brief Finalizes a instance of the Session class.
         */
        ~Session() override;

        /**
         * @brief Performs the connect-time actions (banner, outbound connect, login line).
         * @returns bool True, if the session should continue, otherwise false.
         */
        virtual bool open() = 0;
        /**
         * @brief Processes a received line (without line terminator).
         * @param line Line text.
         */
        virtual void processLine(const std::string& line) = 0;
        /**
         * @brief Updates the session timers by the passed number of milliseconds.
         * @param ms Number of milliseconds.
         */
        virtual void clock(uint32_t ms) = 0;

        /**
         * @brief Gets a printable name for the session (callsign, peer name or address).
         * @returns std::string Session name.
         */
        virtual std::string name() const = 0;

        /**
         * @brief Enqueues a line for transmission.
         * @param line Line text (without line terminator).
         * @returns bool True, if the line was queued, false if the session is closing or
         *  the queue is full (the session is then closed with QUEUE_OVERFLOW).
         */
        bool write(const std::string& line);
        /**
         * @brief Removes and returns all queued outbound lines.
         * @returns std::vector<std::string> Queued lines, oldest first.
         */
        std::vector<std::string> takeOutbound();
        /**
         * @brief Gets the number of queued outbound lines.
         * @returns size_t Number of queued lines.
         */
        size_t queueSize() const;

        /**
         * @brief Requests the session be closed; the first reason given is kept.
         * @param reason Closure reason.
         */
        void close(relay::SessionError::ENUM reason);
        /**
         * @brief Requests the session be closed for shutdown.
         */
        void stop() { close(relay::SessionError::SHUTDOWN); }

        /**
         * @brief Flag indicating whether closure was requested.
         * @returns bool True, if the session is closing, otherwise false.
         */
        bool isClosing() const { return m_closing; }
        /**
         * @brief Flag indicating whether the session thread has finished.
         * @returns bool True, if the session thread has finished, otherwise false.
         */
        bool isFinished() const { return m_finished; }

        /**
         * @brief Gets the closure reason.
         * @returns relay::SessionError::ENUM Closure reason.
         */
        relay::SessionError::ENUM closeReason() const;
        /**
         * @brief Gets the session login state.
         * @returns relay::SessionState::ENUM Login state.
         */
        relay::SessionState::ENUM state() const { return m_state; }

        /**
         * @brief Thread entry point; runs the session pump until closure.
         */
        void entry() override;

    public:
        /**
         * @brief Unique Connection Identity.
         */
        DECLARE_RO_PROPERTY_PLAIN(uint32_t, id);
        /**
         * @brief Session Kind.
         */
        DECLARE_RO_PROPERTY_PLAIN(relay::SessionKind::ENUM, kind);
        /**
         * @brief Remote Address.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, address);

        /**
         * @brief Gets the number of packets received and handed to the Router.
         * @returns uint32_t Packet count.
         */
        uint32_t rxPackets() const { return m_rxPackets; }
        /**
         * @brief Gets the number of lines written to the socket.
         * @returns uint32_t Line count.
         */
        uint32_t txLines() const { return m_txLines; }
        /**
         * @brief Gets the number of received packets dropped (codec errors, loops, receive-only).
         * @returns uint32_t Packet count.
         */
        uint32_t dropped() const { return m_dropped; }
        /**
         * @brief Gets the number of received packets dropped as duplicates.
         * @returns uint32_t Packet count.
         */
        uint32_t duplicates() const { return m_duplicates; }

    protected:
        Router* m_router;
        tcp::Socket* m_socket;

        std::atomic<uint32_t> m_rxPackets;
        std::atomic<uint32_t> m_txLines;
        std::atomic<uint32_t> m_dropped;
        std::atomic<uint32_t> m_duplicates;

        /**
         * @brief Sets the session login state.
         * @param state Login state.
         */
        void setState(relay::SessionState::ENUM state) { m_state = state; }
        /**
         * @brief Sets the printable remote address (only before the session thread runs).
         * @param address Remote address.
         */
        void setAddress(const std::string& address) { m_address = address; }

        /**
         * @brief Hands a decoded packet to the Router with this session as origin.
         * @param pkt Packet.
         * @returns relay::DispatchResult::ENUM Dispatch result.
         */
        relay::DispatchResult::ENUM dispatchPacket(aprs::Packet& pkt);

        /**
         * @brief Called on the session thread after the session has been deregistered
         *  and its socket closed.
         */
        virtual void closed() { }

    private:
        uint32_t m_maxQueueLines;
        std::deque<std::string> m_txQueue;
        mutable std::mutex m_queueMutex;

        std::atomic<bool> m_closing;
        std::atomic<bool> m_finished;
        relay::SessionError::ENUM m_closeReason;
        std::atomic<relay::SessionState::ENUM> m_state;

        std::string m_rxBuffer;

        /**
         * @brief Helper to write all queued lines to the socket.
         * @returns bool True, if all lines were written, otherwise false.
         */
        bool flush();
        /**
         * @brief Helper to split received data into lines.
         * @param buffer Received data.
         * @param len Length of received data.
         */
        void assemble(const uint8_t* buffer, uint32_t len);

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;
    };
} // namespace network

#endif // __SESSION_H__
