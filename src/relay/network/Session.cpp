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
#include "common/StopWatch.h"
#include "network/Session.h"
#include "network/Router.h"

using namespace network;
using namespace relay;

#include <chrono>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t RX_BUFFER_LEN = 4096U;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Session class. */

Session::Session(uint32_t id, SessionKind::ENUM kind, tcp::Socket* socket, Router* router, uint32_t maxQueueLines) :
    m_id(id),
    m_kind(kind),
    m_address(),
    m_router(router),
    m_socket(socket),
    m_rxPackets(0U),
    m_txLines(0U),
    m_dropped(0U),
    m_duplicates(0U),
    m_maxQueueLines(maxQueueLines),
    m_txQueue(),
    m_queueMutex(),
    m_closing(false),
    m_finished(false),
    m_closeReason(SessionError::NONE),
    m_state(SessionState::CONNECTED),
    m_rxBuffer()
{
    if (m_maxQueueLines == 0U)
        m_maxQueueLines = DEFAULT_MAX_QUEUE_LINES;

    if (m_socket != nullptr && m_socket->isOpen())
        m_address = m_socket->getRemoteAddress();
}

/* Finalizes a instance of the Session class. */

Session::~Session()
{
    // a session that never ran its thread may still be registered
    if (m_router != nullptr && !m_finished)
        m_router->unregisterSession(this);

    if (m_socket != nullptr) {
        delete m_socket;
        m_socket = nullptr;
    }
}

/* Enqueues a line for transmission. */

bool Session::write(const std::string& line)
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    if (m_closing)
        return false;

    if (m_txQueue.size() >= m_maxQueueLines) {
        m_closing = true;
        m_closeReason = SessionError::QUEUE_OVERFLOW;
        LogWarning(LOG_NET, "%s, outbound queue full (%u lines), disconnecting slow consumer", name().c_str(), m_maxQueueLines);
        return false;
    }

    m_txQueue.push_back(line);
    return true;
}

/* Removes and returns all queued outbound lines. */

std::vector<std::string> Session::takeOutbound()
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    std::vector<std::string> lines(m_txQueue.begin(), m_txQueue.end());
    m_txQueue.clear();
    return lines;
}

/* Gets the number of queued outbound lines. */

size_t Session::queueSize() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_txQueue.size();
}

/* Requests the session be closed; the first reason given is kept. */

void Session::close(SessionError::ENUM reason)
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    if (m_closing)
        return;

    m_closeReason = reason;
    m_closing = true;
}

/* Gets the closure reason. */

SessionError::ENUM Session::closeReason() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_closeReason;
}

/* Thread entry point; runs the session pump until closure. */

void Session::entry()
{
    if (open()) {
        StopWatch stopWatch;
        stopWatch.start();

        uint8_t buffer[RX_BUFFER_LEN];
        while (!m_closing) {
            uint32_t ms = stopWatch.elapsed();
            stopWatch.start();

            if (!flush()) {
                close(SessionError::REMOTE_CLOSED);
                break;
            }

            if (m_closing)
                break;

            if (m_socket != nullptr) {
                ssize_t len = m_socket->read(buffer, RX_BUFFER_LEN, SESSION_POLL_MS);
                if (len < 0) {
                    close(SessionError::REMOTE_CLOSED);
                    break;
                }

                if (len > 0)
                    assemble(buffer, (uint32_t)len);
            }
            else {
                Thread::sleep(SESSION_POLL_MS);
            }

            clock(ms);
        }
    }
    else {
        close(SessionError::CONNECT_FAILED);
    }

    // send any parting diagnostic line (rejections, timeouts)
    flush();

    if (m_state != SessionState::REJECTED)
        m_state = SessionState::CLOSED;

    // deregister before the socket goes away so no dispatch can target a dead session
    if (m_router != nullptr)
        m_router->unregisterSession(this);

    if (m_socket != nullptr)
        m_socket->close();

    LogDebugEx(LOG_NET, "Session::entry()", "%s, session %u closed, %s", name().c_str(), m_id, sessionErrorToString(closeReason()));
    closed();

    m_finished = true;
}

// ---------------------------------------------------------------------------
//  Protected Class Members
// ---------------------------------------------------------------------------

/* Hands a decoded packet to the Router with this session as origin. */

DispatchResult::ENUM Session::dispatchPacket(aprs::Packet& pkt)
{
    pkt.rxTime((uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    m_rxPackets++;

    if (m_router == nullptr)
        return DispatchResult::DELIVERED;

    DispatchResult::ENUM result = m_router->dispatch(pkt, this);
    switch (result) {
    case DispatchResult::DROP_DUPLICATE:
        m_duplicates++;
        break;
    case DispatchResult::DROP_LOOP:
    case DispatchResult::DROP_READONLY:
        m_dropped++;
        break;
    default:
        break;
    }

    return result;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Helper to write all queued lines to the socket. */

bool Session::flush()
{
    if (m_socket == nullptr || !m_socket->isOpen())
        return true;

    std::vector<std::string> lines = takeOutbound();
    for (const std::string& line : lines) {
        std::string data = line + "\r\n";
        if (!m_socket->write((const uint8_t*)data.c_str(), (uint32_t)data.length(), SESSION_WRITE_TIMEOUT_MS))
            return false;

        m_txLines++;
    }

    return true;
}

/* Helper to split received data into lines. */

void Session::assemble(const uint8_t* buffer, uint32_t len)
{
    m_rxBuffer.append((const char*)buffer, len);

    size_t pos = 0U;
    while (!m_closing) {
        size_t eol = m_rxBuffer.find('\n', pos);
        if (eol == std::string::npos)
            break;

        std::string line = m_rxBuffer.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        pos = eol + 1U;

        if (!line.empty())
            processLine(line);
    }

    m_rxBuffer.erase(0U, pos);

    // a peer that never sends a line terminator must not grow the buffer unbounded
    if (m_rxBuffer.length() > aprs::defines::MAX_LINE_LEN + 2U) {
        std::string line = m_rxBuffer;
        m_rxBuffer.clear();
        processLine(line);
    }
}
