// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "relay/Defines.h"
#include "common/network/tcp/TcpListener.h"
#include "common/Thread.h"
#include "network/ConnectionListener.h"
#include "network/PeerManager.h"
#include "network/Router.h"

using namespace network;
using namespace relay;

#include <catch2/catch_test_macros.hpp>

static PeerManagerConfig makeConfig(const std::string& serverId)
{
    PeerManagerConfig config;
    config.session.serverId = serverId;
    config.session.handshakeTimeout = 5U;
    config.session.connectTimeout = 2U;
    config.backoffMin = 1U;
    config.backoffMax = 8U;
    config.backoffStable = 60U;
    config.maxQueueLines = 64U;
    return config;
}

static PeerDescriptor makeDescriptor(const std::string& peerName, const std::string& host, uint16_t port, int32_t passcode, bool connect)
{
    PeerDescriptor desc;
    desc.peerName = peerName;
    desc.host = host;
    desc.port = port;
    desc.passcode = passcode;
    desc.connect = connect;
    return desc;
}

TEST_CASE("PeerManager admits configured inbound peers", "[relay][peer_manager]") {
    Router router("T2TEST", RouterConfig());

    std::vector<PeerDescriptor> descriptors;
    descriptors.push_back(makeDescriptor("CORE-1", "192.0.2.1", 14579U, 12345, false));
    descriptors.push_back(makeDescriptor("CORE-2", "192.0.2.2", 14579U, 777, false));

    PeerManagerConfig config = makeConfig("T2TEST");
    PeerManager manager(&router, config, descriptors);

    PeerSession* session = new PeerSession(1U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session,
        PeerDescriptor(), -1, 64U);
    session->open();
    session->processLine("# aprsc 2.1.5 s2s core-2 777 14579");

    REQUIRE(session->state() == SessionState::AUTHENTICATED);
    REQUIRE(session->peerIndex() == 1);
    REQUIRE(session->remoteId() == "CORE-2");

    std::vector<std::string> out = session->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "# aprsrelay 1.0.0 s2s T2TEST 777 14579");

    std::vector<PeerStatus> status = manager.getPeerStatus();
    REQUIRE(status.size() == 2U);
    REQUIRE(status[0U].state == PeerState::DISCONNECTED);
    REQUIRE(status[1U].state == PeerState::CONNECTED);
    REQUIRE(status[1U].connects == 1U);
    REQUIRE(router.getStatus().peers == 1U);

    SECTION("a second link to the same peer is refused") {
        PeerSession* dup = new PeerSession(2U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session,
            PeerDescriptor(), -1, 64U);
        dup->open();
        dup->processLine("# aprsc 2.1.5 s2s CORE-2 777 14579");

        REQUIRE(dup->state() == SessionState::REJECTED);
        out = dup->takeOutbound();
        REQUIRE(out.size() == 1U);
        REQUIRE(out[0U] == "# s2s login rejected: already connected");
        REQUIRE(router.getStatus().peers == 1U);
        delete dup;
    }

    delete session;
}

TEST_CASE("PeerManager rejects unknown peers and bad passcodes", "[relay][peer_manager]") {
    Router router("T2TEST", RouterConfig());

    std::vector<PeerDescriptor> descriptors;
    descriptors.push_back(makeDescriptor("CORE-1", "192.0.2.1", 14579U, 12345, false));

    PeerManagerConfig config = makeConfig("T2TEST");
    PeerManager manager(&router, config, descriptors);

    PeerSession unknown(1U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session, PeerDescriptor(), -1, 64U);
    unknown.open();
    unknown.processLine("# aprsc 2.1.5 s2s ROGUE 12345 14579");
    REQUIRE(unknown.state() == SessionState::REJECTED);
    REQUIRE(unknown.takeOutbound()[0U] == "# s2s login rejected: unknown peer");

    PeerSession badPass(2U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session, PeerDescriptor(), -1, 64U);
    badPass.open();
    badPass.processLine("# aprsc 2.1.5 s2s CORE-1 1 14579");
    REQUIRE(badPass.state() == SessionState::REJECTED);
    REQUIRE(badPass.takeOutbound()[0U] == "# s2s login rejected: bad passcode");

    std::vector<PeerStatus> status = manager.getPeerStatus();
    REQUIRE(status[0U].state == PeerState::DISCONNECTED);
    REQUIRE(status[0U].connects == 0U);
}

TEST_CASE("PeerManager backs off after a failed connect", "[relay][peer_manager]") {
    // reserve an ephemeral port, then release it so nothing is listening there
    tcp::TcpListener probe;
    REQUIRE(probe.open("127.0.0.1", 0U));
    uint16_t port = probe.localPort();
    probe.close();

    Router router("T2TEST", RouterConfig());

    std::vector<PeerDescriptor> descriptors;
    descriptors.push_back(makeDescriptor("CORE-1", "127.0.0.1", port, 12345, true));

    PeerManager manager(&router, makeConfig("T2TEST"), descriptors);

    bool failed = false;
    for (uint32_t i = 0U; i < 500U && !failed; i++) {
        manager.clock(10U);
        failed = manager.getPeerStatus()[0U].failures > 0U;
        if (!failed)
            Thread::sleep(10U);
    }

    REQUIRE(failed);

    PeerStatus status = manager.getPeerStatus()[0U];
    REQUIRE(status.state == PeerState::BACKOFF);
    REQUIRE(status.lastError == SessionError::CONNECT_FAILED);
    REQUIRE(status.backoffMs > 0U);
    REQUIRE(status.backoffMs <= 1000U);

    manager.close();
    REQUIRE(manager.getPeerStatus()[0U].state == PeerState::BACKOFF);
}

TEST_CASE("PeerManager links two relays over loopback", "[relay][peer_manager]") {
    Router routerA("T2A", RouterConfig());
    Router routerB("T2B", RouterConfig());

    std::vector<PeerDescriptor> descriptorsB;
    descriptorsB.push_back(makeDescriptor("T2A", "127.0.0.1", 14579U, 4242, false));
    PeerManager managerB(&routerB, makeConfig("T2B"), descriptorsB);

    ConnectionListener listener("S2S", [&](tcp::Socket* socket) { managerB.acceptInbound(socket); });
    REQUIRE(listener.open("127.0.0.1", 0U));
    REQUIRE(listener.run());

    std::vector<PeerDescriptor> descriptorsA;
    descriptorsA.push_back(makeDescriptor("T2B", "127.0.0.1", listener.port(), 4242, true));
    PeerManager managerA(&routerA, makeConfig("T2A"), descriptorsA);

    bool linked = false;
    for (uint32_t i = 0U; i < 500U && !linked; i++) {
        managerA.clock(10U);
        managerB.clock(10U);
        linked = managerA.getPeerStatus()[0U].state == PeerState::CONNECTED &&
            managerB.getPeerStatus()[0U].state == PeerState::CONNECTED;
        if (!linked)
            Thread::sleep(10U);
    }

    REQUIRE(linked);
    REQUIRE(routerA.getStatus().peers == 1U);
    REQUIRE(routerB.getStatus().peers == 1U);

    listener.close();
    managerA.close();
    managerB.close();

    REQUIRE(routerA.getStatus().peers == 0U);
    REQUIRE(routerB.getStatus().peers == 0U);
}

TEST_CASE("PeerManager keeps one link when two relays dial each other", "[relay][peer_manager]") {
    Router routerA("T2A", RouterConfig());
    Router routerB("T2B", RouterConfig());

    PeerManager* managerA = nullptr;
    PeerManager* managerB = nullptr;

    ConnectionListener listenerA("S2S", [&](tcp::Socket* socket) {
        if (managerA != nullptr)
            managerA->acceptInbound(socket);
        else
            delete socket;
    });
    ConnectionListener listenerB("S2S", [&](tcp::Socket* socket) {
        if (managerB != nullptr)
            managerB->acceptInbound(socket);
        else
            delete socket;
    });
    REQUIRE(listenerA.open("127.0.0.1", 0U));
    REQUIRE(listenerB.open("127.0.0.1", 0U));

    std::vector<PeerDescriptor> descriptorsA;
    descriptorsA.push_back(makeDescriptor("T2B", "127.0.0.1", listenerB.port(), 4242, true));
    std::vector<PeerDescriptor> descriptorsB;
    descriptorsB.push_back(makeDescriptor("T2A", "127.0.0.1", listenerA.port(), 4242, true));

    managerA = new PeerManager(&routerA, makeConfig("T2A"), descriptorsA);
    managerB = new PeerManager(&routerB, makeConfig("T2B"), descriptorsB);

    REQUIRE(listenerA.run());
    REQUIRE(listenerB.run());

    bool linked = false;
    for (uint32_t i = 0U; i < 500U && !linked; i++) {
        managerA->clock(10U);
        managerB->clock(10U);
        linked = managerA->getPeerStatus()[0U].state == PeerState::CONNECTED &&
            managerB->getPeerStatus()[0U].state == PeerState::CONNECTED;
        if (!linked)
            Thread::sleep(10U);
    }

    REQUIRE(linked);

    // the link initiated by the lower server ID survives on both ends
    bool stable = true;
    for (uint32_t i = 0U; i < 300U; i++) {
        managerA->clock(10U);
        managerB->clock(10U);
        if (managerA->getPeerStatus()[0U].state != PeerState::CONNECTED ||
            managerB->getPeerStatus()[0U].state != PeerState::CONNECTED)
            stable = false;
        Thread::sleep(10U);
    }

    REQUIRE(stable);
    REQUIRE(routerA.getStatus().peers == 1U);
    REQUIRE(routerB.getStatus().peers == 1U);
    REQUIRE(managerA->getPeerStatus()[0U].connects == 1U);
    REQUIRE(managerB->getPeerStatus()[0U].connects == 1U);

    listenerA.close();
    listenerB.close();
    managerA->close();
    managerB->close();

    delete managerA;
    delete managerB;
}

TEST_CASE("PeerManager grows the backoff and resets it after a stable link", "[relay][peer_manager]") {
    tcp::TcpListener probe;
    REQUIRE(probe.open("127.0.0.1", 0U));
    uint16_t port = probe.localPort();
    probe.close();

    Router routerA("T2A", RouterConfig());
    Router routerB("T2B", RouterConfig());

    PeerManagerConfig configA = makeConfig("T2A");
    configA.backoffMin = 1U;
    configA.backoffMax = 4U;
    configA.backoffStable = 1U;

    std::vector<PeerDescriptor> descriptorsA;
    descriptorsA.push_back(makeDescriptor("T2B", "127.0.0.1", port, 4242, true));
    PeerManager managerA(&routerA, configA, descriptorsA);

    // nothing is listening; each failed attempt doubles the delay up to the maximum
    std::vector<uint32_t> delays;
    uint32_t failures = 0U;
    for (uint32_t i = 0U; i < 3000U && delays.size() < 4U; i++) {
        managerA.clock(100U);

        PeerStatus status = managerA.getPeerStatus()[0U];
        if (status.failures != failures) {
            failures = status.failures;
            REQUIRE(status.state == PeerState::BACKOFF);
            delays.push_back(status.backoffMs);
        }
        else {
            Thread::sleep(2U);
        }
    }

    REQUIRE(delays.size() == 4U);
    REQUIRE(delays[0U] == 1000U);
    REQUIRE(delays[1U] == 2000U);
    REQUIRE(delays[2U] == 4000U);
    REQUIRE(delays[3U] == 4000U);

    // bring the remote up and hold the link past the stable interval
    std::vector<PeerDescriptor> descriptorsB;
    descriptorsB.push_back(makeDescriptor("T2A", "127.0.0.1", 14579U, 4242, false));
    PeerManager managerB(&routerB, makeConfig("T2B"), descriptorsB);

    ConnectionListener listener("S2S", [&](tcp::Socket* socket) { managerB.acceptInbound(socket); });
    REQUIRE(listener.open("127.0.0.1", port));
    REQUIRE(listener.run());

    bool linked = false;
    for (uint32_t i = 0U; i < 1000U && !linked; i++) {
        managerA.clock(100U);
        managerB.clock(10U);
        linked = managerA.getPeerStatus()[0U].state == PeerState::CONNECTED;
        if (!linked)
            Thread::sleep(10U);
    }

    REQUIRE(linked);

    for (uint32_t i = 0U; i < 150U; i++) {
        managerA.clock(10U);
        managerB.clock(10U);
        Thread::sleep(10U);
    }

    REQUIRE(managerA.getPeerStatus()[0U].state == PeerState::CONNECTED);
    failures = managerA.getPeerStatus()[0U].failures;

    // dropping the stable link restarts the delay at the minimum
    listener.close();
    managerB.close();

    bool dropped = false;
    PeerStatus status;
    for (uint32_t i = 0U; i < 500U && !dropped; i++) {
        managerA.clock(1U);
        status = managerA.getPeerStatus()[0U];
        dropped = status.state == PeerState::BACKOFF;
        if (!dropped)
            Thread::sleep(10U);
    }

    REQUIRE(dropped);
    REQUIRE(status.lastError == SessionError::REMOTE_CLOSED);
    REQUIRE(status.failures == failures);
    REQUIRE(status.backoffMs == 1000U);

    managerA.close();
}

TEST_CASE("PeerManager resolves crossed links by server ID", "[relay][peer_manager]") {
    SECTION("the link initiated by the lower server ID replaces an inbound link") {
        Router router("T2A", RouterConfig());

        std::vector<PeerDescriptor> descriptors;
        descriptors.push_back(makeDescriptor("T2B", "192.0.2.2", 14579U, 4242, true));
        PeerManagerConfig config = makeConfig("T2A");
        PeerManager manager(&router, config, descriptors);

        PeerSession* inbound = new PeerSession(1U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session,
            PeerDescriptor(), -1, 64U);
        inbound->open();
        inbound->processLine("# aprsrelay 1.0.0 s2s T2B 4242 14579");
        REQUIRE(inbound->state() == SessionState::AUTHENTICATED);

        PeerSession* outbound = new PeerSession(2U, PeerRole::INITIATOR, nullptr, &router, &manager, config.session,
            descriptors[0U], 0, 64U);
        outbound->open();
        outbound->processLine("# aprsrelay 1.0.0 s2s T2B 4242 14579");

        REQUIRE(outbound->state() == SessionState::AUTHENTICATED);
        REQUIRE(inbound->isClosing());
        REQUIRE(inbound->closeReason() == SessionError::DUPLICATE_LINK);

        PeerStatus status = manager.getPeerStatus()[0U];
        REQUIRE(status.state == PeerState::CONNECTED);
        REQUIRE(status.connects == 1U);

        delete outbound;
        delete inbound;
    }

    SECTION("the link initiated by the higher server ID yields to an inbound link") {
        Router router("T2B", RouterConfig());

        std::vector<PeerDescriptor> descriptors;
        descriptors.push_back(makeDescriptor("T2A", "192.0.2.1", 14579U, 4242, true));
        PeerManagerConfig config = makeConfig("T2B");
        PeerManager manager(&router, config, descriptors);

        PeerSession* inbound = new PeerSession(1U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session,
            PeerDescriptor(), -1, 64U);
        inbound->open();
        inbound->processLine("# aprsrelay 1.0.0 s2s T2A 4242 14579");
        REQUIRE(inbound->state() == SessionState::AUTHENTICATED);

        PeerSession* outbound = new PeerSession(2U, PeerRole::INITIATOR, nullptr, &router, &manager, config.session,
            descriptors[0U], 0, 64U);
        outbound->open();
        outbound->processLine("# aprsrelay 1.0.0 s2s T2A 4242 14579");

        REQUIRE(outbound->isClosing());
        REQUIRE(outbound->closeReason() == SessionError::DUPLICATE_LINK);
        REQUIRE_FALSE(inbound->isClosing());
        REQUIRE(manager.getPeerStatus()[0U].connects == 1U);

        delete outbound;
        delete inbound;
    }

    SECTION("an inbound link from the lower server ID is admitted over an outbound link") {
        Router router("T2B", RouterConfig());

        std::vector<PeerDescriptor> descriptors;
        descriptors.push_back(makeDescriptor("T2A", "192.0.2.1", 14579U, 4242, true));
        PeerManagerConfig config = makeConfig("T2B");
        PeerManager manager(&router, config, descriptors);

        PeerSession* outbound = new PeerSession(1U, PeerRole::INITIATOR, nullptr, &router, &manager, config.session,
            descriptors[0U], 0, 64U);
        outbound->open();
        outbound->processLine("# aprsrelay 1.0.0 s2s T2A 4242 14579");
        REQUIRE(outbound->state() == SessionState::AUTHENTICATED);

        PeerSession* inbound = new PeerSession(2U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session,
            PeerDescriptor(), -1, 64U);
        inbound->open();
        inbound->processLine("# aprsrelay 1.0.0 s2s T2A 4242 14579");

        REQUIRE(inbound->state() == SessionState::AUTHENTICATED);
        REQUIRE(outbound->isClosing());
        REQUIRE(outbound->closeReason() == SessionError::DUPLICATE_LINK);

        delete inbound;
        delete outbound;
    }

    SECTION("an inbound link from the higher server ID is refused over an outbound link") {
        Router router("T2A", RouterConfig());

        std::vector<PeerDescriptor> descriptors;
        descriptors.push_back(makeDescriptor("T2B", "192.0.2.2", 14579U, 4242, true));
        PeerManagerConfig config = makeConfig("T2A");
        PeerManager manager(&router, config, descriptors);

        PeerSession* outbound = new PeerSession(1U, PeerRole::INITIATOR, nullptr, &router, &manager, config.session,
            descriptors[0U], 0, 64U);
        outbound->open();
        outbound->processLine("# aprsrelay 1.0.0 s2s T2B 4242 14579");
        REQUIRE(outbound->state() == SessionState::AUTHENTICATED);

        PeerSession* inbound = new PeerSession(2U, PeerRole::ACCEPTOR, nullptr, &router, &manager, config.session,
            PeerDescriptor(), -1, 64U);
        inbound->open();
        inbound->processLine("# aprsrelay 1.0.0 s2s T2B 4242 14579");

        REQUIRE(inbound->state() == SessionState::REJECTED);
        std::vector<std::string> out = inbound->takeOutbound();
        REQUIRE(out.size() == 1U);
        REQUIRE(out[0U] == "# s2s login rejected: already connected");
        REQUIRE_FALSE(outbound->isClosing());

        delete inbound;
        delete outbound;
    }
}
