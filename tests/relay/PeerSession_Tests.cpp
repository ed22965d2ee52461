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
#include "network/PeerSession.h"
#include "network/Router.h"

using namespace network;
using namespace relay;

#include <catch2/catch_test_macros.hpp>

static PeerSessionConfig makeConfig()
{
    PeerSessionConfig config;
    config.serverId = "t2test";
    config.s2sPort = 14579U;
    config.heartbeat = 30U;
    config.idleTimeout = 120U;
    config.handshakeTimeout = 20U;
    return config;
}

static PeerDescriptor makeDescriptor()
{
    PeerDescriptor desc;
    desc.host = "127.0.0.1";
    desc.port = 14579U;
    desc.passcode = 12345;
    desc.peerName = "CORE-1";
    return desc;
}

TEST_CASE("PeerSession builds the S2S login line", "[relay][peer_session]") {
    REQUIRE(PeerSession::s2sLoginLine("T2TEST", 12345, 14579U) == "# aprsrelay 1.0.0 s2s T2TEST 12345 14579");
}

TEST_CASE("PeerSession initiator login exchange", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());
    PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
    REQUIRE(session.address() == "127.0.0.1:14579");

    REQUIRE(session.open());
    REQUIRE(session.linkState() == PeerState::HANDSHAKING);
    REQUIRE(session.state() == SessionState::AWAITING_LOGIN);

    std::vector<std::string> out = session.takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "# aprsrelay 1.0.0 s2s T2TEST 12345 14579");

    // server banners ahead of the acknowledgement are ignored
    session.processLine("# aprsc 2.1.5");
    REQUIRE(session.state() == SessionState::AWAITING_LOGIN);

    session.processLine("# aprsc 2.1.5 s2s core-1 12345 14579");
    REQUIRE(session.state() == SessionState::AUTHENTICATED);
    REQUIRE(session.linkState() == PeerState::CONNECTED);
    REQUIRE(session.remoteId() == "CORE-1");
    REQUIRE(router.getStatus().peers == 1U);
}

TEST_CASE("PeerSession initiator rejects bad acknowledgements", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());

    SECTION("passcode mismatch") {
        PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
        session.open();
        session.processLine("# aprsc 2.1.5 s2s CORE-1 54321 14579");
        REQUIRE(session.state() == SessionState::REJECTED);
        REQUIRE(session.closeReason() == SessionError::AUTH_FAILED);
    }

    SECTION("unexpected identity") {
        PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
        session.open();
        session.processLine("# aprsc 2.1.5 s2s CORE-9 12345 14579");
        REQUIRE(session.state() == SessionState::REJECTED);
    }

    SECTION("remote rejection") {
        PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
        session.open();
        session.processLine("# s2s login rejected: bad passcode");
        REQUIRE(session.state() == SessionState::REJECTED);
        REQUIRE(session.closeReason() == SessionError::AUTH_FAILED);
    }

    REQUIRE(router.getStatus().peers == 0U);
}

TEST_CASE("PeerSession handshake timeout", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());
    PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
    session.open();

    session.clock(19000U);
    REQUIRE_FALSE(session.isClosing());

    session.clock(2000U);
    REQUIRE(session.isClosing());
    REQUIRE(session.closeReason() == SessionError::HANDSHAKE_TIMEOUT);
}

TEST_CASE("PeerSession keepalive and idle timeout", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());
    PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
    session.open();
    session.processLine("# aprsc 2.1.5 s2s CORE-1 12345 14579");
    session.takeOutbound();

    session.clock(31000U);
    std::vector<std::string> out = session.takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "# keepalive T2TEST");
    REQUIRE(session.connectedMs() == 31000U);

    // remote keepalives count as traffic
    session.processLine("# keepalive CORE-1");
    session.clock(119000U);
    REQUIRE_FALSE(session.isClosing());

    session.clock(2000U);
    REQUIRE(session.isClosing());
    REQUIRE(session.closeReason() == SessionError::PEER_IDLE);
}

TEST_CASE("PeerSession drops bad packets without disconnecting", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());
    PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
    session.open();
    session.processLine("# aprsc 2.1.5 s2s CORE-1 12345 14579");

    for (uint32_t i = 0U; i < 20U; i++)
        session.processLine("not a packet");

    REQUIRE_FALSE(session.isClosing());
    REQUIRE(session.dropped() == 20U);

    session.processLine("N0CALL>APRS:>fine");
    REQUIRE(session.rxPackets() == 1U);
}

TEST_CASE("PeerSession acceptor without a peer table rejects logins", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());

    SECTION("unknown peer") {
        PeerSession session(1U, PeerRole::ACCEPTOR, nullptr, &router, nullptr, makeConfig(), PeerDescriptor(), -1, 16U);
        REQUIRE(session.open());
        REQUIRE(session.takeOutbound().empty());

        session.processLine("# aprsc 2.1.5 s2s CORE-1 12345 14579");
        REQUIRE(session.state() == SessionState::REJECTED);

        std::vector<std::string> out = session.takeOutbound();
        REQUIRE(out.size() == 1U);
        REQUIRE(out[0U] == "# s2s login rejected: unknown peer");
    }

    SECTION("malformed login") {
        PeerSession session(1U, PeerRole::ACCEPTOR, nullptr, &router, nullptr, makeConfig(), PeerDescriptor(), -1, 16U);
        session.open();

        session.processLine("user N0CALL pass 13023");
        REQUIRE(session.state() == SessionState::REJECTED);

        std::vector<std::string> out = session.takeOutbound();
        REQUIRE(out.size() == 1U);
        REQUIRE(out[0U] == "# s2s login rejected: malformed login");
    }
}

TEST_CASE("PeerSession uplink login", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());

    PeerDescriptor desc;
    desc.host = "rotate.example.net";
    desc.port = 14580U;
    desc.passcode = -1;
    desc.peerName = "n0call";
    desc.uplink = true;

    PeerSession session(1U, PeerRole::UPLINK, nullptr, &router, nullptr, makeConfig(), desc, 0, 16U);
    REQUIRE(session.kind() == SessionKind::UPLINK);
    session.open();

    std::vector<std::string> out = session.takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "user N0CALL pass -1 vers aprsrelay 1.0.0");

    session.processLine("# aprsc 2.1.5 22 Mar 2026 10:00:00 GMT T2EDGE 10.0.0.1:14580");
    REQUIRE(session.state() == SessionState::AWAITING_LOGIN);

    session.processLine("# logresp N0CALL unverified, server T2EDGE");
    REQUIRE(session.state() == SessionState::AUTHENTICATED);
    REQUIRE(session.remoteId() == "T2EDGE");
    REQUIRE(router.getStatus().uplinkConnected);

    // upstream packets are passed through unmarked
    session.processLine("K1ABC>APRS,TCPIP*,qAC,T2EDGE:>status");
    REQUIRE(session.rxPackets() == 1U);
}

TEST_CASE("PeerSession initiator yields when the remote is already connected", "[relay][peer_session]") {
    Router router("T2TEST", RouterConfig());
    PeerSession session(1U, PeerRole::INITIATOR, nullptr, &router, nullptr, makeConfig(), makeDescriptor(), 0, 16U);
    session.open();

    session.processLine("# s2s login rejected: already connected");
    REQUIRE(session.state() == SessionState::REJECTED);
    REQUIRE(session.isClosing());
    REQUIRE(session.closeReason() == SessionError::DUPLICATE_LINK);
}
