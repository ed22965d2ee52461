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
#include "network/ClientSession.h"
#include "network/PeerSession.h"
#include "network/Router.h"

using namespace network;
using namespace relay;

#include <catch2/catch_test_macros.hpp>

static ClientSession* loginClient(Router* router, uint32_t id, const std::string& login)
{
    ClientSessionConfig config;
    config.serverId = "T2TEST";

    ClientSession* session = new ClientSession(id, nullptr, router, config, 64U);
    session->open();
    session->processLine(login);
    REQUIRE(session->state() == SessionState::AUTHENTICATED);

    session->takeOutbound();
    return session;
}

static PeerSession* linkPeer(Router* router, uint32_t id, const std::string& peerName, bool receiveOnly = false)
{
    PeerSessionConfig config;
    config.serverId = "T2TEST";

    PeerDescriptor desc;
    desc.host = "127.0.0.1";
    desc.passcode = 12345;
    desc.peerName = peerName;
    desc.receiveOnly = receiveOnly;

    PeerSession* session = new PeerSession(id, PeerRole::INITIATOR, nullptr, router, nullptr, config, desc, 0, 64U);
    session->open();
    session->processLine("# aprsc 2.1.5 s2s " + peerName + " 12345 14579");
    REQUIRE(session->state() == SessionState::AUTHENTICATED);

    session->takeOutbound();
    return session;
}

static PeerSession* linkUplink(Router* router, uint32_t id)
{
    PeerSessionConfig config;
    config.serverId = "T2TEST";

    PeerDescriptor desc;
    desc.host = "rotate.example.net";
    desc.port = 14580U;
    desc.passcode = 13023;
    desc.peerName = "N0CALL";
    desc.uplink = true;

    PeerSession* session = new PeerSession(id, PeerRole::UPLINK, nullptr, router, nullptr, config, desc, 0, 64U);
    session->open();
    session->processLine("# logresp N0CALL verified, server T2EDGE");
    REQUIRE(session->state() == SessionState::AUTHENTICATED);

    session->takeOutbound();
    return session;
}

TEST_CASE("Router fans client packets out to other clients and peers", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* a = loginClient(&router, 1U, "user N0CALL pass 13023");
    ClientSession* b = loginClient(&router, 2U, "user W1AW pass 25988");
    PeerSession* peer = linkPeer(&router, 3U, "CORE-1");

    a->processLine("N0CALL>APRS,WIDE1-1:>hello");

    REQUIRE(a->takeOutbound().empty());

    std::vector<std::string> out = b->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "N0CALL>APRS,WIDE1-1:>hello");

    out = peer->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "N0CALL>APRS,WIDE1-1,qAS,T2TEST:>hello");

    RouterStatus status = router.getStatus();
    REQUIRE(status.clients == 2U);
    REQUIRE(status.peers == 1U);
    REQUIRE(status.packetsRx == 1U);
    REQUIRE(status.packetsTx == 2U);

    delete peer;
    delete b;
    delete a;
}

TEST_CASE("Router marks peer packets and never echoes them back", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* client = loginClient(&router, 1U, "user N0CALL pass 13023");
    PeerSession* core = linkPeer(&router, 2U, "CORE-1");
    PeerSession* edge = linkPeer(&router, 3U, "EDGE-2");

    core->processLine("W1AW>APRS:>from core");

    REQUIRE(core->takeOutbound().empty());

    std::vector<std::string> out = client->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "W1AW>APRS,qAS,CORE-1:>from core");

    out = edge->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "W1AW>APRS,qAS,CORE-1,qAS,T2TEST:>from core");

    delete edge;
    delete core;
    delete client;
}

TEST_CASE("Router skips peers that already relayed the packet", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    PeerSession* core = linkPeer(&router, 1U, "CORE-1");
    PeerSession* edge = linkPeer(&router, 2U, "EDGE-2");

    core->processLine("W1AW>APRS,qAS,EDGE-2:>seen by edge");
    REQUIRE(edge->takeOutbound().empty());

    delete edge;
    delete core;
}

TEST_CASE("Router drops loops and duplicates", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* client = loginClient(&router, 1U, "user N0CALL pass 13023");
    PeerSession* core = linkPeer(&router, 2U, "CORE-1");

    aprs::Packet looped;
    REQUIRE(looped.decode("W1AW>APRS,qAS,T2TEST:>loop") == aprs::defines::PacketError::NONE);
    REQUIRE(router.dispatch(looped, core) == DispatchResult::DROP_LOOP);

    aprs::Packet pkt;
    REQUIRE(pkt.decode("W1AW>APRS:>once") == aprs::defines::PacketError::NONE);
    REQUIRE(router.dispatch(pkt, core) == DispatchResult::DELIVERED);

    // a copy arriving over a different path is still a duplicate
    aprs::Packet copy;
    REQUIRE(copy.decode("W1AW>APRS,WIDE1-1:>once") == aprs::defines::PacketError::NONE);
    REQUIRE(router.dispatch(copy, client) == DispatchResult::DROP_DUPLICATE);

    REQUIRE(client->takeOutbound().size() == 1U);
    REQUIRE(core->takeOutbound().empty());

    RouterStatus status = router.getStatus();
    REQUIRE(status.loops == 1U);
    REQUIRE(status.duplicates == 1U);

    // the window expires
    for (uint32_t i = 0U; i < 31U; i++)
        router.clock(1000U);
    REQUIRE(router.dispatch(copy, client) == DispatchResult::DELIVERED);

    delete core;
    delete client;
}

TEST_CASE("Router keeps receive-only traffic local", "[relay][router]") {
    RouterConfig config;

    SECTION("dropped by default") {
        Router router("T2TEST", config);
        ClientSession* listener = loginClient(&router, 1U, "user W1AW pass 25988");
        ClientSession* ro = loginClient(&router, 2U, "user N0CALL pass -1");
        PeerSession* core = linkPeer(&router, 3U, "CORE-1");

        aprs::Packet pkt;
        REQUIRE(pkt.decode("N0CALL>APRS:>receive only") == aprs::defines::PacketError::NONE);
        REQUIRE(router.dispatch(pkt, ro) == DispatchResult::DROP_READONLY);
        REQUIRE(listener->takeOutbound().empty());
        REQUIRE(core->takeOutbound().empty());

        // the dropped copy does not suppress a later verified one
        REQUIRE(router.dispatch(pkt, listener) == DispatchResult::DELIVERED);
        REQUIRE(router.getStatus().readOnlyDrops == 1U);

        delete core;
        delete ro;
        delete listener;
    }

    SECTION("local delivery allowed") {
        config.allowReadOnlyLocal = true;
        Router router("T2TEST", config);
        ClientSession* listener = loginClient(&router, 1U, "user W1AW pass 25988");
        ClientSession* ro = loginClient(&router, 2U, "user N0CALL pass -1");
        PeerSession* core = linkPeer(&router, 3U, "CORE-1");

        ro->processLine("N0CALL>APRS:>receive only");
        REQUIRE(listener->takeOutbound().size() == 1U);
        REQUIRE(core->takeOutbound().empty());

        delete core;
        delete ro;
        delete listener;
    }
}

TEST_CASE("Router never sends to receive-only peers", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* client = loginClient(&router, 1U, "user N0CALL pass 13023");
    PeerSession* feed = linkPeer(&router, 2U, "FEED-1", true);

    client->processLine("N0CALL>APRS:>hello");
    REQUIRE(feed->takeOutbound().empty());

    // packets from the receive-only peer are still accepted
    feed->processLine("W1AW>APRS:>from feed");
    REQUIRE(client->takeOutbound().size() == 1U);

    delete feed;
    delete client;
}

TEST_CASE("Router uplink traffic", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* client = loginClient(&router, 1U, "user W1AW pass 25988");
    PeerSession* core = linkPeer(&router, 2U, "CORE-1");
    PeerSession* uplink = linkUplink(&router, 3U);

    RouterStatus status = router.getStatus();
    REQUIRE(status.uplinkConnected);
    REQUIRE(status.peers == 1U);

    // local client traffic goes upstream unmarked
    client->processLine("W1AW>APRS:>to upstream");
    std::vector<std::string> out = uplink->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "W1AW>APRS:>to upstream");
    core->takeOutbound();

    // upstream traffic only reaches local clients
    uplink->processLine("K1ABC>APRS,TCPIP*,qAC,T2EDGE:>from upstream");
    out = client->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "K1ABC>APRS,TCPIP*,qAC,T2EDGE:>from upstream");
    REQUIRE(core->takeOutbound().empty());

    // peer traffic is not forwarded upstream
    core->processLine("N0CALL>APRS:>from core");
    REQUIRE(uplink->takeOutbound().empty());

    delete uplink;
    delete core;
    delete client;
}

TEST_CASE("Router stops delivering to unregistered sessions", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* a = loginClient(&router, 1U, "user N0CALL pass 13023");
    ClientSession* b = loginClient(&router, 2U, "user W1AW pass 25988");

    router.unregisterSession(b);
    REQUIRE(router.getStatus().clients == 1U);

    a->processLine("N0CALL>APRS:>hello");
    REQUIRE(b->takeOutbound().empty());

    delete b;
    delete a;
}

TEST_CASE("Router local receive-only delivery does not block a verified copy", "[relay][router]") {
    RouterConfig config;
    config.allowReadOnlyLocal = true;
    Router router("T2TEST", config);

    ClientSession* listener = loginClient(&router, 1U, "user W1AW pass 25988");
    ClientSession* ro = loginClient(&router, 2U, "user N0CALL-9 pass -1");
    ClientSession* verified = loginClient(&router, 3U, "user N0CALL-5 pass 13023");
    PeerSession* core = linkPeer(&router, 4U, "CORE-1");

    ro->processLine("N0CALL-5>APRS,TCPIP*:>status test");
    REQUIRE(listener->takeOutbound().size() == 1U);
    REQUIRE(verified->takeOutbound().size() == 1U);
    REQUIRE(core->takeOutbound().empty());

    // the verified copy still leaves the node, without a second local delivery
    verified->processLine("N0CALL-5>APRS,TCPIP*:>status test");
    std::vector<std::string> out = core->takeOutbound();
    REQUIRE(out.size() == 1U);
    REQUIRE(out[0U] == "N0CALL-5>APRS,TCPIP*,qAS,T2TEST:>status test");
    REQUIRE(listener->takeOutbound().empty());
    REQUIRE(ro->takeOutbound().empty());

    // both caches now hold the packet
    aprs::Packet pkt;
    REQUIRE(pkt.decode("N0CALL-5>APRS,TCPIP*:>status test") == aprs::defines::PacketError::NONE);
    REQUIRE(router.dispatch(pkt, ro) == DispatchResult::DROP_DUPLICATE);
    REQUIRE(router.dispatch(pkt, verified) == DispatchResult::DROP_DUPLICATE);

    SECTION("a receive-only copy of a relayed packet is a duplicate") {
        aprs::Packet relayed;
        REQUIRE(relayed.decode("W1AW>APRS:>already relayed") == aprs::defines::PacketError::NONE);
        REQUIRE(router.dispatch(relayed, listener) == DispatchResult::DELIVERED);
        REQUIRE(router.dispatch(relayed, ro) == DispatchResult::DROP_DUPLICATE);
    }

    delete core;
    delete verified;
    delete ro;
    delete listener;
}

TEST_CASE("Router disconnects a slow consumer without affecting others", "[relay][router]") {
    Router router("T2TEST", RouterConfig());

    ClientSession* sender = loginClient(&router, 1U, "user N0CALL pass 13023");
    ClientSession* slow = loginClient(&router, 2U, "user W1AW pass 25988");
    PeerSession* core = linkPeer(&router, 3U, "CORE-1");

    // the slow client never drains; its queue holds 64 lines
    uint32_t delivered = 0U;
    for (uint32_t i = 0U; i < 70U; i++) {
        sender->processLine("N0CALL>APRS:>packet " + std::to_string(i));
        delivered += (uint32_t)core->takeOutbound().size();
    }

    REQUIRE(slow->isClosing());
    REQUIRE(slow->closeReason() == SessionError::QUEUE_OVERFLOW);
    REQUIRE(slow->queueSize() == 64U);

    REQUIRE_FALSE(core->isClosing());
    REQUIRE_FALSE(sender->isClosing());
    REQUIRE(delivered == 70U);

    delete core;
    delete slow;
    delete sender;
}
