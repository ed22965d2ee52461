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
#include "common/aprs/Packet.h"

using namespace aprs;
using namespace aprs::defines;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Packet decodes header, path and payload", "[aprs][packet]") {
    Packet pkt;
    REQUIRE(pkt.decode("N0CALL-9>APRS,WIDE1-1,WIDE2-1*,qAR,T2TEST:!4903.50N/07201.75W-Test\r\n") == PacketError::NONE);

    REQUIRE(pkt.source().encode() == "N0CALL-9");
    REQUIRE(pkt.destination().encode() == "APRS");
    REQUIRE(pkt.payload() == "!4903.50N/07201.75W-Test");

    REQUIRE(pkt.path().size() == 3U);
    REQUIRE(pkt.path()[0U].kind() == PathElementKind::HOP);
    REQUIRE(pkt.path()[0U].station().encode() == "WIDE1-1");
    REQUIRE_FALSE(pkt.path()[0U].used());
    REQUIRE(pkt.path()[1U].used());
    REQUIRE(pkt.path()[2U].kind() == PathElementKind::Q_CONSTRUCT);
    REQUIRE(pkt.path()[2U].q() == "qAR");
    REQUIRE(pkt.path()[2U].serverId() == "T2TEST");
}

TEST_CASE("Packet re-encodes to the original line", "[aprs][packet]") {
    const std::string line = "N0CALL-9>APRS,WIDE1-1,WIDE2-1*,qAS,CORE-1:>status text, with: colons";

    Packet pkt;
    REQUIRE(pkt.decode(line) == PacketError::NONE);
    REQUIRE(pkt.payload() == ">status text, with: colons");
    REQUIRE(pkt.encode() == line);
}

TEST_CASE("Packet rejects malformed lines", "[aprs][packet]") {
    Packet pkt;

    REQUIRE(pkt.decode("") == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode("N0CALL APRS payload") == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode(">APRS:payload") == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode("N0CALL>APRS:") == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode("N0CALL>APRS,,WIDE1-1:payload") == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode("N0CALL>APRS,qAR:payload") == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode(std::string("N0CALL>APRS:pay\rload")) == PacketError::MALFORMED_PACKET);
    REQUIRE(pkt.decode("N0CALL>APRS:" + std::string(MAX_LINE_LEN, 'x')) == PacketError::MALFORMED_PACKET);
}

TEST_CASE("Packet rejects bad station identifiers", "[aprs][packet]") {
    Packet pkt;

    REQUIRE(pkt.decode("N0CALL-99>APRS:payload") == PacketError::INVALID_CALLSIGN);
    REQUIRE(pkt.decode("N0CALL>AP_RS:payload") == PacketError::INVALID_CALLSIGN);
    REQUIRE(pkt.decode("N0CALL>APRS,WIDE1-1,BAD HOP:payload") == PacketError::INVALID_CALLSIGN);
    REQUIRE(pkt.decode("N0CALL>APRS,qAR,BAD_ID:payload") == PacketError::INVALID_CALLSIGN);
}

TEST_CASE("Packet enforces the path length limit", "[aprs][packet]") {
    Packet pkt;

    REQUIRE(pkt.decode("N0CALL>APRS,A,B,C:payload", 3U) == PacketError::NONE);
    REQUIRE(pkt.decode("N0CALL>APRS,A,B,C,D:payload", 3U) == PacketError::PATH_TOO_LONG);
}

TEST_CASE("Packet fingerprint ignores the path", "[aprs][packet]") {
    Packet a;
    Packet b;
    Packet c;

    REQUIRE(a.decode("N0CALL>APRS,WIDE1-1:payload") == PacketError::NONE);
    REQUIRE(b.decode("N0CALL>APRS,qAS,CORE-1:payload") == PacketError::NONE);
    REQUIRE(c.decode("N0CALL>APRS,WIDE1-1:other payload") == PacketError::NONE);

    REQUIRE(a.fingerprint() == b.fingerprint());
    REQUIRE(a.fingerprint() != c.fingerprint());
    REQUIRE(a != b);
}

TEST_CASE("Packet relay marker is added once and respects the path limit", "[aprs][packet]") {
    Packet pkt;
    REQUIRE(pkt.decode("N0CALL>APRS,WIDE1-1:payload") == PacketError::NONE);

    REQUIRE_FALSE(pkt.hasRelayMarker("T2TEST"));
    REQUIRE(pkt.addRelayMarker("t2test", DEFAULT_MAX_PATH));
    REQUIRE(pkt.hasRelayMarker("T2TEST"));
    REQUIRE(pkt.encode() == "N0CALL>APRS,WIDE1-1,qAS,T2TEST:payload");

    // marking twice leaves the path alone
    REQUIRE(pkt.addRelayMarker("T2TEST", DEFAULT_MAX_PATH));
    REQUIRE(pkt.path().size() == 2U);

    REQUIRE_FALSE(pkt.addRelayMarker("CORE-1", 2U));
    REQUIRE_FALSE(pkt.hasRelayMarker("CORE-1"));
}

TEST_CASE("Packet extracts message addressees", "[aprs][packet]") {
    Packet pkt;

    REQUIRE(pkt.decode("N0CALL>APRS::W1AW-5   :hello{01") == PacketError::NONE);
    REQUIRE(pkt.messageAddressee() == "W1AW-5");

    REQUIRE(pkt.decode("N0CALL>APRS:!4903.50N/07201.75W-") == PacketError::NONE);
    REQUIRE(pkt.messageAddressee().empty());
}
