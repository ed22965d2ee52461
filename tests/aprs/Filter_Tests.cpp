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
#include "common/aprs/Filter.h"

using namespace aprs;
using namespace aprs::defines;

#include <catch2/catch_test_macros.hpp>

static Packet makePacket(const std::string& line)
{
    Packet pkt;
    REQUIRE(pkt.decode(line) == PacketError::NONE);
    return pkt;
}

TEST_CASE("Empty filter passes everything", "[aprs][filter]") {
    Filter filter;
    std::string error;

    REQUIRE(Filter::parse("", filter, error));
    REQUIRE(filter.isEmpty());
    REQUIRE(filter.matches(makePacket("N0CALL>APRS:payload")));
}

TEST_CASE("Prefix filter matches source callsigns", "[aprs][filter]") {
    Filter filter;
    std::string error;
    REQUIRE(Filter::parse("p/N0/W1", filter, error));

    REQUIRE(filter.matches(makePacket("N0CALL-9>APRS:payload")));
    REQUIRE(filter.matches(makePacket("W1AW>APRS:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("K1ABC>APRS:payload")));
}

TEST_CASE("Buddy, digi and unproto filters", "[aprs][filter]") {
    Filter filter;
    std::string error;

    REQUIRE(Filter::parse("b/N0CALL*", filter, error));
    REQUIRE(filter.matches(makePacket("N0CALL-9>APRS:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("W1AW>APRS:payload")));

    REQUIRE(Filter::parse("d/WIDE2-1", filter, error));
    REQUIRE(filter.matches(makePacket("W1AW>APRS,WIDE1-1,WIDE2-1*:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("W1AW>APRS,WIDE1-1:payload")));

    REQUIRE(Filter::parse("u/APRS", filter, error));
    REQUIRE(filter.matches(makePacket("W1AW>APRS:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("W1AW>APDW16:payload")));
}

TEST_CASE("Exclusion terms override inclusions", "[aprs][filter]") {
    Filter filter;
    std::string error;
    REQUIRE(Filter::parse("p/N0 -b/N0CALL-9", filter, error));

    REQUIRE(filter.matches(makePacket("N0XYZ>APRS:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("N0CALL-9>APRS:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("W1AW>APRS:payload")));

    // exclusions alone pass everything else
    REQUIRE(Filter::parse("-p/N0", filter, error));
    REQUIRE(filter.matches(makePacket("W1AW>APRS:payload")));
    REQUIRE_FALSE(filter.matches(makePacket("N0XYZ>APRS:payload")));
}

TEST_CASE("Catch-all filter forms", "[aprs][filter]") {
    Filter filter;
    std::string error;

    REQUIRE(Filter::parse("all", filter, error));
    REQUIRE(filter.matches(makePacket("W1AW>APRS:payload")));

    REQUIRE(Filter::parse("a/*", filter, error));
    REQUIRE(filter.matches(makePacket("W1AW>APRS:payload")));
}

TEST_CASE("Invalid filters leave the previous filter intact", "[aprs][filter]") {
    Filter filter;
    std::string error;
    REQUIRE(Filter::parse("p/N0", filter, error));

    REQUIRE_FALSE(Filter::parse("r/49/-72/50", filter, error));
    REQUIRE_FALSE(error.empty());
    REQUIRE_FALSE(Filter::parse("p", filter, error));
    REQUIRE_FALSE(Filter::parse("p//N0", filter, error));
    REQUIRE_FALSE(Filter::parse("a/49/-72/48/-71", filter, error));

    REQUIRE(filter.expression() == "p/N0");
    REQUIRE_FALSE(filter.matches(makePacket("W1AW>APRS:payload")));
}
