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
#include "network/ReconnectBackoff.h"

using namespace network;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("ReconnectBackoff doubles up to the maximum", "[relay][backoff]") {
    ReconnectBackoff backoff(1000U, 10000U, 300000U);

    REQUIRE(backoff.next() == 1000U);
    REQUIRE(backoff.next() == 2000U);
    REQUIRE(backoff.next() == 4000U);
    REQUIRE(backoff.next() == 8000U);
    REQUIRE(backoff.next() == 10000U);
    REQUIRE(backoff.next() == 10000U);
}

TEST_CASE("ReconnectBackoff resets to the minimum", "[relay][backoff]") {
    ReconnectBackoff backoff(1000U, 60000U, 300000U);

    backoff.next();
    backoff.next();
    REQUIRE(backoff.current() == 4000U);

    backoff.reset();
    REQUIRE(backoff.next() == 1000U);
}

TEST_CASE("ReconnectBackoff stable link threshold", "[relay][backoff]") {
    ReconnectBackoff backoff(1000U, 60000U, 300000U);

    REQUIRE_FALSE(backoff.isStable(299999U));
    REQUIRE(backoff.isStable(300000U));
}

TEST_CASE("ReconnectBackoff clamps its bounds", "[relay][backoff]") {
    ReconnectBackoff backoff(0U, 0U, 0U);

    REQUIRE(backoff.minMs() == 1U);
    REQUIRE(backoff.maxMs() == 1U);
    REQUIRE(backoff.next() == 1U);
    REQUIRE(backoff.next() == 1U);
}
