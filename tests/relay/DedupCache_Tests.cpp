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
#include "network/DedupCache.h"

using namespace network;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("DedupCache reports repeats within the window", "[relay][dedup]") {
    DedupCache cache(30000U, 100U);

    REQUIRE_FALSE(cache.checkAndInsert(0x1234U, 0U));
    REQUIRE(cache.checkAndInsert(0x1234U, 1000U));
    REQUIRE(cache.checkAndInsert(0x1234U, 29999U));
    REQUIRE_FALSE(cache.checkAndInsert(0x5678U, 29999U));
    REQUIRE(cache.size() == 2U);
}

TEST_CASE("DedupCache accepts a repeat after the window", "[relay][dedup]") {
    DedupCache cache(30000U, 100U);

    REQUIRE_FALSE(cache.checkAndInsert(0x1234U, 0U));
    REQUIRE_FALSE(cache.checkAndInsert(0x1234U, 30000U));

    // the refreshed entry starts a new window
    REQUIRE(cache.checkAndInsert(0x1234U, 45000U));
}

TEST_CASE("DedupCache sweep purges expired entries only", "[relay][dedup]") {
    DedupCache cache(30000U, 100U);

    cache.checkAndInsert(1U, 0U);
    cache.checkAndInsert(2U, 10000U);
    cache.checkAndInsert(3U, 20000U);

    REQUIRE(cache.sweep(35000U) == 1U);
    REQUIRE(cache.size() == 2U);
    REQUIRE(cache.sweep(50000U) == 2U);
    REQUIRE(cache.size() == 0U);
}

TEST_CASE("DedupCache sweep skips refreshed entries", "[relay][dedup]") {
    DedupCache cache(30000U, 100U);

    cache.checkAndInsert(1U, 0U);
    cache.checkAndInsert(1U, 40000U);

    REQUIRE(cache.sweep(45000U) == 0U);
    REQUIRE(cache.size() == 1U);
    REQUIRE(cache.checkAndInsert(1U, 45000U));
}

TEST_CASE("DedupCache evicts the oldest entry when full", "[relay][dedup]") {
    DedupCache cache(30000U, 2U);

    cache.checkAndInsert(1U, 0U);
    cache.checkAndInsert(2U, 100U);
    cache.checkAndInsert(3U, 200U);

    REQUIRE(cache.size() == 2U);
    REQUIRE_FALSE(cache.checkAndInsert(1U, 300U));
    REQUIRE(cache.checkAndInsert(3U, 300U));

    cache.clear();
    REQUIRE(cache.size() == 0U);
}
