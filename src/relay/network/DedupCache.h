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
 * @file DedupCache.h
 * @ingroup relay
 * @file DedupCache.cpp
 * @ingroup relay
 */
#if !defined(__DEDUP_CACHE_H__)
#define __DEDUP_CACHE_H__

#include "relay/Defines.h"

#include <deque>
#include <unordered_map>
#include <utility>

namespace network
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a time-bounded set of recently seen packet fingerprints.
     * @ingroup relay
     *
     * Entries are kept in insertion order; expiry and the size bound both evict from
     * the oldest end. The cache is not synchronized, the owning Router serializes access.
     */
    class RELAY_SW_API DedupCache {
    public:
        /**
         * @brief Initializes a new instance of the DedupCache class.
         * @param ttlMs Time an entry stays live, in milliseconds.
         * @param maxEntries Maximum number of entries.
         */
        DedupCache(uint64_t ttlMs, uint32_t maxEntries);

        /**
         * @brief Checks whether a fingerprint is a live duplicate; inserts it if not.
         * @param fingerprint Packet fingerprint.
         * @param now Current time, in milliseconds.
         * @returns bool True, if the fingerprint was seen within the window, otherwise false.
         */
        bool checkAndInsert(uint64_t fingerprint, uint64_t now);
        /**
         * @brief Checks whether a fingerprint is a live duplicate without inserting it.
         * @param fingerprint Packet fingerprint.
         * @param now Current time, in milliseconds.
         * @returns bool True, if the fingerprint was seen within the window, otherwise false.
         */
        bool contains(uint64_t fingerprint, uint64_t now) const;

        /**
         * @brief Purges expired entries.
         * @param now Current time, in milliseconds.
         * @returns uint32_t Number of entries purged.
         */
        uint32_t sweep(uint64_t now);

        /**
         * @brief Gets the number of entries in the cache.
         * @returns size_t Number of entries.
         */
        size_t size() const { return m_entries.size(); }

        /**
         * @brief Clears the cache.
         */
        void clear();

    public:
        /**
         * @brief Entry Time-to-Live (ms).
         */
        DECLARE_RO_PROPERTY_PLAIN(uint64_t, ttlMs);
        /**
         * @brief Maximum Entries.
         */
        DECLARE_RO_PROPERTY_PLAIN(uint32_t, maxEntries);

    private:
        std::unordered_map<uint64_t, uint64_t> m_entries;
        std::deque<std::pair<uint64_t, uint64_t>> m_order;

        /**
         * @brief Helper to evict the oldest entry.
         */
        void evictOldest();
    };
} // namespace network

#endif // __DEDUP_CACHE_H__
