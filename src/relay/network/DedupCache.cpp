// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "network/DedupCache.h"

using namespace network;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the DedupCache class. */

DedupCache::DedupCache(uint64_t ttlMs, uint32_t maxEntries) :
    m_ttlMs(ttlMs),
    m_maxEntries(maxEntries),
    m_entries(),
    m_order()
{
    if (m_maxEntries == 0U)
        m_maxEntries = 1U;
}

/* Checks whether a fingerprint is a live duplicate; inserts it if not. */

bool DedupCache::checkAndInsert(uint64_t fingerprint, uint64_t now)
{
    auto it = m_entries.find(fingerprint);
    if (it != m_entries.end()) {
        if (now - it->second < m_ttlMs)
            return true;

        // stale; the deque entry for the old timestamp is skipped when it reaches the front
        it->second = now;
        m_order.push_back(std::make_pair(fingerprint, now));
        return false;
    }

    while (m_entries.size() >= m_maxEntries && !m_order.empty())
        evictOldest();

    m_entries[fingerprint] = now;
    m_order.push_back(std::make_pair(fingerprint, now));
    return false;
}

/* Checks whether a fingerprint is a live duplicate without inserting it. */

bool DedupCache::contains(uint64_t fingerprint, uint64_t now) const
{
    auto it = m_entries.find(fingerprint);
    if (it == m_entries.end())
        return false;

    return (now - it->second < m_ttlMs);
}

/* Purges expired entries. */

uint32_t DedupCache::sweep(uint64_t now)
{
    uint32_t purged = 0U;
    while (!m_order.empty()) {
        const std::pair<uint64_t, uint64_t>& front = m_order.front();
        if (now - front.second < m_ttlMs)
            break;

        auto it = m_entries.find(front.first);
        if (it != m_entries.end() && it->second == front.second) {
            m_entries.erase(it);
            purged++;
        }

        m_order.pop_front();
    }

    return purged;
}

/* Clears the cache. */

void DedupCache::clear()
{
    m_entries.clear();
    m_order.clear();
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Helper to evict the oldest entry. */

void DedupCache::evictOldest()
{
    const std::pair<uint64_t, uint64_t>& front = m_order.front();

    auto it = m_entries.find(front.first);
    if (it != m_entries.end() && it->second == front.second)
        m_entries.erase(it);

    m_order.pop_front();
}
