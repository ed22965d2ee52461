// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file Filter.h
 * @ingroup aprs
 * @file Filter.cpp
 * @ingroup aprs
 */
#if !defined(__APRS__FILTER_H__)
#define  __APRS__FILTER_H__

#include "common/Defines.h"
#include "common/aprs/AprsDefines.h"
#include "common/aprs/Packet.h"

#include <string>
#include <vector>

namespace aprs
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the client server-side filter.
     * @ingroup aprs
     *
     * A filter is a whitespace separated list of terms:
     *  p/A/B      source callsign prefix
     *  b/C1/C2*   source station (trailing '*' is a wildcard)
     *  d/D1/D2*   any path hop
     *  u/U1/U2*   destination
     *  a/* | all  everything
     *
     * A leading '-' turns a term into an exclusion. A packet passes when no exclusion
     * matches and either an inclusion matches or no inclusions are present. The empty
     * filter passes everything. Terms that need payload decoding (range, area, type, ...)
     * are rejected.
     */
    class RELAY_SW_API Filter {
    public:
        /**
         * @brief Initializes a new instance of the Filter class.
         */
        Filter();

        /**
         * @brief Parses a filter expression.
         * @param expr Filter expression.
         * @param filter Parsed filter; untouched on failure.
         * @param error Reason the expression was rejected.
         * @returns bool True, if the expression was valid, otherwise false.
         */
        static bool parse(const std::string& expr, Filter& filter, std::string& error);

        /**
         * @brief Checks whether a packet passes the filter.
         * @param pkt Packet.
         * @returns bool True, if the packet passes, otherwise false.
         */
        bool matches(const Packet& pkt) const;

        /**
         * @brief Flag indicating whether the filter has no terms.
         * @returns bool True, if the filter is empty, otherwise false.
         */
        bool isEmpty() const { return m_terms.empty(); }

    public:
        /**
         * @brief Normalized filter expression.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, expression);

    private:
        /**
         * @brief Represents a single filter term.
         */
        struct FilterTerm {
            defines::FilterType::ENUM type;
            bool exclude;
            std::vector<std::string> args;
        };

        std::vector<FilterTerm> m_terms;

        /**
         * @brief Checks whether a single term matches a packet.
         * @param term Filter term.
         * @param pkt Packet.
         * @returns bool True, if the term matches, otherwise false.
         */
        static bool termMatches(const FilterTerm& term, const Packet& pkt);
    };
} // namespace aprs

#endif // __APRS__FILTER_H__
