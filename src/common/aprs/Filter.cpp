// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "common/aprs/Filter.h"
#include "common/Utils.h"

using namespace aprs;
using namespace aprs::defines;

#include <cctype>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Filter class. */

Filter::Filter() :
    m_expression(),
    m_terms()
{
    /* stub */
}

/* Parses a filter expression. */

bool Filter::parse(const std::string& expr, Filter& filter, std::string& error)
{
    std::vector<std::string> tokens = Utils::tokenize(expr);
    std::vector<FilterTerm> terms;

    for (const std::string& token : tokens) {
        std::string text = token;

        FilterTerm term;
        term.type = FilterType::ALL;
        term.exclude = false;
        if (text[0U] == '-') {
            term.exclude = true;
            text = text.substr(1U);
        }

        if (Utils::iequals(text, "all")) {
            terms.push_back(term);
            continue;
        }

        if (text.length() < 3U || text[1U] != '/') {
            error = "bad term " + token;
            return false;
        }

        std::vector<std::string> args = Utils::split(Utils::toUpper(text.substr(2U)), '/');
        for (const std::string& arg : args) {
            if (arg.empty()) {
                error = "empty argument in " + token;
                return false;
            }
        }

        switch (::tolower((unsigned char)text[0U])) {
        case 'p':
            term.type = FilterType::PREFIX;
            break;
        case 'b':
            term.type = FilterType::BUDDY;
            break;
        case 'd':
            term.type = FilterType::DIGI;
            break;
        case 'u':
            term.type = FilterType::UNPROTO;
            break;
        case 'a':
            // only the catch-all form is supported; a/lat/lon/... is an area filter
            if (args.size() != 1U || args[0U] != "*") {
                error = "unsupported filter " + token;
                return false;
            }
            term.type = FilterType::ALL;
            break;
        default:
            error = "unsupported filter " + token;
            return false;
        }

        if (term.type != FilterType::ALL)
            term.args = args;
        terms.push_back(term);
    }

    std::string normalized;
    for (const std::string& token : tokens) {
        if (!normalized.empty())
            normalized += " ";
        normalized += token;
    }

    filter.m_terms = terms;
    filter.m_expression = normalized;
    return true;
}

/* Checks whether a packet passes the filter. */

bool Filter::matches(const Packet& pkt) const
{
    bool hasInclusion = false;
    bool included = false;

    for (const FilterTerm& term : m_terms) {
        bool match = termMatches(term, pkt);
        if (term.exclude) {
            if (match)
                return false;
            continue;
        }

        hasInclusion = true;
        if (match)
            included = true;
    }

    return !hasInclusion || included;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Checks whether a single term matches a packet. */

bool Filter::termMatches(const FilterTerm& term, const Packet& pkt)
{
    if (term.type == FilterType::ALL)
        return true;

    for (const std::string& arg : term.args) {
        switch (term.type) {
        case FilterType::PREFIX:
            if (pkt.source().callsign().compare(0U, arg.length(), arg) == 0)
                return true;
            break;
        case FilterType::BUDDY:
            if (pkt.source().matches(arg))
                return true;
            break;
        case FilterType::DIGI:
            for (const PathElement& elem : pkt.path()) {
                if (elem.kind() == PathElementKind::HOP && elem.station().matches(arg))
                    return true;
            }
            break;
        case FilterType::UNPROTO:
            if (pkt.destination().matches(arg))
                return true;
            break;
        default:
            break;
        }
    }

    return false;
}
