// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "Utils.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Returns an ASCII uppercased copy of the given string. */

std::string Utils::toUpper(const std::string& str)
{
    std::string ret = str;
    for (char& c : ret)
        c = (char)::toupper((unsigned char)c);

    return ret;
}

/* Returns a copy of the string with leading and trailing whitespace removed. */

std::string Utils::trim(const std::string& str)
{
    size_t start = 0U;
    while (start < str.length() && ::isspace((unsigned char)str[start]))
        start++;

    size_t end = str.length();
    while (end > start && ::isspace((unsigned char)str[end - 1U]))
        end--;

    return str.substr(start, end - start);
}

/* Compares two strings, ignoring ASCII case. */

bool Utils::iequals(const std::string& a, const std::string& b)
{
    if (a.length() != b.length())
        return false;

    for (size_t i = 0U; i < a.length(); i++) {
        if (::toupper((unsigned char)a[i]) != ::toupper((unsigned char)b[i]))
            return false;
    }

    return true;
}

/* Checks whether the string begins with the given prefix, ignoring ASCII case. */

bool Utils::istartsWith(const std::string& str, const std::string& prefix)
{
    if (str.length() < prefix.length())
        return false;

    return iequals(str.substr(0U, prefix.length()), prefix);
}

/* Splits a string on the given delimiter; empty fields are kept. */

std::vector<std::string> Utils::split(const std::string& str, char delim)
{
    std::vector<std::string> fields;

    size_t start = 0U;
    while (true) {
        size_t pos = str.find(delim, start);
        if (pos == std::string::npos) {
            fields.push_back(str.substr(start));
            break;
        }

        fields.push_back(str.substr(start, pos - start));
        start = pos + 1U;
    }

    return fields;
}

/* Splits a string into whitespace separated tokens; empty tokens are dropped. */

std::vector<std::string> Utils::tokenize(const std::string& str)
{
    std::vector<std::string> tokens;

    size_t i = 0U;
    while (i < str.length()) {
        while (i < str.length() && ::isspace((unsigned char)str[i]))
            i++;
        if (i >= str.length())
            break;

        size_t start = i;
        while (i < str.length() && !::isspace((unsigned char)str[i]))
            i++;

        tokens.push_back(str.substr(start, i - start));
    }

    return tokens;
}

/* Parses a signed decimal integer; the entire string must be consumed. */

bool Utils::parseInt(const std::string& str, int32_t& value)
{
    if (str.empty())
        return false;

    errno = 0;
    char* end = nullptr;
    long v = ::strtol(str.c_str(), &end, 10);
    if (errno != 0 || end == str.c_str() || *end != '\0')
        return false;
    if (v < INT32_MIN || v > INT32_MAX)
        return false;

    value = (int32_t)v;
    return true;
}
