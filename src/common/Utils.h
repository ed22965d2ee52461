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
 * @file Utils.h
 * @ingroup common
 * @file Utils.cpp
 * @ingroup common
 */
#if !defined(__UTILS_H__)
#define __UTILS_H__

#include "common/Defines.h"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Various string helper routines.
 * @ingroup common
 */
class RELAY_SW_API Utils {
public:
    /**
     * @brief Returns an ASCII uppercased copy of the given string.
     * @param str String to convert.
     * @returns std::string Uppercased string.
     */
    static std::string toUpper(const std::string& str);
    /**
     * @brief Returns a copy of the string with leading and trailing whitespace removed.
     * @param str String to trim.
     * @returns std::string Trimmed string.
     */
    static std::string trim(const std::string& str);
    /**
     * @brief Compares two strings, ignoring ASCII case.
     * @param a First string.
     * @param b Second string.
     * @returns bool True, if the strings are equal ignoring case, otherwise false.
     */
    static bool iequals(const std::string& a, const std::string& b);
    /**
     * @brief Checks whether the string begins with the given prefix, ignoring ASCII case.
     * @param str String to check.
     * @param prefix Prefix.
     * @returns bool True, if the string begins with the prefix, otherwise false.
     */
    static bool istartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Splits a string on the given delimiter; empty fields are kept.
     * @param str String to split.
     * @param delim Delimiter.
     * @returns std::vector<std::string> Fields.
     */
    static std::vector<std::string> split(const std::string& str, char delim);
    /**
     * @brief Splits a string into whitespace separated tokens; empty tokens are dropped.
     * @param str String to split.
     * @returns std::vector<std::string> Tokens.
     */
    static std::vector<std::string> tokenize(const std::string& str);

    /**
     * @brief Parses a signed decimal integer; the entire string must be consumed.
     * @param str String to parse.
     * @param value Parsed value.
     * @returns bool True, if the string was a valid integer, otherwise false.
     */
    static bool parseInt(const std::string& str, int32_t& value);
};

#endif // __UTILS_H__
