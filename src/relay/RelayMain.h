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
 * @file RelayMain.h
 * @ingroup relay
 * @file RelayMain.cpp
 * @ingroup relay
 */
#if !defined(__RELAY_MAIN_H__)
#define __RELAY_MAIN_H__

#include "Defines.h"

#include <string>

// ---------------------------------------------------------------------------
//  Externs
// ---------------------------------------------------------------------------

/** @brief Last received signal. */
extern int g_signal;
/** @brief Program executable name. */
extern std::string g_progExe;
/** @brief Configuration file. */
extern std::string g_iniFile;

/** @brief (Global) Flag indicating foreground operation. */
extern bool g_foreground;
/** @brief (Global) Flag indicating the relay should stop immediately. */
extern bool g_killed;

/**
 * @brief Helper to print a fatal error message and exit.
 * @note This is a variable argument function.
 * @param msg Message.
 */
extern RELAY_SW_API void fatal(const char* msg, ...);

#endif // __RELAY_MAIN_H__
