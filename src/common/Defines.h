// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2025 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @defgroup common Common Library
 * @brief Defines and implements the common library shared by the relay daemon and tests.
 *
 * @file Defines.h
 * @ingroup common
 */
#if !defined(__COMMON_DEFINES_H__)
#define __COMMON_DEFINES_H__

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#ifndef __GIT_VER__
#define __GIT_VER__ "00000000"
#endif
#ifndef __GIT_VER_HASH__
#define __GIT_VER_HASH__ "00000000"
#endif

#define __PROG_NAME__ "APRS-IS Relay"
#define __EXE_NAME__ "aprsrelay"

#define VERSION_MAJOR "01"
#define VERSION_MINOR "00"
#define VERSION_REV "A"

#define __NETVER__ "APRSRELAY" VERSION_MAJOR VERSION_REV VERSION_MINOR

#define __SW_VER__ "1.0.0"
#define __VER__ VERSION_MAJOR "." VERSION_MINOR VERSION_REV " (R" VERSION_MAJOR VERSION_REV VERSION_MINOR " " __GIT_VER__ ")"

#define __BUILD__ __DATE__ " " __TIME__

#define __BANNER__ "\r\n" \
"    _   ___ ___  ___   ___ ___   ___     _           \r\n" \
"   /_\\ | _ \\ _ \\/ __| |_ _/ __| | _ \\___| |__ _ _  _ \r\n" \
"  / _ \\|  _/   /\\__ \\  | |\\__ \\ |   / -_) / _` | || |\r\n" \
" /_/ \\_\\_| |_|_\\|___/ |___|___/ |_|_\\___|_\\__,_|\\_, |\r\n" \
"                                                |__/ \r\n"

#define RELAY_SW_API

#if !defined(__forceinline)
#define __forceinline __attribute__((always_inline)) inline
#endif

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

/**
 * @brief Declares a private property with read-only accessor.
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 */
#define DECLARE_RO_PROPERTY_PLAIN(type, variableName)                                   \
        private: type m_##variableName;                                                 \
        public: __forceinline type variableName(void) const { return m_##variableName; }
/**
 * @brief Declares a protected property with read-only accessor.
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 * @param propName Property name (used to build the accessor name).
 */
#define DECLARE_PROTECTED_RO_PROPERTY(type, variableName, propName)                     \
        protected: type m_##variableName;                                               \
        public: __forceinline type get##propName(void) const { return m_##variableName; }

/**
 * @brief Declares a private property with get and set accessors.
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 */
#define DECLARE_PROPERTY_PLAIN(type, variableName)                                      \
        private: type m_##variableName;                                                 \
        public: __forceinline type variableName(void) const { return m_##variableName; } \
                __forceinline void variableName(type val) { m_##variableName = val; }
/**
 * @brief Declares a private property with get and set accessors.
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 * @param propName Property name (used to build the accessor name).
 */
#define DECLARE_PROPERTY(type, variableName, propName)                                  \
        private: type m_##variableName;                                                 \
        public: __forceinline type get##propName(void) const { return m_##variableName; } \
                __forceinline void set##propName(type val) { m_##variableName = val; }

#endif // __COMMON_DEFINES_H__
