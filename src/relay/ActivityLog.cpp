// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "ActivityLog.h"
#include "common/Log.h" // for CurrentLogFileLevel() and g_logDisplayLevel

#include <cstdio>
#include <ctime>
#include <mutex>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define EOL    "\r\n"

// ---------------------------------------------------------------------------
//  Global Variables
// ---------------------------------------------------------------------------

static std::string g_actFilePath;
static std::string g_actFileRoot;

static FILE* g_actFpLog = nullptr;

static struct tm g_actTm;

static std::mutex g_actLogMutex;

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Helper to open the activity log file, file handle. */

static bool ActivityLogOpen()
{
    if (CurrentLogFileLevel() == 0U)
        return true;

    time_t now;
    ::time(&now);

    struct tm* tm = ::gmtime(&now);

    if (tm->tm_mday == g_actTm.tm_mday && tm->tm_mon == g_actTm.tm_mon && tm->tm_year == g_actTm.tm_year) {
        if (g_actFpLog != nullptr)
            return true;
    }
    else {
        if (g_actFpLog != nullptr) {
            ::fclose(g_actFpLog);
            g_actFpLog = nullptr;
        }
    }

    char filename[300U];
    ::snprintf(filename, sizeof(filename), "%s/%s-%04d-%02d-%02d.activity.log", g_actFilePath.c_str(), g_actFileRoot.c_str(),
        tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday);

    g_actFpLog = ::fopen(filename, "a+t");
    g_actTm = *tm;

    return g_actFpLog != nullptr;
}

/* Initializes the activity log. */

bool ActivityLogInitialise(const std::string& filePath, const std::string& fileRoot)
{
#if defined(CATCH2_TEST_COMPILATION)
    return true;
#endif
    std::lock_guard<std::mutex> lock(g_actLogMutex);
    g_actFilePath = filePath;
    g_actFileRoot = fileRoot;

    return ::ActivityLogOpen();
}

/* Finalizes the activity log. */

void ActivityLogFinalise()
{
#if defined(CATCH2_TEST_COMPILATION)
    return;
#endif
    std::lock_guard<std::mutex> lock(g_actLogMutex);
    if (g_actFpLog != nullptr) {
        ::fclose(g_actFpLog);
        g_actFpLog = nullptr;
    }
}

/* Writes a new entry to the activity log. */

void log_internal::ActivityLogInternal(const std::string& log)
{
#if defined(CATCH2_TEST_COMPILATION)
    return;
#endif
    std::lock_guard<std::mutex> lock(g_actLogMutex);
    bool ret = ::ActivityLogOpen();
    if (!ret)
        return;

    if (CurrentLogFileLevel() == 0U)
        return;

    ::fprintf(g_actFpLog, "%s\n", log.c_str());
    ::fflush(g_actFpLog);

    if (2U >= g_logDisplayLevel && g_logDisplayLevel != 0U) {
        ::fprintf(stdout, "%s" EOL, log.c_str());
        ::fflush(stdout);
    }
}
