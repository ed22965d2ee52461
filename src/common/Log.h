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
 * @defgroup logging Logging Routines
 * @brief Defines and implements logging routines.
 * @ingroup common
 *
 * @file Log.h
 * @ingroup logging
 * @file Log.cpp
 * @ingroup logging
 */
#if !defined(__LOG_H__)
#define __LOG_H__

#include "common/Defines.h"

#include <sys/time.h>

#include <cstdio>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @addtogroup logging
 * @{
 */

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

/** @cond */

#define LOG_HOST    "HOST"
#define LOG_NET     "NET"
#define LOG_CLIENT  "CLIENT"
#define LOG_PEER    "PEER"
#define LOG_ROUTER  "ROUTER"

/** @endcond */

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

/**
 * @brief Macro helper to create a debug log entry.
 * @param _module Name of module generating log entry.
 * @param fmt String format.
 *
 * This is a variable argument function.
 */
#define LogDebug(_module, fmt, ...)             Log(1U, {_module, __FILE__, __LINE__, nullptr}, fmt, ##__VA_ARGS__)
/**
 * @brief Macro helper to create a debug log entry.
 * @param _module Name of module generating log entry.
 * @param _func Name of function generating log entry.
 * @param fmt String format.
 *
 * This is a variable argument function.
 */
#define LogDebugEx(_module, _func, fmt, ...)    Log(1U, {_module, __FILE__, __LINE__, _func}, fmt, ##__VA_ARGS__)
/**
 * @brief Macro helper to create a informational log entry.
 * @param fmt String format.
 *
 * This is a variable argument function. LogInfo() does not use a module
 * name when creating a log entry.
 */
#define LogInfo(fmt, ...)                       Log(2U, {nullptr, nullptr, 0, nullptr}, fmt, ##__VA_ARGS__)
/**
 * @brief Macro helper to create a informational log entry with module name.
 * @param _module Name of module generating log entry.
 * @param fmt String format.
 *
 * This is a variable argument function.
 */
#define LogInfoEx(_module, fmt, ...)            Log(2U, {_module, nullptr, 0, nullptr}, fmt, ##__VA_ARGS__)
/**
 * @brief Macro helper to create a warning log entry.
 * @param _module Name of module generating log entry.
 * @param fmt String format.
 *
 * This is a variable argument function.
 */
#define LogWarning(_module, fmt, ...)           Log(3U, {_module, nullptr, 0, nullptr}, fmt, ##__VA_ARGS__)
/**
 * @brief Macro helper to create a error log entry.
 * @param _module Name of module generating log entry.
 * @param fmt String format.
 *
 * This is a variable argument function.
 */
#define LogError(_module, fmt, ...)             Log(4U, {_module, nullptr, 0, nullptr}, fmt, ##__VA_ARGS__)
/**
 * @brief Macro helper to create a fatal log entry.
 * @param _module Name of module generating log entry.
 * @param fmt String format.
 *
 * This is a variable argument function.
 */
#define LogFatal(_module, fmt, ...)             Log(5U, {_module, nullptr, 0, nullptr}, fmt, ##__VA_ARGS__)

// ---------------------------------------------------------------------------
//  Externs
// ---------------------------------------------------------------------------

/**
 * @brief (Global) Display log level.
 */
extern uint32_t g_logDisplayLevel;
/**
 * @brief (Global) Flag for displaying timestamps on log entries (does not apply to syslog logging).
 */
extern bool g_disableTimeDisplay;
/**
 * @brief (Global) Flag indicating whether or not logging goes to the syslog.
 */
extern bool g_useSyslog;

namespace log_internal
{
    constexpr static char LOG_LEVELS[] = " DIWEF";

    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents a source code location.
     * @ingroup logging
     */
    struct SourceLocation {
    public:
        /**
         * @brief Initializes a new instance of the SourceLocation class.
         */
        constexpr SourceLocation() = default;
        /**
         * @brief Initializes a new instance of the SourceLocation class.
         * @param module Application module.
         * @param filename Source code filename.
         * @param line Line number in source code file.
         * @param func Function name within source code.
         */
        constexpr SourceLocation(const char* module, const char* filename, int line, const char* func) :
            module(module),
            filename(filename),
            line(line),
            funcname(func)
        {
            /* stub */
        }

    public:
        const char* module = nullptr;
        const char* filename = nullptr;
        int line = 0;
        const char* funcname = nullptr;
    };

    /**
     * @brief Writes a new entry to the diagnostics log.
     * @param level Log level for entry.
     * @param log Fully formatted log message.
     */
    extern RELAY_SW_API void LogInternal(uint32_t level, const std::string& log);

    /**
     * @brief Internal helper to get the log file path.
     * @returns std::string Configured log file path.
     */
    extern RELAY_SW_API std::string GetLogFilePath();
    /**
     * @brief Internal helper to get the log file root name.
     * @returns std::string Configured log file root name.
     */
    extern RELAY_SW_API std::string GetLogFileRoot();
} // namespace log_internal

// ---------------------------------------------------------------------------
//  Global Function Externs
// ---------------------------------------------------------------------------

/**
 * @brief Helper to get the current log file level.
 * @returns uint32_t Current log file level.
 */
extern RELAY_SW_API uint32_t CurrentLogFileLevel();

/**
 * @brief Helper to get the current log file path.
 * @returns std::string Current log file path.
 */
extern RELAY_SW_API std::string LogGetFilePath();
/**
 * @brief Helper to get the current log file root.
 * @returns std::string Current log file root.
 */
extern RELAY_SW_API std::string LogGetFileRoot();

/**
 * @brief Initializes the diagnostics log.
 * @param filePath File path for the log file.
 * @param fileRoot Root name for log file.
 * @param fileLevel File log level.
 * @param displaylevel Display log level.
 * @param disableTimeDisplay Flag to disable the date and time stamp for the log entries.
 * @param useSyslog Flag indicating whether or not logs will be sent to syslog.
 * @returns bool True, if the log was opened, otherwise false.
 */
extern RELAY_SW_API bool LogInitialise(const std::string& filePath, const std::string& fileRoot,
    uint32_t fileLevel, uint32_t displayLevel, bool disableTimeDisplay = false, bool useSyslog = false);
/**
 * @brief Finalizes the diagnostics log.
 */
extern RELAY_SW_API void LogFinalise();

/**
 * @brief Writes a new entry to the diagnostics log.
 * @param level Log level for entry.
 * @param sourceLoc Source code location information.
 * @param fmt String format.
 *
 * This is a variable argument function. This shouldn't be called directly, utilize the LogXXXX macros above, instead.
 */
template<typename ... Args>
RELAY_SW_API void Log(uint32_t level, log_internal::SourceLocation sourceLoc, const std::string& fmt, Args... args)
{
    using namespace log_internal;

    int size_s = std::snprintf(nullptr, 0, fmt.c_str(), args...) + 1; // Extra space for '\0'
    if (size_s <= 0) {
        throw std::runtime_error("Error during formatting.");
    }

#if defined(CATCH2_TEST_COMPILATION)
    g_disableTimeDisplay = true;
#endif
    if (level > 6U)
        level = 2U; // default this sort of log message to INFO

    int prefixLen = 0;
    char prefixBuf[256];

    prefixLen = ::snprintf(prefixBuf, sizeof(prefixBuf), "%c: ", LOG_LEVELS[level]);

    if (!g_disableTimeDisplay && !g_useSyslog) {
        time_t now;
        ::time(&now);
        struct tm* tm = ::localtime(&now);

        struct timeval nowMillis;
        ::gettimeofday(&nowMillis, NULL);

        prefixLen += ::snprintf(prefixBuf + prefixLen, sizeof(prefixBuf) - prefixLen, "%04d-%02d-%02d %02d:%02d:%02d.%03lu ",
            tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday, tm->tm_hour, tm->tm_min, tm->tm_sec, (unsigned long)(nowMillis.tv_usec / 1000U));
    }

    if (sourceLoc.module != nullptr) {
        // the module tag replaces the trailing space
        prefixLen--;
        prefixLen += ::snprintf(prefixBuf + prefixLen, sizeof(prefixBuf) - prefixLen, " (%s)", sourceLoc.module);
    }
    else {
        prefixLen--;
    }

    // level 1 is DEBUG -- if we have a file and line number add that to the log entry
    if (level == 1U && sourceLoc.filename != nullptr && sourceLoc.line > 0) {
        if (sourceLoc.funcname != nullptr) {
            prefixLen += ::snprintf(prefixBuf + prefixLen, sizeof(prefixBuf) - prefixLen, "[%s:%u][%s]",
                sourceLoc.filename, sourceLoc.line, sourceLoc.funcname);
        }
        else {
            prefixLen += ::snprintf(prefixBuf + prefixLen, sizeof(prefixBuf) - prefixLen, "[%s:%u]",
                sourceLoc.filename, sourceLoc.line);
        }
    }

    if (prefixLen >= (int)sizeof(prefixBuf) - 1)
        prefixLen = (int)sizeof(prefixBuf) - 2;
    prefixBuf[prefixLen++] = ' ';

    auto size = static_cast<size_t>(size_s);
    auto buf = std::make_unique<char[]>(size);

    std::snprintf(buf.get(), size, fmt.c_str(), args ...);

    std::string prefix = std::string(prefixBuf, prefixBuf + prefixLen);
    std::string msg = std::string(buf.get(), buf.get() + size - 1);

    LogInternal(level, std::string(prefix + msg));
}

/** @} */
#endif // __LOG_H__
