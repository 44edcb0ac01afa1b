/**
 * @file Log.h
 * @brief Global log helper for core and modules.
 */
#pragma once

#include "Core/Services/ILogger.h"

namespace Log {
    /**
     * @brief Install the global log hub service.
     *
     * Passing nullptr turns every log call into a no-op (host builds, tests).
     */
    void setHub(const LogHubService* hub);

    /** @brief Drop entries below this level before formatting. Default: Debug. */
    void setMinLevel(LogLevel lvl);

    /**
     * @brief Log a formatted message with a given level.
     */
    void logf(LogLevel lvl, const char* tag, const char* fmt, ...);

    void debug(const char* tag, const char* fmt, ...);
    void info(const char* tag, const char* fmt, ...);
    void warn(const char* tag, const char* fmt, ...);
    void error(const char* tag, const char* fmt, ...);
}

// Macros are provided by Core/ModuleLog.h to keep Module.h neutral.
