/**
 * @file Log.cpp
 * @brief Log facade: formats entries and forwards them to the installed hub.
 */
#include "Core/Log.h"
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

namespace {
    const LogHubService* g_hub = nullptr;
    LogLevel g_minLevel = LogLevel::Debug;

    void logVa(LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        if (!g_hub || !g_hub->enqueue || !fmt) return;
        if ((uint8_t)lvl < (uint8_t)g_minLevel) return;

        LogEntry e{};
        e.lvl = lvl;
        strncpy(e.tag, tag ? tag : "-", LOG_TAG_MAX - 1);
        vsnprintf(e.msg, LOG_MSG_MAX, fmt, ap);

        // Refused entries are counted by the hub.
        (void)g_hub->enqueue(g_hub->ctx, e);
    }
}

void Log::setHub(const LogHubService* hub) {
    g_hub = hub;
}

void Log::setMinLevel(LogLevel lvl) {
    g_minLevel = lvl;
}

void Log::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(lvl, tag, fmt, ap);
    va_end(ap);
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}
