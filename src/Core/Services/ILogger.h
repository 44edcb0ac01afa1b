#pragma once
/**
 * @file ILogger.h
 * @brief Logging service interfaces shared by the log hub, sinks and producers.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Log severity levels. */
enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

constexpr int LOG_TAG_MAX = 10;
constexpr int LOG_MSG_MAX = 120;

/**
 * @brief Fixed-size log entry.
 *
 * `ts_ms` is left at 0 by producers and stamped by the hub on enqueue, so the
 * producer side stays usable without the Arduino clock.
 */
struct LogEntry {
    uint32_t ts_ms;
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Log sink interface. */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Log hub interface (producer side). */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Registry interface for log sinks. */
struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    void* ctx;
};

/** @brief Short printable name of a level ("D", "I", "W", "E"). */
static inline const char* logLevelShort(LogLevel lvl)
{
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info: return "I";
        case LogLevel::Warn: return "W";
        case LogLevel::Error: return "E";
        default: return "?";
    }
}
