/**
 * @file LogSerialSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogSerialSinkModule.h"
#include <Arduino.h>

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static void formatUptime(char* out, size_t outSize, uint32_t ms)
{
    const uint32_t s = ms / 1000;
    const uint32_t m = s / 60;
    const uint32_t h = m / 60;

    snprintf(out, outSize, "%03lu:%02lu:%02lu.%03lu",
             (unsigned long)h,
             (unsigned long)(m % 60),
             (unsigned long)(s % 60),
             (unsigned long)(ms % 1000));
}

static void serialSinkWrite(void*, const LogEntry& e) {
    char ts[24];
    formatUptime(ts, sizeof(ts), e.ts_ms);
    Serial.printf("[%s][%s][%s] %s%s\x1b[0m\n",
                  ts, logLevelShort(e.lvl), e.tag, lvlColor(e.lvl), e.msg);
}

void LogSerialSinkModule::init(ConfigStore&, ServiceRegistry& services) {
    Serial.begin(115200);

    const LogSinkRegistryService* sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = serialSinkWrite;
    sink.ctx = nullptr;
    sinks->add(sinks->ctx, sink);
}
