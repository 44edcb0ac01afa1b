/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <stdio.h>
#include <string.h>

void LogDispatcherModule::init(ConfigStore&, ServiceRegistry& services) {
    const LogHubService* hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");
    if (hubSvc) _hub = static_cast<LogHub*>(hubSvc->ctx);
}

void LogDispatcherModule::loop() {
    if (!_hub || !_sinkReg) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    LogEntry e;
    if (!_hub->dequeue(e, pdMS_TO_TICKS(1000))) return;

    const int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }

    // Report queue overflow once per burst, through the sinks directly.
    const uint32_t drops = _hub->dropped();
    if (drops != _reportedDrops) {
        LogEntry w{};
        w.ts_ms = e.ts_ms;
        w.lvl = LogLevel::Warn;
        strncpy(w.tag, "LogDisp", sizeof(w.tag) - 1);
        snprintf(w.msg, sizeof(w.msg), "%lu log entries dropped", (unsigned long)(drops - _reportedDrops));
        _reportedDrops = drops;
        for (int i = 0; i < n; ++i) {
            LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
            if (sink.write) sink.write(sink.ctx, w);
        }
    }
}
