/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"

void LogHubModule::onLevelChanged_(void*, const uint8_t& level) {
    const uint8_t clamped = (level > (uint8_t)LogLevel::Error) ? (uint8_t)LogLevel::Error : level;
    Log::setMinLevel((LogLevel)clamped);
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    hub.init(Limits::LogQueueLen);

    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.ctx = &hub;

    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc.get = [](void* ctx, int idx) -> LogSinkService {
        return static_cast<LogSinkRegistry*>(ctx)->get(idx);
    };
    sinksSvc.ctx = &sinks;

    services.add("loghub", &hubSvc);
    services.add("logsinks", &sinksSvc);

    levelVar.addHandler(&LogHubModule::onLevelChanged_, this);
    cfg.registerVar(levelVar);

    Log::setHub(&hubSvc);
}

void LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    onLevelChanged_(this, minLevel_);
}
