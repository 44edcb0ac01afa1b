#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed-capacity list of log sinks fed by the dispatcher.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

class LogSinkRegistry {
public:
    bool add(LogSinkService sink);
    int count() const { return count_; }
    LogSinkService get(int idx) const;

private:
    LogSinkService sinks_[Limits::MaxLogSinks]{};
    int count_ = 0;
};
