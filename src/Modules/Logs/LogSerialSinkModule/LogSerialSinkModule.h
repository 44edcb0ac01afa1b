#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to Serial with uptime stamps.
 */
class LogSerialSinkModule : public ModulePassive {
public:
    const char* moduleId() const override { return "log.sink.serial"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
};
