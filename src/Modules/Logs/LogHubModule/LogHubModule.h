#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 *
 * Registered first: every other module logs through the hub it installs.
 * Owns the `log.level` config variable (0=Debug .. 3=Error).
 */
class LogHubModule : public ModulePassive {
public:
    const char* moduleId() const override { return "loghub"; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    LogHub hub;
    LogHubService hubSvc{};

    LogSinkRegistry sinks;
    LogSinkRegistryService sinksSvc{};

    uint8_t minLevel_ = (uint8_t)LogLevel::Info;
    ConfigVariable<uint8_t,1> levelVar {
        NVS_KEY(NvsKeys::Log::MinLevel),"level","log",ConfigType::UInt8,
        &minLevel_,ConfigPersistence::Persistent,0
    };

    static void onLevelChanged_(void* ctx, const uint8_t& level);
};
