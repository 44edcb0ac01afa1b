#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes the ConfigStore service.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module wiring ConfigStore JSON services and the `config.*` commands.
 */
class ConfigStoreModule : public ModulePassive {
public:
    const char* moduleId() const override { return "config"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* registry = nullptr;

    static bool svcApplyJson(void* ctx, const char* json);
    static bool svcToJson(void* ctx, char* out, size_t outLen);
    static bool svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    static uint8_t svcListModules(void* ctx, const char** out, uint8_t max);
    static bool svcErase(void* ctx);

    static bool cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
