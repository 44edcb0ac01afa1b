/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include <ArduinoJson.h>
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json) {
    return ((ConfigStore*)ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJson(void* ctx, char* out, size_t outLen) {
    return ((ConfigStore*)ctx)->toJson(out, outLen);
}

bool ConfigStoreModule::svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated) {
    return ((ConfigStore*)ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules(void* ctx, const char** out, uint8_t max) {
    return ((ConfigStore*)ctx)->listModules(out, max);
}

bool ConfigStoreModule::svcErase(void* ctx) {
    return ((ConfigStore*)ctx)->erase();
}

// config.get {"module":"radio"} -> that module's flat config, without args the full tree.
bool ConfigStoreModule::cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    ConfigStore* store = static_cast<ConfigStore*>(userCtx);

    const char* module = nullptr;
    StaticJsonDocument<128> args;
    if (req.args && req.args[0] != '\0') {
        if (deserializeJson(args, req.args) || !args.is<JsonObject>()) {
            writeErrorJson(reply, replyLen, ErrorCode::BadCmdJson, "config.get");
            return false;
        }
        module = args["module"].as<const char*>();
    }

    const bool ok = module ? store->toJsonModule(module, reply, replyLen)
                           : store->toJson(reply, replyLen);
    if (!ok) {
        writeErrorJson(reply, replyLen, module ? ErrorCode::InvalidValue : ErrorCode::Failed, "config.get");
        return false;
    }
    return true;
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry = &cfg;

    static ConfigStoreService svc{ svcApplyJson, svcToJson, svcToJsonModule, svcListModules, svcErase, nullptr };
    svc.ctx = registry;
    services.add("config", &svc);

    const CommandService* cmd = services.get<CommandService>("cmd");
    if (cmd && cmd->registerHandler) {
        cmd->registerHandler(cmd->ctx, "config.get", &ConfigStoreModule::cmdGet_, registry);
    }
    LOGI("ConfigStoreService registered");
}
