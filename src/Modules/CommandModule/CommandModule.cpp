/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#include "Core/ErrorCodes.h"
#include <ArduinoJson.h>
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"

bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    return ((CommandRegistry*)ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    const CommandRegistry* reg = static_cast<const CommandRegistry*>(userCtx);

    StaticJsonDocument<1024> doc;
    doc["ok"] = true;
    JsonArray names = doc.createNestedArray("commands");
    for (uint8_t i = 0; i < reg->count(); ++i) {
        names.add(reg->nameAt(i));
    }
    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::InternalAckOverflow, "cmd.list");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    static CommandService svc{ svcRegister, svcExecute, nullptr };
    svc.ctx = &registry;
    services.add("cmd", &svc);

    registry.registerHandler("cmd.list", &CommandModule::cmdList_, &registry);
    LOGI("CommandService registered");
}
