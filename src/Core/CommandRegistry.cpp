/**
 * @file CommandRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"

#define LOG_TAG "CmdRegst"
#include "Core/ModuleLog.h"

#include <string.h>

namespace {

bool isJsonObjectReply(const char* s, size_t len)
{
    if (!s || len == 0) return false;
    for (size_t i = 0; i < len && s[i] != '\0'; ++i) {
        const char c = s[i];
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        return c == '{';
    }
    return false;
}

void writeError(char* reply, size_t replyLen, ErrorCode code, const char* where)
{
    if (!reply || replyLen == 0) return;
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

}  // namespace

bool CommandRegistry::registerHandler(const char* cmd, CommandHandler fn, void* userCtx)
{
    if (!cmd || !fn) return false;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].cmd, cmd) == 0) {
            LOGW("command %s already registered", cmd);
            return false;
        }
    }
    if (count_ >= Limits::MaxCommands) {
        LOGE("command table full, %s dropped", cmd);
        return false;
    }
    entries_[count_++] = {cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen)
{
    if (reply && replyLen) reply[0] = '\0';
    if (!cmd) {
        writeError(reply, replyLen, ErrorCode::MissingCmd, "command");
        return false;
    }

    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].cmd, cmd) != 0) continue;

        CommandRequest req{cmd, json, args};
        const bool ok = entries_[i].fn(entries_[i].userCtx, req, reply, replyLen);
        if (reply && replyLen && !isJsonObjectReply(reply, replyLen)) {
            writeError(reply, replyLen, ErrorCode::CmdHandlerFailed, "command.reply");
            return false;
        }
        return ok;
    }

    LOGD("unknown command %s", cmd);
    writeError(reply, replyLen, ErrorCode::UnknownCmd, "command");
    return false;
}
