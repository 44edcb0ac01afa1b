#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>

#include "Core/Services/ICommand.h"
#include "Core/SystemLimits.h"

/** @brief Command invocation context. */
struct CommandRequest {
    const char* cmd;
    const char* json;
    const char* args;
};

struct CommandEntry {
    const char* cmd;
    CommandHandler fn;
    void* userCtx;
};

/**
 * @brief Registry of command handlers keyed by name (`radio.volume`, ...).
 *
 * Handlers must reply with a JSON object; anything else is replaced by a
 * `CmdHandlerFailed` error.
 */
class CommandRegistry {
public:
    /** @brief Register a handler; duplicate names and a full table are refused. */
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    uint8_t count() const { return count_; }
    /** @brief Registered name at `idx`, in registration order, or nullptr. */
    const char* nameAt(uint8_t idx) const { return (idx < count_) ? entries_[idx].cmd : nullptr; }

private:
    CommandEntry entries_[Limits::MaxCommands]{};
    uint8_t count_ = 0;
};
