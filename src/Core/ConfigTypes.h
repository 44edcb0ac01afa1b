#pragma once
/**
 * @file ConfigTypes.h
 * @brief Shared configuration types and metadata.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

// Max NVS key length for Preferences (excluding null terminator).
// Always wrap literal NVS keys with NVS_KEY("...") to enforce length at compile time.
template <size_t N>
constexpr const char* NVS_KEY(const char (&s)[N]) {
    static_assert(N > 0, "NVS key cannot be empty");
    static_assert((N - 1) <= Limits::MaxNvsKeyLen, "NVS key too long");
    return s;
}

/** @brief Config persistence mode. */
enum class ConfigPersistence : uint8_t { Runtime, Persistent };

/** @brief Supported config value types. */
enum class ConfigType : uint8_t {
    Int32,
    UInt8,
    Bool,
    CharArray
};

/** @brief Callback signature for config changes. */
template<typename T>
using ConfigCallback = void(*)(void* ctx, const T& value);

/**
 * @brief Declares a config variable and optional change handlers.
 *
 * Handlers run in the task that applied the change (MQTT task for cfg/set);
 * modules owning a task should react to EventId::ConfigChanged instead.
 */
template<typename T, size_t MAX_HANDLERS>
struct ConfigVariable {
    const char* nvsKey;
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    ConfigPersistence persistence;
    uint16_t size; // for char[]

    struct Handler { ConfigCallback<T> cb; void* ctx; };
    Handler handlers[MAX_HANDLERS > 0 ? MAX_HANDLERS : 1];
    uint8_t handlerCount = 0;

    bool addHandler(ConfigCallback<T> cb, void* ctx) {
        if (handlerCount >= MAX_HANDLERS) return false;
        handlers[handlerCount++] = {cb, ctx};
        return true;
    }

    void notify() {
        for (uint8_t i = 0; i < handlerCount; ++i)
            handlers[i].cb(handlers[i].ctx, *value);
    }
};

/** @brief Internal metadata for registered variables. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* nvsKey;
    ConfigType type;
    ConfigPersistence persistence;
    void* valuePtr;
    uint16_t size;
    /** Runs the owning ConfigVariable handlers (set by registerVar). */
    void (*notifyVar)(void* var);
    void* var;
};
