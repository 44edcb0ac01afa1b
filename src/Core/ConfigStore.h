#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// Every registered variable is addressed as `<module>.<name>` in JSON and by
// its NVS key in Preferences. A value change (set() or applyJson()) persists
// the variable, runs its handlers and posts EventId::ConfigChanged.
// No heap allocation after registration.

#include <Preferences.h>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    ConfigStore() = default;

    /** @brief Inject EventBus dependency for change notifications. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();

    /** @brief Serialize all registered config as `{module:{name:value}}`. */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object, secrets masked). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply a `{module:{name:value}}` patch.
     * @return false on malformed JSON or when a value has the wrong type
     * (other variables of the patch are still applied).
     */
    bool applyJson(const char* json);
    /** @brief Clear the NVS namespace; RAM values are kept until reboot. */
    bool erase();

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[Limits::MaxConfigVars];
    uint16_t _metaCount = 0;

    void notifyChanged(const ConfigMeta& m);
    void persist_(const ConfigMeta& m);
    const ConfigMeta* findMeta_(const void* valuePtr) const;
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= Limits::MaxConfigVars) {
        Log::error("CfgStore", "too many config vars, %s.%s dropped",
                   var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return false;
    }

    ConfigMeta& m = _meta[_metaCount++];
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    m.notifyVar   = [](void* v) { static_cast<ConfigVariable<T, H>*>(v)->notify(); };
    m.var         = &var;
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for strings");
    if (!var.value) return false;
    if (*(var.value) == value) return true;

    *(var.value) = value;
    var.notify();

    const ConfigMeta* m = findMeta_(var.value);
    if (m) {
        persist_(*m);
        notifyChanged(*m);
    }
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;

    memcpy(var.value, str, len);
    var.value[len] = '\0';
    var.notify();

    const ConfigMeta* m = findMeta_(var.value);
    if (m) {
        persist_(*m);
        notifyChanged(*m);
    }
    return true;
}
