/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

static void putValue(JsonObject obj, const ConfigMeta& m, bool maskSecrets) {
    switch (m.type) {
        case ConfigType::Int32:
            obj[m.name] = *(const int32_t*)m.valuePtr;
            break;
        case ConfigType::UInt8:
            obj[m.name] = *(const uint8_t*)m.valuePtr;
            break;
        case ConfigType::Bool:
            obj[m.name] = *(const bool*)m.valuePtr;
            break;
        case ConfigType::CharArray:
            // Const char* is stored by pointer, valid for the document lifetime.
            obj[m.name] = (maskSecrets && isMaskedKey(m.name)) ? "***" : (const char*)m.valuePtr;
            break;
    }
}

void ConfigStore::notifyChanged(const ConfigMeta& m)
{
    if (!_eventBus || !m.nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, m.nvsKey, sizeof(p.nvsKey) - 1);
    if (m.module) strncpy(p.module, m.module, sizeof(p.module) - 1);

    if (!_eventBus->post(EventId::ConfigChanged, &p, sizeof(p))) {
        Log::warn(LOG_TAG_CORE, "ConfigChanged dropped (%s)", m.nvsKey);
    }
}

const ConfigMeta* ConfigStore::findMeta_(const void* valuePtr) const
{
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (_meta[i].valuePtr == valuePtr) return &_meta[i];
    }
    return nullptr;
}

void ConfigStore::persist_(const ConfigMeta& m)
{
    if (!_prefs || m.persistence != ConfigPersistence::Persistent || !m.nvsKey) return;

    size_t written = 0;
    switch (m.type) {
        case ConfigType::Int32:     written = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr); break;
        case ConfigType::UInt8:     written = _prefs->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr); break;
        case ConfigType::Bool:      written = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr); break;
        case ConfigType::CharArray: written = _prefs->putString(m.nvsKey, (const char*)m.valuePtr); break;
    }
    if (written == 0) {
        Log::warn(LOG_TAG_CORE, "NVS write failed (%s)", m.nvsKey);
    }
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent || !m.nvsKey) continue;
        if (!_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
    }
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    JsonObject root = doc.to<JsonObject>();
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonObject mod = root[m.module].as<JsonObject>();
        if (mod.isNull()) mod = root.createNestedObject(m.module);
        putValue(mod, m, true);
    }

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        snprintf(out, outLen, "{}");
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    StaticJsonDocument<Limits::JsonCfgBuf> doc;
    JsonObject root = doc.to<JsonObject>();
    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;
        putValue(root, m, true);
        any = true;
    }

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        if (truncated) *truncated = true;
        snprintf(out, outLen, "{}");
        return false;
    }
    serializeJson(doc, out, outLen);
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount && count < max; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (!exists) out[count++] = m.module;
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err ? err.c_str() : "not an object");
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    bool allOk = true;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonVariantConst v = root[m.module][m.name];
        if (v.isNull()) continue;

        bool changed = false;
        bool typeOk = true;
        switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) { typeOk = false; break; }
            const int32_t nv = v.as<int32_t>();
            if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) { typeOk = false; break; }
            const uint8_t nv = v.as<uint8_t>();
            if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) { typeOk = false; break; }
            const bool nv = v.as<bool>();
            if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::CharArray: {
            if (!v.is<const char*>() || m.size == 0) { typeOk = false; break; }
            const char* s = v.as<const char*>();
            size_t len = strlen(s);
            if (len >= m.size) len = m.size - 1;
            char* dst = (char*)m.valuePtr;
            if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                memcpy(dst, s, len);
                dst[len] = '\0';
                changed = true;
            }
            break;
        }
        }

        if (!typeOk) {
            Log::warn(LOG_TAG_CORE, "applyJson: wrong type for %s.%s", m.module, m.name);
            allOk = false;
            continue;
        }
        if (changed) {
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
            if (m.notifyVar && m.var) m.notifyVar(m.var);
            persist_(m);
            notifyChanged(m);
        }
    }
    return allOk;
}

bool ConfigStore::erase()
{
    if (!_prefs) return false;
    const bool ok = _prefs->clear();
    Log::warn(LOG_TAG_CORE, "NVS erase %s", ok ? "done" : "failed");
    return ok;
}
