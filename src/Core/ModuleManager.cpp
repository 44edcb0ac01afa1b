/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || count >= Limits::MaxModules) {
        Log::error(LOG_TAG_CORE, "cannot add module %s", m ? m->moduleId() : "(null)");
        return false;
    }
    modules[count++] = m;
    return true;
}

Module* ModuleManager::findById(const char* id) {
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

int8_t ModuleManager::indexOf(const Module* m) const {
    for (uint8_t i = 0; i < count; ++i)
        if (modules[i] == m) return (int8_t)i;
    return -1;
}

bool ModuleManager::buildInitOrder() {
    // Kahn topo-sort: each pass places every module whose dependencies are placed.
    bool placed[Limits::MaxModules] = {false};
    orderedCount = 0;

    while (orderedCount < count) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (placed[i]) continue;

            bool depsOk = true;
            for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById(depId);
                if (!dep) {
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }
                if (!placed[indexOf(dep)]) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (!progress) {
            for (uint8_t i = 0; i < count; ++i) {
                if (!placed[i]) Log::error(LOG_TAG_CORE, "unresolved: %s", modules[i]->moduleId());
            }
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "init order built (%u modules)", (unsigned)orderedCount);
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    // Config variables are all registered now.
    cfg.loadPersistent();
    wireCoreServices(services, cfg);

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->hasTask()) continue;
        if (!ordered[i]->startTask()) {
            Log::error(LOG_TAG_CORE, "task start failed: %s", ordered[i]->moduleId());
            return false;
        }
        Log::debug(LOG_TAG_CORE, "task started: %s", ordered[i]->moduleId());
    }

    return true;
}

void ModuleManager::wireCoreServices(ServiceRegistry& services, ConfigStore& config) {
    const EventBusService* eb = services.get<EventBusService>("eventbus");
    if (eb && eb->bus) {
        config.setEventBus(eb->bus);
        Log::debug(LOG_TAG_CORE, "config changes routed to eventbus");
    }
}
