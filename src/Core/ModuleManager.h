#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"

/**
 * @brief Registers modules, resolves dependencies, and starts tasks.
 */
class ModuleManager {
public:
    /** @brief Add a module; refused when the table is full. */
    bool add(Module* m);
    /**
     * @brief Init every module in dependency order, load persistent config,
     * run onConfigLoaded hooks, then start the tasks.
     * @return false on a missing or cyclic dependency (nothing is started).
     */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

private:
    Module* modules[Limits::MaxModules] = {};
    uint8_t count = 0;

    Module* ordered[Limits::MaxModules] = {};
    uint8_t orderedCount = 0;

    Module* findById(const char* id);
    int8_t indexOf(const Module* m) const;
    bool buildInitOrder();
    void wireCoreServices(ServiceRegistry& services, ConfigStore& config);
};
