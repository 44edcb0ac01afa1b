#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include "ConfigStore.h"
#include "ServiceRegistry.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

/**
 * @brief Base class for active modules backed by a FreeRTOS task.
 *
 * Lifecycle, driven by ModuleManager:
 * 1. `init()` in dependency order: register config variables, services, commands.
 * 2. ConfigStore::loadPersistent().
 * 3. `onConfigLoaded()` in the same order.
 * 4. `startTask()`: `loop()` runs forever in the module task.
 */
class Module {
public:
    virtual ~Module() = default;

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;
    /** @brief FreeRTOS task name for this module. */
    virtual const char* taskName() const = 0;

    /** @brief Number of declared dependencies. */
    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Register services, commands and config variables. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Called once all persistent config values are loaded. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief One iteration of the module task. Must block or delay. */
    virtual void loop() = 0;

    virtual uint16_t taskStackSize() const { return 3072; }
    virtual UBaseType_t taskPriority() const { return 1; }
    /** @brief CPU core affinity (`0` or `1` on ESP32). */
    virtual BaseType_t taskCore() const { return 1; }

    /** @brief Whether this module owns a task. */
    virtual bool hasTask() const { return true; }

    /** @brief Create and start the FreeRTOS task. */
    bool startTask() {
        const BaseType_t ok = xTaskCreatePinnedToCore(
            taskEntry, taskName(), taskStackSize(),
            this, taskPriority(), &taskHandle, taskCore()
        );
        return ok == pdPASS;
    }

    TaskHandle_t getTaskHandle() const { return taskHandle; }

protected:
    TaskHandle_t taskHandle = nullptr;

private:
    static void taskEntry(void* arg) {
        Module* self = static_cast<Module*>(arg);
        for (;;) {
            self->loop();
            // Yield even when loop() returns immediately.
            vTaskDelay(1);
        }
    }
};
