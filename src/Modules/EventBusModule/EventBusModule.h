#pragma once
/**
 * @file EventBusModule.h
 * @brief Active module hosting the EventBus task/dispatch loop.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Active module that owns the EventBus instance; subscribers run in its task.
 */
class EventBusModule : public Module {
public:
    const char* moduleId() const override { return "eventbus"; }
    const char* taskName() const override { return "EventBus"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 4096; }

private:
    EventBus _bus;
    EventBusService _svc { &_bus };
    uint32_t _reportedDrops = 0;
};
