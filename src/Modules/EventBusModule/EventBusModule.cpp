/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

void EventBusModule::init(ConfigStore&, ServiceRegistry& services) {
    services.add("eventbus", &_svc);
    LOGI("EventBusService registered");
}

void EventBusModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    // Every subscriber is registered by now.
    _bus.post(EventId::SystemStarted, nullptr, 0);
}

void EventBusModule::loop() {
    _bus.dispatch(8);

    const uint32_t drops = _bus.droppedCount();
    if (drops != _reportedDrops) {
        LOGW("%lu events dropped (queue full)", (unsigned long)(drops - _reportedDrops));
        _reportedDrops = drops;
    }
    vTaskDelay(pdMS_TO_TICKS(5));
}
