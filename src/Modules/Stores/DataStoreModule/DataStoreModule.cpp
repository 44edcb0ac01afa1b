/**
 * @file DataStoreModule.cpp
 * @brief Implementation file.
 */
#include "DataStoreModule.h"
#define LOG_TAG "DataStMd"
#include "Core/ModuleLog.h"

void DataStoreModule::init(ConfigStore&, ServiceRegistry& services)
{
    const EventBusService* eb = services.get<EventBusService>("eventbus");
    if (eb && eb->bus) {
        _store.setEventBus(eb->bus);
    } else {
        LOGW("EventBus unavailable, DataStore changes are not published");
    }

    services.add("datastore", &_svc);
}
