#pragma once
/**
 * @file DataStoreModule.h
 * @brief Module that exposes the DataStore service.
 */
#include "Core/ModulePassive.h"
#include "Core/DataStore/DataStore.h"
#include "Core/Services/Services.h"

/** @brief Passive module owning the DataStore and publishing it on the EventBus. */
class DataStoreModule : public ModulePassive {
public:
    const char* moduleId() const override { return "datastore"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    DataStore _store;
    DataStoreService _svc{ &_store };
};
