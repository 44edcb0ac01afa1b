#pragma once
/**
 * @file DataStore.h
 * @brief Runtime data store with EventBus notifications.
 */
#include <stdint.h>
#include <string.h>

#include "Core/DataModel.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventId.h"
#include "Core/EventBus/EventPayloads.h"

/**
 * @brief Stores runtime data and publishes changes on the EventBus.
 *
 * Each member of RuntimeData is written by its owning module only, through
 * the change-detecting setters of that module's `*Runtime.h`.
 */
class DataStore {
public:
    DataStore() = default;

    /** @brief Inject EventBus dependency for notifications. */
    void setEventBus(EventBus* bus) { _bus = bus; }

    /** @brief Read access to the full runtime model. */
    const RuntimeData& data() const { return _rt; }
    /** @brief Mutable access for module-owned setters. */
    RuntimeData& dataMutable() { return _rt; }

    /** @brief Publish DataChanged for `key`. */
    void notifyChanged(DataKey key);

private:
    RuntimeData _rt{};
    EventBus* _bus = nullptr;
};
