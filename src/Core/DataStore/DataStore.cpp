/**
 * @file DataStore.cpp
 * @brief Implementation file.
 */
#include "Core/DataStore/DataStore.h"

void DataStore::notifyChanged(DataKey key)
{
    if (!_bus) return;
    DataChangedPayload changed{ key };
    _bus->post(EventId::DataChanged, &changed, sizeof(changed));
}
