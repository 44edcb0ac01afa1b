#pragma once
/**
 * @file DataModel.h
 * @brief Runtime data model aggregated from the module contributions.
 */
#include <stdbool.h>

#include "Modules/Network/WifiModule/WifiModuleDataModel.h"
#include "Modules/Network/MQTTModule/MQTTModuleDataModel.h"
#include "Modules/Network/RadioModule/RadioModuleDataModel.h"

/** @brief Root runtime data model, one member per contributing module. */
struct RuntimeData {
    WifiRuntimeData wifi;
    MQTTRuntimeData mqtt;
    RadioRuntimeData radio;
};
