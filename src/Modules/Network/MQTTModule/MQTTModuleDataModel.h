#pragma once
/**
 * @file MQTTModuleDataModel.h
 * @brief MQTT runtime data model contribution.
 */

#include <stdint.h>

/** @brief MQTT runtime status. */
struct MQTTRuntimeData {
    bool mqttReady = false;
};
