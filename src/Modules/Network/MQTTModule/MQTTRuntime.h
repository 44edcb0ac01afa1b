#pragma once
/**
 * @file MQTTRuntime.h
 * @brief MQTT runtime setters.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"

static inline void setMqttReady(DataStore& ds, bool ready)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.mqtt.mqttReady == ready) return;
    rt.mqtt.mqttReady = ready;
    ds.notifyChanged(DataKeys::MqttReady);
}
