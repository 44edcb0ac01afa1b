#pragma once
/**
 * @file DataKeys.h
 * @brief Central registry and reserved ranges for DataStore keys.
 */

#include <stdint.h>

#include "Core/EventBus/EventPayloads.h"

namespace DataKeys {

/** @brief WiFi runtime key: connectivity ready state (`WifiRuntime`). */
constexpr DataKey WifiReady = 1;
/** @brief WiFi runtime key: IPv4 address (`WifiRuntime`). */
constexpr DataKey WifiIp = 2;

/** @brief MQTT runtime key: broker connected state (`MQTTRuntime`). */
constexpr DataKey MqttReady = 4;

/** @brief Radio runtime key: device status name (`RadioRuntime`). */
constexpr DataKey RadioStatus = 20;
/** @brief Radio runtime key: power reading (`RadioRuntime`). */
constexpr DataKey RadioPower = 21;
/** @brief Radio runtime key: volume level, -1 while muted (`RadioRuntime`). */
constexpr DataKey RadioVolume = 22;
/** @brief Radio runtime key: mute state (`RadioRuntime`). */
constexpr DataKey RadioMuted = 23;
/** @brief Radio runtime key: known device IPv4 (`RadioRuntime`). */
constexpr DataKey RadioIp = 24;
/** @brief Radio runtime key: play mode reading (`RadioRuntime`). */
constexpr DataKey RadioPlayMode = 25;

/** @brief Upper bound for currently reserved keys. */
constexpr DataKey ReservedMax = 63;

static_assert(WifiIp < MqttReady, "DataKey ordering invariant broken");
static_assert(MqttReady < RadioStatus, "DataKey ranges overlap");
static_assert(RadioPlayMode <= ReservedMax, "Radio key range exceeds reserved max");

}  // namespace DataKeys
