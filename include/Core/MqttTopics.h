#pragma once
/**
 * @file MqttTopics.h
 * @brief Standard MQTT topic suffixes shared across modules.
 */

namespace MqttTopics {

/** @brief Command ingress suffix (`<base>/<device>/cmd`). */
constexpr char SuffixCmd[] = "cmd";
/** @brief Command acknowledgment suffix (`<base>/<device>/ack`). */
constexpr char SuffixAck[] = "ack";
/** @brief Device availability suffix, Last Will (`<base>/<device>/status`). */
constexpr char SuffixStatus[] = "status";
/** @brief Config patch ingress suffix (`<base>/<device>/cfg/set`). */
constexpr char SuffixCfgSet[] = "cfg/set";
/** @brief Config acknowledgment suffix (`<base>/<device>/cfg/ack`). */
constexpr char SuffixCfgAck[] = "cfg/ack";
/** @brief Retained radio readings snapshot (`<base>/<device>/rt/radio`). */
constexpr char SuffixRadio[] = "rt/radio";

}  // namespace MqttTopics
