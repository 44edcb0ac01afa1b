#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for MQTT `cmd` payload parsing in `MQTTModule::processRxCmd_`. */
constexpr size_t JsonCmdBuf = 1024;
/** @brief JSON capacity for MQTT `cfg/set` payload parsing in `MQTTModule::processRxCfgSet_`. */
constexpr size_t JsonCfgBuf = 1024;
/** @brief JSON capacity for `radio.*` args parsing and replies in `RadioCommands.cpp`. */
constexpr size_t JsonCmdRadioBuf = 384;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers a multi-module patch). */
constexpr size_t JsonConfigApplyBuf = JsonCfgBuf * 2;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 48;
/** @brief Maximum NVS key length (without null terminator) enforced by `NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief Sinks accepted by `LogSinkRegistry`. */
constexpr uint8_t MaxLogSinks = 4;
/** @brief FreeRTOS event queue length used by `EventBus`. */
constexpr uint8_t EventQueueLen = 16;
/** @brief Subscribers accepted by `EventBus::subscribe`. */
constexpr uint8_t MaxEventSubscribers = 16;
/** @brief Commands accepted by `CommandRegistry`. */
constexpr uint8_t MaxCommands = 24;
/** @brief Services accepted by `ServiceRegistry`. */
constexpr uint8_t MaxServices = 16;
/** @brief Modules accepted by `ModuleManager`. */
constexpr uint8_t MaxModules = 12;

/** @brief UDP radio integration capacities. */
namespace Radio {
/** @brief Field slots of one parsed datagram (`RadioFrame`). */
constexpr uint8_t MaxFrameFields = 64;
/** @brief Key buffer of a parsed field, duplicate suffix included. */
constexpr size_t FieldKeyLen = 32;
/** @brief Stored value length per reading (`RadioReadings`), longer values are truncated. */
constexpr size_t ReadingValueLen = 160;
/** @brief Upper bound of `RADIO_READING_COUNT`, sizes the snapshot buffers. */
constexpr uint8_t ReadingSlots = 40;
/** @brief Outbound frame buffer (`RadioEngine`). */
constexpr size_t TxFrameLen = 512;
/** @brief Host name / address buffers (`RadioConfig`). */
constexpr size_t HostLen = 64;
/** @brief Identity token buffer (`RadioConfig`). */
constexpr size_t IdentityLen = 32;
/** @brief Dotted IPv4 text buffer. */
constexpr size_t IpLen = 16;
/** @brief Error message buffer returned by `RadioEngine::setHost`. */
constexpr size_t MessageLen = 96;
/** @brief JSON snapshot capacity (`buildRadioSnapshotJson`), values are stored by pointer. */
constexpr size_t SnapshotJsonDoc = 3072;
/** @brief Serialized snapshot buffer (`rt/radio` publish): every reading at full length plus its key. */
constexpr size_t SnapshotBuf = (size_t)ReadingSlots * (ReadingValueLen + 24) + 256;
/** @brief Radio task stack size returned by `RadioModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 6144;
/** @brief Idle delay between two receive polls in `RadioModule::loop`. */
constexpr uint32_t LoopDelayMs = 20;
}  // namespace Radio

/** @brief MQTT-specific limits grouped by concern. */
namespace Mqtt {

/** @brief MQTT module task stack size returned by `MQTTModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 6144;

namespace Capacity {
/** @brief FreeRTOS RX queue length for inbound MQTT messages in `MQTTModule`. */
constexpr uint8_t RxQueueLen = 8;
}  // namespace Capacity

namespace Defaults {
/** @brief Default MQTT broker port used by `MQTTConfig::port`. */
constexpr int32_t Port = 1883;
}  // namespace Defaults

namespace Buffers {
constexpr size_t Host = 64;
constexpr size_t User = 32;
constexpr size_t Pass = 32;
constexpr size_t BaseTopic = 64;
/** @brief Device identifier (`FlowRadio-XXXXXX`). */
constexpr size_t DeviceId = 24;
constexpr size_t Topic = 128;
constexpr size_t RxTopic = 128;
constexpr size_t RxPayload = 384;
/** @brief ACK JSON buffer length used by `MQTTModule` (`ackBuf_`). */
constexpr size_t Ack = 1536;
/** @brief Command handler reply buffer length used by `MQTTModule` (`replyBuf_`). */
constexpr size_t Reply = 1024;
constexpr size_t CmdName = 64;
constexpr size_t CmdArgs = 320;
}  // namespace Buffers

namespace Timing {
/** @brief Delay in ms while MQTT is disabled in `MQTTModule::loop`. */
constexpr uint32_t DisabledDelayMs = 2000;
/** @brief Network warmup delay in ms before first connect attempt. */
constexpr uint32_t NetWarmupMs = 2000;
/** @brief Connection timeout in ms before forcing a reconnect. */
constexpr uint32_t ConnectTimeoutMs = 10000;
/** @brief Main MQTT task loop delay in ms. */
constexpr uint32_t LoopDelayMs = 50;
}  // namespace Timing

namespace Backoff {
constexpr uint32_t MinMs = 2000;
constexpr uint32_t MaxMs = 300000;
/** @brief Random jitter percentage applied to the reconnect delay. */
constexpr uint8_t JitterPct = 15;
}  // namespace Backoff

}  // namespace Mqtt

namespace Wifi {
/** @brief Connect attempt timeout in `WifiModule::loop`. */
constexpr uint32_t ConnectTimeoutMs = 15000;
/** @brief Wait before retrying after a failed attempt. */
constexpr uint32_t RetryDelayMs = 5000;
}  // namespace Wifi

}  // namespace Limits
