#pragma once
/**
 * @file RadioDefaults.h
 * @brief Protocol constants and default settings of the UDP radio integration.
 */

#include <stdint.h>

namespace RadioDefaults {

/** @brief Device command port (datagrams are sent here). */
constexpr uint16_t UdpPort = 4244;
/** @brief Local port the device sends acknowledgments and notifications to. */
constexpr uint16_t ListenPort = 4242;
/** @brief Broadcast target used before a subnet broadcast could be derived. */
constexpr char BroadcastAddress[] = "255.255.255.255";
/** @brief Identity token echoed by the device in replies. */
constexpr char Identity[] = "flowradio";

constexpr uint32_t TimerSec = 60;
constexpr uint32_t FullUpdateSec = 60UL * 60UL * 24UL;
/**
 * @brief Upper bound for any poll interval.
 *
 * Keeps `interval * 1000` below 2^31 so wrap-safe millis() comparisons stay valid.
 */
constexpr uint32_t MaxIntervalSec = 24UL * 24UL * 3600UL;

/** @brief Silence after which a powered device is considered gone. */
constexpr uint32_t DeadPeerMs = 60UL * 1000UL;

constexpr uint16_t MaxDatagram = 4096;

constexpr int32_t VolumeMin = 0;
constexpr int32_t VolumeMax = 31;
/** @brief Volume restored on unmute when no audible level is known. */
constexpr int32_t UnmuteVolume = 16;
/** @brief Volume reading value while muted. */
constexpr int32_t MutedVolume = -1;

constexpr uint8_t StationCount = 8;

}  // namespace RadioDefaults
