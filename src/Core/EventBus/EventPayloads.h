#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[16];
    char module[16];
};

/** @brief Payload for RadioReadingsChanged: bit `i` set for reading `i` (see RadioReading). */
struct RadioReadingsChangedPayload {
    uint64_t changedMask;
};

/** @brief Payload for RadioStatusChanged. */
struct RadioStatusChangedPayload {
    uint8_t status; // RadioStatus
};

/** @brief Identifiers for DataStore values. */
using DataKey = uint16_t;

/** @brief Payload for data change events. */
struct DataChangedPayload {
    DataKey id;
};

