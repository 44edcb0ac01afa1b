#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // DataStore (runtime model changes)
    DataChanged = 50,

    // Configuration
    ConfigChanged = 100,

    // Radio device
    RadioReadingsChanged = 500,
    RadioStatusChanged = 501,
};
