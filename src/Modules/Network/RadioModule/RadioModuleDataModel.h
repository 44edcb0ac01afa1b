#pragma once
/**
 * @file RadioModuleDataModel.h
 * @brief Radio runtime data model contribution.
 */

#include <stdint.h>

#include "Core/SystemLimits.h"

/** @brief Mirror of the radio device record for other modules. */
struct RadioRuntimeData {
    char status[12] = "offline";
    bool power = false;
    /** -1 while muted or unknown. */
    int32_t volume = -1;
    bool muted = false;
    char ip[Limits::Radio::IpLen] = {0};
    char playMode[12] = {0};
};
