/**
 * @file ModuleLog.h
 * @brief Logging macros for modules; define LOG_TAG before including.
 */
#pragma once

#include "Core/Log.h"
#include "Core/SnprintfCheck.h"

#ifndef LOG_TAG
#define LOG_TAG "Module"
#endif

#undef LOGD
#undef LOGI
#undef LOGW
#undef LOGE

#define LOGD(...) ::Log::debug(LOG_TAG, __VA_ARGS__)
#define LOGI(...) ::Log::info(LOG_TAG, __VA_ARGS__)
#define LOGW(...) ::Log::warn(LOG_TAG, __VA_ARGS__)
#define LOGE(...) ::Log::error(LOG_TAG, __VA_ARGS__)

// Every snprintf in a module source goes through the truncation check.
#ifndef FLOWRADIO_SNPRINTF_WRAP_ACTIVE
#define FLOWRADIO_SNPRINTF_WRAP_ACTIVE 1
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    FLOWRADIO_SNPRINTF_CHECKED(LOG_TAG, OUT, LEN, FMT, ##__VA_ARGS__)
#endif
