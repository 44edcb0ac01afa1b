#pragma once
/**
 * @file IRadio.h
 * @brief Radio integration service interface.
 */

#include <stddef.h>
#include <stdint.h>

/** @brief Result of a radio operation. */
enum RadioSvcStatus : uint8_t {
    RADIO_SVC_OK = 0,
    RADIO_SVC_ERR_INVALID_ARG = 1,
    /** Device state does not allow the operation (offline, nothing cached yet). */
    RADIO_SVC_ERR_NOT_READY = 2,
    /** Sends are suppressed while the configured host is unresolvable. */
    RADIO_SVC_ERR_HOST = 3,
    RADIO_SVC_ERR_RESOLVE = 4,
    /** Neither a host nor a discovered address is known. */
    RADIO_SVC_ERR_NO_ADDRESS = 5,
    RADIO_SVC_ERR_IO = 6
};

const char* radioSvcStatusStr(RadioSvcStatus st);

/** @brief Read side of the radio integration, used by publishers. */
struct RadioService {
    /** @brief Serialize status and set readings as a JSON object. */
    bool (*readingsJson)(void* ctx, char* out, size_t outLen);
    void* ctx;
};
