#pragma once
/**
 * @file IWifi.h
 * @brief WiFi service interface.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Service interface for the station address. */
struct WifiService {
    /** Writes the dotted station IP, false (and empty) while offline. */
    bool (*getIP)(void* ctx, char* out, size_t len);
    void* ctx;
};
