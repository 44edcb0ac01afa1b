#pragma once
/**
 * @file RadioLink.h
 * @brief Datagram transport used by the radio engine.
 *
 * Sends are fire-and-forget: a `false` return means the datagram could not be
 * handed to the network stack, nothing more. Retries belong to the poll policy.
 */

#include <stddef.h>
#include <stdint.h>

class RadioLink {
public:
    virtual ~RadioLink() = default;

    /** @brief Bind the receive socket. Implementations stop a previous listener first. */
    virtual bool startListener(uint16_t port) = 0;
    virtual void stopListener() = 0;
    virtual bool listening() const = 0;

    virtual bool sendUnicast(const char* address, uint16_t port, const uint8_t* data, size_t len) = 0;
    /** @brief Send with broadcast permission on the socket. */
    virtual bool sendBroadcast(const char* address, uint16_t port, const uint8_t* data, size_t len) = 0;
};
