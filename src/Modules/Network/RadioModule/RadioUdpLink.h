#pragma once
/**
 * @file RadioUdpLink.h
 * @brief WiFiUDP transport for the radio engine.
 */

#include <WiFi.h>
#include <WiFiUdp.h>

#include "Domain/RadioDefaults.h"
#include "Modules/Network/RadioModule/RadioLink.h"

/**
 * @brief One UDP socket bound to the listen port, also used for sends.
 *
 * Not thread-safe: owned and driven by the radio task.
 */
class RadioUdpLink : public RadioLink {
public:
    bool startListener(uint16_t port) override;
    void stopListener() override;
    bool listening() const override { return listening_; }

    bool sendUnicast(const char* address, uint16_t port, const uint8_t* data, size_t len) override;
    bool sendBroadcast(const char* address, uint16_t port, const uint8_t* data, size_t len) override;

    /**
     * @brief Read one pending datagram into the internal buffer.
     * @return datagram length, 0 when nothing is pending.
     *
     * Oversized datagrams are truncated to RadioDefaults::MaxDatagram bytes.
     */
    size_t poll();
    /** @brief NUL-terminated payload of the last polled datagram. */
    const char* data() const { return rxBuf_; }

private:
    bool send_(const char* address, uint16_t port, const uint8_t* data, size_t len);

    WiFiUDP udp_;
    bool listening_ = false;
    uint16_t port_ = 0;
    char rxBuf_[RadioDefaults::MaxDatagram + 1] = {0};
};
