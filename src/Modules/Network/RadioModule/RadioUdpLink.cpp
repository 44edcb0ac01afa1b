/**
 * @file RadioUdpLink.cpp
 * @brief Implementation file.
 */
#include "Modules/Network/RadioModule/RadioUdpLink.h"

#define LOG_TAG "RadioUdp"
#include "Core/ModuleLog.h"

bool RadioUdpLink::startListener(uint16_t port)
{
    stopListener();
    if (port == 0) return false;
    if (!udp_.begin(port)) {
        LOGW("listener bind failed port=%u", (unsigned)port);
        return false;
    }
    listening_ = true;
    port_ = port;
    LOGI("listening on udp/%u", (unsigned)port);
    return true;
}

void RadioUdpLink::stopListener()
{
    if (!listening_) return;
    udp_.stop();
    listening_ = false;
    LOGD("listener on udp/%u closed", (unsigned)port_);
    port_ = 0;
}

bool RadioUdpLink::send_(const char* address, uint16_t port, const uint8_t* data, size_t len)
{
    if (!address || address[0] == '\0' || !data || len == 0 || port == 0) return false;

    IPAddress ip;
    if (!ip.fromString(address) && WiFi.hostByName(address, ip) != 1) {
        LOGW("cannot resolve %s", address);
        return false;
    }
    if (!udp_.beginPacket(ip, port)) {
        LOGW("beginPacket failed %s:%u", address, (unsigned)port);
        return false;
    }
    const size_t written = udp_.write(data, len);
    if (!udp_.endPacket() || written != len) {
        LOGW("send failed %s:%u (%u/%u bytes)", address, (unsigned)port, (unsigned)written, (unsigned)len);
        return false;
    }
    return true;
}

bool RadioUdpLink::sendUnicast(const char* address, uint16_t port, const uint8_t* data, size_t len)
{
    return send_(address, port, data, len);
}

bool RadioUdpLink::sendBroadcast(const char* address, uint16_t port, const uint8_t* data, size_t len)
{
    // lwIP sockets created by WiFiUDP accept broadcast destinations as-is.
    return send_(address, port, data, len);
}

size_t RadioUdpLink::poll()
{
    if (!listening_) return 0;
    const int size = udp_.parsePacket();
    if (size <= 0) return 0;

    const int n = udp_.read(rxBuf_, RadioDefaults::MaxDatagram);
    if (n <= 0) {
        rxBuf_[0] = '\0';
        return 0;
    }
    if (size > n) {
        udp_.flush();
        LOGW("datagram truncated (%d > %d bytes)", size, n);
    }
    rxBuf_[n] = '\0';
    return (size_t)n;
}
