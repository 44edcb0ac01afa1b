#pragma once
/**
 * @file FakeRadioLink.h
 * @brief Recording RadioLink and table resolver for host tests.
 */

#include <stdio.h>
#include <string.h>

#include "Modules/Network/RadioModule/RadioAddress.h"
#include "Modules/Network/RadioModule/RadioLink.h"

struct SentDatagram {
    char target[64];
    uint16_t port;
    bool broadcast;
    char payload[512];
};

class FakeRadioLink : public RadioLink {
public:
    static constexpr uint8_t MaxSent = 32;

    bool startListener(uint16_t port) override {
        if (failListen) return false;
        listening_ = true;
        listenPort = port;
        ++listenerStarts;
        return true;
    }
    void stopListener() override { listening_ = false; }
    bool listening() const override { return listening_; }

    bool sendUnicast(const char* address, uint16_t port, const uint8_t* data, size_t len) override {
        return record_(address, port, false, data, len);
    }
    bool sendBroadcast(const char* address, uint16_t port, const uint8_t* data, size_t len) override {
        return record_(address, port, true, data, len);
    }

    void clearSent() { sentCount = 0; }
    /** @brief Back to a fresh, closed link with nothing recorded. */
    void reset() { *this = FakeRadioLink(); }
    const SentDatagram& last() const { return sent[sentCount - 1]; }

    SentDatagram sent[MaxSent]{};
    uint8_t sentCount = 0;
    uint16_t listenPort = 0;
    uint8_t listenerStarts = 0;
    bool failListen = false;
    bool failSend = false;

private:
    bool record_(const char* address, uint16_t port, bool broadcast, const uint8_t* data, size_t len) {
        if (failSend || sentCount >= MaxSent) return false;
        SentDatagram& d = sent[sentCount++];
        snprintf(d.target, sizeof(d.target), "%s", address ? address : "");
        d.port = port;
        d.broadcast = broadcast;
        if (len >= sizeof(d.payload)) len = sizeof(d.payload) - 1;
        memcpy(d.payload, data, len);
        d.payload[len] = '\0';
        return true;
    }

    bool listening_ = false;
};

/** @brief Resolves dotted literals as-is and `radio.local` to 10.0.0.5. */
static inline bool fakeResolve(void*, const char* host, char* out, size_t outLen)
{
    uint8_t ip[4];
    if (radioParseIpv4(host, ip)) {
        snprintf(out, outLen, "%s", host);
        return true;
    }
    if (strcmp(host, "radio.local") == 0) {
        snprintf(out, outLen, "10.0.0.5");
        return true;
    }
    return false;
}
