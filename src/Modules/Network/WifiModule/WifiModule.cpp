/**
 * @file WifiModule.cpp
 * @brief Implementation file.
 */
#include "WifiModule.h"
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"
#include "Modules/Network/WifiModule/WifiRuntime.h"
#include <string.h>

bool WifiModule::svcGetIP(void* ctx, char* out, size_t len) {
    (void)ctx;
    if (!out || len == 0) return false;

    if (!WiFi.isConnected()) {
        out[0] = '\0';
        return false;
    }

    IPAddress ip = WiFi.localIP();
    snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return true;
}

void WifiModule::setState(WifiState s) {
    if (s == state) return;
    state = s;
    stateTs = millis();

    if (state != WifiState::Connected && state != WifiState::Connecting) {
        if (dataStore) setWifiReady(*dataStore, false);
        gotIpSent = false;
    }
}

void WifiModule::startConnect() {
    if (cfgData.ssid[0] == '\0') {
        const uint32_t now = millis();
        if ((uint32_t)(now - lastEmptySsidLogMs) >= 10000U) {
            lastEmptySsidLogMs = now;
            LOGW("SSID empty, skipping connection");
        }
        return;
    }

    LOGI("Connecting to '%s'", cfgData.ssid);

    WiFi.disconnect(false, false);
    WiFi.mode(WIFI_MODE_STA);
    // Modem sleep delays inbound UDP notifications from the radio.
    WiFi.setSleep(false);
    WiFi.begin(cfgData.ssid, cfgData.pass);

    setState(WifiState::Connecting);
}

void WifiModule::publishIp_()
{
    if (gotIpSent) return;
    IPAddress ip = WiFi.localIP();
    if (ip[0] == 0 && ip[1] == 0 && ip[2] == 0 && ip[3] == 0) return;

    if (dataStore) {
        IpV4 ip4{};
        for (uint8_t i = 0; i < 4; ++i) ip4.b[i] = ip[i];
        setWifiIp(*dataStore, ip4);
        setWifiReady(*dataStore, true);
    }
    gotIpSent = true;
}

void WifiModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore = dsSvc ? dsSvc->store : nullptr;

    cfg.registerVar(enabledVar);
    cfg.registerVar(ssidVar);
    cfg.registerVar(passVar);

    static WifiService svc {
        WifiModule::svcGetIP,
        this
    };
    if (!services.add("wifi", &svc)) {
        LOGE("WifiService registration failed");
    }

    // Credentials live in ConfigStore only.
    WiFi.persistent(false);
}

void WifiModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    setState(cfgData.enabled ? WifiState::Idle : WifiState::Disabled);
}

void WifiModule::loop() {
    switch (state) {

    case WifiState::Disabled:
        if (cfgData.enabled) setState(WifiState::Idle);
        vTaskDelay(pdMS_TO_TICKS(2000));
        break;

    case WifiState::Idle:
        startConnect();
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::Connecting:
        if (WiFi.isConnected()) {
            IPAddress ip = WiFi.localIP();
            LOGI("Connected IP=%u.%u.%u.%u RSSI=%d", ip[0], ip[1], ip[2], ip[3], WiFi.RSSI());
            setState(WifiState::Connected);
            publishIp_();
        }
        else if ((uint32_t)(millis() - stateTs) > Limits::Wifi::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            WiFi.disconnect(false, false);
            setState(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(200));
        break;

    case WifiState::Connected:
        if (!cfgData.enabled) {
            WiFi.disconnect(false, false);
            setState(WifiState::Disabled);
        } else if (!WiFi.isConnected()) {
            LOGW("Disconnected");
            setState(WifiState::ErrorWait);
        } else {
            publishIp_();
        }
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::ErrorWait:
        if ((uint32_t)(millis() - stateTs) > Limits::Wifi::RetryDelayMs) {
            setState(WifiState::Idle);
        }
        vTaskDelay(pdMS_TO_TICKS(500));
        break;
    }
}
