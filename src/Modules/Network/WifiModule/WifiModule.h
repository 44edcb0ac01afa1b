#pragma once
/**
 * @file WifiModule.h
 * @brief WiFi station connectivity module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include <WiFi.h>

/** @brief WiFi connection state. */
enum class WifiState : uint8_t {
    Disabled,
    Idle,
    Connecting,
    Connected,
    ErrorWait
};

/** @brief WiFi configuration values. */
struct WifiConfig {
    bool enabled = true;
    char ssid[32] = "";
    char pass[64] = "";
};

/**
 * @brief Active module that keeps the station connected and mirrors the
 * link state into the DataStore (`wifi.ready`, `wifi.ip`).
 */
class WifiModule : public Module {
public:
    const char* moduleId() const override { return "wifi"; }
    const char* taskName() const override { return "wifi"; }
    /** @brief Network stack runs on core 0. */
    BaseType_t taskCore() const override { return 0; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "datastore";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    WifiConfig cfgData;
    WifiState state = WifiState::Idle;
    uint32_t stateTs = 0;
    uint32_t lastEmptySsidLogMs = 0;
    DataStore* dataStore = nullptr;
    bool gotIpSent = false;

    ConfigVariable<bool,0> enabledVar {
        NVS_KEY(NvsKeys::Wifi::Enabled),"enabled","wifi",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };

    ConfigVariable<char,0> ssidVar {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",
        ConfigType::CharArray,
        cfgData.ssid,
        ConfigPersistence::Persistent,
        sizeof(cfgData.ssid)
    };

    ConfigVariable<char,0> passVar {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",
        ConfigType::CharArray,
        cfgData.pass,
        ConfigPersistence::Persistent,
        sizeof(cfgData.pass)
    };

    static bool svcGetIP(void* ctx, char* out, size_t len);

    void setState(WifiState s);
    void startConnect();
    void publishIp_();
};
