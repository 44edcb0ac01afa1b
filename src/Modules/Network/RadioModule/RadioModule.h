#pragma once
/**
 * @file RadioModule.h
 * @brief UDP radio integration module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Domain/RadioDefaults.h"
#include "Modules/Network/RadioModule/RadioEngine.h"
#include "Modules/Network/RadioModule/RadioUdpLink.h"

/** @brief Persistent settings of the radio integration. */
struct RadioModuleConfig {
    char host[Limits::Radio::HostLen] = "";
    char broadcast[Limits::Radio::HostLen] = "";
    int32_t udpPort = RadioDefaults::UdpPort;
    int32_t listenPort = RadioDefaults::ListenPort;
    int32_t timerSec = (int32_t)RadioDefaults::TimerSec;
    int32_t fullUpdateSec = (int32_t)RadioDefaults::FullUpdateSec;
    char identity[Limits::Radio::IdentityLen] = "";
};

/**
 * @brief Active module owning the radio engine and its UDP socket.
 *
 * The engine is started once Wi-Fi is up and stopped when it drops.
 * Commands (`radio.*`) run on the caller task; engine access is serialized
 * by a mutex. Configuration changes are applied from the radio task.
 */
class RadioModule : public Module {
public:
    RadioModule();

    const char* moduleId() const override { return "radio"; }
    const char* taskName() const override { return "radio"; }
    uint16_t taskStackSize() const override { return Limits::Radio::TaskStackSize; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "cmd";
        if (i == 4) return "wifi";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    enum PendingBits : uint8_t {
        PendingHost = 1 << 0,
        PendingBroadcast = 1 << 1,
        PendingUdpPort = 1 << 2,
        PendingListenPort = 1 << 3,
        PendingTimer = 1 << 4,
        PendingFullUpdate = 1 << 5,
        PendingIdentity = 1 << 6
    };

    /** Datagrams handled per loop pass. */
    static constexpr uint8_t MaxDatagramsPerLoop = 8;

    RadioModuleConfig cfgData;

    RadioUdpLink link_;
    RadioEngine engine_;

    SemaphoreHandle_t engineMutex_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    const WifiService* wifiSvc_ = nullptr;
    RadioService radioSvc_{ nullptr, nullptr };

    // Set by the EventBus task, consumed by the radio task.
    portMUX_TYPE pendingMux_ = portMUX_INITIALIZER_UNLOCKED;
    uint8_t pendingCfg_ = 0;
    volatile bool wifiChanged_ = false;

    bool netReady_ = false;
    // Silent changes already announced, radio task only.
    uint64_t postedPendingMask_ = 0;

    ConfigVariable<char,0> hostVar {
        NVS_KEY(NvsKeys::Radio::Host),"host","radio",ConfigType::CharArray,
        cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<char,0> broadcastVar {
        NVS_KEY(NvsKeys::Radio::Broadcast),"broadcast","radio",ConfigType::CharArray,
        cfgData.broadcast,ConfigPersistence::Persistent,sizeof(cfgData.broadcast)
    };
    ConfigVariable<int32_t,0> udpPortVar {
        NVS_KEY(NvsKeys::Radio::UdpPort),"udp_port","radio",ConfigType::Int32,
        &cfgData.udpPort,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> listenPortVar {
        NVS_KEY(NvsKeys::Radio::ListenPort),"listen_port","radio",ConfigType::Int32,
        &cfgData.listenPort,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> timerVar {
        NVS_KEY(NvsKeys::Radio::TimerSec),"timer_s","radio",ConfigType::Int32,
        &cfgData.timerSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> fullUpdateVar {
        NVS_KEY(NvsKeys::Radio::FullUpdateSec),"full_update_s","radio",ConfigType::Int32,
        &cfgData.fullUpdateSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> identityVar {
        NVS_KEY(NvsKeys::Radio::Identity),"identity","radio",ConfigType::CharArray,
        cfgData.identity,ConfigPersistence::Persistent,sizeof(cfgData.identity)
    };

    void lockEngine_();
    void unlockEngine_();

    RadioConfig buildEngineConfig_() const;
    void startEngine_();
    void applyPendingConfig_();
    void pollDatagrams_();
    void syncRuntime_();
    void postReadingsChanged_(uint64_t mask);

    static bool resolveHost_(void* ctx, const char* host, char* out, size_t outLen);

    static void onReadingsChangedStatic_(void* ctx, uint64_t changedMask);
    static void onStatusChangedStatic_(void* ctx, RadioStatus status);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool cmdRadio_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    static bool svcReadingsJson_(void* ctx, char* out, size_t outLen);
};
