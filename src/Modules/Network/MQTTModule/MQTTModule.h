#pragma once
/**
 * @file MQTTModule.h
 * @brief MQTT client module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/ErrorCodes.h"
#include "Core/Services/Services.h"
#include <AsyncMqttClient.h>

/** @brief MQTT configuration values. */
struct MQTTConfig {
    bool enabled = true;
    char host[Limits::Mqtt::Buffers::Host] = "";
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = "";
    char pass[Limits::Mqtt::Buffers::Pass] = "";
    char baseTopic[Limits::Mqtt::Buffers::BaseTopic] = "flowradio";
};

/** @brief MQTT connection state. */
enum class MQTTState : uint8_t { Disabled, WaitingNetwork, Connecting, Connected, ErrorWait };

/**
 * @brief Active module that manages the broker connection.
 *
 * Topics under `<base>/<device>/`:
 * - `cmd` → CommandService, answered on `ack`;
 * - `cfg/set` → ConfigStoreService::applyJson, answered on `cfg/ack`;
 * - `cfg/<module>` retained config blocks, refreshed on ConfigChanged;
 * - `rt/radio` retained radio readings snapshot;
 * - `status` availability with a Last Will.
 */
class MQTTModule : public Module {
public:
    const char* moduleId() const override { return "mqtt"; }
    const char* taskName() const override { return "mqtt"; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "wifi";
        if (i == 2) return "cmd";
        if (i == 3) return "config";
        if (i == 4) return "radio";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;
    /** @brief JSON and snprintf heavy path. */
    uint16_t taskStackSize() const override { return Limits::Mqtt::TaskStackSize; }

    bool publish(const char* topic, const char* payload, int qos = 0, bool retain = false);
    void formatTopic(char* out, size_t outLen, const char* suffix) const;

private:
    static constexpr uint8_t PendingCfgModulesMax = 4;

    MQTTConfig cfgData;
    MQTTState state = MQTTState::Disabled;
    uint32_t stateTs = 0;

    AsyncMqttClient client;

    const CommandService* cmdSvc = nullptr;
    const ConfigStoreService* cfgSvc = nullptr;
    const RadioService* radioSvc = nullptr;
    EventBus* eventBus = nullptr;
    DataStore* dataStore = nullptr;

    char deviceId[Limits::Mqtt::Buffers::DeviceId] = {0};
    char topicCmd[Limits::Mqtt::Buffers::Topic] = {0};
    char topicAck[Limits::Mqtt::Buffers::Topic] = {0};
    char topicStatus[Limits::Mqtt::Buffers::Topic] = {0};
    char topicCfgSet[Limits::Mqtt::Buffers::Topic] = {0};
    char topicCfgAck[Limits::Mqtt::Buffers::Topic] = {0};
    char topicRadio[Limits::Mqtt::Buffers::Topic] = {0};

    struct RxMsg {
        char topic[Limits::Mqtt::Buffers::RxTopic];
        char payload[Limits::Mqtt::Buffers::RxPayload];
    };
    QueueHandle_t rxQ = nullptr;
    char ackBuf[Limits::Mqtt::Buffers::Ack] = {0};
    char replyBuf[Limits::Mqtt::Buffers::Reply] = {0};
    char cfgBuf[Limits::JsonCfgBuf] = {0};
    char publishBuf[Limits::Radio::SnapshotBuf] = {0};

    // Filled by the EventBus task, drained by the MQTT task.
    portMUX_TYPE pendingMux_ = portMUX_INITIALIZER_UNLOCKED;
    char pendingCfgModules_[PendingCfgModulesMax][16] = {{0}};
    uint8_t pendingCfgCount_ = 0;
    volatile bool pendingCfgAll_ = false;
    volatile bool pendingRadio_ = false;
    volatile bool reconnectRequested_ = false;

    ConfigVariable<char,0> hostVar {
        NVS_KEY(NvsKeys::Mqtt::Host),"host","mqtt",ConfigType::CharArray,
        cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t,0> portVar {
        NVS_KEY(NvsKeys::Mqtt::Port),"port","mqtt",ConfigType::Int32,
        &cfgData.port,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> userVar {
        NVS_KEY(NvsKeys::Mqtt::User),"user","mqtt",ConfigType::CharArray,
        cfgData.user,ConfigPersistence::Persistent,sizeof(cfgData.user)
    };
    ConfigVariable<char,0> passVar {
        NVS_KEY(NvsKeys::Mqtt::Pass),"pass","mqtt",ConfigType::CharArray,
        cfgData.pass,ConfigPersistence::Persistent,sizeof(cfgData.pass)
    };
    ConfigVariable<char,0> baseTopicVar {
        NVS_KEY(NvsKeys::Mqtt::BaseTopic),"baseTopic","mqtt",ConfigType::CharArray,
        cfgData.baseTopic,ConfigPersistence::Persistent,sizeof(cfgData.baseTopic)
    };
    ConfigVariable<bool,0> enabledVar {
        NVS_KEY(NvsKeys::Mqtt::Enabled),"enabled","mqtt",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };

    void setState(MQTTState s);
    void buildTopics();
    void connectMqtt();
    void processRx(const RxMsg& msg);
    void processRxCmd_(const RxMsg& msg);
    void processRxCfgSet_(const RxMsg& msg);
    void publishRxError_(const char* ackTopic, ErrorCode code, const char* where);

    void publishAllConfigBlocks_();
    bool publishConfigModule_(const char* module);
    void enqueueCfgModule_(const char* module);
    void flushPendingConfig_();
    void publishRadioSnapshot_();

    void onConnect(bool sessionPresent);
    void onDisconnect(AsyncMqttClientDisconnectReason reason);
    void onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties properties,
                   size_t len, size_t index, size_t total);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    // ---- network warmup ----
    volatile bool _netReady = false;
    volatile uint32_t _netReadyTs = 0;

    // ---- retry backoff ----
    uint8_t _retryCount = 0;
    uint32_t _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
};
