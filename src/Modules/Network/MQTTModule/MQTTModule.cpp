/**
 * @file MQTTModule.cpp
 * @brief Implementation file.
 */
#include "MQTTModule.h"
#include "Core/DataKeys.h"
#include "Core/MqttTopics.h"
#include "Core/SystemLimits.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/Network/MQTTModule/MQTTRuntime.h"
#include "Modules/Network/WifiModule/WifiRuntime.h"
#include <ArduinoJson.h>
#include <esp_system.h>
#include <esp_mac.h>
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

static uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV) {
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = esp_random();
    uint32_t delta = r % (2U * span + 1U);
    int32_t out = (int32_t)baseMs + (int32_t)delta - (int32_t)span;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

static bool isMqttConnKey(const char* key)
{
    static const char* const keys[] = {
        NvsKeys::Mqtt::BaseTopic,
        NvsKeys::Mqtt::Host,
        NvsKeys::Mqtt::Port,
        NvsKeys::Mqtt::User,
        NvsKeys::Mqtt::Pass
    };
    if (!key || key[0] == '\0') return false;
    for (const char* k : keys) {
        if (strcmp(key, k) == 0) return true;
    }
    return false;
}

void MQTTModule::setState(MQTTState s) {
    state = s;
    stateTs = millis();
    if (dataStore) {
        setMqttReady(*dataStore, s == MQTTState::Connected);
    }
}

static void makeDeviceId(char* out, size_t len) {
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(out, len, "FlowRadio-%02X%02X%02X", mac[3], mac[4], mac[5]);
}

void MQTTModule::formatTopic(char* out, size_t outLen, const char* suffix) const
{
    if (!out || outLen == 0 || !suffix) return;
    snprintf(out, outLen, "%s/%s/%s", cfgData.baseTopic, deviceId, suffix);
}

void MQTTModule::buildTopics() {
    formatTopic(topicCmd, sizeof(topicCmd), MqttTopics::SuffixCmd);
    formatTopic(topicAck, sizeof(topicAck), MqttTopics::SuffixAck);
    formatTopic(topicStatus, sizeof(topicStatus), MqttTopics::SuffixStatus);
    formatTopic(topicCfgSet, sizeof(topicCfgSet), MqttTopics::SuffixCfgSet);
    formatTopic(topicCfgAck, sizeof(topicCfgAck), MqttTopics::SuffixCfgAck);
    formatTopic(topicRadio, sizeof(topicRadio), MqttTopics::SuffixRadio);
}

void MQTTModule::connectMqtt() {
    buildTopics();
    client.setServer(cfgData.host, (uint16_t)cfgData.port);
    if (cfgData.user[0] != '\0') client.setCredentials(cfgData.user, cfgData.pass);
    client.setWill(topicStatus, 1, true, "{\"online\":false}");
    client.connect();
    setState(MQTTState::Connecting);
    LOGI("Connecting to %s:%ld", cfgData.host, (long)cfgData.port);
}

void MQTTModule::onConnect(bool) {
    LOGI("Connected subscribe %s", topicCmd);
    client.subscribe(topicCmd, 0);
    client.subscribe(topicCfgSet, 1);

    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
    setState(MQTTState::Connected);

    (void)publish(topicStatus, "{\"online\":true}", 1, true);

    // Retained topics are refreshed from the MQTT task.
    pendingCfgAll_ = true;
    pendingRadio_ = true;
}

void MQTTModule::onDisconnect(AsyncMqttClientDisconnectReason reason) {
    LOGW("Disconnected reason=%u", (unsigned)reason);
    if (state != MQTTState::Disabled && state != MQTTState::WaitingNetwork) {
        setState(MQTTState::ErrorWait);
    }
}

void MQTTModule::onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties,
                           size_t len, size_t, size_t total) {
    if (!rxQ) return;
    // Fragmented or oversized messages are dropped.
    if (!topic || !payload || len != total) return;

    const size_t topicLen = strlen(topic);
    if (topicLen >= sizeof(RxMsg{}.topic) || len >= sizeof(RxMsg{}.payload)) return;

    RxMsg m{};
    memcpy(m.topic, topic, topicLen);
    memcpy(m.payload, payload, len);

    if (xQueueSend(rxQ, &m, 0) != pdTRUE) {
        LOGW("rx queue full, dropped topic=%s", m.topic);
    }
}

bool MQTTModule::publish(const char* topic, const char* payload, int qos, bool retain)
{
    if (!topic || !payload) return false;
    if (state != MQTTState::Connected) return false;
    const uint16_t packetId = client.publish(topic, qos, retain, payload);
    if (packetId == 0U) {
        LOGW("publish rejected topic=%s qos=%d", topic, qos);
        return false;
    }
    LOGD("TX t=%s r=%d %s", topic, retain ? 1 : 0, payload);
    return true;
}

bool MQTTModule::publishConfigModule_(const char* module)
{
    if (!cfgSvc || !cfgSvc->toJsonModule || !module || module[0] == '\0') return false;

    char suffix[32];
    snprintf(suffix, sizeof(suffix), "cfg/%s", module);
    char topic[Limits::Mqtt::Buffers::Topic];
    formatTopic(topic, sizeof(topic), suffix);

    bool truncated = false;
    const bool any = cfgSvc->toJsonModule(cfgSvc->ctx, module, cfgBuf, sizeof(cfgBuf), &truncated);
    if (truncated) {
        LOGW("cfg/%s truncated (buffer=%u)", module, (unsigned)sizeof(cfgBuf));
        return false;
    }
    if (!any) return false;
    return publish(topic, cfgBuf, 1, true);
}

void MQTTModule::publishAllConfigBlocks_()
{
    if (!cfgSvc || !cfgSvc->listModules) return;
    const char* modules[8] = {nullptr};
    const uint8_t n = cfgSvc->listModules(cfgSvc->ctx, modules, 8);
    for (uint8_t i = 0; i < n; ++i) {
        if (!publishConfigModule_(modules[i])) {
            LOGW("cfg/%s publish failed", modules[i]);
        }
    }
}

void MQTTModule::enqueueCfgModule_(const char* module)
{
    if (!module || module[0] == '\0') {
        pendingCfgAll_ = true;
        return;
    }

    portENTER_CRITICAL(&pendingMux_);
    bool known = false;
    for (uint8_t i = 0; i < pendingCfgCount_; ++i) {
        if (strncmp(pendingCfgModules_[i], module, sizeof(pendingCfgModules_[i])) == 0) {
            known = true;
            break;
        }
    }
    if (!known) {
        if (pendingCfgCount_ < PendingCfgModulesMax) {
            strncpy(pendingCfgModules_[pendingCfgCount_], module, sizeof(pendingCfgModules_[0]) - 1);
            pendingCfgModules_[pendingCfgCount_][sizeof(pendingCfgModules_[0]) - 1] = '\0';
            ++pendingCfgCount_;
        } else {
            pendingCfgAll_ = true;
        }
    }
    portEXIT_CRITICAL(&pendingMux_);
}

void MQTTModule::flushPendingConfig_()
{
    if (pendingCfgAll_) {
        pendingCfgAll_ = false;
        portENTER_CRITICAL(&pendingMux_);
        pendingCfgCount_ = 0;
        portEXIT_CRITICAL(&pendingMux_);
        publishAllConfigBlocks_();
        return;
    }

    char modules[PendingCfgModulesMax][16];
    portENTER_CRITICAL(&pendingMux_);
    const uint8_t n = pendingCfgCount_;
    memcpy(modules, pendingCfgModules_, sizeof(modules));
    pendingCfgCount_ = 0;
    portEXIT_CRITICAL(&pendingMux_);

    for (uint8_t i = 0; i < n; ++i) {
        (void)publishConfigModule_(modules[i]);
    }
}

void MQTTModule::publishRadioSnapshot_()
{
    pendingRadio_ = false;
    if (!radioSvc || !radioSvc->readingsJson) return;
    if (!radioSvc->readingsJson(radioSvc->ctx, publishBuf, sizeof(publishBuf))) {
        LOGW("radio snapshot build failed (buffer=%u)", (unsigned)sizeof(publishBuf));
        return;
    }
    if (!publish(topicRadio, publishBuf, 0, true)) {
        pendingRadio_ = true;
    }
}

void MQTTModule::processRx(const RxMsg& msg) {
    if (strcmp(msg.topic, topicCmd) == 0) return processRxCmd_(msg);
    if (strcmp(msg.topic, topicCfgSet) == 0) return processRxCfgSet_(msg);
    publishRxError_(topicAck, ErrorCode::UnknownTopic, "rx");
}

void MQTTModule::processRxCmd_(const RxMsg& msg)
{
    static StaticJsonDocument<Limits::JsonCmdBuf> doc;
    doc.clear();

    const DeserializationError err = deserializeJson(doc, msg.payload);
    if (err || !doc.is<JsonObject>()) {
        LOGW("bad cmd json (%s)", err ? err.c_str() : "not an object");
        publishRxError_(topicAck, ErrorCode::BadCmdJson, "cmd");
        return;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    JsonVariantConst cmdVar = root["cmd"];
    const char* cmdVal = cmdVar.is<const char*>() ? cmdVar.as<const char*>() : nullptr;
    if (!cmdVal || cmdVal[0] == '\0') {
        publishRxError_(topicAck, ErrorCode::MissingCmd, "cmd");
        return;
    }
    if (!cmdSvc || !cmdSvc->execute) {
        publishRxError_(topicAck, ErrorCode::CmdServiceUnavailable, "cmd");
        return;
    }

    char cmd[Limits::Mqtt::Buffers::CmdName];
    snprintf(cmd, sizeof(cmd), "%s", cmdVal);

    const char* argsJson = nullptr;
    char argsBuf[Limits::Mqtt::Buffers::CmdArgs] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            publishRxError_(topicAck, ErrorCode::ArgsTooLarge, "cmd");
            return;
        }
        argsJson = argsBuf;
    }

    // A false return still carries an error envelope in replyBuf.
    const bool ok = cmdSvc->execute(cmdSvc->ctx, cmd, msg.payload, argsJson, replyBuf, sizeof(replyBuf));

    const int wrote = snprintf(ackBuf, sizeof(ackBuf), "{\"ok\":%s,\"cmd\":\"%s\",\"reply\":%s}",
                               ok ? "true" : "false", cmd, replyBuf[0] ? replyBuf : "{}");
    if (!(wrote > 0 && (size_t)wrote < sizeof(ackBuf))) {
        publishRxError_(topicAck, ErrorCode::InternalAckOverflow, "cmd");
        return;
    }
    if (!publish(topicAck, ackBuf, 0, false)) {
        LOGW("cmd ack publish failed cmd=%s", cmd);
    }
}

void MQTTModule::processRxCfgSet_(const RxMsg& msg)
{
    if (!cfgSvc || !cfgSvc->applyJson) {
        publishRxError_(topicCfgAck, ErrorCode::CfgServiceUnavailable, "cfg/set");
        return;
    }

    static StaticJsonDocument<Limits::JsonCfgBuf> cfgDoc;
    cfgDoc.clear();
    const DeserializationError cfgErr = deserializeJson(cfgDoc, msg.payload);
    if (cfgErr || !cfgDoc.is<JsonObject>()) {
        publishRxError_(topicCfgAck, ErrorCode::BadCfgJson, "cfg/set");
        return;
    }

    if (!cfgSvc->applyJson(cfgSvc->ctx, msg.payload)) {
        publishRxError_(topicCfgAck, ErrorCode::CfgApplyFailed, "cfg/set");
        return;
    }

    // cfg/<module> blocks follow through ConfigChanged.
    snprintf(ackBuf, sizeof(ackBuf), "{\"ok\":true,\"where\":\"cfg/set\"}");
    if (!publish(topicCfgAck, ackBuf, 1, false)) {
        LOGW("cfg/set ack publish failed");
    }
}

void MQTTModule::publishRxError_(const char* ackTopic, ErrorCode code, const char* where)
{
    if (!ackTopic || ackTopic[0] == '\0') return;

    if (!writeErrorJson(ackBuf, sizeof(ackBuf), code, where)) {
        snprintf(ackBuf, sizeof(ackBuf), "{\"ok\":false}");
    }
    if (!publish(ackTopic, ackBuf, 0, false)) {
        LOGW("rx error ack publish failed topic=%s", ackTopic);
    }
}

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);
    cfg.registerVar(baseTopicVar);
    cfg.registerVar(enabledVar);

    cmdSvc = services.get<CommandService>("cmd");
    cfgSvc = services.get<ConfigStoreService>("config");
    radioSvc = services.get<RadioService>("radio");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore = dsSvc ? dsSvc->store : nullptr;


    if (eventBus) {
        eventBus->subscribe(EventId::DataChanged, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::ConfigChanged, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::RadioReadingsChanged, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::RadioStatusChanged, &MQTTModule::onEventStatic, this);
    } else {
        LOGW("EventBus unavailable, retained topics refresh on connect only");
    }

    makeDeviceId(deviceId, sizeof(deviceId));
    rxQ = xQueueCreate(Limits::Mqtt::Capacity::RxQueueLen, sizeof(RxMsg));
    client.onConnect([this](bool sp){ this->onConnect(sp); });
    client.onDisconnect([this](AsyncMqttClientDisconnectReason r){ this->onDisconnect(r); });
    client.onMessage([this](char* t, char* p, AsyncMqttClientMessageProperties pr, size_t l, size_t i, size_t tot){
        this->onMessage(t, p, pr, l, i, tot);
    });
}

void MQTTModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    buildTopics();
    LOGI("Init id=%s topic=%s", deviceId, topicCmd);

    _netReady = dataStore ? wifiReady(*dataStore) : false;
    _netReadyTs = millis();
    setState(cfgData.enabled ? MQTTState::WaitingNetwork : MQTTState::Disabled);
}

void MQTTModule::loop() {
    if (!cfgData.enabled) {
        if (state != MQTTState::Disabled) {
            client.disconnect();
            setState(MQTTState::Disabled);
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::DisabledDelayMs));
        return;
    }

    if (reconnectRequested_) {
        reconnectRequested_ = false;
        if (state == MQTTState::Connected || state == MQTTState::Connecting) {
            client.disconnect();
        }
        setState(MQTTState::WaitingNetwork);
    }

    switch (state) {
    case MQTTState::Disabled:
        setState(MQTTState::WaitingNetwork);
        break;

    case MQTTState::WaitingNetwork:
        if (!_netReady || cfgData.host[0] == '\0') break;
        if ((uint32_t)(millis() - _netReadyTs) >= Limits::Mqtt::Timing::NetWarmupMs) connectMqtt();
        break;

    case MQTTState::Connecting:
        if ((uint32_t)(millis() - stateTs) > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            client.disconnect();
            setState(MQTTState::ErrorWait);
        }
        break;

    case MQTTState::Connected: {
        RxMsg m;
        while (xQueueReceive(rxQ, &m, 0) == pdTRUE) processRx(m);
        flushPendingConfig_();
        if (pendingRadio_) publishRadioSnapshot_();
        break;
    }

    case MQTTState::ErrorWait:
        if (!_netReady) {
            setState(MQTTState::WaitingNetwork);
            break;
        }
        if ((uint32_t)(millis() - stateTs) >= _retryDelayMs) {
            _retryCount++;
            const uint32_t next = clampU32(_retryDelayMs * 2U,
                                           Limits::Mqtt::Backoff::MinMs,
                                           Limits::Mqtt::Backoff::MaxMs);
            _retryDelayMs = jitterMs(next, Limits::Mqtt::Backoff::JitterPct);
            LOGI("Retry #%u, next backoff %lu ms", (unsigned)_retryCount, (unsigned long)_retryDelayMs);
            setState(MQTTState::WaitingNetwork);
        }
        break;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::LoopDelayMs));
}

void MQTTModule::onEventStatic(const Event& e, void* user)
{
    static_cast<MQTTModule*>(user)->onEvent(e);
}

void MQTTModule::onEvent(const Event& e)
{
    if (e.id == EventId::DataChanged) {
        const DataChangedPayload* p = (const DataChangedPayload*)e.payload;
        if (!p || p->id != DataKeys::WifiReady || !dataStore) return;

        const bool ready = wifiReady(*dataStore);
        if (ready == _netReady) return;

        _netReady = ready;
        _netReadyTs = millis();
        LOGI("network ready=%s", ready ? "true" : "false");
        if (!ready) reconnectRequested_ = true;
        return;
    }

    if (e.id == EventId::RadioReadingsChanged || e.id == EventId::RadioStatusChanged) {
        pendingRadio_ = true;
        return;
    }

    if (e.id == EventId::ConfigChanged) {
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        if (!p) return;

        if (isMqttConnKey(p->nvsKey)) {
            LOGI("MQTT config changed (%s), reconnecting", p->nvsKey);
            reconnectRequested_ = true;
            _netReadyTs = millis();
        }
        enqueueCfgModule_(p->module);
        return;
    }
}
