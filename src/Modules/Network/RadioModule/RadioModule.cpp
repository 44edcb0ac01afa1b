/**
 * @file RadioModule.cpp
 * @brief Implementation file.
 */
#include "RadioModule.h"
#include "Core/DataKeys.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/Network/RadioModule/RadioCommands.h"
#include "Modules/Network/RadioModule/RadioRuntime.h"
#include "Modules/Network/WifiModule/WifiRuntime.h"
#include <string.h>
#define LOG_TAG "RadioMod"
#include "Core/ModuleLog.h"

static uint16_t portOr(int32_t v, uint16_t fallback, const char* what)
{
    if (v >= 1 && v <= 65535) return (uint16_t)v;
    LOGW("%s=%ld out of range, using %u", what, (long)v, (unsigned)fallback);
    return fallback;
}

static uint32_t secondsOrZero(int32_t v)
{
    return v > 0 ? (uint32_t)v : 0U;
}

RadioModule::RadioModule()
    : engine_(link_, RadioResolver{ &RadioModule::resolveHost_, nullptr })
{
    strncpy(cfgData.identity, RadioDefaults::Identity, sizeof(cfgData.identity) - 1);
}

void RadioModule::lockEngine_()
{
    if (!engineMutex_) return;
    xSemaphoreTake(engineMutex_, portMAX_DELAY);
}

void RadioModule::unlockEngine_()
{
    if (!engineMutex_) return;
    xSemaphoreGive(engineMutex_);
}

bool RadioModule::resolveHost_(void*, const char* host, char* out, size_t outLen)
{
    if (!host || host[0] == '\0' || !out || outLen == 0) return false;
    IPAddress ip;
    if (WiFi.hostByName(host, ip) != 1 || ip == IPAddress((uint32_t)0)) return false;
    const int wrote = snprintf(out, outLen, "%u.%u.%u.%u",
                               (unsigned)ip[0], (unsigned)ip[1], (unsigned)ip[2], (unsigned)ip[3]);
    return wrote > 0 && (size_t)wrote < outLen;
}

RadioConfig RadioModule::buildEngineConfig_() const
{
    RadioConfig c = radioDefaultConfig();
    snprintf(c.identity, sizeof(c.identity), "%s", cfgData.identity);
    snprintf(c.host, sizeof(c.host), "%s", cfgData.host);
    snprintf(c.broadcastAddress, sizeof(c.broadcastAddress), "%s", cfgData.broadcast);
    c.udpPort = portOr(cfgData.udpPort, RadioDefaults::UdpPort, "udp_port");
    c.listenPort = portOr(cfgData.listenPort, RadioDefaults::ListenPort, "listen_port");
    c.timerSec = secondsOrZero(cfgData.timerSec);
    c.fullUpdateSec = secondsOrZero(cfgData.fullUpdateSec);
    return c;
}

void RadioModule::syncRuntime_()
{
    if (!dataStore_) return;
    const RadioRuntimeView v = radioRuntimeView(engine_);

    setRadioStatus(*dataStore_, v.status);
    setRadioPower(*dataStore_, v.power);
    setRadioVolume(*dataStore_, v.volume);
    setRadioMuted(*dataStore_, v.muted);
    setRadioIp(*dataStore_, v.ip);
    setRadioPlayMode(*dataStore_, v.playMode);
}

void RadioModule::postReadingsChanged_(uint64_t mask)
{
    if (!eventBus_) return;
    RadioReadingsChangedPayload p{ mask };
    if (!eventBus_->post(EventId::RadioReadingsChanged, &p, sizeof(p))) {
        LOGW("RadioReadingsChanged dropped");
    }
}

void RadioModule::onReadingsChangedStatic_(void* ctx, uint64_t changedMask)
{
    RadioModule* self = static_cast<RadioModule*>(ctx);
    self->postedPendingMask_ = 0;
    self->syncRuntime_();
    self->postReadingsChanged_(changedMask);
}

void RadioModule::onStatusChangedStatic_(void* ctx, RadioStatus status)
{
    RadioModule* self = static_cast<RadioModule*>(ctx);
    LOGI("status -> %s", radioStatusName(status));
    self->syncRuntime_();
    if (!self->eventBus_) return;
    RadioStatusChangedPayload p{ (uint8_t)status };
    if (!self->eventBus_->post(EventId::RadioStatusChanged, &p, sizeof(p))) {
        LOGW("RadioStatusChanged dropped");
    }
}

bool RadioModule::cmdRadio_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    RadioModule* self = static_cast<RadioModule*>(userCtx);
    if (!self->engine_.running()) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, req.cmd ? req.cmd : "radio");
        return false;
    }
    self->lockEngine_();
    const bool ok = runRadioCommand(self->engine_, req, reply, replyLen);
    self->unlockEngine_();
    // The reply is a summary; the full snapshot goes out on rt/radio.
    if (ok && req.cmd && strcmp(req.cmd, RadioCmd::Readings) == 0) self->postReadingsChanged_(0);
    return ok;
}

bool RadioModule::svcReadingsJson_(void* ctx, char* out, size_t outLen)
{
    RadioModule* self = static_cast<RadioModule*>(ctx);
    self->lockEngine_();
    const bool ok = buildRadioSnapshotJson(self->engine_, out, outLen);
    self->unlockEngine_();
    return ok;
}

void RadioModule::onEventStatic(const Event& e, void* user)
{
    static_cast<RadioModule*>(user)->onEvent(e);
}

void RadioModule::onEvent(const Event& e)
{
    if (e.id == EventId::DataChanged) {
        const DataChangedPayload* p = (const DataChangedPayload*)e.payload;
        if (p && p->id == DataKeys::WifiReady) wifiChanged_ = true;
        return;
    }

    if (e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
    if (!p || strcmp(p->module, "radio") != 0) return;

    uint8_t bit = 0;
    if (strcmp(p->nvsKey, NvsKeys::Radio::Host) == 0) bit = PendingHost;
    else if (strcmp(p->nvsKey, NvsKeys::Radio::Broadcast) == 0) bit = PendingBroadcast;
    else if (strcmp(p->nvsKey, NvsKeys::Radio::UdpPort) == 0) bit = PendingUdpPort;
    else if (strcmp(p->nvsKey, NvsKeys::Radio::ListenPort) == 0) bit = PendingListenPort;
    else if (strcmp(p->nvsKey, NvsKeys::Radio::TimerSec) == 0) bit = PendingTimer;
    else if (strcmp(p->nvsKey, NvsKeys::Radio::FullUpdateSec) == 0) bit = PendingFullUpdate;
    else if (strcmp(p->nvsKey, NvsKeys::Radio::Identity) == 0) bit = PendingIdentity;
    if (bit == 0) return;

    portENTER_CRITICAL(&pendingMux_);
    pendingCfg_ |= bit;
    portEXIT_CRITICAL(&pendingMux_);
}

void RadioModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(hostVar);
    cfg.registerVar(broadcastVar);
    cfg.registerVar(udpPortVar);
    cfg.registerVar(listenPortVar);
    cfg.registerVar(timerVar);
    cfg.registerVar(fullUpdateVar);
    cfg.registerVar(identityVar);

    engineMutex_ = xSemaphoreCreateMutex();
    if (!engineMutex_) {
        LOGE("engine mutex allocation failed");
    }

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;
    wifiSvc_ = services.get<WifiService>("wifi");

    engine_.setObserver(RadioEngineObserver{
        &RadioModule::onReadingsChangedStatic_,
        &RadioModule::onStatusChangedStatic_,
        this
    });

    radioSvc_.readingsJson = &RadioModule::svcReadingsJson_;
    radioSvc_.ctx = this;
    services.add("radio", &radioSvc_);

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc && cmdSvc->registerHandler) {
        for (uint8_t i = 0; i < RADIO_COMMAND_COUNT; ++i) {
            if (!cmdSvc->registerHandler(cmdSvc->ctx, RADIO_COMMAND_NAMES[i], &RadioModule::cmdRadio_, this)) {
                LOGW("command %s not registered", RADIO_COMMAND_NAMES[i]);
            }
        }
    } else {
        LOGW("CommandService unavailable, radio.* commands disabled");
    }

    if (eventBus_) {
        eventBus_->subscribe(EventId::DataChanged, &RadioModule::onEventStatic, this);
        eventBus_->subscribe(EventId::ConfigChanged, &RadioModule::onEventStatic, this);
    } else {
        LOGW("EventBus unavailable, config changes apply after restart");
    }
}

void RadioModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    netReady_ = dataStore_ ? wifiReady(*dataStore_) : false;
    LOGI("Config host=%s udp=%ld listen=%ld timer=%lds full=%lds",
         cfgData.host[0] ? cfgData.host : "(discover)",
         (long)cfgData.udpPort, (long)cfgData.listenPort,
         (long)cfgData.timerSec, (long)cfgData.fullUpdateSec);
    syncRuntime_();
}

void RadioModule::startEngine_()
{
    char msg[Limits::Radio::MessageLen] = {0};
    const RadioConfig c = buildEngineConfig_();

    // Settings already folded into the engine config.
    portENTER_CRITICAL(&pendingMux_);
    pendingCfg_ = 0;
    portEXIT_CRITICAL(&pendingMux_);

    lockEngine_();
    const RadioSvcStatus st = engine_.begin(c, millis(), msg, sizeof(msg));
    postedPendingMask_ = 0;
    unlockEngine_();

    if (st != RADIO_SVC_OK) {
        LOGW("start: %s (%s)", radioSvcStatusStr(st), msg[0] ? msg : "-");
    } else {
        char localIp[16] = {0};
        if (wifiSvc_ && wifiSvc_->getIP && wifiSvc_->getIP(wifiSvc_->ctx, localIp, sizeof(localIp))) {
            LOGI("engine started on %s:%u", localIp, (unsigned)c.listenPort);
        }
    }
    syncRuntime_();
}

void RadioModule::applyPendingConfig_()
{
    portENTER_CRITICAL(&pendingMux_);
    const uint8_t pending = pendingCfg_;
    pendingCfg_ = 0;
    portEXIT_CRITICAL(&pendingMux_);
    if (pending == 0) return;

    const RadioConfig c = buildEngineConfig_();
    const uint32_t now = millis();

    lockEngine_();
    if (pending & PendingIdentity) engine_.setIdentity(c.identity);
    if (pending & PendingUdpPort) engine_.setUdpPort(c.udpPort);
    if (pending & PendingBroadcast) engine_.setBroadcastAddress(c.broadcastAddress);
    if (pending & PendingTimer) engine_.setTimerSec(c.timerSec, now);
    if (pending & PendingFullUpdate) engine_.setFullUpdateSec(c.fullUpdateSec);
    if ((pending & PendingListenPort) && !engine_.setListenPort(c.listenPort)) {
        LOGW("listener restart on port %u failed", (unsigned)c.listenPort);
    }
    RadioSvcStatus hostSt = RADIO_SVC_OK;
    char msg[Limits::Radio::MessageLen] = {0};
    if (pending & PendingHost) hostSt = engine_.setHost(c.host, now, msg, sizeof(msg));
    unlockEngine_();

    if (hostSt != RADIO_SVC_OK) {
        LOGW("host %s: %s (%s)", c.host, radioSvcStatusStr(hostSt), msg[0] ? msg : "-");
    }
    LOGI("config applied (mask=0x%02X)", (unsigned)pending);
    syncRuntime_();
}

void RadioModule::pollDatagrams_()
{
    for (uint8_t i = 0; i < MaxDatagramsPerLoop; ++i) {
        lockEngine_();
        const size_t n = link_.poll();
        if (n == 0) {
            unlockEngine_();
            return;
        }
        const RadioRxResult res = engine_.onDatagram(link_.data(), n, millis());
        if (res != RadioRxResult::Applied) {
            unlockEngine_();
            LOGD("rx dropped: %s", radioRxResultName(res));
            continue;
        }

        // Silent restores (unmute) never notify; mirror them anyway.
        syncRuntime_();
        const uint64_t pending = engine_.readings().pendingMask();
        const bool announce = pending != 0 && pending != postedPendingMask_;
        if (announce) postedPendingMask_ = pending;
        unlockEngine_();
        if (announce) postReadingsChanged_(pending);
    }
}

void RadioModule::loop()
{
    if (wifiChanged_) {
        wifiChanged_ = false;
        netReady_ = dataStore_ ? wifiReady(*dataStore_) : false;
    }

    if (!netReady_) {
        if (engine_.running()) {
            lockEngine_();
            engine_.end();
            unlockEngine_();
            LOGI("network down, radio engine stopped");
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Radio::LoopDelayMs * 10U));
        return;
    }

    if (!engine_.running()) {
        startEngine_();
    }

    applyPendingConfig_();

    pollDatagrams_();

    lockEngine_();
    const RadioPollAction action = engine_.tick(millis());
    unlockEngine_();
    if (action != RadioPollAction::None) {
        LOGD("poll: %s", radioPollActionName(action));
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Radio::LoopDelayMs));
}
