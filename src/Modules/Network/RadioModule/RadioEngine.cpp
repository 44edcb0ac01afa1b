/**
 * @file RadioEngine.cpp
 * @brief Radio protocol dispatcher and device record.
 */

#include "Modules/Network/RadioModule/RadioEngine.h"
#include "Domain/RadioDefaults.h"

#define LOG_TAG "RadioEng"
#include "Core/ModuleLog.h"

#include <stdlib.h>
#include <string.h>

namespace {

bool isEmpty(const char* s)
{
    return !s || *s == '\0';
}

void copyStr(char* out, size_t outLen, const char* in)
{
    if (!out || outLen == 0) return;
    if (out == in) return;
    snprintf(out, outLen, "%s", in ? in : "");
}

bool parseInt(const char* s, int32_t& out)
{
    if (isEmpty(s)) return false;
    char* end = nullptr;
    long v = strtol(s, &end, 10);
    if (!end || *end != '\0') return false;
    out = (int32_t)v;
    return true;
}

}  // namespace

const char* radioSvcStatusStr(RadioSvcStatus st)
{
    switch (st) {
        case RADIO_SVC_OK: return "ok";
        case RADIO_SVC_ERR_INVALID_ARG: return "invalid_arg";
        case RADIO_SVC_ERR_NOT_READY: return "not_ready";
        case RADIO_SVC_ERR_HOST: return "host_error";
        case RADIO_SVC_ERR_RESOLVE: return "resolve_failed";
        case RADIO_SVC_ERR_NO_ADDRESS: return "no_address";
        case RADIO_SVC_ERR_IO: return "io_error";
        default: return "unknown";
    }
}

const char* radioRxResultName(RadioRxResult r)
{
    switch (r) {
        case RadioRxResult::Applied: return "applied";
        case RadioRxResult::NotAck: return "not_ack";
        case RadioRxResult::UnknownVerb: return "unknown_verb";
        case RadioRxResult::ForeignId: return "foreign_id";
        case RadioRxResult::ForeignIp: return "foreign_ip";
        case RadioRxResult::HostErrorDrop: return "host_error";
        case RadioRxResult::UnknownEvent: return "unknown_event";
        default: return "?";
    }
}

RadioConfig radioDefaultConfig()
{
    RadioConfig cfg{};
    copyStr(cfg.identity, sizeof(cfg.identity), RadioDefaults::Identity);
    cfg.udpPort = RadioDefaults::UdpPort;
    cfg.listenPort = RadioDefaults::ListenPort;
    cfg.timerSec = RadioDefaults::TimerSec;
    cfg.fullUpdateSec = RadioDefaults::FullUpdateSec;
    return cfg;
}

RadioEngine::RadioEngine(RadioLink& link, const RadioResolver& resolver)
    : link_(link), resolver_(resolver), cfg_(radioDefaultConfig())
{
    readings_.setSink(RadioReadingsSink{&RadioEngine::onReadingsSink_, this});
}

void RadioEngine::onReadingsSink_(void* ctx, uint64_t changedMask)
{
    RadioEngine* self = static_cast<RadioEngine*>(ctx);
    if (!self || !self->observer_.onReadingsChanged) return;
    self->observer_.onReadingsChanged(self->observer_.ctx, changedMask);
}

RadioSvcStatus RadioEngine::begin(const RadioConfig& cfg, uint32_t nowMs, char* msg, size_t msgLen)
{
    cfg_ = cfg;
    nowMs_ = nowMs;
    sched_.setTimerSec(cfg_.timerSec);
    sched_.setFullUpdateSec(cfg_.fullUpdateSec);
    sched_.resetFullRefresh();
    readings_.reset();
    sm_.reset();
    lastAudibleVolume_ = -1;
    acquired_ = false;
    derivedBroadcast_[0] = '\0';

    running_ = true;
    if (!link_.startListener(cfg_.listenPort)) {
        LOGW("cannot open UDP listener on port %u", (unsigned)cfg_.listenPort);
    } else {
        LOGI("UDP listener started on port %u", (unsigned)cfg_.listenPort);
    }

    RadioSvcStatus st = setHost(cfg_.host, nowMs, msg, msgLen);
    sched_.schedule(nowMs, true);
    return st;
}

void RadioEngine::end()
{
    if (!running_) return;
    link_.stopListener();
    sched_.cancel();
    running_ = false;
    LOGI("UDP listener stopped");
}

RadioSvcStatus RadioEngine::setHost(const char* host, uint32_t nowMs, char* msg, size_t msgLen)
{
    nowMs_ = nowMs;
    copyStr(cfg_.host, sizeof(cfg_.host), host);
    acquired_ = false;
    sched_.resetFullRefresh();
    if (msg && msgLen) msg[0] = '\0';

    if (isEmpty(cfg_.host)) {
        readings_.updateIfChanged(RadioReading::IpAddress, "", true);
        derivedBroadcast_[0] = '\0';
        updateStatus_(RadioStatus::Offline);
    } else {
        char ip[Limits::Radio::IpLen] = {0};
        if (!resolver_.resolve || !resolver_.resolve(resolver_.ctx, cfg_.host, ip, sizeof(ip))) {
            char err[Limits::Radio::MessageLen];
            snprintf(err, sizeof(err), "cannot resolve address: %s", cfg_.host);
            LOGW("%s", err);
            if (msg && msgLen) copyStr(msg, msgLen, err);
            updateStatus_(RadioStatus::HostError);
            return RADIO_SVC_ERR_RESOLVE;
        }
        readings_.updateIfChanged(RadioReading::IpAddress, ip, true);
        if (!radioBroadcastFor(ip, derivedBroadcast_, sizeof(derivedBroadcast_))) {
            derivedBroadcast_[0] = '\0';
        }
        updateStatus_(RadioStatus::Offline);
        LOGI("host %s -> %s (broadcast %s)", cfg_.host, ip, broadcastAddress());
    }

    // Re-acquire right away instead of waiting for the current slice.
    if (running_ && sched_.timerSec() > 0) sched_.schedule(nowMs, true);
    return RADIO_SVC_OK;
}

void RadioEngine::setBroadcastAddress(const char* address)
{
    copyStr(cfg_.broadcastAddress, sizeof(cfg_.broadcastAddress), address);
}

void RadioEngine::setUdpPort(uint16_t port)
{
    cfg_.udpPort = port ? port : RadioDefaults::UdpPort;
}

bool RadioEngine::setListenPort(uint16_t port)
{
    cfg_.listenPort = port ? port : RadioDefaults::ListenPort;
    if (!running_) return true;

    link_.stopListener();
    if (!link_.startListener(cfg_.listenPort)) {
        LOGW("cannot open UDP listener on port %u", (unsigned)cfg_.listenPort);
        return false;
    }
    LOGI("UDP listener restarted on port %u", (unsigned)cfg_.listenPort);
    return true;
}

void RadioEngine::setTimerSec(uint32_t sec, uint32_t nowMs)
{
    if (running_) {
        sched_.retime(sec, nowMs);
    } else {
        sched_.setTimerSec(sec);
    }
    cfg_.timerSec = sched_.timerSec();
}

void RadioEngine::setFullUpdateSec(uint32_t sec)
{
    sched_.setFullUpdateSec(sec);
    cfg_.fullUpdateSec = sched_.fullUpdateSec();
}

void RadioEngine::setIdentity(const char* identity)
{
    copyStr(cfg_.identity, sizeof(cfg_.identity),
            isEmpty(identity) ? RadioDefaults::Identity : identity);
}

const char* RadioEngine::broadcastAddress() const
{
    if (!isEmpty(cfg_.broadcastAddress)) return cfg_.broadcastAddress;
    if (!isEmpty(derivedBroadcast_)) return derivedBroadcast_;
    return RadioDefaults::BroadcastAddress;
}

bool RadioEngine::updateStatus_(RadioStatus next)
{
    const RadioStatus prev = sm_.status();
    if (!sm_.transition(next, nowMs_)) return false;
    LOGD("status %s -> %s", radioStatusName(prev), radioStatusName(next));
    if (observer_.onStatusChanged) observer_.onStatusChanged(observer_.ctx, next);
    return true;
}

bool RadioEngine::updateVolume_(int32_t volume)
{
    bool changed = false;
    if (volume >= 0) {
        lastAudibleVolume_ = volume;
        changed |= readings_.updateIfChanged(RadioReading::Volume, volume);
    } else {
        changed |= readings_.updateIfChanged(RadioReading::Volume, RadioDefaults::MutedVolume);
    }
    changed |= readings_.updateIfChanged(RadioReading::Mute, volume >= 0 ? RadioWire::Off : RadioWire::On);
    return changed;
}

bool RadioEngine::applyReadings_(const char* block)
{
    if (isEmpty(block)) return false;

    readings_.beginBatch();
    bool changed = false;
    bool modeTouched = false;
    bool urlTouched = false;

    for (uint8_t i = 0; i < rx_.count(); ++i) {
        const RadioField& f = rx_.at(i);
        RadioReading r;
        if (!radioLookupField(block, f.key, r)) continue;
        const char* value = radioTranslateValue(r, f.value);

        switch (r) {
            case RadioReading::Volume: {
                int32_t vol = 0;
                if (parseInt(value, vol)) {
                    changed |= updateVolume_(vol);
                } else {
                    LOGD("ignoring volume '%s'", value ? value : "");
                }
                break;
            }
            case RadioReading::Power: {
                changed |= readings_.updateIfChanged(r, value);
                RadioStatus st;
                if (radioStatusFromName(value, st)) changed |= updateStatus_(st);
                break;
            }
            case RadioReading::PlayMode:
            case RadioReading::PlayStation:
                changed |= readings_.updateIfChanged(r, value);
                modeTouched = true;
                break;
            case RadioReading::PlayStationName:
            case RadioReading::PlayUrl:
                changed |= readings_.updateIfChanged(r, value);
                urlTouched = true;
                break;
            default:
                changed |= readings_.updateIfChanged(r, value);
                break;
        }
    }

    if (modeTouched) {
        const char* mode = readings_.getOr(RadioReading::PlayMode, "");
        char modeX[Limits::Radio::ReadingValueLen];
        if (strcmp(mode, "radio") == 0) {
            snprintf(modeX, sizeof(modeX), "station_%s", readings_.getOr(RadioReading::PlayStation, ""));
        } else {
            copyStr(modeX, sizeof(modeX), mode);
        }
        changed |= readings_.updateIfChanged(RadioReading::PlayModeX, modeX);
    }

    if (urlTouched) {
        char urlX[Limits::Radio::ReadingValueLen * 2];
        snprintf(urlX, sizeof(urlX), "%s|%s",
                 readings_.getOr(RadioReading::PlayStationName, ""),
                 readings_.getOr(RadioReading::PlayUrl, ""));
        changed |= readings_.updateIfChanged(RadioReading::PlayUrlX, urlX);
    }

    readings_.endBatch(changed);
    return changed;
}

RadioRxResult RadioEngine::onDatagram(const char* data, size_t len, uint32_t nowMs)
{
    nowMs_ = nowMs;
    if (!rx_.parse(data, len)) return RadioRxResult::NotAck;
    if (rx_.truncated()) LOGD("datagram has more than %u fields", (unsigned)Limits::Radio::MaxFrameFields);

    const char* cmd = rx_.get(RadioWire::KeyCommand);
    if (!rx_.is(RadioWire::KeyResponse, RadioWire::Ack) || !cmd) return RadioRxResult::NotAck;

    const RadioVerb verb = radioVerbFromString(cmd);
    switch (verb) {
        case RadioVerb::Notification:
            return processNotification_();
        case RadioVerb::Discover:
            return processDiscover_();
        case RadioVerb::Unrecognized:
            LOGD("unknown verb %s", cmd);
            return RadioRxResult::UnknownVerb;
        default:
            break;
    }

    // Replies to our own requests are correlated by the echoed identity only.
    if (!rx_.is(RadioWire::KeyId, cfg_.identity)) return RadioRxResult::ForeignId;

    updateStatus_(RadioStatus::Online);
    switch (verb) {
        case RadioVerb::Get:
            applyReadings_(rx_.get(RADIO_BARE_KEY));
            return RadioRxResult::Applied;
        case RadioVerb::Set:
            return processSetAck_();
        case RadioVerb::Play:
            // Readings follow with the NOTIFICATION the device sends once playing.
            return RadioRxResult::Applied;
        default:
            return RadioRxResult::UnknownVerb;
    }
}

RadioRxResult RadioEngine::processSetAck_()
{
    const char* action = rx_.get(RADIO_BARE_KEY);
    if (action) {
        switch (radioSetActionFromString(action)) {
            case RadioSetAction::RadioOn:
                updateStatus_(RadioStatus::On);
                readings_.updateIfChanged(RadioReading::Power, RadioWire::On, true);
                break;
            case RadioSetAction::RadioOff:
                updateStatus_(RadioStatus::Off);
                readings_.updateIfChanged(RadioReading::Power, RadioWire::Off, true);
                break;
            case RadioSetAction::VolumeMute: {
                readings_.beginBatch();
                readings_.endBatch(updateVolume_(RadioDefaults::MutedVolume));
                break;
            }
            case RadioSetAction::VolumeUnmute: {
                // Restore silently; the GET VOLUME reply notifies if the level moved.
                const int32_t restore = (lastAudibleVolume_ >= 0) ? lastAudibleVolume_ : RadioDefaults::UnmuteVolume;
                readings_.beginBatch();
                updateVolume_(restore);
                readings_.endBatch(false);
                const char* block = RadioBlocks::Volume;
                sendCommand_("GET", &block, 1);
                break;
            }
            case RadioSetAction::Unrecognized:
            default:
                LOGD("SET ack %s ignored", action);
                break;
        }
        return RadioRxResult::Applied;
    }

    int32_t vol = 0;
    if (parseInt(rx_.get(RadioWire::KeyVolumeSet), vol)) {
        readings_.beginBatch();
        readings_.endBatch(updateVolume_(vol));
    }
    return RadioRxResult::Applied;
}

RadioRxResult RadioEngine::processNotification_()
{
    const char* knownIp = readings_.get(RadioReading::IpAddress);
    if (isEmpty(knownIp) || !rx_.is(RadioWire::KeyIp, knownIp)) return RadioRxResult::ForeignIp;

    updateStatus_(RadioStatus::Online);

    const char* eventName = rx_.get(RadioWire::KeyEvent);
    const RadioEvent event = radioEventFromString(eventName);
    switch (event) {
        case RadioEvent::SystemBooted:
            requestStatus();
            break;
        case RadioEvent::PowerOn:
            readings_.updateIfChanged(RadioReading::Power, RadioWire::On, true);
            updateStatus_(RadioStatus::On);
            break;
        case RadioEvent::PowerOff:
            readings_.updateIfChanged(RadioReading::Power, RadioWire::Off, true);
            updateStatus_(RadioStatus::Off);
            break;
        case RadioEvent::VolumeChanged: {
            updateStatus_(RadioStatus::On);
            const char* block = RadioBlocks::Volume;
            sendCommand_("GET", &block, 1);
            break;
        }
        case RadioEvent::StationChanged:
        case RadioEvent::UrlIsPlaying: {
            updateStatus_(RadioStatus::On);
            const char* block = RadioBlocks::PlayingMode;
            sendCommand_("GET", &block, 1);
            break;
        }
        case RadioEvent::TuneinInitComplete:
        case RadioEvent::TuneinFavoriteCmdFinished:
            break;
        case RadioEvent::Unrecognized:
        default:
            LOGD("unknown notification event %s", eventName ? eventName : "(none)");
            return RadioRxResult::UnknownEvent;
    }
    return RadioRxResult::Applied;
}

RadioRxResult RadioEngine::processDiscover_()
{
    if (sm_.status() == RadioStatus::HostError) {
        LOGW("DISCOVER reply ignored, host %s is not valid", cfg_.host);
        return RadioRxResult::HostErrorDrop;
    }

    const char* knownIp = readings_.get(RadioReading::IpAddress);
    const char* knownName = readings_.get(RadioReading::DeviceName);
    if (!radioDiscoveryIsOurs(knownIp,
                              knownName,
                              rx_.get(RadioWire::KeyIp),
                              rx_.get(RadioWire::KeyName))) {
        return RadioRxResult::ForeignIp;
    }

    const bool firstAcquisition = isEmpty(knownIp) || !acquired_;
    updateStatus_(RadioStatus::Online);
    applyReadings_(RadioBlocks::Discover);
    acquired_ = true;

    // Without a configured host the discovered address drives the broadcast target.
    if (isEmpty(cfg_.host) &&
        !radioBroadcastFor(readings_.getOr(RadioReading::IpAddress, ""), derivedBroadcast_, sizeof(derivedBroadcast_))) {
        derivedBroadcast_[0] = '\0';
    }

    if (firstAcquisition) {
        LOGI("device acquired at %s", readings_.getOr(RadioReading::IpAddress, "?"));
        requestFullUpdate();
        sched_.markFullRefresh(nowMs_);
    }
    return RadioRxResult::Applied;
}

RadioPollAction RadioEngine::tick(uint32_t nowMs)
{
    if (!running_ || !sched_.due(nowMs)) return RadioPollAction::None;
    nowMs_ = nowMs;

    const RadioStatus st = sm_.status();
    const RadioPollAction action = sched_.decide(st, nowMs);
    switch (action) {
        case RadioPollAction::Discover:
            requestDiscover();
            break;
        case RadioPollAction::FullRefresh:
            requestFullUpdate();
            break;
        case RadioPollAction::StatusRefresh:
            requestStatus();
            break;
        case RadioPollAction::None:
        default:
            break;
    }

    if ((st == RadioStatus::On || st == RadioStatus::Online) && RadioPollScheduler::peerDead(sm_, nowMs)) {
        LOGI("no reply for %lu ms, device considered offline", (unsigned long)(nowMs - sm_.lastAckMs()));
        readings_.updateIfChanged(RadioReading::Power, RadioWire::Off, true);
        updateStatus_(RadioStatus::Offline);
    }

    sched_.rearmAfterTick(nowMs);
    return action;
}

bool RadioEngine::frame_(const char* verb, const char* const* params, size_t count, size_t& lenOut)
{
    lenOut = buildRadioCommand(tx_, sizeof(tx_), verb, params, count, cfg_.identity);
    if (lenOut == 0) {
        LOGW("%s frame does not fit %u bytes", verb, (unsigned)sizeof(tx_));
        return false;
    }
    return true;
}

RadioSvcStatus RadioEngine::sendCommand_(const char* verb, const char* const* params, size_t count)
{
    if (sm_.status() == RadioStatus::HostError) {
        LOGW("cannot send: invalid host %s", cfg_.host);
        return RADIO_SVC_ERR_HOST;
    }

    const char* target = !isEmpty(cfg_.host) ? cfg_.host : readings_.get(RadioReading::IpAddress);
    if (isEmpty(target)) {
        LOGW("cannot send: no address defined, must discover first");
        return RADIO_SVC_ERR_NO_ADDRESS;
    }

    size_t len = 0;
    if (!frame_(verb, params, count, len)) return RADIO_SVC_ERR_IO;
    if (!link_.sendUnicast(target, cfg_.udpPort, reinterpret_cast<const uint8_t*>(tx_), len)) {
        LOGW("send %s to %s:%u failed", verb, target, (unsigned)cfg_.udpPort);
        return RADIO_SVC_ERR_IO;
    }
    LOGD("tx %s %s -> %s", verb, count ? params[0] : "", target);
    return RADIO_SVC_OK;
}

RadioSvcStatus RadioEngine::broadcastCommand_(const char* verb, const char* const* params, size_t count)
{
    const char* target = broadcastAddress();
    size_t len = 0;
    if (!frame_(verb, params, count, len)) return RADIO_SVC_ERR_IO;
    if (!link_.sendBroadcast(target, cfg_.udpPort, reinterpret_cast<const uint8_t*>(tx_), len)) {
        LOGW("broadcast %s to %s:%u failed", verb, target, (unsigned)cfg_.udpPort);
        return RADIO_SVC_ERR_IO;
    }
    LOGD("tx %s -> %s (broadcast)", verb, target);
    return RADIO_SVC_OK;
}

RadioSvcStatus RadioEngine::sendGetBlocks_(const char* const* blocks, uint8_t count)
{
    for (uint8_t i = 0; i < count; ++i) {
        RadioSvcStatus st = sendCommand_("GET", &blocks[i], 1);
        if (st != RADIO_SVC_OK) return st;
    }
    return RADIO_SVC_OK;
}

RadioSvcStatus RadioEngine::requestStatus()
{
    return sendGetBlocks_(RADIO_STATUS_BLOCKS, RADIO_STATUS_BLOCK_COUNT);
}

RadioSvcStatus RadioEngine::requestFullUpdate()
{
    return sendGetBlocks_(RADIO_FULL_BLOCKS, RADIO_FULL_BLOCK_COUNT);
}

RadioSvcStatus RadioEngine::requestDiscover()
{
    // The device expects one empty parameter line after the verb.
    const char* empty = "";
    return broadcastCommand_("DISCOVER", &empty, 1);
}

RadioSvcStatus RadioEngine::powerOn()
{
    if (sm_.status() == RadioStatus::Offline) {
        LOGW("Cannot turn on the device while it is offline. Did you set energy mode to PREMIUM?");
        return RADIO_SVC_ERR_NOT_READY;
    }
    const char* param = "RADIO_ON";
    return sendCommand_("SET", &param, 1);
}

RadioSvcStatus RadioEngine::powerOff()
{
    const char* param = "RADIO_OFF";
    return sendCommand_("SET", &param, 1);
}

RadioSvcStatus RadioEngine::setVolume(int32_t volume)
{
    if (volume < RadioDefaults::VolumeMin || volume > RadioDefaults::VolumeMax) return RADIO_SVC_ERR_INVALID_ARG;
    char param[32];
    snprintf(param, sizeof(param), "VOLUME_ABSOLUTE:%ld", (long)volume);
    const char* p = param;
    return sendCommand_("SET", &p, 1);
}

RadioSvcStatus RadioEngine::volumeStep(int8_t delta)
{
    int32_t current = 0;
    if (!readings_.getInt(RadioReading::Volume, current)) return RADIO_SVC_ERR_NOT_READY;
    if (current < 0) {
        if (lastAudibleVolume_ < 0) return RADIO_SVC_ERR_NOT_READY;
        current = lastAudibleVolume_;
    }
    return setVolume(current + delta);
}

RadioSvcStatus RadioEngine::setMute(bool mute)
{
    const char* param = mute ? "VOLUME_MUTE" : "VOLUME_UNMUTE";
    return sendCommand_("SET", &param, 1);
}

RadioSvcStatus RadioEngine::playStation(uint8_t station)
{
    if (station < 1 || station > RadioDefaults::StationCount) return RADIO_SVC_ERR_INVALID_ARG;
    char param[16];
    snprintf(param, sizeof(param), "STATION:%u", (unsigned)station);
    const char* p = param;
    return sendCommand_("PLAY", &p, 1);
}

RadioSvcStatus RadioEngine::playMode(const char* mode)
{
    if (isEmpty(mode)) return RADIO_SVC_ERR_INVALID_ARG;

    if (strcmp(mode, "aux") == 0 || strcmp(mode, "upnp") == 0) {
        const char* param = (mode[0] == 'a') ? "AUX" : "UPNP";
        return sendCommand_("PLAY", &param, 1);
    }
    if (strcmp(mode, "radio") == 0) {
        int32_t station = 1;
        if (!readings_.getInt(RadioReading::PlayStation, station) ||
            station < 1 || station > RadioDefaults::StationCount) {
            station = 1;
        }
        return playStation((uint8_t)station);
    }
    if (strncmp(mode, "station_", 8) == 0) {
        const char* digits = mode + 8;
        if (digits[0] < '1' || digits[0] > '8' || digits[1] != '\0') return RADIO_SVC_ERR_INVALID_ARG;
        return playStation((uint8_t)(digits[0] - '0'));
    }
    if (strcmp(mode, "tunein") == 0) {
        const char* last = readings_.get(RadioReading::PlayUrlX);
        if (isEmpty(last)) return RADIO_SVC_ERR_NOT_READY;
        return playUrl(last);
    }
    return RADIO_SVC_ERR_INVALID_ARG;
}

RadioSvcStatus RadioEngine::playStationName(const char* name)
{
    if (isEmpty(name)) return RADIO_SVC_ERR_INVALID_ARG;
    for (uint8_t s = 1; s <= RadioDefaults::StationCount; ++s) {
        RadioReading nameReading;
        RadioReading urlReading;
        if (!radioStationReadings(s, nameReading, urlReading)) continue;
        if (readings_.equals(nameReading, name)) return playStation(s);
    }
    return RADIO_SVC_ERR_INVALID_ARG;
}

RadioSvcStatus RadioEngine::playUrl(const char* descriptor)
{
    char name[Limits::Radio::ReadingValueLen];
    char url[Limits::Radio::ReadingValueLen];
    if (!radioSplitPlayUrl(descriptor, name, sizeof(name), url, sizeof(url))) return RADIO_SVC_ERR_INVALID_ARG;

    char urlLine[Limits::Radio::ReadingValueLen + 8];
    char textLine[Limits::Radio::ReadingValueLen + 8];
    snprintf(urlLine, sizeof(urlLine), "URL:%s", url);
    snprintf(textLine, sizeof(textLine), "TEXT:%s", name);
    const char* params[] = {"TUNEIN_PLAY", urlLine, textLine};
    return sendCommand_("PLAY", params, 3);
}
