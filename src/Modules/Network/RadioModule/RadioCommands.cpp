/**
 * @file RadioCommands.cpp
 * @brief `radio.*` command handlers and readings snapshot.
 */

#include "Modules/Network/RadioModule/RadioCommands.h"
#include "Modules/Network/RadioModule/RadioEngine.h"
#include "Core/SystemLimits.h"
#include "Domain/RadioDefaults.h"

#define LOG_TAG "RadioCmd"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>
#include <stdlib.h>
#include <string.h>

namespace {

typedef bool (*RadioCommandFn)(RadioEngine& engine, JsonVariantConst value, char* reply, size_t replyLen);

struct RadioCommandDef {
    const char* name;
    RadioCommandFn fn;
    /** Command refuses to run without `value`. */
    bool needsValue;
};

bool parseCmdArgsObject_(const CommandRequest& req, JsonObjectConst& outObj)
{
    static StaticJsonDocument<Limits::JsonCmdRadioBuf> doc;

    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        outObj = doc.as<JsonObjectConst>();
        return true;
    }

    if (req.json && req.json[0] != '\0' && req.args != req.json) {
        doc.clear();
        if (deserializeJson(doc, req.json) || !doc.is<JsonObject>()) return false;
        JsonVariantConst argsVar = doc["args"];
        if (argsVar.is<JsonObjectConst>()) {
            outObj = argsVar.as<JsonObjectConst>();
            return true;
        }
    }
    return false;
}

void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

bool reply_(RadioEngine& engine, RadioSvcStatus st, const char* where, char* reply, size_t replyLen)
{
    if (st != RADIO_SVC_OK) {
        LOGD("%s failed: %s", where, radioSvcStatusStr(st));
        writeCmdError_(reply, replyLen, where, radioSvcToErrorCode(st));
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"status\":\"%s\"}", radioStatusName(engine.status()));
    return true;
}

/** @brief `on`/`off`, `true`/`false`, 1/0. */
bool parseOnOff_(JsonVariantConst v, bool& out)
{
    if (v.is<bool>()) {
        out = v.as<bool>();
        return true;
    }
    if (v.is<int32_t>()) {
        out = v.as<int32_t>() != 0;
        return true;
    }
    const char* s = v.as<const char*>();
    if (!s) return false;
    if (strcmp(s, "on") == 0 || strcmp(s, "true") == 0 || strcmp(s, "1") == 0) {
        out = true;
        return true;
    }
    if (strcmp(s, "off") == 0 || strcmp(s, "false") == 0 || strcmp(s, "0") == 0) {
        out = false;
        return true;
    }
    return false;
}

bool parseInt_(JsonVariantConst v, int32_t& out)
{
    if (v.is<int32_t>()) {
        out = v.as<int32_t>();
        return true;
    }
    const char* s = v.as<const char*>();
    if (!s || *s == '\0') return false;
    char* end = nullptr;
    long parsed = strtol(s, &end, 10);
    if (!end || *end != '\0') return false;
    out = (int32_t)parsed;
    return true;
}

bool cmdPower_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    bool on = false;
    if (!parseOnOff_(v, on)) {
        writeCmdError_(reply, replyLen, RadioCmd::Power, ErrorCode::InvalidValue);
        return false;
    }
    return reply_(e, on ? e.powerOn() : e.powerOff(), RadioCmd::Power, reply, replyLen);
}

bool cmdVolume_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    int32_t vol = 0;
    if (!parseInt_(v, vol)) {
        writeCmdError_(reply, replyLen, RadioCmd::Volume, ErrorCode::InvalidValue);
        return false;
    }
    RadioSvcStatus st = e.setVolume(vol);
    if (st == RADIO_SVC_ERR_INVALID_ARG) {
        writeCmdError_(reply, replyLen, RadioCmd::Volume, ErrorCode::OutOfRange);
        return false;
    }
    return reply_(e, st, RadioCmd::Volume, reply, replyLen);
}

bool cmdVolumeUp_(RadioEngine& e, JsonVariantConst, char* reply, size_t replyLen)
{
    return reply_(e, e.volumeStep(+1), RadioCmd::VolumeUp, reply, replyLen);
}

bool cmdVolumeDown_(RadioEngine& e, JsonVariantConst, char* reply, size_t replyLen)
{
    return reply_(e, e.volumeStep(-1), RadioCmd::VolumeDown, reply, replyLen);
}

bool cmdMute_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    bool mute = false;
    if (!parseOnOff_(v, mute)) {
        writeCmdError_(reply, replyLen, RadioCmd::Mute, ErrorCode::InvalidValue);
        return false;
    }
    return reply_(e, e.setMute(mute), RadioCmd::Mute, reply, replyLen);
}

bool cmdPlayMode_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    return reply_(e, e.playMode(v.as<const char*>()), RadioCmd::PlayMode, reply, replyLen);
}

bool cmdPlayStation_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    int32_t station = 0;
    if (!parseInt_(v, station) || station < 0 || station > 255) {
        writeCmdError_(reply, replyLen, RadioCmd::PlayStation, ErrorCode::InvalidValue);
        return false;
    }
    return reply_(e, e.playStation((uint8_t)station), RadioCmd::PlayStation, reply, replyLen);
}

bool cmdPlayStationName_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    return reply_(e, e.playStationName(v.as<const char*>()), RadioCmd::PlayStationName, reply, replyLen);
}

bool cmdPlayUrl_(RadioEngine& e, JsonVariantConst v, char* reply, size_t replyLen)
{
    return reply_(e, e.playUrl(v.as<const char*>()), RadioCmd::PlayUrl, reply, replyLen);
}

bool cmdStatus_(RadioEngine& e, JsonVariantConst, char* reply, size_t replyLen)
{
    return reply_(e, e.requestStatus(), RadioCmd::Status, reply, replyLen);
}

bool cmdUpdateInfo_(RadioEngine& e, JsonVariantConst, char* reply, size_t replyLen)
{
    return reply_(e, e.requestFullUpdate(), RadioCmd::UpdateInfo, reply, replyLen);
}

bool cmdDiscover_(RadioEngine& e, JsonVariantConst, char* reply, size_t replyLen)
{
    return reply_(e, e.requestDiscover(), RadioCmd::Discover, reply, replyLen);
}

/**
 * Full snapshots go to the retained `rt/radio` topic; the reply stays small:
 * one reading when `value` names it, otherwise status and address summary.
 */
bool cmdReadings_(RadioEngine& e, JsonVariantConst value, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::JsonCmdRadioBuf> doc;
    const RadioReadings& r = e.readings();
    doc["ok"] = true;
    doc["status"] = radioStatusName(e.status());

    if (!value.isNull()) {
        RadioReading id;
        if (!value.is<const char*>() || !radioReadingFromName(value.as<const char*>(), id)) {
            writeCmdError_(reply, replyLen, RadioCmd::Readings, ErrorCode::InvalidValue);
            return false;
        }
        doc["name"] = radioReadingName(id);
        doc["value"] = r.get(id);
    } else {
        doc["ip"] = r.getOr(RadioReading::IpAddress, "");
        doc["broadcast"] = e.broadcastAddress();
        uint8_t set = 0;
        for (uint8_t i = 0; i < RADIO_READING_COUNT; ++i) {
            if (r.isSet((RadioReading)i)) ++set;
        }
        doc["set"] = set;
    }

    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeCmdError_(reply, replyLen, RadioCmd::Readings, ErrorCode::InternalAckOverflow);
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

const RadioCommandDef kCommands[] = {
    {RadioCmd::Power, cmdPower_, true},
    {RadioCmd::Volume, cmdVolume_, true},
    {RadioCmd::VolumeUp, cmdVolumeUp_, false},
    {RadioCmd::VolumeDown, cmdVolumeDown_, false},
    {RadioCmd::Mute, cmdMute_, true},
    {RadioCmd::PlayMode, cmdPlayMode_, true},
    {RadioCmd::PlayStation, cmdPlayStation_, true},
    {RadioCmd::PlayStationName, cmdPlayStationName_, true},
    {RadioCmd::PlayUrl, cmdPlayUrl_, true},
    {RadioCmd::Status, cmdStatus_, false},
    {RadioCmd::UpdateInfo, cmdUpdateInfo_, false},
    {RadioCmd::Discover, cmdDiscover_, false},
    {RadioCmd::Readings, cmdReadings_, false},
};

}  // namespace

const char* const RADIO_COMMAND_NAMES[] = {
    RadioCmd::Power,
    RadioCmd::Volume,
    RadioCmd::VolumeUp,
    RadioCmd::VolumeDown,
    RadioCmd::Mute,
    RadioCmd::PlayMode,
    RadioCmd::PlayStation,
    RadioCmd::PlayStationName,
    RadioCmd::PlayUrl,
    RadioCmd::Status,
    RadioCmd::UpdateInfo,
    RadioCmd::Discover,
    RadioCmd::Readings,
};
const uint8_t RADIO_COMMAND_COUNT = (uint8_t)(sizeof(RADIO_COMMAND_NAMES) / sizeof(RADIO_COMMAND_NAMES[0]));

static_assert(sizeof(RADIO_COMMAND_NAMES) / sizeof(RADIO_COMMAND_NAMES[0]) ==
                  sizeof(kCommands) / sizeof(kCommands[0]),
              "command name list out of sync");

ErrorCode radioSvcToErrorCode(RadioSvcStatus st)
{
    switch (st) {
        case RADIO_SVC_ERR_INVALID_ARG: return ErrorCode::InvalidValue;
        case RADIO_SVC_ERR_NOT_READY: return ErrorCode::NotReady;
        case RADIO_SVC_ERR_HOST: return ErrorCode::HostError;
        case RADIO_SVC_ERR_RESOLVE: return ErrorCode::ResolveFailed;
        case RADIO_SVC_ERR_NO_ADDRESS: return ErrorCode::NoAddress;
        case RADIO_SVC_ERR_IO: return ErrorCode::IoError;
        default: return ErrorCode::Failed;
    }
}

bool runRadioCommand(RadioEngine& engine, const CommandRequest& req, char* reply, size_t replyLen)
{
    if (!req.cmd) {
        writeCmdError_(reply, replyLen, "radio", ErrorCode::MissingCmd);
        return false;
    }

    for (const RadioCommandDef& def : kCommands) {
        if (strcmp(def.name, req.cmd) != 0) continue;

        JsonObjectConst args;
        const bool hasArgs = parseCmdArgsObject_(req, args);
        JsonVariantConst value = hasArgs ? args["value"] : JsonVariantConst();
        if (def.needsValue) {
            if (!hasArgs) {
                writeCmdError_(reply, replyLen, def.name, ErrorCode::MissingArgs);
                return false;
            }
            if (value.isNull()) {
                writeCmdError_(reply, replyLen, def.name, ErrorCode::MissingValue);
                return false;
            }
        }
        return def.fn(engine, value, reply, replyLen);
    }

    writeCmdError_(reply, replyLen, "radio", ErrorCode::UnknownCmd);
    return false;
}

RadioRuntimeView radioRuntimeView(const RadioEngine& engine)
{
    const RadioReadings& r = engine.readings();
    RadioRuntimeView v{};
    v.status = radioStatusName(engine.status());
    v.power = r.equals(RadioReading::Power, RadioWire::On);
    if (!r.getInt(RadioReading::Volume, v.volume)) v.volume = RadioDefaults::MutedVolume;
    v.muted = r.equals(RadioReading::Mute, RadioWire::On);
    v.ip = r.getOr(RadioReading::IpAddress, "");
    v.playMode = r.getOr(RadioReading::PlayMode, "");
    return v;
}

bool buildRadioSnapshotJson(const RadioEngine& engine, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    static StaticJsonDocument<Limits::Radio::SnapshotJsonDoc> doc;
    doc.clear();

    const RadioReadings& r = engine.readings();
    doc["status"] = radioStatusName(engine.status());
    doc["ip"] = r.getOr(RadioReading::IpAddress, "");
    doc["broadcast"] = engine.broadcastAddress();

    JsonObject readings = doc.createNestedObject("readings");
    for (uint8_t i = 0; i < RADIO_READING_COUNT; ++i) {
        const RadioReading id = (RadioReading)i;
        const char* v = r.get(id);
        if (!v) continue;
        readings[radioReadingName(id)] = v;
    }

    if (doc.overflowed()) return false;
    const size_t needed = measureJson(doc);
    if (needed >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}
