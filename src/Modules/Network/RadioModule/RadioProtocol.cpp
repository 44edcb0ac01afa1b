/**
 * @file RadioProtocol.cpp
 * @brief Protocol vocabularies and field dictionary tables.
 */

#include "Modules/Network/RadioModule/RadioProtocol.h"
#include "Domain/RadioDefaults.h"

#include <stddef.h>
#include <string.h>

namespace {

struct NamedVerb {
    const char* name;
    RadioVerb verb;
};

struct NamedEvent {
    const char* name;
    RadioEvent event;
};

struct NamedSetAction {
    const char* name;
    RadioSetAction action;
};

struct FieldBinding {
    const char* block;
    const char* field;
    RadioReading reading;
};

struct ValueMapEntry {
    const char* wire;
    const char* local;
};

const NamedVerb kVerbs[] = {
    {"GET", RadioVerb::Get},
    {"SET", RadioVerb::Set},
    {"PLAY", RadioVerb::Play},
    {"NOTIFICATION", RadioVerb::Notification},
    {"DISCOVER", RadioVerb::Discover},
};

const NamedEvent kEvents[] = {
    {"SYSTEM_BOOTED", RadioEvent::SystemBooted},
    {"POWER_ON", RadioEvent::PowerOn},
    {"POWER_OFF", RadioEvent::PowerOff},
    {"VOLUME_CHANGED", RadioEvent::VolumeChanged},
    {"STATION_CHANGED", RadioEvent::StationChanged},
    {"URL_IS_PLAYING", RadioEvent::UrlIsPlaying},
    {"TUNEIN_INIT_COMPLETE", RadioEvent::TuneinInitComplete},
    {"TUNEIN_FAVORITE_CMD_FINISHED", RadioEvent::TuneinFavoriteCmdFinished},
};

const NamedSetAction kSetActions[] = {
    {"RADIO_ON", RadioSetAction::RadioOn},
    {"RADIO_OFF", RadioSetAction::RadioOff},
    {"VOLUME_MUTE", RadioSetAction::VolumeMute},
    {"VOLUME_UNMUTE", RadioSetAction::VolumeUnmute},
};

// Indexed by RadioReading.
const char* const kReadingNames[RADIO_READING_COUNT] = {
    "device_name",
    "mac_address",
    "serial_no",
    "version",
    "ip_address",
    "ip_netmask",
    "ip_gateway",
    "ip_mode",
    "wifi_version",
    "wifi_ssid",
    "country",
    "power",
    "energy_mode",
    "volume",
    "mute",
    "operating_mode",
    "play_mode",
    "play_station",
    "play_station_name",
    "play_url",
    "play_mode_x",
    "play_url_x",
    "app_version",
    "station_1_name",
    "station_1_url",
    "station_2_name",
    "station_2_url",
    "station_3_name",
    "station_3_url",
    "station_4_name",
    "station_4_url",
    "station_5_name",
    "station_5_url",
    "station_6_name",
    "station_6_url",
    "station_7_name",
    "station_7_url",
    "station_8_name",
    "station_8_url",
};

// PLAYING_MODE replies carry two ID lines; the station number is the second one.
// ALL_STATION_INFO repeats NAME/URL once per preset.
const FieldBinding kFieldMap[] = {
    {"INFO_BLOCK", "NAME", RadioReading::DeviceName},
    {"INFO_BLOCK", "MAC", RadioReading::MacAddress},
    {"INFO_BLOCK", "SERNO", RadioReading::SerialNo},
    {"INFO_BLOCK", "SW-VERSION", RadioReading::Version},
    {"INFO_BLOCK", "IPADDR", RadioReading::IpAddress},
    {"INFO_BLOCK", "IPMASK", RadioReading::IpNetmask},
    {"INFO_BLOCK", "GATEWAY", RadioReading::IpGateway},
    {"INFO_BLOCK", "IPMODE", RadioReading::IpMode},
    {"INFO_BLOCK", "WLAN-FW", RadioReading::WifiVersion},
    {"INFO_BLOCK", "SSID", RadioReading::WifiSsid},
    {"INFO_BLOCK", "COUNTRY", RadioReading::Country},
    {"POWER_STATUS", "POWER", RadioReading::Power},
    {"POWER_STATUS", "ENERGY_MODE", RadioReading::EnergyMode},
    {"VOLUME", "VOLUME_SET", RadioReading::Volume},
    {"OPERATING_MODE", "MODE", RadioReading::OperatingMode},
    {"PLAYING_MODE", "PLAYING", RadioReading::PlayMode},
    {"PLAYING_MODE", "ID_1", RadioReading::PlayStation},
    {"PLAYING_MODE", "NAME", RadioReading::PlayStationName},
    {"PLAYING_MODE", "URL", RadioReading::PlayUrl},
    {"DISCOVER", "IP", RadioReading::IpAddress},
    {"DISCOVER", "NAME", RadioReading::DeviceName},
    {"DISCOVER", "APP_VERSION", RadioReading::AppVersion},
    {"ALL_STATION_INFO", "NAME", RadioReading::Station1Name},
    {"ALL_STATION_INFO", "URL", RadioReading::Station1Url},
    {"ALL_STATION_INFO", "NAME_1", RadioReading::Station2Name},
    {"ALL_STATION_INFO", "URL_1", RadioReading::Station2Url},
    {"ALL_STATION_INFO", "NAME_2", RadioReading::Station3Name},
    {"ALL_STATION_INFO", "URL_2", RadioReading::Station3Url},
    {"ALL_STATION_INFO", "NAME_3", RadioReading::Station4Name},
    {"ALL_STATION_INFO", "URL_3", RadioReading::Station4Url},
    {"ALL_STATION_INFO", "NAME_4", RadioReading::Station5Name},
    {"ALL_STATION_INFO", "URL_4", RadioReading::Station5Url},
    {"ALL_STATION_INFO", "NAME_5", RadioReading::Station6Name},
    {"ALL_STATION_INFO", "URL_5", RadioReading::Station6Url},
    {"ALL_STATION_INFO", "NAME_6", RadioReading::Station7Name},
    {"ALL_STATION_INFO", "URL_6", RadioReading::Station7Url},
    {"ALL_STATION_INFO", "NAME_7", RadioReading::Station8Name},
    {"ALL_STATION_INFO", "URL_7", RadioReading::Station8Url},
};

const ValueMapEntry kPowerValues[] = {
    {"ON", RadioWire::On},
    {"OFF", RadioWire::Off},
};

const ValueMapEntry kPlayModeValues[] = {
    {"STATION", "radio"},
    {"TUNEIN", "tunein"},
    {"UPNP", "upnp"},
    {"AUX_IDCOCK", "aux"},
};

template<typename T, size_t N>
constexpr size_t countOf(const T (&)[N])
{
    return N;
}

const char* translate(const ValueMapEntry* table, size_t n, const char* raw)
{
    if (!raw) return nullptr;
    for (size_t i = 0; i < n; ++i) {
        if (strcmp(table[i].wire, raw) == 0) return table[i].local;
    }
    return nullptr;
}

}  // namespace

const char* const RADIO_STATUS_BLOCKS[] = {"POWER_STATUS", "PLAYING_MODE", "VOLUME"};
const uint8_t RADIO_STATUS_BLOCK_COUNT = (uint8_t)countOf(RADIO_STATUS_BLOCKS);

const char* const RADIO_FULL_BLOCKS[] = {
    "POWER_STATUS",
    "PLAYING_MODE",
    "VOLUME",
    "INFO_BLOCK",
    "ALARM_STATUS",
    "TUNEIN_PARTNER_ID",
    "OPERATING_MODE",
    "ALL_STATION_INFO",
};
const uint8_t RADIO_FULL_BLOCK_COUNT = (uint8_t)countOf(RADIO_FULL_BLOCKS);

RadioVerb radioVerbFromString(const char* s)
{
    if (!s) return RadioVerb::Unrecognized;
    for (const NamedVerb& v : kVerbs) {
        if (strcmp(v.name, s) == 0) return v.verb;
    }
    return RadioVerb::Unrecognized;
}

const char* radioVerbName(RadioVerb v)
{
    for (const NamedVerb& nv : kVerbs) {
        if (nv.verb == v) return nv.name;
    }
    return "UNRECOGNIZED";
}

RadioEvent radioEventFromString(const char* s)
{
    if (!s) return RadioEvent::Unrecognized;
    for (const NamedEvent& e : kEvents) {
        if (strcmp(e.name, s) == 0) return e.event;
    }
    return RadioEvent::Unrecognized;
}

const char* radioEventName(RadioEvent e)
{
    for (const NamedEvent& ne : kEvents) {
        if (ne.event == e) return ne.name;
    }
    return "UNRECOGNIZED";
}

RadioSetAction radioSetActionFromString(const char* s)
{
    if (!s) return RadioSetAction::Unrecognized;
    for (const NamedSetAction& a : kSetActions) {
        if (strcmp(a.name, s) == 0) return a.action;
    }
    return RadioSetAction::Unrecognized;
}

const char* radioReadingName(RadioReading r)
{
    uint8_t idx = (uint8_t)r;
    if (idx >= RADIO_READING_COUNT) return "?";
    return kReadingNames[idx];
}

bool radioReadingFromName(const char* name, RadioReading& out)
{
    if (!name) return false;
    for (uint8_t i = 0; i < RADIO_READING_COUNT; ++i) {
        if (strcmp(kReadingNames[i], name) == 0) {
            out = (RadioReading)i;
            return true;
        }
    }
    return false;
}

bool radioStationReadings(uint8_t index, RadioReading& nameOut, RadioReading& urlOut)
{
    if (index < 1 || index > RadioDefaults::StationCount) return false;
    uint8_t base = (uint8_t)RadioReading::Station1Name + (uint8_t)((index - 1) * 2);
    nameOut = (RadioReading)base;
    urlOut = (RadioReading)(base + 1);
    return true;
}

bool radioLookupField(const char* block, const char* field, RadioReading& out)
{
    if (!block || !field) return false;
    for (const FieldBinding& b : kFieldMap) {
        if (strcmp(b.block, block) == 0 && strcmp(b.field, field) == 0) {
            out = b.reading;
            return true;
        }
    }
    return false;
}

const char* radioTranslateValue(RadioReading r, const char* raw)
{
    switch (r) {
        case RadioReading::Power:
            return translate(kPowerValues, countOf(kPowerValues), raw);
        case RadioReading::PlayMode:
            return translate(kPlayModeValues, countOf(kPlayModeValues), raw);
        default:
            return raw;
    }
}
