#pragma once
/**
 * @file RadioProtocol.h
 * @brief Closed vocabularies of the radio protocol and its field dictionary.
 *
 * Verbs, notification events and SET acknowledgments are decoded into enums;
 * anything outside the known set maps to `Unrecognized` and is never matched
 * implicitly. The field dictionary maps `(block, field)` pairs of GET and
 * DISCOVER replies onto readings, with optional value translation.
 */

#include <stdint.h>

#include "Core/SystemLimits.h"

enum class RadioVerb : uint8_t {
    Get,
    Set,
    Play,
    Notification,
    Discover,
    Unrecognized
};

enum class RadioEvent : uint8_t {
    SystemBooted,
    PowerOn,
    PowerOff,
    VolumeChanged,
    StationChanged,
    UrlIsPlaying,
    TuneinInitComplete,
    TuneinFavoriteCmdFinished,
    Unrecognized
};

/** @brief Bare-line action echoed in a SET acknowledgment. */
enum class RadioSetAction : uint8_t {
    RadioOn,
    RadioOff,
    VolumeMute,
    VolumeUnmute,
    Unrecognized
};

/** @brief Every reading the integration can publish. */
enum class RadioReading : uint8_t {
    DeviceName,
    MacAddress,
    SerialNo,
    Version,
    IpAddress,
    IpNetmask,
    IpGateway,
    IpMode,
    WifiVersion,
    WifiSsid,
    Country,
    Power,
    EnergyMode,
    Volume,
    Mute,
    OperatingMode,
    PlayMode,
    PlayStation,
    PlayStationName,
    PlayUrl,
    PlayModeX,
    PlayUrlX,
    AppVersion,
    Station1Name,
    Station1Url,
    Station2Name,
    Station2Url,
    Station3Name,
    Station3Url,
    Station4Name,
    Station4Url,
    Station5Name,
    Station5Url,
    Station6Name,
    Station6Url,
    Station7Name,
    Station7Url,
    Station8Name,
    Station8Url,
    Count
};

constexpr uint8_t RADIO_READING_COUNT = (uint8_t)RadioReading::Count;
static_assert(RADIO_READING_COUNT <= 64, "reading change masks are 64-bit");
static_assert(RADIO_READING_COUNT <= Limits::Radio::ReadingSlots, "snapshot buffers are sized from ReadingSlots");

/** @brief Change-mask bit of a reading. */
constexpr uint64_t radioReadingBit(RadioReading r)
{
    return 1ULL << (uint8_t)r;
}

RadioVerb radioVerbFromString(const char* s);
const char* radioVerbName(RadioVerb v);

RadioEvent radioEventFromString(const char* s);
const char* radioEventName(RadioEvent e);

RadioSetAction radioSetActionFromString(const char* s);

/** @brief Reading name as published (`device_name`, `play_mode_x`, ...). */
const char* radioReadingName(RadioReading r);
/** @brief Reverse lookup; false when `name` is not a reading. */
bool radioReadingFromName(const char* name, RadioReading& out);

/** @brief Name/URL readings of station `index` (1..8). */
bool radioStationReadings(uint8_t index, RadioReading& nameOut, RadioReading& urlOut);

/**
 * @brief Look up the reading bound to field `field` of reply block `block`.
 * @return false when the pair is not part of the dictionary.
 */
bool radioLookupField(const char* block, const char* field, RadioReading& out);

/**
 * @brief Translate a wire value for readings that have a value table.
 *
 * Readings without a table return `raw` unchanged. Readings with a table
 * return nullptr for values outside it, which clears the reading.
 */
const char* radioTranslateValue(RadioReading r, const char* raw);

/** @brief GET blocks of a status refresh, in send order. */
extern const char* const RADIO_STATUS_BLOCKS[];
extern const uint8_t RADIO_STATUS_BLOCK_COUNT;
/** @brief GET blocks of a full refresh (status blocks first). */
extern const char* const RADIO_FULL_BLOCKS[];
extern const uint8_t RADIO_FULL_BLOCK_COUNT;

namespace RadioBlocks {
constexpr char Discover[] = "DISCOVER";
constexpr char Volume[] = "VOLUME";
constexpr char PlayingMode[] = "PLAYING_MODE";
}  // namespace RadioBlocks

namespace RadioWire {
constexpr char KeyCommand[] = "COMMAND";
constexpr char KeyResponse[] = "RESPONSE";
constexpr char KeyId[] = "ID";
constexpr char KeyIp[] = "IP";
constexpr char KeyName[] = "NAME";
constexpr char KeyEvent[] = "EVENT";
constexpr char KeyVolumeSet[] = "VOLUME_SET";
constexpr char Ack[] = "ACK";
constexpr char On[] = "on";
constexpr char Off[] = "off";
}  // namespace RadioWire
