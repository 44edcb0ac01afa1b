#pragma once
/**
 * @file RadioCommands.h
 * @brief Command surface of the radio integration (`radio.*`).
 *
 * Arguments come as a JSON object, single values under `value`:
 * `{"value":"on"}`, `{"value":12}`, `{"value":"Jazz|http://host/stream"}`.
 * Replies are `{"ok":true,"status":"<status>"}` or the shared error envelope.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/Services/IRadio.h"

class RadioEngine;

namespace RadioCmd {
constexpr char Power[] = "radio.power";
constexpr char Volume[] = "radio.volume";
constexpr char VolumeUp[] = "radio.volume_up";
constexpr char VolumeDown[] = "radio.volume_down";
constexpr char Mute[] = "radio.mute";
constexpr char PlayMode[] = "radio.play_mode";
constexpr char PlayStation[] = "radio.play_station";
constexpr char PlayStationName[] = "radio.play_station_name";
constexpr char PlayUrl[] = "radio.play_url";
constexpr char Status[] = "radio.status";
constexpr char UpdateInfo[] = "radio.update_info";
constexpr char Discover[] = "radio.discover";
constexpr char Readings[] = "radio.readings";
}  // namespace RadioCmd

/** @brief Every `radio.*` command name, for registration. */
extern const char* const RADIO_COMMAND_NAMES[];
extern const uint8_t RADIO_COMMAND_COUNT;

/**
 * @brief Run the `radio.*` command named by `req.cmd` against `engine`.
 * @return true on success; the reply carries the result or the error.
 */
bool runRadioCommand(RadioEngine& engine, const CommandRequest& req, char* reply, size_t replyLen);

ErrorCode radioSvcToErrorCode(RadioSvcStatus st);

/** @brief Radio values mirrored into the DataStore. */
struct RadioRuntimeView {
    const char* status;
    bool power;
    /** RadioDefaults::MutedVolume when muted or unknown. */
    int32_t volume;
    bool muted;
    const char* ip;
    const char* playMode;
};

/** @brief Current view of `engine`, including changes still pending notification. */
RadioRuntimeView radioRuntimeView(const RadioEngine& engine);

/**
 * @brief Serialize `{"status":..,"ip":..,"broadcast":..,"readings":{..}}`.
 *
 * Only readings that are set appear under `readings`.
 */
bool buildRadioSnapshotJson(const RadioEngine& engine, char* out, size_t outLen);
