#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "flowradio";

namespace Log {
constexpr char MinLevel[] = "log_lvl"; // Minimum LogLevel forwarded to sinks (0=Debug..3=Error).
}  // namespace Log

namespace Wifi {
constexpr char Enabled[] = "wifi_en";
constexpr char Ssid[] = "wifi_ssid";
constexpr char Pass[] = "wifi_pass";
}  // namespace Wifi

namespace Mqtt {
constexpr char Host[] = "mq_host";
constexpr char Port[] = "mq_port";
constexpr char User[] = "mq_user";
constexpr char Pass[] = "mq_pass";
constexpr char BaseTopic[] = "mq_base";
constexpr char Enabled[] = "mq_en";
}  // namespace Mqtt

namespace Radio {
constexpr char Host[] = "rd_host"; // Device host name or dotted address.
constexpr char Broadcast[] = "rd_bcast"; // Discovery broadcast override, empty = derived.
constexpr char UdpPort[] = "rd_uport"; // Device command port.
constexpr char ListenPort[] = "rd_lport"; // Local reply/notification port.
constexpr char TimerSec[] = "rd_timer"; // Poll interval in seconds, 0 = disabled.
constexpr char FullUpdateSec[] = "rd_full"; // Full refresh interval in seconds, 0 = disabled.
constexpr char Identity[] = "rd_ident"; // ID token stamped on outbound frames.
}  // namespace Radio

}  // namespace NvsKeys
