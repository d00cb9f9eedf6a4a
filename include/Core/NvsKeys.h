#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "thermio"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Config schema version key read/written by `ConfigStore::runMigrations`. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker used to select and run config migrations.

namespace Log {
constexpr char MinLevel[] = "log_lvl"; // Log hub persisted key for field `min_level`.
}  // namespace Log

namespace Wifi {
constexpr char Enabled[] = "wifi_en"; // WiFi module persisted key for field `enabled`.
constexpr char Ssid[] = "wifi_ssid"; // WiFi module persisted key for field `ssid`.
constexpr char Pass[] = "wifi_pass"; // WiFi module persisted key for field `pass`.
constexpr char Mdns[] = "wifi_mdns"; // WiFi module persisted key for field `mdns`.
}  // namespace Wifi

namespace Mqtt {
constexpr char Host[] = "mq_host"; // MQTT module persisted key for field `host`.
constexpr char Port[] = "mq_port"; // MQTT module persisted key for field `port`.
constexpr char User[] = "mq_user"; // MQTT module persisted key for field `user`.
constexpr char Pass[] = "mq_pass"; // MQTT module persisted key for field `pass`.
constexpr char BaseTopic[] = "mq_base"; // MQTT module persisted key for field `baseTopic`.
constexpr char Enabled[] = "mq_en"; // MQTT module persisted key for field `enabled`.
}  // namespace Mqtt

namespace Time {
constexpr char Server1[] = "ntp_s1"; // Time module persisted key for field `server1`.
constexpr char Server2[] = "ntp_s2"; // Time module persisted key for field `server2`.
constexpr char Tz[] = "ntp_tz"; // Time module persisted key for field `tz`.
constexpr char Enabled[] = "ntp_en"; // Time module persisted key for field `enabled`.
}  // namespace Time

namespace Inventory {
constexpr char Json[] = "inv_json"; // Inventory module persisted key for field `json`.
constexpr char DeviceBaseTopic[] = "inv_dbase"; // Inventory module persisted key for field `device_base_topic`.
constexpr char DisplaySuffix[] = "inv_dsuf"; // Inventory module persisted key for field `display_suffix`.
constexpr char MonitorTopic[] = "inv_mon"; // Inventory module persisted key for field `monitor_topic`.
}  // namespace Inventory

namespace Thermostat {
constexpr char ReconcileTimeoutMs[] = "th_rc_ms"; // Thermostat module persisted key for field `reconcile_timeout_ms`.
constexpr char BatteryLowPct[] = "th_batlow"; // Thermostat module persisted key for field `battery_low_pct`.
constexpr char ApplyOnConnect[] = "th_aoc"; // Thermostat module persisted key for field `apply_on_connect`.
constexpr char ApplyGapMs[] = "th_gap"; // Thermostat module persisted key for field `apply_gap_ms`.
}  // namespace Thermostat

namespace Monitor {
constexpr char StaleThresholdS[] = "mon_stale"; // Monitor module persisted key for field `stale_threshold_s`.
constexpr char ReportPeriodS[] = "mon_per"; // Monitor module persisted key for field `report_period_s`.
constexpr char ReportSuffix[] = "mon_rsuf"; // Monitor module persisted key for field `report_suffix`.
}  // namespace Monitor

}  // namespace NvsKeys
