#pragma once

#include <stdint.h>

namespace ThermoDefaults {

constexpr uint16_t MinutesPerDay = 24 * 60;
constexpr uint8_t NightPoints = 2;
constexpr uint8_t DayPoints = 4;

constexpr double NumericTolerance = 1e-6;
constexpr float BatteryLowPct = 20.0f;

constexpr uint32_t StaleThresholdS = 3600;
constexpr uint32_t ReportPeriodS = 300;
constexpr uint32_t ReconcileTimeoutMs = 5000;
constexpr uint32_t ApplyGapMs = 500;

constexpr const char* DeviceBaseTopic = "zigbee2mqtt";
constexpr const char* DisplaySuffix = " Thermostat";
constexpr const char* MonitorTopic = "thermostat_monitor";
constexpr const char* ScheduleKeyPrefix = "schedule";
constexpr const char* StaleReportSuffix = "thermostat/stale";

/** Installation inventory used until a custom one is written to NVS. */
constexpr const char* InventoryJson =
    "{\"types\":{"
    "\"VNTH-T2_v2\":{\"mode_fields\":{\"temperature_sensitivity\":0.5,\"system_mode\":\"heat\",\"preset\":\"schedule\"}},"
    "\"TR-M3Z\":{\"mode_fields\":{\"system_mode\":\"heat\",\"preset\":\"schedule\"}},"
    "\"ME168_1\":{\"mode_fields\":{\"system_mode\":\"auto\"}},"
    "\"ME167\":{\"mode_fields\":{\"system_mode\":\"auto\"}}"
    "},\"devices\":{"
    "\"Arbeitszimmer\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"ME168_1\"},"
    "\"Bad OG\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"},"
    "\"Caros\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"},"
    "\"Dusche\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"ME168_1\"},"
    "\"Esszimmer\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"},"
    "\"Julians\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"},"
    "\"Schlafzimmer\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"},"
    "\"Waschk\xc3\xbc" "che\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"TR-M3Z\"},"
    "\"WC OG\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"},"
    "\"Wohnzimmer\":{\"day_time\":\"05:00\",\"day_temperature\":21,\"night_time\":\"23:00\",\"night_temperature\":19,\"type\":\"VNTH-T2_v2\"}"
    "}}";

}  // namespace ThermoDefaults
