#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for command args parsing in `ThermostatModule` and `MonitorModule`. */
constexpr size_t JsonCmdArgsBuf = 256;
/** @brief JSON capacity of a `cmd` request in `MQTTModule::runCommand_` (strings are copied). */
constexpr size_t JsonCmdBuf = 6144;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (inventory patch included). */
constexpr size_t JsonConfigApplyBuf = 4608;
/** @brief JSON capacity for `ConfigStore::toJson` and `toJsonModule` (values are referenced, not copied). */
constexpr size_t JsonConfigExportBuf = 2048;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief Maximum number of config modules listed by `config.list`. */
constexpr uint8_t MaxConfigModules = 16;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 16;

/** @brief MQTT-specific limits grouped by concern to keep `SystemLimits` readable. */
namespace Mqtt {

/** @brief MQTT module task stack size returned by `MQTTModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 8192;

/** @brief MQTT static capacities (queues, tables). */
namespace Capacity {
/** @brief FreeRTOS RX queue length for inbound MQTT messages in `MQTTModule`. */
constexpr uint8_t RxQueueLen = 6;
/** @brief Maximum number of extra subscriptions registered through `MqttService::subscribe`. */
constexpr uint8_t MaxRoutes = 24;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
/** @brief Default broker host (`MqttLinkConfig::host`). */
constexpr char Host[] = "192.168.1.4";
/** @brief Default broker port (`MqttLinkConfig::port`). */
constexpr int32_t Port = 1883;
/** @brief Default root of the supervisor's own topics (`MqttLinkConfig::baseTopic`). */
constexpr char BaseTopic[] = "thermio";
}  // namespace Defaults

/** @brief MQTT string/payload buffer sizes. */
namespace Buffers {
constexpr size_t Host = 64;
constexpr size_t User = 32;
constexpr size_t Pass = 32;
constexpr size_t BaseTopic = 64;
/** @brief Client id buffer (`thermio-xxxxxx`), also the second topic level. */
constexpr size_t DeviceId = 24;
/** @brief Own topic buffers (`status`, `cmd`, `ack`). */
constexpr size_t Topic = 128;
/** @brief Topic filter length stored per extra route in `MQTTModule`. */
constexpr size_t RouteFilter = 96;
/** @brief Inbox slot topic (`MQTTModule::Inbound`). */
constexpr size_t RxTopic = 128;
/** @brief Inbox slot payload: device states and `config.set` requests carrying an inventory. */
constexpr size_t RxPayload = 3584;
/** @brief Command ack buffer (`{"ok":true,"cmd":..,"reply":..}`). */
constexpr size_t Ack = 2048;
/** @brief Command handler reply buffer. */
constexpr size_t Reply = 1536;
/** @brief Re-serialized command args; never larger than the request itself. */
constexpr size_t CmdArgs = RxPayload;
}  // namespace Buffers

/** @brief MQTT timing constants (runtime behavior). */
namespace Timing {
constexpr uint32_t DisabledDelayMs = 2000;
/** @brief Wait after `WifiNetReady` before connecting. */
constexpr uint32_t NetWarmupMs = 2000;
/** @brief CONNACK wait before the attempt counts as failed. */
constexpr uint32_t ConnectTimeoutMs = 10000;
constexpr uint32_t LoopDelayMs = 50;
/** @brief Timeout in ms to take the publish mutex. */
constexpr uint32_t PublishLockMs = 500;
}  // namespace Timing

/** @brief Reconnect delay: doubles from MinMs after each failure, capped at MaxMs, +/- JitterPct. */
namespace Backoff {
constexpr uint32_t MinMs = 2000;
constexpr uint32_t MaxMs = 300000;
constexpr uint8_t JitterPct = 15;
}  // namespace Backoff

}  // namespace Mqtt

/** @brief WiFi station limits. */
namespace Wifi {
/** @brief Association timeout before the attempt counts as failed. */
constexpr uint32_t ConnectTimeoutMs = 15000;
/** @brief Pause after a failed or lost link. */
constexpr uint32_t RetryDelayMs = 5000;
/** @brief Interval of the "SSID not set" warning. */
constexpr uint32_t NoSsidLogMs = 10000;
constexpr uint32_t LoopDelayMs = 250;
}  // namespace Wifi

/** @brief Time synchronization limits. */
namespace Time {
/** @brief SNTP server buffer (`time.server1` / `time.server2`). */
constexpr size_t Server = 40;
/** @brief POSIX TZ buffer (`time.tz`). */
constexpr size_t Tz = 64;
/** @brief Warmup in ms after `WifiNetReady` before the first sync. */
constexpr uint32_t NetWarmupMs = 2000;
/** @brief Timeout in ms of one `getLocalTime` sync attempt. */
constexpr uint32_t SyncWaitMs = 4000;
/** @brief First retry delay after a failed sync, doubled up to RetryMaxMs. */
constexpr uint32_t RetryMinMs = 2000;
constexpr uint32_t RetryMaxMs = 300000;
/** @brief Periodic resync interval in ms. */
constexpr uint32_t ResyncPeriodMs = 6UL * 3600UL * 1000UL;
/** @brief Idle loop delay in ms. */
constexpr uint32_t LoopDelayMs = 250;
/** @brief Epoch below this value means the clock was never set (2021-01-01). */
constexpr uint32_t MinValidEpoch = 1609459200UL;
}  // namespace Time

/** @brief Inventory storage limits. */
namespace Inventory {
/** @brief Inventory JSON config buffer (`InventoryModule`); NVS strings stay below 4000 bytes. */
constexpr size_t JsonBuf = 3072;
/** @brief Device bridge base topic buffer (`inventory.device_base_topic`). */
constexpr size_t BaseTopic = 64;
/** @brief Display suffix buffer (`inventory.display_suffix`). */
constexpr size_t DisplaySuffix = 24;
/** @brief Monitor query topic buffer (`inventory.monitor_topic`). */
constexpr size_t MonitorTopic = 64;
}  // namespace Inventory

/** @brief Thermostat module limits. */
namespace Thermostat {
/** @brief Task stack size returned by `ThermostatModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 8192;
/** @brief Device/reply topic buffer length. */
constexpr size_t Topic = 128;
/** @brief Serialized expected payload buffer length. */
constexpr size_t PayloadBuf = 1536;
/** @brief Serialized reconciliation report buffer length. */
constexpr size_t ReportBuf = 1536;
/** @brief JSON capacity of a reconciliation report document. */
constexpr size_t ReportDoc = 2048;
/** @brief JSON capacity of a monitor reply decoded in place (`{"last_seen":..,"state":{..}}`). */
constexpr size_t ReplyDoc = 4096;
/** @brief Slice in ms used while waiting for monitor replies. */
constexpr uint32_t WaitSliceMs = 100;
/** @brief Idle loop delay in ms. */
constexpr uint32_t LoopDelayMs = 100;
}  // namespace Thermostat

/** @brief Liveness monitor limits. */
namespace Monitor {
/** @brief Task stack size returned by `MonitorModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 6144;
/** @brief Report suffix buffer (`monitor.report_suffix`). */
constexpr size_t ReportSuffix = 48;
/** @brief Serialized staleness report / per-device reply buffer length. */
constexpr size_t PublishBuf = 2048;
/** @brief JSON capacity of a per-device query reply document. */
constexpr size_t ReplyDoc = 3072;
/** @brief Serialized query list buffer length (all devices, published on the query topic). */
constexpr size_t ListBuf = 6144;
/** @brief JSON capacity of the query list document. */
constexpr size_t ListDoc = 8192;
/** @brief Maximum number of device state routes registered with MQTT. */
constexpr uint8_t MaxDeviceRoutes = 16;
/** @brief Idle loop delay in ms. */
constexpr uint32_t LoopDelayMs = 250;
}  // namespace Monitor

/** @brief `system.*` commands. */
namespace System {
constexpr uint32_t RestartDelayMs = 500;  ///< Leaves time for the command ack to go out.
}  // namespace System

}  // namespace Limits
