#pragma once
/**
 * @file MqttTopics.h
 * @brief Standard MQTT topic suffixes shared across modules.
 */

namespace MqttTopics {

/** @brief Command ingress suffix (`<base>/<device>/cmd`). */
constexpr char SuffixCmd[] = "cmd";
/** @brief Command acknowledgment suffix (`<base>/<device>/ack`). */
constexpr char SuffixAck[] = "ack";
/** @brief Device availability/status suffix, Last Will (`<base>/<device>/status`). */
constexpr char SuffixStatus[] = "status";
/** @brief Reconciliation result root (`<base>/<device>/thermostat/reconcile[/<name>]`). */
constexpr char SuffixReconcile[] = "thermostat/reconcile";
/** @brief Monitor query keyword accepted on the query topic. */
constexpr char MonitorQueryGet[] = "get";

}  // namespace MqttTopics
