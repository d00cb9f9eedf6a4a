#pragma once
/**
 * @file MonitorReply.h
 * @brief JSON form of liveness snapshots in monitor answers.
 */

#include <stddef.h>
#include <stdint.h>
#include <ArduinoJson.h>
#include "Modules/MonitorModule/LivenessTable.h"

/// Bytes a per-device reply adds around the state: `{"last_seen":"<iso>","state":}`.
constexpr size_t MONITOR_REPLY_ENVELOPE = 96;
/// Largest device state the monitor keeps; its reply then fits one liveness entry.
constexpr size_t DEVICE_STATE_MAX = LIVENESS_PAYLOAD_MAX - MONITOR_REPLY_ENVELOPE;

/** @brief How the state member is written. */
enum class StateForm : uint8_t {
    Reply,      ///< Per-device reply: a never-seen device has a null state.
    ListItem,   ///< Query list entry: a never-seen device has state "unknown".
    Omitted     ///< State replaced by "truncated".
};

/**
 * @brief `{"last_seen":iso|null,"state":..}` of one snapshot.
 *
 * A structured payload is embedded as JSON, a raw one as a string.
 * @param lastSeenIso Formatted last-seen time, nullptr writes null.
 */
void putDeviceValue(JsonObject out, const DeviceStateView& v, const char* lastSeenIso, StateForm form);

/**
 * @brief Serialize the per-device reply of @p v into @p out.
 *
 * When the reply with its state does not fit @p outLen, the state is written as
 * "truncated" instead so the text stays well-formed.
 * @return false when even that form does not fit.
 */
bool writeDeviceReply(const DeviceStateView& v, const char* lastSeenIso, JsonDocument& doc,
                      char* out, size_t outLen);
