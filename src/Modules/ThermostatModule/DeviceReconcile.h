#pragma once
/**
 * @file DeviceReconcile.h
 * @brief One device of a reconciliation pass, from monitor reply to report.
 */

#include <stddef.h>
#include <stdint.h>
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"
#include "Modules/MonitorModule/LivenessTable.h"
#include "Modules/ThermostatModule/StateReconciler.h"

/** @brief Outcome of one device in a reconciliation pass. */
enum class ReconcileStatus : uint8_t { Ok, Mismatch, Timeout, Skipped };

const char* reconcileStatusStr(ReconcileStatus s);

/**
 * @brief Result for one device.
 *
 * Mismatch values point into the expected document and the reply document
 * passed to reconcileReply(); both must outlive the outcome.
 */
struct DeviceOutcome {
    ReconcileStatus status = ReconcileStatus::Timeout;
    ErrorCode error = ErrorCode::None;   ///< Why the device was skipped.
    bool batteryKnown = false;           ///< false: battery written as null.
    BatteryAnnotation battery;
    MismatchReport mismatches;
};

/**
 * @brief Compare the monitor reply of a device with its expected payload.
 *
 * @p reply is the reply-table entry: `{"last_seen":..,"state":..}`. An entry
 * never seen is a timeout and every expected key is reported absent. A reply
 * that is not structured, or whose state is not an object, yields a mismatch
 * on every key.
 * @param reply Decoded in place; string values of the outcome point into its payload.
 * @param replyDoc Receives the decoded reply.
 */
void reconcileReply(const StateReconciler& reconciler, JsonObjectConst expected,
                    DeviceStateView& reply, JsonDocument& replyDoc,
                    float batteryLowPct, DeviceOutcome& out);

/** @brief Device that could not be compared: invalid inventory entry or expected payload failure. */
void markSkipped(DeviceOutcome& out, ErrorCode err);

/**
 * @brief `{"name","status","mismatches":[{"key","expected","reported"?}],"overflow"?,"battery","error"?}`.
 * @return false when @p doc overflowed.
 */
bool buildDeviceReport(const char* name, const DeviceOutcome& outcome, JsonDocument& doc);
