/**
 * @file DeviceReconcile.cpp
 * @brief One device of a reconciliation pass, from monitor reply to report.
 */

#include "Modules/ThermostatModule/DeviceReconcile.h"

const char* reconcileStatusStr(ReconcileStatus s)
{
    switch (s) {
    case ReconcileStatus::Ok: return "ok";
    case ReconcileStatus::Mismatch: return "mismatch";
    case ReconcileStatus::Timeout: return "timeout";
    case ReconcileStatus::Skipped: return "skipped";
    default: return "unknown";
    }
}

void reconcileReply(const StateReconciler& reconciler, JsonObjectConst expected,
                    DeviceStateView& reply, JsonDocument& replyDoc,
                    float batteryLowPct, DeviceOutcome& out)
{
    out.error = ErrorCode::None;
    out.mismatches.clear();
    replyDoc.clear();

    JsonVariantConst reported;
    if (reply.seen && reply.structured &&
        deserializeJson(replyDoc, reply.payload) == DeserializationError::Ok) {
        reported = replyDoc.as<JsonObjectConst>()["state"];
    }
    reconciler.reconcile(expected, reported, out.mismatches);

    if (!reply.seen) {
        out.status = ReconcileStatus::Timeout;
        out.batteryKnown = false;
        return;
    }
    out.status = out.mismatches.empty() ? ReconcileStatus::Ok : ReconcileStatus::Mismatch;
    out.battery = StateReconciler::annotateBattery(reported, batteryLowPct);
    out.batteryKnown = true;
}

void markSkipped(DeviceOutcome& out, ErrorCode err)
{
    out.status = ReconcileStatus::Skipped;
    out.error = err;
    out.batteryKnown = false;
    out.mismatches.clear();
}

bool buildDeviceReport(const char* name, const DeviceOutcome& outcome, JsonDocument& doc)
{
    doc.clear();
    doc["name"] = (char*)name;
    doc["status"] = reconcileStatusStr(outcome.status);

    JsonArray arr = doc.createNestedArray("mismatches");
    for (uint8_t i = 0; i < outcome.mismatches.count; ++i) {
        const Mismatch& m = outcome.mismatches.entries[i];
        JsonObject o = arr.createNestedObject();
        o["key"] = (char*)m.key;
        o["expected"] = m.expected;
        if (m.reportedPresent) o["reported"] = m.reported;
    }
    if (outcome.mismatches.overflow) doc["overflow"] = true;

    char battery[24];
    if (outcome.batteryKnown && StateReconciler::formatBattery(outcome.battery, battery, sizeof(battery)) &&
        battery[0] != '\0') {
        doc["battery"] = battery;
    } else {
        doc["battery"] = nullptr;
    }
    if (outcome.status == ReconcileStatus::Skipped) doc["error"] = errorCodeStr(outcome.error);
    return !doc.overflowed();
}
