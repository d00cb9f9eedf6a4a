/**
 * @file MonitorReply.cpp
 * @brief JSON form of liveness snapshots in monitor answers.
 */

#include "Modules/MonitorModule/MonitorReply.h"

void putDeviceValue(JsonObject out, const DeviceStateView& v, const char* lastSeenIso, StateForm form)
{
    if (v.seen && lastSeenIso) out["last_seen"] = (char*)lastSeenIso;
    else out["last_seen"] = nullptr;

    if (form == StateForm::Omitted) {
        out["state"] = "truncated";
    } else if (!v.seen) {
        if (form == StateForm::ListItem) out["state"] = "unknown";
        else out["state"] = nullptr;
    } else if (v.structured) {
        // char* source: the JSON text is copied into the document.
        out["state"] = serialized((char*)v.payload);
    } else {
        out["state"] = (char*)v.payload;
    }
}

bool writeDeviceReply(const DeviceStateView& v, const char* lastSeenIso, JsonDocument& doc,
                      char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    doc.clear();
    putDeviceValue(doc.to<JsonObject>(), v, lastSeenIso, StateForm::Reply);
    if (doc.overflowed() || measureJson(doc) >= outLen) {
        doc.clear();
        putDeviceValue(doc.to<JsonObject>(), v, lastSeenIso, StateForm::Omitted);
        if (doc.overflowed() || measureJson(doc) >= outLen) return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}
