/**
 * @file LivenessTable.cpp
 * @brief Last-seen time and last payload per device.
 */

#include "Modules/MonitorModule/LivenessTable.h"
#include <string.h>

namespace {

bool isSpace_(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Index after the object or array opening at text[start]; 0 when it never closes.
size_t enclosedEnd_(const char* text, size_t len, size_t start)
{
    int depth = 0;
    char quote = 0;
    for (size_t i = start; i < len; ++i) {
        const char c = text[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            if (--depth == 0) return i + 1;
        }
    }
    return 0;
}

DeserializationError decodeCopy_(JsonDocument& doc, char* scratch, const char* text, size_t len)
{
    // Zero-copy: string values stay in scratch.
    memcpy(scratch, text, len);
    scratch[len] = '\0';
    doc.clear();
    return deserializeJson(doc, scratch, len);
}

bool writeCompact_(const JsonDocument& doc, char* out, size_t outLen)
{
    const size_t need = measureJson(doc);
    if (need == 0 || need >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

}  // namespace

LivenessTable::LivenessTable(size_t payloadLimit)
    : payloadLimit_((payloadLimit == 0 || payloadLimit > LIVENESS_PAYLOAD_MAX) ? LIVENESS_PAYLOAD_MAX : payloadLimit)
{
}

int8_t LivenessTable::find_(const char* name) const
{
    if (!name) return -1;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].name, name) == 0) return (int8_t)i;
    }
    return -1;
}

void LivenessTable::copyOut_(const Entry& e, DeviceStateView& out)
{
    memcpy(out.name, e.name, sizeof(out.name));
    out.seen = e.seen;
    out.lastSeen = e.lastSeen;
    out.structured = e.structured;
    out.truncated = e.truncated;
    memcpy(out.payload, e.payload, sizeof(out.payload));
}

bool LivenessTable::addDevice(const char* name)
{
    if (!name || name[0] == '\0') return false;
    if (find_(name) >= 0) return true;
    const size_t len = strlen(name);
    if (count_ >= LIVENESS_MAX_DEVICES || len >= LIVENESS_NAME_MAX) return false;

    Entry& e = entries_[count_];
    memset(&e, 0, sizeof(e));
    memcpy(e.name, name, len + 1);
    ++count_;
    return true;
}

bool LivenessTable::record(const char* name, uint32_t timestamp, const char* payload, size_t len)
{
    const int8_t idx = find_(name);
    if (idx < 0) return false;
    Entry& e = entries_[idx];

    if (!payload) len = 0;
    const bool truncated = len >= payloadLimit_;
    const size_t keep = truncated ? payloadLimit_ - 1 : len;
    if (keep > 0) memcpy(e.payload, payload, keep);
    e.payload[keep] = '\0';

    const bool structured = !truncated && keep > 0 && storeStructured_(e, keep);

    e.seen = true;
    e.lastSeen = timestamp;
    e.structured = structured;
    e.truncated = truncated;
    return true;
}

bool LivenessTable::storeStructured_(Entry& e, size_t len)
{
    size_t start = 0;
    while (start < len && isSpace_(e.payload[start])) ++start;
    if (start == len || (e.payload[start] != '{' && e.payload[start] != '[')) return false;

    // Nothing but whitespace may follow the value.
    const size_t end = enclosedEnd_(e.payload, len, start);
    if (end == 0) return false;
    for (size_t i = end; i < len; ++i) {
        if (!isSpace_(e.payload[i])) return false;
    }

    DeserializationError err = decodeCopy_(decodeDoc_, scratch_, e.payload, len);
    if (err == DeserializationError::NoMemory) {
        decodeDoc_.clear();
        DynamicJsonDocument large(LIVENESS_LARGE_DOC_CAPACITY);
        if (large.capacity() == 0) return false;
        if (decodeCopy_(large, scratch_, e.payload, len)) return false;
        return writeCompact_(large, e.payload, payloadLimit_);
    }
    const bool ok = !err && writeCompact_(decodeDoc_, e.payload, payloadLimit_);
    decodeDoc_.clear();
    return ok;
}

bool LivenessTable::snapshot(const char* name, DeviceStateView& out) const
{
    const int8_t idx = find_(name);
    if (idx < 0) return false;
    copyOut_(entries_[idx], out);
    return true;
}

bool LivenessTable::snapshotAt(uint8_t idx, DeviceStateView& out) const
{
    if (idx >= count_) return false;
    copyOut_(entries_[idx], out);
    return true;
}

uint8_t LivenessTable::stalenessReport(uint32_t now, uint32_t thresholdS, StaleEntry* out, uint8_t maxOut) const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < count_ && n < maxOut; ++i) {
        const Entry& e = entries_[i];
        bool stale = !e.seen;
        if (e.seen) {
            const int64_t age = (int64_t)now - (int64_t)e.lastSeen;
            stale = age > (int64_t)thresholdS;
        }
        if (!stale) continue;

        if (out) {
            memcpy(out[n].name, e.name, sizeof(out[n].name));
            out[n].seen = e.seen;
            out[n].lastSeen = e.lastSeen;
        }
        ++n;
    }
    return n;
}

void LivenessTable::resetSeen()
{
    for (uint8_t i = 0; i < count_; ++i) {
        entries_[i].seen = false;
        entries_[i].lastSeen = 0;
        entries_[i].structured = false;
        entries_[i].truncated = false;
        entries_[i].payload[0] = '\0';
    }
}

uint8_t LivenessTable::seenCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (entries_[i].seen) ++n;
    }
    return n;
}
