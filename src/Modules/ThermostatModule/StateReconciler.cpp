/**
 * @file StateReconciler.cpp
 * @brief Expected vs reported device state comparison.
 */

#include "Modules/ThermostatModule/StateReconciler.h"
#include "Modules/ThermostatModule/ScheduleGenerator.h"
#include "Domain/ThermostatDefaults.h"
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace {

NumericComparator kNumeric;
ScheduleComparator kSchedule;
TextComparator kText;
StrictComparator kStrict;

bool isSpace_(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

void skipSpaces_(const char*& p)
{
    while (isSpace_(*p)) ++p;
}

bool readDecimal_(JsonVariantConst v, double& out)
{
    if (v.is<bool>()) return false;
    if (v.is<double>()) {
        out = v.as<double>();
        return true;
    }
    if (!v.is<const char*>()) return false;

    const char* s = v.as<const char*>();
    skipSpaces_(s);
    size_t len = strlen(s);
    while (len > 0 && isSpace_(s[len - 1])) --len;

    char canon[40];
    if (!canonicalizeDecimal(s, len, canon, sizeof(canon))) return false;
    out = strtod(canon, nullptr);
    return true;
}

/** Splits the next "HH:MM/temp" token; time and canonical temperature are copied out. */
bool nextScheduleToken_(const char*& p, char* timeOut, size_t timeLen, char* tempOut, size_t tempLen)
{
    skipSpaces_(p);
    const char* start = p;
    while (*p != '\0' && !isSpace_(*p)) ++p;
    const size_t tokLen = (size_t)(p - start);
    if (tokLen == 0) return false;

    const char* slash = (const char*)memchr(start, '/', tokLen);
    if (!slash) return false;
    const size_t tLen = (size_t)(slash - start);
    if (tLen == 0 || tLen >= timeLen) return false;
    memcpy(timeOut, start, tLen);
    timeOut[tLen] = '\0';

    uint16_t minute = 0;
    if (!parseTimeOfDay(timeOut, minute)) return false;
    return canonicalizeDecimal(slash + 1, (size_t)(p - slash - 1), tempOut, tempLen);
}

bool isScheduleText_(const char* s)
{
    const char* p = s;
    uint8_t tokens = 0;
    while (true) {
        skipSpaces_(p);
        if (*p == '\0') break;
        char t[8];
        char v[24];
        if (!nextScheduleToken_(p, t, sizeof(t), v, sizeof(v))) return false;
        ++tokens;
    }
    return tokens > 0;
}

bool collapsedEqual_(const char* a, const char* b)
{
    skipSpaces_(a);
    skipSpaces_(b);
    while (*a != '\0' && *b != '\0') {
        const bool sa = isSpace_(*a);
        const bool sb = isSpace_(*b);
        if (sa || sb) {
            if (!(sa && sb)) return false;
            skipSpaces_(a);
            skipSpaces_(b);
            if ((*a == '\0') != (*b == '\0')) return false;
            continue;
        }
        if (*a != *b) return false;
        ++a;
        ++b;
    }
    skipSpaces_(a);
    skipSpaces_(b);
    return *a == '\0' && *b == '\0';
}

void addMismatch_(MismatchReport& out, const char* key, JsonVariantConst expected, JsonVariantConst reported, bool present)
{
    uint8_t pos = 0;
    while (pos < out.count && strcmp(out.entries[pos].key, key) < 0) ++pos;

    if (pos >= MISMATCH_MAX) {
        out.overflow = true;
        return;
    }
    if (out.count >= MISMATCH_MAX) {
        out.overflow = true;
        out.count = MISMATCH_MAX - 1;
    }
    for (uint8_t i = out.count; i > pos; --i) out.entries[i] = out.entries[i - 1];

    Mismatch& m = out.entries[pos];
    m.key = key;
    m.expected = expected;
    m.reported = reported;
    m.reportedPresent = present;
    ++out.count;
}

}  // namespace

bool NumericComparator::accepts(JsonVariantConst expected, JsonVariantConst reported) const
{
    double a = 0.0;
    double b = 0.0;
    return readDecimal_(expected, a) && readDecimal_(reported, b);
}

bool NumericComparator::equal(JsonVariantConst expected, JsonVariantConst reported) const
{
    double a = 0.0;
    double b = 0.0;
    if (!readDecimal_(expected, a) || !readDecimal_(reported, b)) return false;
    return fabs(a - b) <= ThermoDefaults::NumericTolerance;
}

bool ScheduleComparator::accepts(JsonVariantConst expected, JsonVariantConst reported) const
{
    if (!expected.is<const char*>() || !reported.is<const char*>()) return false;
    return isScheduleText_(expected.as<const char*>()) && isScheduleText_(reported.as<const char*>());
}

bool ScheduleComparator::equal(JsonVariantConst expected, JsonVariantConst reported) const
{
    const char* a = expected.as<const char*>();
    const char* b = reported.as<const char*>();
    if (!a || !b) return false;

    while (true) {
        skipSpaces_(a);
        skipSpaces_(b);
        if (*a == '\0' || *b == '\0') return *a == '\0' && *b == '\0';

        char ta[8], tb[8];
        char va[24], vb[24];
        if (!nextScheduleToken_(a, ta, sizeof(ta), va, sizeof(va))) return false;
        if (!nextScheduleToken_(b, tb, sizeof(tb), vb, sizeof(vb))) return false;
        if (strcmp(ta, tb) != 0 || strcmp(va, vb) != 0) return false;
    }
}

bool TextComparator::accepts(JsonVariantConst expected, JsonVariantConst reported) const
{
    return expected.is<const char*>() && reported.is<const char*>();
}

bool TextComparator::equal(JsonVariantConst expected, JsonVariantConst reported) const
{
    const char* a = expected.as<const char*>();
    const char* b = reported.as<const char*>();
    if (!a || !b) return false;
    return collapsedEqual_(a, b);
}

bool StrictComparator::equal(JsonVariantConst expected, JsonVariantConst reported) const
{
    return expected == reported;
}

StateReconciler::StateReconciler()
{
    chain_[0] = &kNumeric;
    chain_[1] = &kSchedule;
    chain_[2] = &kText;
    chain_[3] = &kStrict;
}

bool StateReconciler::valuesEqual(JsonVariantConst expected, JsonVariantConst reported) const
{
    for (uint8_t i = 0; i < COMPARATOR_COUNT; ++i) {
        if (chain_[i]->accepts(expected, reported)) return chain_[i]->equal(expected, reported);
    }
    return false;
}

void StateReconciler::reconcile(JsonObjectConst expected, JsonVariantConst reported, MismatchReport& out) const
{
    out.clear();
    JsonObjectConst reportedObj = reported.as<JsonObjectConst>();

    for (JsonPairConst kv : expected) {
        const char* key = kv.key().c_str();
        if (reportedObj.isNull() || !reportedObj.containsKey(key)) {
            addMismatch_(out, key, kv.value(), JsonVariantConst(), false);
            continue;
        }
        JsonVariantConst rv = reportedObj[key];
        if (!valuesEqual(kv.value(), rv)) addMismatch_(out, key, kv.value(), rv, true);
    }
}

BatteryAnnotation StateReconciler::annotateBattery(JsonVariantConst reported, float lowThresholdPct)
{
    BatteryAnnotation result;
    JsonObjectConst obj = reported.as<JsonObjectConst>();
    if (obj.isNull()) {
        result.status = BatteryStatus::Unknown;
        return result;
    }

    JsonVariantConst low = obj["battery_low"];
    JsonVariantConst level = obj["battery"];
    if (low.is<bool>() && low.as<bool>()) {
        result.status = BatteryStatus::Low;
        return result;
    }

    double pct = 0.0;
    if (readDecimal_(level, pct) && pct < (double)lowThresholdPct) {
        result.status = BatteryStatus::Level;
        result.level = (float)pct;
        return result;
    }

    if (!obj.containsKey("battery_low") && !obj.containsKey("battery")) {
        result.status = BatteryStatus::Unknown;
    }
    return result;
}

bool StateReconciler::formatBattery(const BatteryAnnotation& battery, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    int wrote = 0;
    switch (battery.status) {
    case BatteryStatus::Low:
        wrote = snprintf(out, outLen, "battery low");
        break;
    case BatteryStatus::Level: {
        char level[16];
        if (!formatTemperature(battery.level, level, sizeof(level))) return false;
        wrote = snprintf(out, outLen, "battery %s", level);
        break;
    }
    case BatteryStatus::Unknown:
        wrote = snprintf(out, outLen, "battery unknown");
        break;
    default:
        out[0] = '\0';
        return true;
    }
    return (wrote > 0) && ((size_t)wrote < outLen);
}
