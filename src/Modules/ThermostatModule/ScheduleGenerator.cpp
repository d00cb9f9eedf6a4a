/**
 * @file ScheduleGenerator.cpp
 * @brief Day/night set points to device schedule string conversion.
 */

#include "Modules/ThermostatModule/ScheduleGenerator.h"
#include "Domain/ThermostatDefaults.h"
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace {

struct RawPoint {
    uint16_t minute;
    float temperature;
    bool wrapped;
};

bool isDigit_(char c)
{
    return c >= '0' && c <= '9';
}

bool isSpace_(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

void fillSegment_(RawPoint* out, uint8_t count, uint16_t start, uint16_t duration, float temp)
{
    const double step = (double)duration / (double)count;
    for (uint8_t i = 0; i < count; ++i) {
        const double at = (double)start + (double)i * step;
        // Ties go to the even minute (570.5 -> 570).
        long rounded = lrint(fmod(at, (double)ThermoDefaults::MinutesPerDay));
        rounded %= ThermoDefaults::MinutesPerDay;
        out[i].minute = (uint16_t)rounded;
        out[i].temperature = temp;
        out[i].wrapped = at >= (double)ThermoDefaults::MinutesPerDay;
    }
}

void forceMidnight_(RawPoint* seg, uint8_t count)
{
    for (uint8_t i = 1; i < count; ++i) {
        if (seg[i].wrapped) {
            seg[i].minute = 0;
            return;
        }
    }
    seg[count - 1].minute = 0;
}

}  // namespace

bool parseTimeOfDay(const char* text, uint16_t& minuteOut)
{
    if (!text) return false;
    const char* p = text;
    if (!isDigit_(p[0])) return false;

    int hour = p[0] - '0';
    ++p;
    if (isDigit_(p[0])) {
        hour = hour * 10 + (p[0] - '0');
        ++p;
    }
    if (*p != ':') return false;
    ++p;
    if (!isDigit_(p[0]) || !isDigit_(p[1])) return false;
    const int minute = (p[0] - '0') * 10 + (p[1] - '0');
    p += 2;
    if (*p != '\0') return false;
    if (hour > 23 || minute > 59) return false;

    minuteOut = (uint16_t)(hour * 60 + minute);
    return true;
}

bool formatTimeOfDay(uint16_t minute, char* out, size_t outLen)
{
    if (!out || outLen < 6 || minute >= ThermoDefaults::MinutesPerDay) return false;
    snprintf(out, outLen, "%02u:%02u", (unsigned)(minute / 60), (unsigned)(minute % 60));
    return true;
}

bool canonicalizeDecimal(const char* text, size_t len, char* out, size_t outLen)
{
    if (!text || !out || outLen == 0) return false;

    size_t i = 0;
    bool negative = false;
    if (i < len && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        ++i;
    }

    const size_t intStart = i;
    while (i < len && isDigit_(text[i])) ++i;
    size_t intEnd = i;

    size_t fracStart = i;
    size_t fracEnd = i;
    if (i < len && text[i] == '.') {
        ++i;
        fracStart = i;
        while (i < len && isDigit_(text[i])) ++i;
        fracEnd = i;
    }
    if (i != len) return false;
    if (intEnd == intStart && fracEnd == fracStart) return false;

    size_t intFirst = intStart;
    while (intFirst + 1 < intEnd && text[intFirst] == '0') ++intFirst;
    while (fracEnd > fracStart && text[fracEnd - 1] == '0') --fracEnd;

    const bool intIsZero = (intEnd == intStart) || (intEnd - intFirst == 1 && text[intFirst] == '0');
    if (intIsZero && fracEnd == fracStart) negative = false;

    size_t pos = 0;
    if (negative) {
        if (pos + 1 >= outLen) return false;
        out[pos++] = '-';
    }
    if (intEnd == intStart) {
        if (pos + 1 >= outLen) return false;
        out[pos++] = '0';
    } else {
        for (size_t k = intFirst; k < intEnd; ++k) {
            if (pos + 1 >= outLen) return false;
            out[pos++] = text[k];
        }
    }
    if (fracEnd > fracStart) {
        if (pos + 1 >= outLen) return false;
        out[pos++] = '.';
        for (size_t k = fracStart; k < fracEnd; ++k) {
            if (pos + 1 >= outLen) return false;
            out[pos++] = text[k];
        }
    }
    out[pos] = '\0';
    return true;
}

bool formatTemperature(float value, char* out, size_t outLen)
{
    if (!out || outLen == 0 || !isfinite(value)) return false;
    char raw[24];
    const int n = snprintf(raw, sizeof(raw), "%.2f", (double)value);
    if (n <= 0 || (size_t)n >= sizeof(raw)) return false;
    return canonicalizeDecimal(raw, (size_t)n, out, outLen);
}

bool generateSchedule(uint16_t dayMinute,
                      float dayTemp,
                      uint16_t nightMinute,
                      float nightTemp,
                      ScheduleString& out,
                      ErrorCode& err)
{
    out.count = 0;
    if (dayMinute >= ThermoDefaults::MinutesPerDay || nightMinute >= ThermoDefaults::MinutesPerDay ||
        dayMinute == nightMinute) {
        err = ErrorCode::InvalidConfig;
        return false;
    }

    const uint16_t nightDuration =
        (uint16_t)((dayMinute + ThermoDefaults::MinutesPerDay - nightMinute) % ThermoDefaults::MinutesPerDay);
    const uint16_t dayDuration =
        (uint16_t)((nightMinute + ThermoDefaults::MinutesPerDay - dayMinute) % ThermoDefaults::MinutesPerDay);

    RawPoint raw[ThermoDefaults::NightPoints + ThermoDefaults::DayPoints];
    RawPoint* night = &raw[0];
    RawPoint* day = &raw[ThermoDefaults::NightPoints];
    fillSegment_(night, ThermoDefaults::NightPoints, nightMinute, nightDuration, nightTemp);
    fillSegment_(day, ThermoDefaults::DayPoints, dayMinute, dayDuration, dayTemp);

    const uint8_t total = ThermoDefaults::NightPoints + ThermoDefaults::DayPoints;
    bool hasMidnight = false;
    for (uint8_t i = 0; i < total; ++i) {
        if (raw[i].minute == 0) hasMidnight = true;
    }
    if (!hasMidnight) {
        if (nightMinute > dayMinute) {
            forceMidnight_(night, ThermoDefaults::NightPoints);
        } else {
            forceMidnight_(day, ThermoDefaults::DayPoints);
        }
    }

    // Stable insertion sort keeps generation order among equal times.
    for (uint8_t i = 1; i < total; ++i) {
        RawPoint cur = raw[i];
        int j = (int)i - 1;
        while (j >= 0 && raw[j].minute > cur.minute) {
            raw[j + 1] = raw[j];
            --j;
        }
        raw[j + 1] = cur;
    }

    for (uint8_t i = 0; i < total; ++i) {
        if (out.count > 0 && out.points[out.count - 1].minute == raw[i].minute) continue;
        out.points[out.count].minute = raw[i].minute;
        out.points[out.count].temperature = raw[i].temperature;
        ++out.count;
    }
    return true;
}

bool generateScheduleFromText(const char* dayTime,
                              float dayTemp,
                              const char* nightTime,
                              float nightTemp,
                              ScheduleString& out,
                              ErrorCode& err)
{
    uint16_t dayMinute = 0;
    uint16_t nightMinute = 0;
    if (!parseTimeOfDay(dayTime, dayMinute) || !parseTimeOfDay(nightTime, nightMinute)) {
        out.count = 0;
        err = ErrorCode::ParseError;
        return false;
    }
    return generateSchedule(dayMinute, dayTemp, nightMinute, nightTemp, out, err);
}

bool formatSchedule(const ScheduleString& schedule, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';

    size_t pos = 0;
    for (uint8_t i = 0; i < schedule.count; ++i) {
        char hhmm[6];
        char temp[16];
        if (!formatTimeOfDay(schedule.points[i].minute, hhmm, sizeof(hhmm))) return false;
        if (!formatTemperature(schedule.points[i].temperature, temp, sizeof(temp))) return false;

        const int n = snprintf(out + pos, outLen - pos, "%s%s/%s", (i == 0) ? "" : " ", hhmm, temp);
        if (n < 0 || (size_t)n >= outLen - pos) {
            out[0] = '\0';
            return false;
        }
        pos += (size_t)n;
    }
    return true;
}

bool parseSchedule(const char* text, ScheduleString& out, ErrorCode& err)
{
    out.count = 0;
    err = ErrorCode::ParseError;
    if (!text) return false;

    const char* p = text;
    while (true) {
        while (isSpace_(*p)) ++p;
        if (*p == '\0') break;

        const char* tokEnd = p;
        while (*tokEnd != '\0' && !isSpace_(*tokEnd)) ++tokEnd;

        const char* slash = (const char*)memchr(p, '/', (size_t)(tokEnd - p));
        if (!slash) return false;

        char hhmm[8];
        const size_t timeLen = (size_t)(slash - p);
        if (timeLen == 0 || timeLen >= sizeof(hhmm)) return false;
        memcpy(hhmm, p, timeLen);
        hhmm[timeLen] = '\0';

        uint16_t minute = 0;
        if (!parseTimeOfDay(hhmm, minute)) return false;

        char temp[16];
        const size_t tempLen = (size_t)(tokEnd - slash - 1);
        if (!canonicalizeDecimal(slash + 1, tempLen, temp, sizeof(temp))) return false;

        if (out.count >= SCHEDULE_MAX_POINTS) {
            out.count = 0;
            return false;
        }
        out.points[out.count].minute = minute;
        out.points[out.count].temperature = strtof(temp, nullptr);
        ++out.count;
        p = tokEnd;
    }

    return out.count > 0;
}

bool scheduleEquals(const ScheduleString& a, const ScheduleString& b)
{
    if (a.count != b.count) return false;
    for (uint8_t i = 0; i < a.count; ++i) {
        if (a.points[i].minute != b.points[i].minute) return false;
        char ta[16];
        char tb[16];
        if (!formatTemperature(a.points[i].temperature, ta, sizeof(ta))) return false;
        if (!formatTemperature(b.points[i].temperature, tb, sizeof(tb))) return false;
        if (strcmp(ta, tb) != 0) return false;
    }
    return true;
}
