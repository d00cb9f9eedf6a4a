/**
 * @file ExpectedPayload.cpp
 * @brief Expected device configuration payload and topic derivation.
 */

#include "Modules/ThermostatModule/ExpectedPayload.h"
#include "Modules/ThermostatModule/ScheduleGenerator.h"
#include <stdio.h>
#include <string.h>

const char* const kWeekdayNames[7] = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

bool formatDeviceTopic(const TopicLayout& layout, const char* deviceName, const char* tail, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!layout.baseTopic || layout.baseTopic[0] == '\0' || !deviceName || deviceName[0] == '\0') return false;

    const char* suffix = layout.displaySuffix ? layout.displaySuffix : "";
    int wrote = 0;
    if (tail && tail[0] != '\0') {
        wrote = snprintf(out, outLen, "%s/%s%s/%s", layout.baseTopic, deviceName, suffix, tail);
    } else {
        wrote = snprintf(out, outLen, "%s/%s%s", layout.baseTopic, deviceName, suffix);
    }
    if (wrote <= 0 || (size_t)wrote >= outLen) {
        out[0] = '\0';
        return false;
    }
    return true;
}

bool buildExpectedPayload(const DeviceConfig& device,
                          const TypeProfileRegistry& types,
                          const TopicLayout& layout,
                          JsonDocument& out,
                          char* topicOut,
                          size_t topicLen,
                          char* scheduleOut,
                          size_t scheduleLen,
                          ErrorCode& err)
{
    out.clear();

    const TypeProfile* profile = types.resolve(device.type, err);
    if (!profile) return false;

    ScheduleString schedule;
    if (!generateSchedule(device.dayMinute,
                          device.dayTemperature,
                          device.nightMinute,
                          device.nightTemperature,
                          schedule,
                          err)) {
        return false;
    }

    char scheduleText[SCHEDULE_TEXT_MAX];
    if (!formatSchedule(schedule, scheduleText, sizeof(scheduleText))) {
        err = ErrorCode::BufferTooSmall;
        return false;
    }

    if (!formatDeviceTopic(layout, device.name, "set", topicOut, topicLen)) {
        err = ErrorCode::BufferTooSmall;
        return false;
    }

    const DeserializationError jerr = deserializeJson(out, profile->modeFields);
    if (jerr || !out.is<JsonObject>()) {
        out.clear();
        err = ErrorCode::InvalidConfig;
        return false;
    }

    char key[TYPE_PREFIX_MAX + 16];
    for (uint8_t d = 0; d < 7; ++d) {
        snprintf(key, sizeof(key), "%s_%s", profile->scheduleKeyPrefix, kWeekdayNames[d]);
        // char* key and value are copied into the document.
        if (!out[key].set(scheduleText)) {
            out.clear();
            err = ErrorCode::BufferTooSmall;
            return false;
        }
    }

    if (scheduleOut && scheduleLen > 0) {
        if (strlen(scheduleText) >= scheduleLen) {
            err = ErrorCode::BufferTooSmall;
            return false;
        }
        memcpy(scheduleOut, scheduleText, strlen(scheduleText) + 1);
    }
    return true;
}
