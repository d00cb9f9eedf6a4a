/**
 * @file TypeProfiles.cpp
 * @brief Thermostat model payload templates and their registry.
 */

#include "Modules/ThermostatModule/TypeProfiles.h"
#include "Domain/ThermostatDefaults.h"
#include <string.h>

static bool copyText_(char* dst, size_t dstLen, const char* src)
{
    const size_t len = strlen(src);
    if (len >= dstLen) return false;
    memcpy(dst, src, len + 1);
    return true;
}

bool TypeProfileRegistry::add(const char* name, JsonObjectConst modeFields, const char* prefix, ErrorCode& err)
{
    if (!name || name[0] == '\0' || modeFields.isNull() || modeFields.size() == 0) {
        err = ErrorCode::InvalidConfig;
        return false;
    }
    for (JsonPairConst kv : modeFields) {
        JsonVariantConst v = kv.value();
        if (v.is<JsonObjectConst>() || v.is<JsonArrayConst>()) {
            err = ErrorCode::InvalidConfig;
            return false;
        }
    }
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(profiles_[i].name, name) == 0) {
            err = ErrorCode::InvalidConfig;
            return false;
        }
    }
    if (count_ >= TYPE_PROFILE_MAX) {
        err = ErrorCode::CapacityExceeded;
        return false;
    }

    TypeProfile& p = profiles_[count_];
    const char* pfx = (prefix && prefix[0] != '\0') ? prefix : ThermoDefaults::ScheduleKeyPrefix;
    if (!copyText_(p.name, sizeof(p.name), name) ||
        !copyText_(p.scheduleKeyPrefix, sizeof(p.scheduleKeyPrefix), pfx)) {
        err = ErrorCode::BufferTooSmall;
        return false;
    }
    // serializeJson stops one byte short of a full buffer, so size the text first.
    const size_t need = measureJson(modeFields);
    if (need == 0 || need >= sizeof(p.modeFields)) {
        err = ErrorCode::BufferTooSmall;
        return false;
    }
    serializeJson(modeFields, p.modeFields, sizeof(p.modeFields));

    ++count_;
    return true;
}

const TypeProfile* TypeProfileRegistry::resolve(const char* name, ErrorCode& err) const
{
    if (name) {
        for (uint8_t i = 0; i < count_; ++i) {
            if (strcmp(profiles_[i].name, name) == 0) return &profiles_[i];
        }
    }
    err = ErrorCode::UnknownType;
    return nullptr;
}
