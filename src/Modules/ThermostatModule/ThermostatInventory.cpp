/**
 * @file ThermostatInventory.cpp
 * @brief Device set points and type profiles loaded from the inventory document.
 */

#include "Modules/ThermostatModule/ThermostatInventory.h"
#include "Modules/ThermostatModule/ScheduleGenerator.h"
#include <ArduinoJson.h>
#include <string.h>

static bool readTime_(JsonVariantConst v, uint16_t& minute)
{
    if (!v.is<const char*>()) return false;
    return parseTimeOfDay(v.as<const char*>(), minute);
}

static bool readTemp_(JsonVariantConst v, float& temp)
{
    if (!v.is<float>()) return false;
    temp = v.as<float>();
    return true;
}

void ThermostatInventory::clear_()
{
    types_.clear();
    deviceCount_ = 0;
    rejectedTypes_ = 0;
    rejectedDevices_ = 0;
}

bool ThermostatInventory::load(const char* json, ErrorCode& err)
{
    clear_();
    if (!json || json[0] == '\0') {
        err = ErrorCode::ParseError;
        return false;
    }

    static StaticJsonDocument<INVENTORY_DOC_CAPACITY> doc;
    doc.clear();
    const DeserializationError jerr = deserializeJson(doc, json);
    if (jerr || !doc.is<JsonObject>()) {
        err = ErrorCode::ParseError;
        return false;
    }

    JsonObjectConst typesObj = doc["types"].as<JsonObjectConst>();
    JsonObjectConst devicesObj = doc["devices"].as<JsonObjectConst>();
    if (typesObj.isNull() || devicesObj.isNull()) {
        err = ErrorCode::InvalidConfig;
        return false;
    }

    for (JsonPairConst kv : typesObj) {
        JsonObjectConst t = kv.value().as<JsonObjectConst>();
        ErrorCode typeErr = ErrorCode::Failed;
        if (t.isNull() || !types_.add(kv.key().c_str(), t["mode_fields"].as<JsonObjectConst>(), t["schedule_key_prefix"] | "", typeErr)) {
            ++rejectedTypes_;
        }
    }

    for (JsonPairConst kv : devicesObj) {
        const char* name = kv.key().c_str();
        if (deviceCount_ >= DEVICE_MAX || strlen(name) == 0 || strlen(name) >= DEVICE_NAME_MAX) {
            ++rejectedDevices_;
            continue;
        }

        DeviceConfig& d = devices_[deviceCount_++];
        d = DeviceConfig{};
        memcpy(d.name, name, strlen(name) + 1);

        JsonObjectConst o = kv.value().as<JsonObjectConst>();
        if (o.isNull()) {
            d.error = ErrorCode::InvalidConfig;
            continue;
        }

        const char* type = o["type"] | "";
        strncpy(d.type, type, sizeof(d.type) - 1);
        d.type[sizeof(d.type) - 1] = '\0';

        if (!readTime_(o["day_time"], d.dayMinute) || !readTime_(o["night_time"], d.nightMinute)) {
            d.error = ErrorCode::ParseError;
            continue;
        }
        if (!readTemp_(o["day_temperature"], d.dayTemperature) ||
            !readTemp_(o["night_temperature"], d.nightTemperature)) {
            d.error = ErrorCode::InvalidConfig;
            continue;
        }
        if (d.dayMinute == d.nightMinute) {
            d.error = ErrorCode::InvalidConfig;
            continue;
        }
        ErrorCode typeErr = ErrorCode::Failed;
        if (strlen(type) >= sizeof(d.type) || !types_.resolve(type, typeErr)) {
            d.error = ErrorCode::UnknownType;
            continue;
        }

        d.valid = true;
    }

    return true;
}

const DeviceConfig* ThermostatInventory::findDevice(const char* name) const
{
    if (!name) return nullptr;
    for (uint8_t i = 0; i < deviceCount_; ++i) {
        if (strcmp(devices_[i].name, name) == 0) return &devices_[i];
    }
    return nullptr;
}

uint8_t ThermostatInventory::validCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < deviceCount_; ++i) {
        if (devices_[i].valid) ++n;
    }
    return n;
}
