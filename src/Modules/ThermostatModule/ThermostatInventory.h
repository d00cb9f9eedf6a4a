#pragma once
/**
 * @file ThermostatInventory.h
 * @brief Device set points and type profiles loaded from the inventory document.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Modules/ThermostatModule/TypeProfiles.h"

constexpr uint8_t DEVICE_MAX = 16;
constexpr size_t DEVICE_NAME_MAX = 32;
constexpr size_t INVENTORY_DOC_CAPACITY = 8192;

/** @brief Heating policy of one thermostat. */
struct DeviceConfig {
    char name[DEVICE_NAME_MAX] = {0};
    uint16_t dayMinute = 0;
    float dayTemperature = 0.0f;
    uint16_t nightMinute = 0;
    float nightTemperature = 0.0f;
    char type[TYPE_NAME_MAX] = {0};
    bool valid = false;                 ///< false when this entry failed validation.
    ErrorCode error = ErrorCode::Failed; ///< Validation failure reason when !valid.
};

/**
 * @brief Parsed inventory: type registry plus device table.
 *
 * Invalid devices are kept (with their error) so that they are still monitored,
 * but they never take part in schedule apply or reconciliation.
 */
class ThermostatInventory {
public:
    /**
     * @brief Parse an inventory JSON document.
     *
     * Expected shape:
     * {"types":{"T":{"mode_fields":{..},"schedule_key_prefix":"schedule"}},
     *  "devices":{"N":{"day_time":"HH:MM","day_temperature":21,
     *                  "night_time":"HH:MM","night_temperature":19,"type":"T"}}}
     *
     * A bad type entry is skipped; devices referencing it then fail with UnknownType.
     * @param err ParseError/InvalidConfig when the document itself is unusable.
     * @return false only when the whole document is unusable.
     */
    bool load(const char* json, ErrorCode& err);

    const TypeProfileRegistry& types() const { return types_; }
    uint8_t deviceCount() const { return deviceCount_; }
    const DeviceConfig* device(uint8_t idx) const { return (idx < deviceCount_) ? &devices_[idx] : nullptr; }
    const DeviceConfig* findDevice(const char* name) const;
    uint8_t validCount() const;

    /** @brief Number of type entries rejected during the last load. */
    uint8_t rejectedTypes() const { return rejectedTypes_; }
    /** @brief Device entries dropped during the last load (table full or bad name). */
    uint8_t rejectedDevices() const { return rejectedDevices_; }

private:
    void clear_();

    TypeProfileRegistry types_;
    DeviceConfig devices_[DEVICE_MAX];
    uint8_t deviceCount_ = 0;
    uint8_t rejectedTypes_ = 0;
    uint8_t rejectedDevices_ = 0;
};
