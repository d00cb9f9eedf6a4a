#pragma once
/**
 * @file IInventory.h
 * @brief Thermostat inventory service interface.
 */
#include <stddef.h>
#include <stdint.h>
#include <ArduinoJson.h>

#include "Core/ErrorCodes.h"
#include "Modules/ThermostatModule/ThermostatInventory.h"

/**
 * @brief Read access to the parsed device/type inventory.
 *
 * All accessors copy out under the inventory lock, so callers never hold a
 * reference into the live tables.
 */
struct InventoryService {
    /** Incremented every time a new document was accepted. */
    uint32_t (*generation)(void* ctx);
    uint8_t (*deviceCount)(void* ctx);
    bool (*deviceAt)(void* ctx, uint8_t idx, DeviceConfig* out);
    bool (*findDevice)(void* ctx, const char* name, DeviceConfig* out);
    /** Expected payload, set topic and schedule text of one device. */
    bool (*buildExpected)(void* ctx, const char* name, JsonDocument* out,
                          char* topic, size_t topicLen,
                          char* schedule, size_t scheduleLen,
                          ErrorCode* err);
    /** State topic `{device_base}/{name}{suffix}` of one device. */
    bool (*stateTopic)(void* ctx, const char* name, char* out, size_t len);
    /** Monitor query topic (`inventory.monitor_topic`). */
    bool (*monitorTopic)(void* ctx, char* out, size_t len);
    void* ctx;
};
