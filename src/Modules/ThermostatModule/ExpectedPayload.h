#pragma once
/**
 * @file ExpectedPayload.h
 * @brief Expected device configuration payload and topic derivation.
 */

#include <stddef.h>
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"
#include "Modules/ThermostatModule/ThermostatInventory.h"

constexpr size_t SCHEDULE_TEXT_MAX = 128;
constexpr size_t EXPECTED_PAYLOAD_CAPACITY = 2048;

/** @brief Weekday key suffixes, monday first. */
extern const char* const kWeekdayNames[7];

/** @brief Where payload topics are derived from. */
struct TopicLayout {
    const char* baseTopic = nullptr;     ///< Device bridge root, e.g. "zigbee2mqtt".
    const char* displaySuffix = nullptr; ///< Appended to the device name, e.g. " Thermostat".
};

/**
 * @brief "{base}/{name}{suffix}" then "/{tail}" when tail is set.
 * @return false on overflow or missing parts.
 */
bool formatDeviceTopic(const TopicLayout& layout, const char* deviceName, const char* tail, char* out, size_t outLen);

/**
 * @brief Build the expected payload for one device.
 *
 * Output object: the type's mode fields plus "{prefix}_{weekday}" for all seven
 * weekdays, each set to the same generated schedule string. The topic is the
 * device command topic "{base}/{name}{suffix}/set". No I/O is performed.
 *
 * @param scheduleOut Optional copy of the generated schedule text.
 * @param err UnknownType, ParseError, InvalidConfig or BufferTooSmall.
 */
bool buildExpectedPayload(const DeviceConfig& device,
                          const TypeProfileRegistry& types,
                          const TopicLayout& layout,
                          JsonDocument& out,
                          char* topicOut,
                          size_t topicLen,
                          char* scheduleOut,
                          size_t scheduleLen,
                          ErrorCode& err);
