#pragma once
/**
 * @file TypeProfiles.h
 * @brief Thermostat model payload templates and their registry.
 */

#include <stddef.h>
#include <stdint.h>
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"

constexpr uint8_t TYPE_PROFILE_MAX = 16;
constexpr size_t TYPE_NAME_MAX = 24;
constexpr size_t TYPE_PREFIX_MAX = 24;
constexpr size_t TYPE_MODE_FIELDS_MAX = 192;

/** @brief Fields that put one thermostat model into schedule mode. */
struct TypeProfile {
    char name[TYPE_NAME_MAX] = {0};
    char modeFields[TYPE_MODE_FIELDS_MAX] = {0};   ///< Serialized JSON object, scalar values only.
    char scheduleKeyPrefix[TYPE_PREFIX_MAX] = {0};
};

/**
 * @brief Immutable-after-load set of type profiles.
 *
 * Filled once by the inventory loader, then only read.
 */
class TypeProfileRegistry {
public:
    /**
     * @brief Register a profile.
     * @param prefix Schedule key prefix; nullptr or empty selects "schedule".
     * @param err InvalidConfig on empty/non-scalar mode fields or duplicate name,
     *            CapacityExceeded when the table is full, BufferTooSmall on long fields.
     */
    bool add(const char* name, JsonObjectConst modeFields, const char* prefix, ErrorCode& err);

    /** @brief Look up a profile; nullptr with UnknownType when not registered. */
    const TypeProfile* resolve(const char* name, ErrorCode& err) const;

    uint8_t count() const { return count_; }
    const TypeProfile* at(uint8_t idx) const { return (idx < count_) ? &profiles_[idx] : nullptr; }
    void clear() { count_ = 0; }

private:
    TypeProfile profiles_[TYPE_PROFILE_MAX];
    uint8_t count_ = 0;
};
