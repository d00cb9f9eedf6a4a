#pragma once
/**
 * @file ConfigStore.h
 * @brief Registered config variables, their NVS copies and JSON access.
 */
#include <Preferences.h>
#include <stdint.h>
#include <string.h>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"

/** @brief One schema upgrade of the NVS namespace. */
struct MigrationStep {
    uint32_t fromVersion;
    uint32_t toVersion;
    bool (*apply)(Preferences& prefs, bool clearOnFail);
};

/** @brief Outcome of ConfigStore::applyJson. */
struct ConfigApplyResult {
    uint16_t matched = 0;   ///< Registered variables present in the patch.
    uint16_t changed = 0;   ///< Variables whose value actually changed.
    uint16_t rejected = 0;  ///< Variables present with a value of the wrong JSON type.
};

/**
 * @brief Table of config variables owned by the modules.
 *
 * Values live in the modules; the store only keeps pointers to them. A value
 * changed by applyJson() is written to NVS and announced as `ConfigChanged`
 * carrying its NVS key.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    void setEventBus(EventBus* bus) { bus_ = bus; }
    void setPreferences(Preferences& prefs) { prefs_ = &prefs; }

    /** @brief Add a variable. Init phase only. */
    template<typename T>
    void registerVar(ConfigVariable<T>& var);

    /** @brief Overwrite registered values with the ones stored in NVS. Unstored keys keep their default. */
    void loadPersistent();
    /** @brief Clear the NVS namespace; RAM values are kept until reboot. */
    bool erasePersistent();

    /**
     * @brief Flat JSON object of one module's values (`pass` masked).
     * @return false for an unknown module. @p truncated is set, and `{}` written,
     * when the object does not fit @p outLen.
     */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief Distinct module names in registration order. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply `{"module":{"key":value}}`. Values of the wrong JSON type are
     * counted as rejected and skipped; the other keys are still applied.
     * @return false when the patch is not an object or anything was rejected.
     */
    bool applyJson(const char* json, ConfigApplyResult* result = nullptr);

    /** @brief Bring the NVS namespace from its stored schema version to @p currentVersion. */
    bool runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                       const char* versionKey, bool clearOnFail = true);

private:
    Preferences* prefs_ = nullptr;
    EventBus* bus_ = nullptr;
    ConfigMeta meta_[MAX_CONFIG_VARS];
    uint16_t metaCount_ = 0;

    void store_(const ConfigMeta& m);
    void announce_(const char* nvsKey);
    void resetNamespace_(const char* versionKey);
};

template<typename T>
void ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (metaCount_ >= MAX_CONFIG_VARS) {
        Log::error("CfgStore", "no slot for %s.%s", var.moduleName, var.jsonName);
        return;
    }
    meta_[metaCount_++] = ConfigMeta{var.moduleName, var.jsonName, var.nvsKey, var.type,
                                     var.persistence, (void*)var.value, var.size};
}
